//===- TaskStateChanges.h ---------------------------------------*- C++ -*-===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2014 - 2017 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#ifndef TASKSTATE_CORE_TASKSTATECHANGES_H
#define TASKSTATE_CORE_TASKSTATECHANGES_H

#include "taskstate/Basic/LLVM.h"
#include "taskstate/Core/TaskStateChange.h"
#include "taskstate/State/TaskExecution.h"

#include "llvm/ADT/STLExtras.h"

#include <memory>
#include <string>
#include <vector>

namespace taskstate {
namespace core {

/// A visitor over change events, which returns false to stop the visit.
typedef function_ref<bool(const TaskStateChange&)> TaskStateChangeVisitor;

/// The facts the change rules compare.
struct TaskStateFacts {
  /// The path of the task.
  std::string taskPath;

  /// The previous execution, or null if the task has no history.
  const state::TaskExecution* previous = nullptr;

  /// The execution for the current build.
  const state::TaskExecution* current = nullptr;

  /// The snapshots of the output files, taken before the task executes.
  state::TaskExecution::SnapshotsByProperty outputsBeforeTask;
};

/// A single change rule.
///
/// Rules are stateless views over the facts they were created with, so they
/// may be visited any number of times.
class TaskStateChanges {
protected:
  const TaskStateFacts& facts;

public:
  explicit TaskStateChanges(const TaskStateFacts& facts) : facts(facts) {}
  virtual ~TaskStateChanges();

  /// The short name of the rule, for diagnostics.
  virtual StringRef getName() const = 0;

  /// Whether changes reported by this rule prevent incremental execution.
  virtual bool isRebuildForcing() const = 0;

  /// Visit the changes detected by this rule, in a deterministic order.
  ///
  /// \returns False if the visitor stopped the visit.
  virtual bool visitChanges(TaskStateChangeVisitor visitor) const = 0;
};

typedef std::vector<std::unique_ptr<TaskStateChanges>> TaskStateRuleList;

/// Create the full list of change rules, in evaluation order.
///
/// The facts must outlive the rules.
TaskStateRuleList createTaskStateRules(const TaskStateFacts& facts);

/// Selects which rules of a list contribute to a summary.
enum class TaskStateChangeFilter {
  /// Every rule.
  AllChanges,

  /// Only the rules which prevent incremental execution.
  RebuildChanges,

  /// Only the rules compatible with incremental execution.
  IncrementalChanges,
};

/// An ordered view over a filtered list of rules.
///
/// Summaries are cheap to create; the same rule list backs any number of
/// them. A summary evaluates its rules only as far as its visitor asks for.
class SummaryTaskStateChanges {
  const TaskStateRuleList* rules;

  TaskStateChangeFilter filter;

  /// The maximum number of changes to report, or 0 for no limit.
  unsigned maxReportedChanges;

  bool accepts(const TaskStateChanges& rule) const;

public:
  SummaryTaskStateChanges(const TaskStateRuleList& rules,
                          TaskStateChangeFilter filter,
                          unsigned maxReportedChanges = 0)
      : rules(&rules), filter(filter),
        maxReportedChanges(maxReportedChanges) {}

  /// Visit the changes of all accepted rules, in rule order.
  ///
  /// The visit ends once the visitor returns false or once the maximum
  /// number of changes has been reported.
  ///
  /// \returns False if the visitor stopped the visit.
  bool visitChanges(TaskStateChangeVisitor visitor) const;

  /// Check if any accepted rule reports a change, stopping at the first one.
  bool hasChanges() const;

  /// Collect the reported changes.
  std::vector<TaskStateChange> getChanges() const;
};

}
}

#endif
