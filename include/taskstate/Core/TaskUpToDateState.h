//===- TaskUpToDateState.h --------------------------------------*- C++ -*-===//
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

#ifndef TASKSTATE_CORE_TASKUPTODATESTATE_H
#define TASKSTATE_CORE_TASKUPTODATESTATE_H

#include "taskstate/Basic/LLVM.h"
#include "taskstate/Core/TaskStateChanges.h"
#include "taskstate/State/TaskDescription.h"

#include <memory>
#include <string>
#include <vector>

namespace taskstate {
namespace state {
class FileCollectionSnapshotter;
class TaskHistory;
class TaskImplementationHasher;
}

namespace core {

/// The snapshotters and hasher used to capture the current state of a task.
struct TaskStateCollaborators {
  state::FileCollectionSnapshotter& inputSnapshotter;
  state::FileCollectionSnapshotter& outputSnapshotter;
  state::FileCollectionSnapshotter& discoveredInputSnapshotter;
  state::TaskImplementationHasher& implementationHasher;
};

/// The decision engine for one task in one build.
///
/// Creating the engine captures the current state of the task into the
/// current execution of its history; the change rules then compare it with
/// the previous execution.
class TaskUpToDateState {
  state::TaskDescription task;

  state::TaskHistory& history;

  TaskStateCollaborators collaborators;

  TaskStateFacts facts;

  TaskStateRuleList rules;

  /// The paths of the discovered inputs of this execution.
  std::vector<std::string> discoveredInputs;

  TaskUpToDateState(const state::TaskDescription& task,
                    state::TaskHistory& history,
                    const TaskStateCollaborators& collaborators);

  bool snapshotCurrentState(std::string* error_out);

  bool snapshotDiscoveredInputs(std::string* error_out);

public:
  ~TaskUpToDateState();

  /// Create the engine, snapshotting the inputs, the outputs as they stand
  /// before the task executes, and the inputs discovered by the previous
  /// execution.
  ///
  /// \param error_out [out] Error string if the result is null.
  static std::unique_ptr<TaskUpToDateState>
  create(const state::TaskDescription& task, state::TaskHistory& history,
         const TaskStateCollaborators& collaborators, std::string* error_out);

  const state::TaskDescription& getTask() const { return task; }

  /// Get every change, in rule order.
  SummaryTaskStateChanges getAllTaskChanges(
      unsigned maxReportedChanges = 0) const {
    return SummaryTaskStateChanges(rules, TaskStateChangeFilter::AllChanges,
                                   maxReportedChanges);
  }

  /// Get the changes which prevent incremental execution.
  SummaryTaskStateChanges getRebuildChanges() const {
    return SummaryTaskStateChanges(rules,
                                   TaskStateChangeFilter::RebuildChanges);
  }

  /// Get the changes to input files and discovered inputs.
  SummaryTaskStateChanges getInputFilesChanges() const {
    return SummaryTaskStateChanges(rules,
                                   TaskStateChangeFilter::IncrementalChanges);
  }

  /// Get the existing input files of the current execution, sorted and
  /// without duplicates.
  std::vector<std::string> getCurrentInputFiles() const;

  /// Replace the discovered inputs of this execution.
  void newInputs(const std::vector<std::string>& paths);

  /// Capture the outputs and discovered inputs after the task has executed.
  ///
  /// \param error_out [out] Error string if return value is false.
  bool snapshotAfterTask(std::string* error_out);
};

}
}

#endif
