//===- IncrementalTaskInputs.h ----------------------------------*- C++ -*-===//
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

#ifndef TASKSTATE_CORE_INCREMENTALTASKINPUTS_H
#define TASKSTATE_CORE_INCREMENTALTASKINPUTS_H

#include "taskstate/Basic/LLVM.h"
#include "taskstate/Core/TaskStateChange.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/Support/Error.h"

#include <string>
#include <vector>

namespace taskstate {
namespace core {

/// The view of input changes handed to a task body which is about to execute.
///
/// The body first processes the out of date inputs, and then the removed ones.
/// Each may be processed at most once.
class IncrementalTaskInputs {
  std::vector<TaskStateChange> changes;

  std::vector<std::string> discoveredInputs;

  bool outOfDateProcessed = false;
  bool removedProcessed = false;

protected:
  explicit IncrementalTaskInputs(std::vector<TaskStateChange> changes)
      : changes(std::move(changes)) {}

public:
  virtual ~IncrementalTaskInputs();

  /// Whether only the changed inputs need processing.
  ///
  /// If false, every input is reported as out of date.
  virtual bool isIncremental() const = 0;

  /// Visit the inputs which were added or modified.
  llvm::Error outOfDate(function_ref<void(const TaskStateChange&)> visitor);

  /// Visit the inputs which were removed.
  ///
  /// This may only be called after \see outOfDate().
  llvm::Error removed(function_ref<void(const TaskStateChange&)> visitor);

  /// Get the changes this view was created with.
  ArrayRef<TaskStateChange> getChanges() const { return changes; }

  /// Record an input discovered while executing the task.
  void newInput(StringRef path) { discoveredInputs.push_back(path.str()); }

  /// Get the inputs discovered while executing the task.
  const std::vector<std::string>& getDiscoveredInputs() const {
    return discoveredInputs;
  }
};

/// The view used when only the changed inputs need processing.
class ChangesOnlyIncrementalTaskInputs : public IncrementalTaskInputs {
public:
  explicit ChangesOnlyIncrementalTaskInputs(
      std::vector<TaskStateChange> changes)
      : IncrementalTaskInputs(std::move(changes)) {}

  virtual bool isIncremental() const override { return true; }
};

/// The view used when all inputs need processing.
///
/// Every existing input file is reported as added, and no removals are
/// reported.
class RebuildIncrementalTaskInputs : public IncrementalTaskInputs {
  static std::vector<TaskStateChange>
  makeChanges(const std::vector<std::string>& inputFiles);

public:
  explicit RebuildIncrementalTaskInputs(
      const std::vector<std::string>& inputFiles)
      : IncrementalTaskInputs(makeChanges(inputFiles)) {}

  virtual bool isIncremental() const override { return false; }
};

}
}

#endif
