//===- TaskHistoryRepository.h ----------------------------------*- C++ -*-===//
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

#ifndef TASKSTATE_STATE_TASKHISTORYREPOSITORY_H
#define TASKSTATE_STATE_TASKHISTORYREPOSITORY_H

#include "taskstate/Basic/LLVM.h"
#include "taskstate/State/TaskExecution.h"

#include "llvm/ADT/StringRef.h"

#include <memory>
#include <string>

namespace taskstate {
namespace state {

class TaskHistoryStore;

/// The history of a single task, as seen by one build.
///
/// The history holds the previous execution, as loaded when the history was
/// created, and the current execution which is filled in over the course of
/// the build.
class TaskHistory {
  TaskHistoryStore& store;

  std::string taskPath;

  bool hasPrevious;
  TaskExecution previousExecution;

  TaskExecution currentExecution;

public:
  TaskHistory(TaskHistoryStore& store, StringRef taskPath,
              std::unique_ptr<TaskExecution> previous);

  const std::string& getTaskPath() const { return taskPath; }

  /// Get the previous execution, or null if the task has never executed.
  const TaskExecution* getPreviousExecution() const {
    return hasPrevious ? &previousExecution : nullptr;
  }

  /// Get the execution for the current build.
  TaskExecution& getCurrentExecution() { return currentExecution; }
  const TaskExecution& getCurrentExecution() const { return currentExecution; }

  /// Persist the current execution as the new previous execution.
  ///
  /// The cache key of the current execution is resolved before it is stored.
  /// This does not change the result of \see getPreviousExecution().
  ///
  /// \param error_out [out] Error string if return value is false.
  bool update(std::string* error_out);
};

/// Hands out per-task histories backed by a store.
class TaskHistoryRepository {
  TaskHistoryStore& store;

public:
  explicit TaskHistoryRepository(TaskHistoryStore& store) : store(store) {}

  /// Load the history of a task.
  ///
  /// \param error_out [out] Error string if the result is null.
  /// \returns The history, or null if the store failed.
  std::unique_ptr<TaskHistory> getHistory(StringRef taskPath,
                                          std::string* error_out);
};

}
}

#endif
