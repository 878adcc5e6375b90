//===-- TaskHistoryRepository.cpp -----------------------------------------===//
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

#include "taskstate/State/TaskHistoryRepository.h"

#include "taskstate/State/TaskHistoryStore.h"

using namespace taskstate;
using namespace taskstate::state;

TaskHistory::TaskHistory(TaskHistoryStore& store, StringRef taskPath,
                         std::unique_ptr<TaskExecution> previous)
    : store(store), taskPath(taskPath.str()), hasPrevious(previous != nullptr)
{
  if (previous)
    previousExecution = std::move(*previous);
  currentExecution.taskPath = this->taskPath;
}

bool TaskHistory::update(std::string* error_out) {
  currentExecution.cacheKey = currentExecution.calculateCacheKey();
  return store.setExecution(taskPath, currentExecution, error_out);
}

std::unique_ptr<TaskHistory>
TaskHistoryRepository::getHistory(StringRef taskPath, std::string* error_out) {
  auto previous = std::make_unique<TaskExecution>();
  std::string error;
  bool found = store.lookupExecution(taskPath, previous.get(), &error);
  if (!error.empty()) {
    *error_out = std::move(error);
    return nullptr;
  }
  if (!found)
    previous.reset();

  return std::make_unique<TaskHistory>(store, taskPath, std::move(previous));
}
