//===-- TaskUpToDateState.cpp ---------------------------------------------===//
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

#include "taskstate/Core/TaskUpToDateState.h"

#include "taskstate/State/FileCollectionSnapshotter.h"
#include "taskstate/State/TaskHistoryRepository.h"

#include <algorithm>

using namespace taskstate;
using namespace taskstate::basic;
using namespace taskstate::core;
using namespace taskstate::state;

TaskUpToDateState::TaskUpToDateState(
    const TaskDescription& task, TaskHistory& history,
    const TaskStateCollaborators& collaborators)
    : task(task), history(history), collaborators(collaborators)
{
  facts.taskPath = task.path;
  facts.previous = history.getPreviousExecution();
  facts.current = &history.getCurrentExecution();
  rules = createTaskStateRules(facts);

  // Unless the task reports otherwise, it depends on the same discovered
  // inputs as last time.
  if (facts.previous) {
    for (const auto& entry:
           facts.previous->discoveredInputSnapshot.getSnapshots())
      discoveredInputs.push_back(entry.first);
  }
}

TaskUpToDateState::~TaskUpToDateState() {}

std::unique_ptr<TaskUpToDateState>
TaskUpToDateState::create(const TaskDescription& task, TaskHistory& history,
                          const TaskStateCollaborators& collaborators,
                          std::string* error_out) {
  std::unique_ptr<TaskUpToDateState> result(
      new TaskUpToDateState(task, history, collaborators));
  if (!result->snapshotCurrentState(error_out))
    return nullptr;
  return result;
}

bool TaskUpToDateState::snapshotCurrentState(std::string* error_out) {
  TaskExecution& current = history.getCurrentExecution();

  current.taskType = task.type;
  current.implementationHash =
    collaborators.implementationHasher.getImplementationHash(task);

  current.inputPropertyHashes.clear();
  for (const auto& entry: task.inputProperties)
    current.inputPropertyHashes[entry.first] = hashString(entry.second);

  current.inputFileSnapshots.clear();
  for (const auto& entry: task.inputFiles) {
    FileCollectionSnapshot snapshot;
    if (!collaborators.inputSnapshotter.snapshot(entry.second, &snapshot,
                                                 error_out))
      return false;
    current.inputFileSnapshots[entry.first] = std::move(snapshot);
  }

  current.outputPropertyNames.clear();
  facts.outputsBeforeTask.clear();
  for (const auto& entry: task.outputFiles) {
    current.outputPropertyNames.insert(entry.first);

    FileCollectionSnapshot snapshot;
    if (!collaborators.outputSnapshotter.snapshot(entry.second, &snapshot,
                                                  error_out))
      return false;
    facts.outputsBeforeTask[entry.first] = std::move(snapshot);
  }

  return snapshotDiscoveredInputs(error_out);
}

bool TaskUpToDateState::snapshotDiscoveredInputs(std::string* error_out) {
  FileCollectionSnapshot snapshot;
  if (!discoveredInputs.empty()) {
    if (!collaborators.discoveredInputSnapshotter.snapshot(
            FileCollectionSpec(discoveredInputs), &snapshot, error_out))
      return false;
  }
  history.getCurrentExecution().discoveredInputSnapshot = std::move(snapshot);
  return true;
}

std::vector<std::string> TaskUpToDateState::getCurrentInputFiles() const {
  std::vector<std::string> result;
  for (const auto& entry: facts.current->inputFileSnapshots) {
    auto files = entry.second.getFiles();
    result.insert(result.end(), files.begin(), files.end());
  }
  std::sort(result.begin(), result.end());
  result.erase(std::unique(result.begin(), result.end()), result.end());
  return result;
}

void TaskUpToDateState::newInputs(const std::vector<std::string>& paths) {
  discoveredInputs = paths;
}

bool TaskUpToDateState::snapshotAfterTask(std::string* error_out) {
  TaskExecution& current = history.getCurrentExecution();

  current.outputFileSnapshots.clear();
  for (const auto& entry: task.outputFiles) {
    FileCollectionSnapshot snapshot;
    if (!collaborators.outputSnapshotter.snapshot(entry.second, &snapshot,
                                                  error_out))
      return false;
    current.outputFileSnapshots[entry.first] = std::move(snapshot);
  }

  return snapshotDiscoveredInputs(error_out);
}
