//===-- TaskArtifactState.cpp ---------------------------------------------===//
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

#include "taskstate/Core/TaskArtifactState.h"

#include "taskstate/Core/TaskStateTrace.h"
#include "taskstate/State/TaskHistoryRepository.h"

#include "llvm/Support/raw_ostream.h"

using namespace taskstate;
using namespace taskstate::core;
using namespace taskstate::state;

TaskArtifactStateDelegate::~TaskArtifactStateDelegate() {}

char InvalidStateError::ID = 0;

void InvalidStateError::log(raw_ostream& os) const {
  os << "invalid state for " << operation << ": " << reason;
}

StringRef core::getSessionStateName(TaskArtifactState::SessionState state) {
  switch (state) {
  case TaskArtifactState::SessionState::Fresh:
    return "fresh";
  case TaskArtifactState::SessionState::UpToDate:
    return "up-to-date";
  case TaskArtifactState::SessionState::ExecutionPending:
    return "execution-pending";
  case TaskArtifactState::SessionState::Finalized:
    return "finalized";
  case TaskArtifactState::SessionState::Failed:
    return "failed";
  case TaskArtifactState::SessionState::Finished:
    return "finished";
  }
  return "unknown";
}

/// Describe why an operation is not permitted in the given state.
static StringRef getRejectionReason(TaskArtifactState::SessionState state) {
  switch (state) {
  case TaskArtifactState::SessionState::Fresh:
    return "no state computed";
  case TaskArtifactState::SessionState::UpToDate:
    return "task is up-to-date";
  case TaskArtifactState::SessionState::ExecutionPending:
    return "task execution is pending";
  case TaskArtifactState::SessionState::Finalized:
    return "task execution has already been recorded";
  case TaskArtifactState::SessionState::Failed:
    return "session has failed";
  case TaskArtifactState::SessionState::Finished:
    return "session has finished";
  }
  return "unknown state";
}

#pragma mark - TaskArtifactState

TaskArtifactState::TaskArtifactState(TaskArtifactStateRepository& repository,
                                     const TaskDescription& task,
                                     std::unique_ptr<TaskHistory> history)
    : repository(repository), task(task), history(std::move(history)) {}

TaskArtifactState::~TaskArtifactState() {}

llvm::Error TaskArtifactState::reject(StringRef operation, StringRef reason) {
  repository.delegate.error("invalid state for " + operation + ": " + reason);
  sessionState = SessionState::Failed;
  if (repository.trace)
    repository.trace->sessionFailed(task.path);
  return llvm::make_error<InvalidStateError>(operation, reason);
}

llvm::Error TaskArtifactState::fail(const std::string& message) {
  repository.delegate.error(message);
  sessionState = SessionState::Failed;
  if (repository.trace)
    repository.trace->sessionFailed(task.path);
  return llvm::make_error<llvm::StringError>(message,
                                             llvm::inconvertibleErrorCode());
}

llvm::Expected<TaskUpToDateState*> TaskArtifactState::getStates() {
  if (!states) {
    std::string error;
    states = TaskUpToDateState::create(task, *history,
                                       repository.collaborators, &error);
    if (!states)
      return fail(error);
  }
  return states.get();
}

llvm::Expected<bool>
TaskArtifactState::isUpToDate(std::vector<std::string>* messages) {
  switch (sessionState) {
  case SessionState::UpToDate:
    return true;
  case SessionState::Fresh:
  case SessionState::ExecutionPending:
    break;
  default:
    return reject("isUpToDate", getRejectionReason(sessionState));
  }

  auto statesOrErr = getStates();
  if (!statesOrErr)
    return statesOrErr.takeError();
  TaskUpToDateState* engine = *statesOrErr;

  unsigned numChanges = 0;
  if (messages) {
    engine->getAllTaskChanges(repository.options.maxReportedChanges)
      .visitChanges([&](const TaskStateChange& change) {
          messages->push_back(change.getMessage());
          ++numChanges;
          return true;
        });
  } else if (engine->getAllTaskChanges().hasChanges()) {
    numChanges = 1;
  }
  bool upToDate = numChanges == 0;

  // Once the input view has been handed out the task is committed to
  // executing.
  if (!upToDate)
    sessionState = SessionState::ExecutionPending;
  else if (!inputs)
    sessionState = SessionState::UpToDate;

  if (repository.trace)
    repository.trace->checkedUpToDate(task.path, upToDate, numChanges);
  return upToDate;
}

llvm::Expected<IncrementalTaskInputs&> TaskArtifactState::getInputChanges() {
  switch (sessionState) {
  case SessionState::Fresh:
  case SessionState::ExecutionPending:
    break;
  default:
    return reject("getInputChanges", getRejectionReason(sessionState));
  }

  if (inputs)
    return *inputs;

  auto statesOrErr = getStates();
  if (!statesOrErr)
    return statesOrErr.takeError();
  TaskUpToDateState* engine = *statesOrErr;

  if (engine->getRebuildChanges().hasChanges()) {
    inputs = std::make_unique<RebuildIncrementalTaskInputs>(
        engine->getCurrentInputFiles());
  } else {
    inputs = std::make_unique<ChangesOnlyIncrementalTaskInputs>(
        engine->getInputFilesChanges().getChanges());
  }
  sessionState = SessionState::ExecutionPending;

  if (repository.trace)
    repository.trace->computedInputChanges(task.path, inputs->isIncremental(),
                                           inputs->getChanges().size());
  return *inputs;
}

llvm::Expected<TaskCacheKey> TaskArtifactState::calculateCacheKey() {
  if (sessionState == SessionState::Failed ||
      sessionState == SessionState::Finished)
    return reject("calculateCacheKey", getRejectionReason(sessionState));

  // The key describes the current state, which only exists once the engine
  // has captured it.
  auto statesOrErr = getStates();
  if (!statesOrErr)
    return statesOrErr.takeError();

  TaskCacheKey key = history->getCurrentExecution().calculateCacheKey();
  if (repository.trace)
    repository.trace->computedCacheKey(task.path, key.str());
  return key;
}

llvm::Expected<FileSet>
TaskArtifactState::getOutputFiles(StringRef propertyName) {
  if (sessionState == SessionState::Failed ||
      sessionState == SessionState::Finished)
    return reject("getOutputFiles", getRejectionReason(sessionState));

  std::string name = (Twine("Task ") + task.path + " " + propertyName +
                      " outputs").str();

  std::vector<std::string> paths;
  if (const TaskExecution* previous = history->getPreviousExecution()) {
    auto it = previous->outputFileSnapshots.find(propertyName.str());
    if (it != previous->outputFileSnapshots.end())
      paths = it->second.getFiles();
  }
  return FileSet(name, std::move(paths));
}

llvm::Error TaskArtifactState::afterTask(bool successful) {
  switch (sessionState) {
  case SessionState::UpToDate:
    return llvm::Error::success();
  case SessionState::ExecutionPending:
    break;
  case SessionState::Fresh:
    // A cache key lookup computes the state without deciding anything.
    if (!states)
      return reject("afterTask", getRejectionReason(sessionState));
    sessionState = SessionState::ExecutionPending;
    break;
  case SessionState::Finalized:
    return reject("afterTask", "called twice");
  default:
    return reject("afterTask", getRejectionReason(sessionState));
  }

  // Inputs discovered by the task body replace the previous ones.
  if (inputs)
    states->newInputs(inputs->getDiscoveredInputs());

  std::string error;
  if (!states->snapshotAfterTask(&error))
    return fail(error);

  history->getCurrentExecution().successful = successful;
  if (!history->update(&error))
    return fail(error);

  sessionState = SessionState::Finalized;
  if (repository.trace)
    repository.trace->committedExecution(task.path, successful);
  return llvm::Error::success();
}

void TaskArtifactState::finished() {
  sessionState = SessionState::Finished;
  if (repository.trace)
    repository.trace->sessionFinished(task.path);
}

#pragma mark - TaskArtifactStateRepository

TaskArtifactStateRepository::TaskArtifactStateRepository(
    TaskHistoryRepository& historyRepository,
    const TaskStateCollaborators& collaborators,
    TaskArtifactStateDelegate& delegate, Options options)
    : historyRepository(historyRepository), collaborators(collaborators),
      delegate(delegate), options(options) {}

TaskArtifactStateRepository::~TaskArtifactStateRepository() {}

uint32_t TaskArtifactStateRepository::getSchemaVersion() {
  // Version History:
  // * 1: Initial execution record layout.
  return 1;
}

bool TaskArtifactStateRepository::enableTracing(const std::string& path,
                                                std::string* error_out) {
  auto trace = std::make_unique<TaskStateTrace>();

  if (!trace->open(path, error_out))
    return false;

  this->trace = std::move(trace);
  return true;
}

llvm::Expected<std::unique_ptr<TaskArtifactState>>
TaskArtifactStateRepository::getStateFor(const TaskDescription& task) {
  std::string error;
  auto history = historyRepository.getHistory(task.path, &error);
  if (!history) {
    delegate.error(error);
    return llvm::make_error<llvm::StringError>(
        error, llvm::inconvertibleErrorCode());
  }

  bool hasHistory = history->getPreviousExecution() != nullptr;
  std::unique_ptr<TaskArtifactState> state(
      new TaskArtifactState(*this, task, std::move(history)));
  if (trace)
    trace->sessionCreated(task.path, hasHistory);
  return std::move(state);
}
