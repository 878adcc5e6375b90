//===- TaskArtifactState.h --------------------------------------*- C++ -*-===//
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

#ifndef TASKSTATE_CORE_TASKARTIFACTSTATE_H
#define TASKSTATE_CORE_TASKARTIFACTSTATE_H

#include "taskstate/Basic/LLVM.h"
#include "taskstate/Core/FileSet.h"
#include "taskstate/Core/IncrementalTaskInputs.h"
#include "taskstate/Core/TaskUpToDateState.h"
#include "taskstate/State/TaskCacheKey.h"
#include "taskstate/State/TaskDescription.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace taskstate {
namespace state {
class TaskHistory;
class TaskHistoryRepository;
}

namespace core {

class TaskArtifactStateRepository;
class TaskStateTrace;

/// Delegate interface for clients of the artifact state engine.
class TaskArtifactStateDelegate {
public:
  virtual ~TaskArtifactStateDelegate();

  /// Called when a session is misused, or when a collaborator fails.
  virtual void error(const Twine& message) = 0;
};

/// The error returned when a session operation is invoked in a state which
/// does not permit it.
class InvalidStateError : public llvm::ErrorInfo<InvalidStateError> {
  std::string operation;
  std::string reason;

public:
  static char ID;

  InvalidStateError(StringRef operation, StringRef reason)
      : operation(operation.str()), reason(reason.str()) {}

  const std::string& getOperation() const { return operation; }
  const std::string& getReason() const { return reason; }

  void log(raw_ostream& os) const override;

  std::error_code convertToErrorCode() const override {
    return llvm::inconvertibleErrorCode();
  }
};

/// The per-task, per-build session of the artifact state engine.
///
/// A session is used from one thread at a time. The expected sequence is
/// \see beforeTask(), any number of queries, the task body (if the task is not
/// up-to-date), \see afterTask() and finally \see finished().
class TaskArtifactState {
public:
  enum class SessionState {
    /// Nothing has been decided yet.
    Fresh,

    /// The task was found up-to-date and will not execute.
    UpToDate,

    /// The task will execute.
    ExecutionPending,

    /// The execution has been recorded.
    Finalized,

    /// An operation failed or was misused; the session is unusable.
    Failed,

    /// The session has ended.
    Finished,
  };

private:
  TaskArtifactStateRepository& repository;

  state::TaskDescription task;

  std::unique_ptr<state::TaskHistory> history;

  /// The decision engine, created on first need.
  std::unique_ptr<TaskUpToDateState> states;

  /// The input view, created on first request.
  std::unique_ptr<IncrementalTaskInputs> inputs;

  SessionState sessionState = SessionState::Fresh;

  TaskArtifactState(TaskArtifactStateRepository& repository,
                    const state::TaskDescription& task,
                    std::unique_ptr<state::TaskHistory> history);

  llvm::Expected<TaskUpToDateState*> getStates();

  /// Report misuse and move to the failed state.
  llvm::Error reject(StringRef operation, StringRef reason);

  /// Report a collaborator failure and move to the failed state.
  llvm::Error fail(const std::string& message);

  friend class TaskArtifactStateRepository;

public:
  ~TaskArtifactState();

  const state::TaskDescription& getTask() const { return task; }

  SessionState getSessionState() const { return sessionState; }

  /// Get the history of the task.
  const state::TaskHistory& getHistory() const { return *history; }

  /// Check if the task is up-to-date.
  ///
  /// \param messages If given, the messages of every detected change (up to
  /// the configured limit) are appended.
  llvm::Expected<bool> isUpToDate(std::vector<std::string>* messages = nullptr);

  /// Get the view of the input changes for a task which is about to execute.
  ///
  /// The view is incremental unless a rebuild-forcing change was detected.
  /// Repeated calls return the same view.
  llvm::Expected<IncrementalTaskInputs&> getInputChanges();

  /// Compute the cache key of the current input state.
  llvm::Expected<state::TaskCacheKey> calculateCacheKey();

  /// Get the files the previous execution recorded for an output property.
  ///
  /// The result is empty if there is no such record.
  llvm::Expected<FileSet> getOutputFiles(StringRef propertyName);

  void beforeTask() {}

  /// Record the execution of the task.
  ///
  /// This does nothing if the task was up-to-date.
  ///
  /// \param successful Whether the task body completed successfully.
  llvm::Error afterTask(bool successful = true);

  /// End the session.
  void finished();
};

StringRef getSessionStateName(TaskArtifactState::SessionState state);

/// Hands out artifact state sessions.
class TaskArtifactStateRepository {
public:
  struct Options {
    /// The maximum number of change messages collected by an up-to-date
    /// check, or 0 for no limit.
    unsigned maxReportedChanges;

    Options() : maxReportedChanges(0) {}
  };

private:
  state::TaskHistoryRepository& historyRepository;

  TaskStateCollaborators collaborators;

  TaskArtifactStateDelegate& delegate;

  Options options;

  std::unique_ptr<TaskStateTrace> trace;

  friend class TaskArtifactState;

public:
  TaskArtifactStateRepository(state::TaskHistoryRepository& historyRepository,
                              const TaskStateCollaborators& collaborators,
                              TaskArtifactStateDelegate& delegate,
                              Options options = Options());
  ~TaskArtifactStateRepository();

  /// Get the client schema version of the records written by the engine.
  static uint32_t getSchemaVersion();

  TaskArtifactStateDelegate& getDelegate() { return delegate; }

  const Options& getOptions() const { return options; }

  /// Enable tracing into the given output file.
  ///
  /// \returns True on success.
  bool enableTracing(const std::string& path, std::string* error_out);

  /// Create the session for a task.
  llvm::Expected<std::unique_ptr<TaskArtifactState>>
  getStateFor(const state::TaskDescription& task);
};

}
}

#endif
