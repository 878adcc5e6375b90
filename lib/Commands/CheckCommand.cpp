//===-- CheckCommand.cpp --------------------------------------------------===//
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

#include "taskstate/Commands/Commands.h"

#include "taskstate/Basic/FileSystem.h"
#include "taskstate/Commands/TaskStateInvocation.h"
#include "taskstate/Core/TaskArtifactState.h"
#include "taskstate/State/FileCollectionSnapshotter.h"
#include "taskstate/State/TaskHistoryRepository.h"
#include "taskstate/State/TaskHistoryStore.h"

#include "CommandUtil.h"

#include "llvm/Support/SourceMgr.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdio>
#include <cstdlib>

using namespace taskstate;
using namespace taskstate::commands;
using namespace taskstate::core;
using namespace taskstate::state;

namespace {

class CheckCommandDelegate : public TaskArtifactStateDelegate {
  unsigned numErrors = 0;

public:
  unsigned getNumErrors() const { return numErrors; }

  virtual void error(const Twine& message) override {
    ++numErrors;
    fprintf(stderr, "error: %s: %s\n", getProgramName(),
            message.str().c_str());
  }
};

static void checkUsage(int exitCode) {
  int optionWidth = 28;
  fprintf(stderr, "Usage: %s check [options]\n", getProgramName());
  fprintf(stderr, "\nOptions:\n");
  TaskStateInvocation::getUsage(optionWidth, llvm::errs());
  llvm::errs().flush();
  ::exit(exitCode);
}

/// Report an error which was already diagnosed through the delegate.
static int reportedFailure(llvm::Error error) {
  llvm::consumeError(std::move(error));
  return 1;
}

}

int commands::executeCheckCommand(const std::vector<std::string>& args) {
  llvm::SourceMgr sourceMgr;
  TaskStateInvocation invocation;
  invocation.parse(args, sourceMgr);

  if (invocation.showUsage)
    checkUsage(0);
  if (invocation.hadErrors) {
    fprintf(stderr, "\n");
    checkUsage(1);
  }

  std::string error;
  auto store = util::openHistoryStore(invocation.dbPath, &error);
  if (!store) {
    fprintf(stderr, "error: %s: unable to open task history: %s\n",
            getProgramName(), error.c_str());
    return 1;
  }
  if (!store->buildStarted(&error)) {
    fprintf(stderr, "error: %s: %s\n", getProgramName(), error.c_str());
    return 1;
  }

  auto fileSystem = basic::createLocalFileSystem();
  auto snapshotter = createLocalFileCollectionSnapshotter(*fileSystem);
  auto hasher = createVersionedImplementationHasher(
      invocation.implementationVersion);

  TaskHistoryRepository historyRepository(*store);
  CheckCommandDelegate delegate;
  TaskArtifactStateRepository::Options options;
  options.maxReportedChanges = invocation.maxReportedChanges;
  TaskArtifactStateRepository repository(
      historyRepository,
      TaskStateCollaborators{*snapshotter, *snapshotter, *snapshotter,
                             *hasher},
      delegate, options);

  if (!invocation.traceFilePath.empty()) {
    if (!repository.enableTracing(invocation.traceFilePath, &error)) {
      fprintf(stderr, "error: %s: unable to enable tracing: %s\n",
              getProgramName(), error.c_str());
      return 1;
    }
  }

  auto stateOrErr = repository.getStateFor(invocation.getTaskDescription());
  if (!stateOrErr)
    return reportedFailure(stateOrErr.takeError());
  auto& state = **stateOrErr;

  state.beforeTask();

  std::vector<std::string> messages;
  auto upToDateOrErr = state.isUpToDate(&messages);
  if (!upToDateOrErr)
    return reportedFailure(upToDateOrErr.takeError());

  auto& os = llvm::outs();
  if (*upToDateOrErr) {
    os << "up-to-date\n";
  } else {
    os << "out-of-date\n";
    for (const auto& message: messages)
      os << "  " << message << "\n";

    auto inputsOrErr = state.getInputChanges();
    if (!inputsOrErr)
      return reportedFailure(inputsOrErr.takeError());
    IncrementalTaskInputs& inputs = *inputsOrErr;

    os << "mode: " << (inputs.isIncremental() ? "incremental" : "rebuild")
       << "\n";
    auto outOfDateErr = inputs.outOfDate([&](const TaskStateChange& change) {
        os << "  out-of-date: " << change.getPath() << "\n";
      });
    if (outOfDateErr) {
      delegate.error(llvm::toString(std::move(outOfDateErr)));
      return 1;
    }
    auto removedErr = inputs.removed([&](const TaskStateChange& change) {
        os << "  removed: " << change.getPath() << "\n";
      });
    if (removedErr) {
      delegate.error(llvm::toString(std::move(removedErr)));
      return 1;
    }

    for (const auto& path: invocation.discoveredInputs)
      inputs.newInput(path);
  }

  auto keyOrErr = state.calculateCacheKey();
  if (!keyOrErr)
    return reportedFailure(keyOrErr.takeError());
  os << "cache-key: " << keyOrErr->str() << "\n";

  if (invocation.commit) {
    if (auto err = state.afterTask(!invocation.failed))
      return reportedFailure(std::move(err));
    if (!*upToDateOrErr)
      os << "committed\n";
  }
  os << "state: " << getSessionStateName(state.getSessionState()) << "\n";

  state.finished();
  os.flush();

  if (!store->buildComplete(&error)) {
    fprintf(stderr, "error: %s: %s\n", getProgramName(), error.c_str());
    return 1;
  }

  return delegate.getNumErrors() ? 1 : 0;
}
