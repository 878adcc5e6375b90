//===-- TaskArtifactStateTest.cpp -----------------------------------------===//
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

#include "taskstate/Basic/FileSystem.h"
#include "taskstate/State/FileCollectionSnapshotter.h"
#include "taskstate/State/TaskHistoryRepository.h"
#include "taskstate/State/TaskHistoryStore.h"

#include "../Support/TempDir.h"

#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"

#include "gtest/gtest.h"

#include <algorithm>
#include <functional>

using namespace taskstate;
using namespace taskstate::basic;
using namespace taskstate::core;
using namespace taskstate::state;

namespace {

class TestDelegate : public TaskArtifactStateDelegate {
public:
  std::vector<std::string> errors;

  virtual void error(const Twine& message) override {
    errors.push_back(message.str());
  }
};

class FailingSnapshotter : public FileCollectionSnapshotter {
public:
  virtual bool snapshot(const FileCollectionSpec&, FileCollectionSnapshot*,
                        std::string* error_out) override {
    *error_out = "unable to snapshot files";
    return false;
  }
};

template<typename T>
bool succeeded(llvm::Expected<T>& valueOrErr) {
  if (valueOrErr)
    return true;
  ADD_FAILURE() << llvm::toString(valueOrErr.takeError());
  return false;
}

template<typename T>
bool succeeded(llvm::Expected<T>&& valueOrErr) {
  return succeeded(valueOrErr);
}

std::string getErrorMessage(llvm::Error err) {
  if (!err)
    return "";
  return llvm::toString(std::move(err));
}

template<typename T>
std::string getErrorMessage(llvm::Expected<T>& valueOrErr) {
  if (valueOrErr)
    return "";
  return llvm::toString(valueOrErr.takeError());
}

class TaskArtifactStateTest : public ::testing::Test {
protected:
  TmpDir tempDir{"TaskArtifactStateTest"};
  std::unique_ptr<FileSystem> fs;
  std::unique_ptr<FileCollectionSnapshotter> snapshotter;
  std::unique_ptr<TaskImplementationHasher> hasher;
  std::unique_ptr<TaskHistoryStore> store;
  std::unique_ptr<TaskHistoryRepository> historyRepository;
  TestDelegate delegate;
  std::unique_ptr<TaskArtifactStateRepository> repository;

  virtual void SetUp() override {
    fs = createLocalFileSystem();
    snapshotter = createLocalFileCollectionSnapshotter(*fs);
    hasher = createVersionedImplementationHasher("1");
    store = createInMemoryTaskHistoryStore();
    historyRepository = std::make_unique<TaskHistoryRepository>(*store);
    createRepository(TaskArtifactStateRepository::Options());
  }

  void createRepository(TaskArtifactStateRepository::Options options) {
    repository = std::make_unique<TaskArtifactStateRepository>(
        *historyRepository,
        TaskStateCollaborators{ *snapshotter, *snapshotter, *snapshotter,
                                *hasher },
        delegate, options);
  }

  TaskDescription makeTask(StringRef path = ":compile") {
    TaskDescription task;
    task.path = path.str();
    task.type = "JavaCompile";
    task.inputProperties["mode"] = "fast";
    task.inputProperties["target"] = "1.8";
    task.inputFiles["sources"] = FileCollectionSpec({ tempDir.path("src") });
    task.outputFiles["classes"] = FileCollectionSpec({
        tempDir.path("classes") });
    return task;
  }

  std::unique_ptr<TaskArtifactState> getState(const TaskDescription& task) {
    auto stateOrErr = repository->getStateFor(task);
    if (!succeeded(stateOrErr))
      return nullptr;
    return std::move(*stateOrErr);
  }

  /// Run a complete session for the task, invoking \p body if the task is
  /// out-of-date, and return whether the task was up-to-date.
  bool runTask(const TaskDescription& task,
               std::function<void(IncrementalTaskInputs&)> body = nullptr) {
    auto state = getState(task);
    if (!state)
      return false;

    auto upToDate = state->isUpToDate();
    if (!succeeded(upToDate))
      return false;
    if (!*upToDate) {
      auto inputs = state->getInputChanges();
      if (!succeeded(inputs))
        return false;
      if (body)
        body(*inputs);
    }
    EXPECT_EQ("", getErrorMessage(state->afterTask()));
    state->finished();
    return *upToDate;
  }

  bool checkUpToDate(TaskArtifactState& state) {
    auto upToDate = state.isUpToDate();
    if (!succeeded(upToDate))
      return false;
    return *upToDate;
  }

  std::vector<std::string> getMessages(TaskArtifactState& state) {
    std::vector<std::string> messages;
    auto upToDate = state.isUpToDate(&messages);
    if (!succeeded(upToDate))
      return {};
    EXPECT_EQ(messages.empty(), *upToDate);
    return messages;
  }

  void writeClasses() {
    tempDir.writeFile("classes/A.class", "A.class");
    tempDir.writeFile("classes/pkg/B.class", "B.class");
  }
};

TEST_F(TaskArtifactStateTest, noHistory) {
  std::string a = tempDir.writeFile("src/A.java", "class A {}");
  std::string b = tempDir.writeFile("src/B.java", "class B {}");

  auto state = getState(makeTask());
  ASSERT_TRUE(state != nullptr);
  EXPECT_EQ(TaskArtifactState::SessionState::Fresh, state->getSessionState());
  EXPECT_EQ(nullptr, state->getHistory().getPreviousExecution());

  EXPECT_EQ(std::vector<std::string>({ "No history is available." }),
            getMessages(*state));
  EXPECT_EQ(TaskArtifactState::SessionState::ExecutionPending,
            state->getSessionState());

  auto inputs = state->getInputChanges();
  ASSERT_TRUE(succeeded(inputs));
  EXPECT_FALSE(inputs->isIncremental());
  ASSERT_EQ(2u, inputs->getChanges().size());
  EXPECT_EQ(TaskStateChange(ChangeKind::Added, a,
                            "Input file " + a + " is out of date.", false),
            inputs->getChanges()[0]);
  EXPECT_EQ(b, inputs->getChanges()[1].getPath());

  // The view is computed once per session.
  auto again = state->getInputChanges();
  ASSERT_TRUE(succeeded(again));
  EXPECT_EQ(&*inputs, &*again);

  writeClasses();
  EXPECT_EQ("", getErrorMessage(state->afterTask()));
  EXPECT_EQ(TaskArtifactState::SessionState::Finalized,
            state->getSessionState());
  state->finished();
  EXPECT_EQ(TaskArtifactState::SessionState::Finished,
            state->getSessionState());

  TaskExecution record;
  std::string error;
  ASSERT_TRUE(store->lookupExecution(":compile", &record, &error));
  EXPECT_EQ("JavaCompile", record.taskType);
  EXPECT_TRUE(record.successful);
  EXPECT_TRUE(record.cacheKey.isValid());
  EXPECT_EQ(2u, record.outputFileSnapshots["classes"].getFiles().size());
  EXPECT_TRUE(delegate.errors.empty());
}

TEST_F(TaskArtifactStateTest, upToDate) {
  tempDir.writeFile("src/A.java", "class A {}");
  EXPECT_FALSE(runTask(makeTask(), [&](IncrementalTaskInputs&) {
        writeClasses();
      }));

  TaskExecution before;
  std::string error;
  ASSERT_TRUE(store->lookupExecution(":compile", &before, &error));

  auto state = getState(makeTask());
  ASSERT_TRUE(state != nullptr);
  EXPECT_TRUE(getMessages(*state).empty());
  EXPECT_EQ(TaskArtifactState::SessionState::UpToDate,
            state->getSessionState());

  // Asking again does not recompute.
  auto upToDate = state->isUpToDate();
  ASSERT_TRUE(succeeded(upToDate));
  EXPECT_TRUE(*upToDate);

  EXPECT_EQ("", getErrorMessage(state->afterTask()));
  EXPECT_EQ(TaskArtifactState::SessionState::UpToDate,
            state->getSessionState());

  TaskExecution after;
  ASSERT_TRUE(store->lookupExecution(":compile", &after, &error));
  EXPECT_EQ(before, after);
  EXPECT_TRUE(delegate.errors.empty());
}

TEST_F(TaskArtifactStateTest, inputChangesAfterUpToDate) {
  tempDir.writeFile("src/A.java", "class A {}");
  runTask(makeTask());

  auto state = getState(makeTask());
  ASSERT_TRUE(state != nullptr);
  auto upToDate = state->isUpToDate();
  ASSERT_TRUE(succeeded(upToDate));
  EXPECT_TRUE(*upToDate);

  auto inputs = state->getInputChanges();
  ASSERT_FALSE(bool(inputs));
  EXPECT_TRUE(inputs.errorIsA<InvalidStateError>());
  EXPECT_EQ("invalid state for getInputChanges: task is up-to-date",
            getErrorMessage(inputs));
  EXPECT_EQ(std::vector<std::string>({
        "invalid state for getInputChanges: task is up-to-date" }),
    delegate.errors);
  EXPECT_EQ(TaskArtifactState::SessionState::Failed, state->getSessionState());

  // A failed session rejects everything.
  auto key = state->calculateCacheKey();
  EXPECT_EQ("invalid state for calculateCacheKey: session has failed",
            getErrorMessage(key));
}

TEST_F(TaskArtifactStateTest, inputChangesBeforeUpToDateCheck) {
  tempDir.writeFile("src/A.java", "class A {}");
  runTask(makeTask());

  // Once the view is handed out the task will execute, even if nothing
  // changed.
  auto state = getState(makeTask());
  ASSERT_TRUE(state != nullptr);
  auto inputs = state->getInputChanges();
  ASSERT_TRUE(succeeded(inputs));
  EXPECT_TRUE(inputs->isIncremental());
  EXPECT_TRUE(inputs->getChanges().empty());

  auto upToDate = state->isUpToDate();
  ASSERT_TRUE(succeeded(upToDate));
  EXPECT_TRUE(*upToDate);
  EXPECT_EQ(TaskArtifactState::SessionState::ExecutionPending,
            state->getSessionState());
  EXPECT_EQ("", getErrorMessage(state->afterTask()));
  EXPECT_EQ(TaskArtifactState::SessionState::Finalized,
            state->getSessionState());
}

TEST_F(TaskArtifactStateTest, cacheKey) {
  tempDir.writeFile("src/A.java", "class A {}");

  auto first = getState(makeTask(":a"));
  auto second = getState(makeTask(":b"));
  ASSERT_TRUE(first != nullptr);
  ASSERT_TRUE(second != nullptr);

  auto key = first->calculateCacheKey();
  auto sameKey = first->calculateCacheKey();
  auto otherKey = second->calculateCacheKey();
  ASSERT_TRUE(succeeded(key));
  ASSERT_TRUE(succeeded(sameKey));
  ASSERT_TRUE(succeeded(otherKey));
  EXPECT_TRUE(key->isValid());
  EXPECT_EQ(*key, *sameKey);

  // The task path does not participate.
  EXPECT_EQ(*key, *otherKey);

  auto task = makeTask(":a");
  task.inputProperties["mode"] = "slow";
  auto changed = getState(task);
  ASSERT_TRUE(changed != nullptr);
  auto changedKey = changed->calculateCacheKey();
  ASSERT_TRUE(succeeded(changedKey));
  EXPECT_NE(*key, *changedKey);

  tempDir.writeFile("src/A.java", "class A { int x; }");
  auto edited = getState(makeTask(":a"));
  ASSERT_TRUE(edited != nullptr);
  auto editedKey = edited->calculateCacheKey();
  ASSERT_TRUE(succeeded(editedKey));
  EXPECT_NE(*key, *editedKey);

  // The key is recorded with the execution.
  EXPECT_FALSE(checkUpToDate(*first));
  ASSERT_TRUE(succeeded(first->getInputChanges()));
  EXPECT_EQ("", getErrorMessage(first->afterTask()));
  TaskExecution record;
  std::string error;
  ASSERT_TRUE(store->lookupExecution(":a", &record, &error));
  EXPECT_EQ(*key, record.cacheKey);
}

TEST_F(TaskArtifactStateTest, unknownImplementation) {
  hasher = createVersionedImplementationHasher("");
  createRepository(TaskArtifactStateRepository::Options());
  tempDir.writeFile("src/A.java", "class A {}");

  auto state = getState(makeTask());
  ASSERT_TRUE(state != nullptr);
  auto key = state->calculateCacheKey();
  ASSERT_TRUE(succeeded(key));
  EXPECT_FALSE(key->isValid());
  EXPECT_EQ("INVALID", key->str());
  state.reset();

  runTask(makeTask());
  state = getState(makeTask());
  ASSERT_TRUE(state != nullptr);
  EXPECT_EQ(std::vector<std::string>({
        "Task ':compile' was implemented with an unknown implementation." }),
    getMessages(*state));
}

TEST_F(TaskArtifactStateTest, propertyRemoved) {
  std::string a = tempDir.writeFile("src/A.java", "class A {}");
  runTask(makeTask());

  auto task = makeTask();
  task.inputProperties.erase("target");
  auto state = getState(task);
  ASSERT_TRUE(state != nullptr);
  EXPECT_EQ(std::vector<std::string>({
        "Input property 'target' has been removed for task ':compile'" }),
    getMessages(*state));

  auto inputs = state->getInputChanges();
  ASSERT_TRUE(succeeded(inputs));
  EXPECT_FALSE(inputs->isIncremental());
  ASSERT_EQ(1u, inputs->getChanges().size());
  EXPECT_EQ(a, inputs->getChanges()[0].getPath());
}

TEST_F(TaskArtifactStateTest, propertyValueChanged) {
  tempDir.writeFile("src/A.java", "class A {}");
  runTask(makeTask());

  auto task = makeTask();
  task.inputProperties["mode"] = "slow";
  auto state = getState(task);
  ASSERT_TRUE(state != nullptr);
  EXPECT_EQ(std::vector<std::string>({
        "Value of input property 'mode' has changed for task ':compile'" }),
    getMessages(*state));
  auto inputs = state->getInputChanges();
  ASSERT_TRUE(succeeded(inputs));
  EXPECT_FALSE(inputs->isIncremental());
}

TEST_F(TaskArtifactStateTest, taskTypeChanged) {
  tempDir.writeFile("src/A.java", "class A {}");
  runTask(makeTask());

  auto task = makeTask();
  task.type = "GroovyCompile";
  auto state = getState(task);
  ASSERT_TRUE(state != nullptr);
  auto messages = getMessages(*state);
  ASSERT_FALSE(messages.empty());
  EXPECT_EQ("Task ':compile' has changed type from 'JavaCompile' to "
            "'GroovyCompile'.", messages[0]);
}

TEST_F(TaskArtifactStateTest, incrementalChanges) {
  std::string a = tempDir.writeFile("src/A.java", "class A {}");
  std::string b = tempDir.writeFile("src/B.java", "class B {}");
  runTask(makeTask(), [&](IncrementalTaskInputs&) { writeClasses(); });

  tempDir.writeFile("src/B.java", "class B { int x; }");
  std::string c = tempDir.writeFile("src/C.java", "class C {}");

  auto state = getState(makeTask());
  ASSERT_TRUE(state != nullptr);
  EXPECT_EQ(std::vector<std::string>({
        "Input file " + b + " has changed.",
        "Input file " + c + " has been added." }),
    getMessages(*state));

  auto inputs = state->getInputChanges();
  ASSERT_TRUE(succeeded(inputs));
  EXPECT_TRUE(inputs->isIncremental());

  std::vector<std::string> outOfDate, removed;
  EXPECT_EQ("", getErrorMessage(inputs->outOfDate(
                                    [&](const TaskStateChange& change) {
                                      outOfDate.push_back(change.getPath());
                                    })));
  EXPECT_EQ("", getErrorMessage(inputs->removed(
                                    [&](const TaskStateChange& change) {
                                      removed.push_back(change.getPath());
                                    })));
  EXPECT_EQ(std::vector<std::string>({ b, c }), outOfDate);
  EXPECT_TRUE(removed.empty());
  EXPECT_EQ("", getErrorMessage(state->afterTask()));
  state.reset();

  ASSERT_FALSE(bool(llvm::sys::fs::remove(a)));
  state = getState(makeTask());
  ASSERT_TRUE(state != nullptr);
  inputs = state->getInputChanges();
  ASSERT_TRUE(succeeded(inputs));
  EXPECT_TRUE(inputs->isIncremental());
  ASSERT_EQ(1u, inputs->getChanges().size());
  EXPECT_EQ(TaskStateChange(ChangeKind::Removed, a,
                            "Input file " + a + " has been removed.", false),
            inputs->getChanges()[0]);
}

TEST_F(TaskArtifactStateTest, outputFiles) {
  tempDir.writeFile("src/A.java", "class A {}");

  auto state = getState(makeTask());
  ASSERT_TRUE(state != nullptr);
  auto classes = state->getOutputFiles("classes");
  ASSERT_TRUE(succeeded(classes));
  EXPECT_EQ("Task :compile classes outputs", classes->getName());
  EXPECT_TRUE(classes->isEmpty());

  EXPECT_FALSE(checkUpToDate(*state));
  writeClasses();
  EXPECT_EQ("", getErrorMessage(state->afterTask()));

  // This session keeps its view of the previous execution.
  classes = state->getOutputFiles("classes");
  ASSERT_TRUE(succeeded(classes));
  EXPECT_TRUE(classes->isEmpty());
  state->finished();

  // Later sessions see the committed outputs.
  state = getState(makeTask());
  ASSERT_TRUE(state != nullptr);
  classes = state->getOutputFiles("classes");
  ASSERT_TRUE(succeeded(classes));
  EXPECT_EQ(std::vector<std::string>({
        tempDir.path("classes/A.class"), tempDir.path("classes/pkg/B.class") }),
    classes->getPaths());
  EXPECT_TRUE(classes->contains(tempDir.path("classes/A.class")));

  auto reports = state->getOutputFiles("reports");
  ASSERT_TRUE(succeeded(reports));
  EXPECT_EQ("Task :compile reports outputs", reports->getName());
  EXPECT_TRUE(reports->isEmpty());
}

TEST_F(TaskArtifactStateTest, outputFilesAcrossCommit) {
  tempDir.writeFile("src/A.java", "class A {}");
  std::string a = tempDir.path("classes/A.class");
  std::string b = tempDir.path("classes/B.class");
  runTask(makeTask(), [&](IncrementalTaskInputs&) {
      tempDir.writeFile("classes/A.class", "A.class");
    });

  tempDir.writeFile("src/B.java", "class B {}");
  auto state = getState(makeTask());
  ASSERT_TRUE(state != nullptr);
  EXPECT_FALSE(checkUpToDate(*state));
  tempDir.writeFile("classes/B.class", "B.class");

  auto classes = state->getOutputFiles("classes");
  ASSERT_TRUE(succeeded(classes));
  EXPECT_EQ(std::vector<std::string>({ a }), classes->getPaths());
  EXPECT_EQ("", getErrorMessage(state->afterTask()));
  state->finished();

  state = getState(makeTask());
  ASSERT_TRUE(state != nullptr);
  classes = state->getOutputFiles("classes");
  ASSERT_TRUE(succeeded(classes));
  EXPECT_EQ(std::vector<std::string>({ a, b }), classes->getPaths());
  EXPECT_TRUE(checkUpToDate(*state));
}

TEST_F(TaskArtifactStateTest, outputChangedExternally) {
  std::string a = tempDir.writeFile("src/A.java", "class A {}");
  runTask(makeTask(), [&](IncrementalTaskInputs&) { writeClasses(); });

  std::string classFile = tempDir.writeFile("classes/A.class", "tampered");
  auto state = getState(makeTask());
  ASSERT_TRUE(state != nullptr);
  EXPECT_EQ(std::vector<std::string>({
        "Output file " + classFile + " has changed." }),
    getMessages(*state));

  auto inputs = state->getInputChanges();
  ASSERT_TRUE(succeeded(inputs));
  EXPECT_FALSE(inputs->isIncremental());
  ASSERT_EQ(1u, inputs->getChanges().size());
  EXPECT_EQ(a, inputs->getChanges()[0].getPath());
}

TEST_F(TaskArtifactStateTest, previousFailure) {
  tempDir.writeFile("src/A.java", "class A {}");

  auto state = getState(makeTask());
  ASSERT_TRUE(state != nullptr);
  EXPECT_FALSE(checkUpToDate(*state));
  EXPECT_EQ("", getErrorMessage(state->afterTask(/*successful=*/false)));
  state->finished();

  state = getState(makeTask());
  ASSERT_TRUE(state != nullptr);
  EXPECT_EQ(std::vector<std::string>({ "Task has failed previously." }),
            getMessages(*state));
}

TEST_F(TaskArtifactStateTest, afterTaskMisuse) {
  tempDir.writeFile("src/A.java", "class A {}");

  auto state = getState(makeTask());
  ASSERT_TRUE(state != nullptr);
  llvm::Error err = state->afterTask();
  EXPECT_TRUE(err.isA<InvalidStateError>());
  EXPECT_EQ("invalid state for afterTask: no state computed",
            getErrorMessage(std::move(err)));
  EXPECT_EQ(TaskArtifactState::SessionState::Failed, state->getSessionState());

  state = getState(makeTask());
  ASSERT_TRUE(state != nullptr);
  EXPECT_FALSE(checkUpToDate(*state));
  EXPECT_EQ("", getErrorMessage(state->afterTask()));
  EXPECT_EQ("invalid state for afterTask: called twice",
            getErrorMessage(state->afterTask()));
  EXPECT_EQ(2u, delegate.errors.size());

  // The first commit is the one recorded.
  TaskExecution record;
  std::string error;
  EXPECT_TRUE(store->lookupExecution(":compile", &record, &error));
}

TEST_F(TaskArtifactStateTest, afterTaskFollowingCacheKeyLookup) {
  tempDir.writeFile("src/A.java", "class A {}");

  // A cache miss followed by running the task commits the execution.
  auto state = getState(makeTask());
  ASSERT_TRUE(state != nullptr);
  auto key = state->calculateCacheKey();
  ASSERT_TRUE(succeeded(key));
  EXPECT_EQ(TaskArtifactState::SessionState::Fresh, state->getSessionState());
  EXPECT_EQ("", getErrorMessage(state->afterTask()));
  EXPECT_EQ(TaskArtifactState::SessionState::Finalized,
            state->getSessionState());
  EXPECT_EQ("finalized", getSessionStateName(state->getSessionState()));
  EXPECT_TRUE(delegate.errors.empty());

  TaskExecution record;
  std::string error;
  ASSERT_TRUE(store->lookupExecution(":compile", &record, &error));
  EXPECT_EQ(*key, record.cacheKey);
  EXPECT_TRUE(runTask(makeTask()));

  // Reading the previous outputs does not compute any state.
  state = getState(makeTask());
  ASSERT_TRUE(state != nullptr);
  ASSERT_TRUE(succeeded(state->getOutputFiles("classes")));
  EXPECT_EQ("invalid state for afterTask: no state computed",
            getErrorMessage(state->afterTask()));
  EXPECT_EQ("failed", getSessionStateName(state->getSessionState()));
}

TEST_F(TaskArtifactStateTest, enumerationOrder) {
  tempDir.writeFile("src/A.java", "class A {}");
  tempDir.writeFile("src/B.java", "class B {}");
  tempDir.writeFile("lib/C.java", "class C {}");
  tempDir.writeFile("res/a.properties", "a=1");

  auto makeOrderedTask = [&](bool reversed) {
    TaskDescription task;
    task.path = ":compile";
    task.type = "JavaCompile";
    std::vector<std::string> roots = {
      tempDir.path("src"), tempDir.path("lib") };
    if (reversed) {
      std::reverse(roots.begin(), roots.end());
      task.inputProperties["target"] = "1.8";
      task.inputProperties["mode"] = "fast";
      task.inputFiles["resources"] = FileCollectionSpec({
          tempDir.path("res") });
      task.inputFiles["sources"] = FileCollectionSpec(roots);
    } else {
      task.inputProperties["mode"] = "fast";
      task.inputProperties["target"] = "1.8";
      task.inputFiles["sources"] = FileCollectionSpec(roots);
      task.inputFiles["resources"] = FileCollectionSpec({
          tempDir.path("res") });
    }
    task.outputFiles["classes"] = FileCollectionSpec({
        tempDir.path("classes") });
    return task;
  };

  EXPECT_FALSE(runTask(makeOrderedTask(false)));

  tempDir.writeFile("src/B.java", "class B { int y; }");
  tempDir.writeFile("lib/D.java", "class D {}");
  tempDir.writeFile("res/a.properties", "a=2");

  auto forward = getState(makeOrderedTask(false));
  auto reversed = getState(makeOrderedTask(true));
  ASSERT_TRUE(forward != nullptr);
  ASSERT_TRUE(reversed != nullptr);

  auto forwardKey = forward->calculateCacheKey();
  auto reversedKey = reversed->calculateCacheKey();
  ASSERT_TRUE(succeeded(forwardKey));
  ASSERT_TRUE(succeeded(reversedKey));
  EXPECT_TRUE(forwardKey->isValid());
  EXPECT_EQ(*forwardKey, *reversedKey);

  auto forwardMessages = getMessages(*forward);
  EXPECT_EQ(3u, forwardMessages.size());
  EXPECT_EQ(forwardMessages, getMessages(*reversed));
}

TEST_F(TaskArtifactStateTest, finishedSession) {
  tempDir.writeFile("src/A.java", "class A {}");
  auto state = getState(makeTask());
  ASSERT_TRUE(state != nullptr);
  state->finished();

  auto upToDate = state->isUpToDate();
  EXPECT_EQ("invalid state for isUpToDate: session has finished",
            getErrorMessage(upToDate));
  auto classes = state->getOutputFiles("classes");
  EXPECT_EQ("invalid state for getOutputFiles: session has failed",
            getErrorMessage(classes));
}

TEST_F(TaskArtifactStateTest, discoveredInputs) {
  tempDir.writeFile("src/A.java", "class A {}");
  std::string header = tempDir.writeFile("include/A.h", "int a;");

  EXPECT_FALSE(runTask(makeTask(), [&](IncrementalTaskInputs& inputs) {
        inputs.newInput(header);
      }));
  TaskExecution record;
  std::string error;
  ASSERT_TRUE(store->lookupExecution(":compile", &record, &error));
  EXPECT_EQ(std::vector<std::string>({ header }),
            record.discoveredInputSnapshot.getFiles());

  // Unchanged discovered inputs keep the task up-to-date.
  EXPECT_TRUE(runTask(makeTask()));

  // A changed discovered input only ever leads to an incremental execution.
  tempDir.writeFile("include/A.h", "int a, b;");
  auto state = getState(makeTask());
  ASSERT_TRUE(state != nullptr);
  EXPECT_EQ(std::vector<std::string>({
        "Discovered input file " + header + " has changed." }),
    getMessages(*state));
  auto inputs = state->getInputChanges();
  ASSERT_TRUE(succeeded(inputs));
  EXPECT_TRUE(inputs->isIncremental());
  ASSERT_EQ(1u, inputs->getChanges().size());
  EXPECT_EQ(TaskStateChange(ChangeKind::Modified, header,
                            "Discovered input file " + header +
                            " has changed.", false),
            inputs->getChanges()[0]);

  // The task reports its inputs anew on every execution.
  inputs->newInput(header);
  EXPECT_EQ("", getErrorMessage(state->afterTask()));
  state->finished();
  EXPECT_TRUE(runTask(makeTask()));
}

TEST_F(TaskArtifactStateTest, reportingLimit) {
  TaskArtifactStateRepository::Options options;
  options.maxReportedChanges = 1;
  createRepository(options);

  tempDir.writeFile("src/A.java", "class A {}");
  runTask(makeTask());

  auto task = makeTask();
  task.type = "GroovyCompile";
  task.inputProperties.clear();
  auto state = getState(task);
  ASSERT_TRUE(state != nullptr);
  std::vector<std::string> messages;
  auto upToDate = state->isUpToDate(&messages);
  ASSERT_TRUE(succeeded(upToDate));
  EXPECT_FALSE(*upToDate);
  EXPECT_EQ(1u, messages.size());

  // The limit bounds reporting, not the decision.
  auto inputs = state->getInputChanges();
  ASSERT_TRUE(succeeded(inputs));
  EXPECT_FALSE(inputs->isIncremental());
}

TEST_F(TaskArtifactStateTest, collaboratorFailure) {
  FailingSnapshotter failing;
  repository = std::make_unique<TaskArtifactStateRepository>(
      *historyRepository,
      TaskStateCollaborators{ failing, *snapshotter, *snapshotter, *hasher },
      delegate);

  auto state = getState(makeTask());
  ASSERT_TRUE(state != nullptr);
  auto upToDate = state->isUpToDate();
  ASSERT_FALSE(bool(upToDate));
  EXPECT_FALSE(upToDate.errorIsA<InvalidStateError>());
  EXPECT_EQ("unable to snapshot files", getErrorMessage(upToDate));
  EXPECT_EQ(std::vector<std::string>({ "unable to snapshot files" }),
            delegate.errors);
  EXPECT_EQ(TaskArtifactState::SessionState::Failed, state->getSessionState());
}

TEST_F(TaskArtifactStateTest, storeFailure) {
  class BrokenStore : public TaskHistoryStore {
  public:
    virtual bool lookupExecution(StringRef, TaskExecution*,
                                 std::string* error_out) override {
      *error_out = "history is unavailable";
      return false;
    }
    virtual bool setExecution(StringRef, const TaskExecution&,
                              std::string*) override {
      return true;
    }
    virtual bool removeExecution(StringRef, std::string*) override {
      return true;
    }
    virtual bool getTaskPaths(std::vector<std::string>&,
                              std::string*) override {
      return true;
    }
    virtual bool buildStarted(std::string*) override { return true; }
    virtual bool buildComplete(std::string*) override { return true; }
  };

  BrokenStore brokenStore;
  TaskHistoryRepository brokenHistory(brokenStore);
  TaskArtifactStateRepository brokenRepository(
      brokenHistory,
      TaskStateCollaborators{ *snapshotter, *snapshotter, *snapshotter,
                              *hasher },
      delegate);

  auto stateOrErr = brokenRepository.getStateFor(makeTask());
  EXPECT_EQ("history is unavailable", getErrorMessage(stateOrErr));
  EXPECT_EQ(std::vector<std::string>({ "history is unavailable" }),
            delegate.errors);
}

TEST_F(TaskArtifactStateTest, trace) {
  tempDir.writeFile("src/A.java", "class A {}");
  std::string tracePath = tempDir.path("trace.txt");
  std::string error;
  ASSERT_TRUE(repository->enableTracing(tracePath, &error));

  std::string key;
  {
    auto state = getState(makeTask());
    ASSERT_TRUE(state != nullptr);
    EXPECT_FALSE(checkUpToDate(*state));
    ASSERT_TRUE(succeeded(state->getInputChanges()));
    auto keyOrErr = state->calculateCacheKey();
    ASSERT_TRUE(succeeded(keyOrErr));
    key = keyOrErr->str();
    EXPECT_EQ("", getErrorMessage(state->afterTask()));
    state->finished();
  }
  repository.reset();

  auto buffer = llvm::MemoryBuffer::getFile(tracePath);
  ASSERT_TRUE(bool(buffer));
  EXPECT_EQ("[\n"
            "{ \"new-task\", \"T1\", \":compile\" },\n"
            "{ \"session-created\", \"T1\", \"no-history\" },\n"
            "{ \"checked-up-to-date\", \"T1\", \"out-of-date\", 1 },\n"
            "{ \"computed-input-changes\", \"T1\", \"rebuild\", 1 },\n"
            "{ \"computed-cache-key\", \"T1\", \"" + key + "\" },\n"
            "{ \"committed-execution\", \"T1\", \"successful\" },\n"
            "{ \"session-finished\", \"T1\" },\n"
            "]\n", (*buffer)->getBuffer().str());
}

TEST_F(TaskArtifactStateTest, traceEscapesTaskPaths) {
  std::string tracePath = tempDir.path("trace.txt");
  std::string error;
  ASSERT_TRUE(repository->enableTracing(tracePath, &error));

  {
    auto state = getState(makeTask(":a\"b\\c"));
    ASSERT_TRUE(state != nullptr);
    state->finished();
  }
  repository.reset();

  auto buffer = llvm::MemoryBuffer::getFile(tracePath);
  ASSERT_TRUE(bool(buffer));
  EXPECT_EQ("[\n"
            "{ \"new-task\", \"T1\", \":a\\22b\\\\c\" },\n"
            "{ \"session-created\", \"T1\", \"no-history\" },\n"
            "{ \"session-finished\", \"T1\" },\n"
            "]\n", (*buffer)->getBuffer().str());
}

TEST_F(TaskArtifactStateTest, tracingFailure) {
  std::string error;
  EXPECT_FALSE(repository->enableTracing(
                   tempDir.path("missing/trace.txt"), &error));
  EXPECT_EQ(0u, error.find("unable to open '"));
}

}
