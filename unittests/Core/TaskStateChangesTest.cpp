//===-- TaskStateChangesTest.cpp ------------------------------------------===//
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

#include "taskstate/Core/TaskStateChanges.h"

#include "gtest/gtest.h"

using namespace taskstate;
using namespace taskstate::basic;
using namespace taskstate::core;
using namespace taskstate::state;

namespace {

FileSnapshot makeFile(StringRef contents) {
  return FileSnapshot::makeRegularFile(contents.size(), FileTimestamp(),
                                       hashString(contents));
}

FileCollectionSnapshot makeSnapshot(
    std::vector<std::pair<std::string, std::string>> files) {
  FileCollectionSnapshot::SnapshotMap map;
  for (const auto& file: files)
    map[file.first] = makeFile(file.second);
  return FileCollectionSnapshot(map);
}

std::vector<std::string> getMessages(const SummaryTaskStateChanges& changes) {
  std::vector<std::string> result;
  for (const auto& change: changes.getChanges())
    result.push_back(change.getMessage());
  return result;
}

/// Build a previous and current execution differing in every checked aspect.
class TaskStateChangesTest : public ::testing::Test {
protected:
  TaskExecution previous;
  TaskExecution current;
  TaskStateFacts facts;

  virtual void SetUp() override {
    previous.taskPath = current.taskPath = ":t";
    previous.taskType = "Copy";
    previous.successful = false;
    previous.implementationHash = hashString("v1");
    previous.inputPropertyHashes["a"] = hashString("1");
    previous.inputPropertyHashes["b"] = hashString("2");
    previous.inputFileSnapshots["srcs"] = makeSnapshot({ { "f1", "x" } });
    previous.outputPropertyNames = { "old", "out" };
    previous.outputFileSnapshots["out"] = makeSnapshot({ { "o1", "o" } });
    previous.discoveredInputSnapshot = makeSnapshot({ { "d1", "d" } });

    current.taskType = "Sync";
    current.implementationHash = hashString("v2");
    current.inputPropertyHashes["b"] = hashString("3");
    current.inputPropertyHashes["c"] = hashString("4");
    current.inputFileSnapshots["extra"] = FileCollectionSnapshot();
    current.inputFileSnapshots["srcs"] = makeSnapshot(
        { { "f1", "y" }, { "f2", "z" } });
    current.outputPropertyNames = { "out" };
    current.discoveredInputSnapshot = makeSnapshot(
        { { "d1", "d" }, { "d2", "e" } });

    facts.taskPath = ":t";
    facts.previous = &previous;
    facts.current = &current;
    facts.outputsBeforeTask["out"] = makeSnapshot({ { "o1", "changed" } });
  }
};

TEST_F(TaskStateChangesTest, ruleOrder) {
  auto rules = createTaskStateRules(facts);
  std::vector<std::string> names;
  for (const auto& rule: rules)
    names.push_back(rule->getName().str());
  EXPECT_EQ(std::vector<std::string>({
        "no-history", "previous-failure", "task-type", "implementation",
        "input-properties", "input-file-properties", "input-files",
        "output-file-properties", "output-files", "discovered-inputs" }),
    names);
}

TEST_F(TaskStateChangesTest, allChanges) {
  auto rules = createTaskStateRules(facts);
  SummaryTaskStateChanges changes(rules, TaskStateChangeFilter::AllChanges);
  EXPECT_EQ(std::vector<std::string>({
        "Task has failed previously.",
        "Task ':t' has changed type from 'Copy' to 'Sync'.",
        "Task ':t' has changed implementation.",
        "Input property 'a' has been removed for task ':t'",
        "Input property 'c' has been added for task ':t'",
        "Value of input property 'b' has changed for task ':t'",
        "Input file property 'extra' has been added for task ':t'",
        "Input file f1 has changed.",
        "Input file f2 has been added.",
        "Output file property 'old' has been removed for task ':t'",
        "Output file o1 has changed.",
        "Discovered input file d2 has been added." }),
    getMessages(changes));
  EXPECT_TRUE(changes.hasChanges());
}

TEST_F(TaskStateChangesTest, filters) {
  auto rules = createTaskStateRules(facts);

  SummaryTaskStateChanges incremental(
      rules, TaskStateChangeFilter::IncrementalChanges);
  auto changes = incremental.getChanges();
  ASSERT_EQ(3u, changes.size());
  EXPECT_EQ(TaskStateChange(ChangeKind::Modified, "f1",
                            "Input file f1 has changed.", false),
            changes[0]);
  EXPECT_EQ(TaskStateChange(ChangeKind::Added, "f2",
                            "Input file f2 has been added.", false),
            changes[1]);
  EXPECT_EQ(TaskStateChange(ChangeKind::Added, "d2",
                            "Discovered input file d2 has been added.",
                            false),
            changes[2]);

  SummaryTaskStateChanges rebuild(rules,
                                  TaskStateChangeFilter::RebuildChanges);
  changes = rebuild.getChanges();
  EXPECT_EQ(9u, changes.size());
  for (const auto& change: changes)
    EXPECT_TRUE(change.isRebuildForcing());
}

TEST_F(TaskStateChangesTest, reportingLimit) {
  auto rules = createTaskStateRules(facts);
  SummaryTaskStateChanges changes(rules, TaskStateChangeFilter::AllChanges,
                                  /*maxReportedChanges=*/2);
  std::vector<std::string> messages;
  EXPECT_TRUE(changes.visitChanges([&](const TaskStateChange& change) {
        messages.push_back(change.getMessage());
        return true;
      }));
  EXPECT_EQ(std::vector<std::string>({
        "Task has failed previously.",
        "Task ':t' has changed type from 'Copy' to 'Sync'." }),
    messages);

  // A visitor may stop the walk itself.
  unsigned numVisited = 0;
  SummaryTaskStateChanges unlimited(rules, TaskStateChangeFilter::AllChanges);
  EXPECT_FALSE(unlimited.visitChanges([&](const TaskStateChange&) {
        return ++numVisited < 4;
      }));
  EXPECT_EQ(4u, numVisited);
}

TEST_F(TaskStateChangesTest, noHistory) {
  facts.previous = nullptr;
  auto rules = createTaskStateRules(facts);

  SummaryTaskStateChanges all(rules, TaskStateChangeFilter::AllChanges);
  auto changes = all.getChanges();
  ASSERT_EQ(1u, changes.size());
  EXPECT_EQ("No history is available.", changes[0].getMessage());
  EXPECT_TRUE(changes[0].isRebuildForcing());
  EXPECT_EQ(ChangeKind::Other, changes[0].getKind());

  EXPECT_FALSE(SummaryTaskStateChanges(
                   rules, TaskStateChangeFilter::IncrementalChanges)
               .hasChanges());
}

TEST_F(TaskStateChangesTest, unchanged) {
  facts.previous = &current;
  facts.outputsBeforeTask.clear();
  auto rules = createTaskStateRules(facts);
  EXPECT_FALSE(SummaryTaskStateChanges(rules,
                                       TaskStateChangeFilter::AllChanges)
               .hasChanges());
}

TEST_F(TaskStateChangesTest, unknownImplementation) {
  TaskExecution unknown = previous;
  unknown.successful = true;
  unknown.implementationHash = HashCode();
  facts.previous = &unknown;
  facts.current = &unknown;
  facts.outputsBeforeTask.clear();
  facts.outputsBeforeTask["out"] = makeSnapshot({ { "o1", "o" } });

  // Even an identical record cannot be up-to-date.
  auto rules = createTaskStateRules(facts);
  EXPECT_EQ(std::vector<std::string>({
        "Task ':t' was implemented with an unknown implementation." }),
    getMessages(SummaryTaskStateChanges(
                    rules, TaskStateChangeFilter::AllChanges)));
}

}
