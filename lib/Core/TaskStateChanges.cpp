//===-- TaskStateChanges.cpp ----------------------------------------------===//
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

#include "llvm/ADT/Twine.h"

using namespace taskstate;
using namespace taskstate::core;
using namespace taskstate::state;

TaskStateChanges::~TaskStateChanges() {}

namespace {

/// Visit the names present in only one of two sorted sequences.
template<typename PreviousRange, typename CurrentRange, typename GetName>
bool visitAddedAndRemoved(
    const PreviousRange& previous, const CurrentRange& current,
    GetName getName, function_ref<bool(StringRef, ChangeKind)> visitor) {
  auto prevIt = previous.begin(), prevEnd = previous.end();
  auto curIt = current.begin(), curEnd = current.end();
  while (prevIt != prevEnd || curIt != curEnd) {
    if (curIt == curEnd ||
        (prevIt != prevEnd && getName(*prevIt) < getName(*curIt))) {
      if (!visitor(getName(*prevIt), ChangeKind::Removed))
        return false;
      ++prevIt;
    } else if (prevIt == prevEnd || getName(*curIt) < getName(*prevIt)) {
      if (!visitor(getName(*curIt), ChangeKind::Added))
        return false;
      ++curIt;
    } else {
      ++prevIt;
      ++curIt;
    }
  }
  return true;
}

template<typename T>
StringRef getKey(const std::pair<const std::string, T>& entry) {
  return entry.first;
}

StringRef getElement(const std::string& name) { return name; }

/// Diff the file snapshots of the properties present in both runs.
bool visitFileChanges(const TaskExecution::SnapshotsByProperty& previous,
                      const TaskExecution::SnapshotsByProperty& current,
                      StringRef title, bool rebuildForcing,
                      TaskStateChangeVisitor visitor) {
  for (const auto& entry: current) {
    auto it = previous.find(entry.first);
    if (it == previous.end())
      continue;

    bool completed = entry.second.visitChangesSince(
        it->second, [&](const FileChange& change) {
          return visitor(TaskStateChange(
                             change.kind, change.path,
                             (Twine(title) + " " + change.path + " " +
                              getChangeKindDescription(change.kind) +
                              ".").str(),
                             rebuildForcing));
        });
    if (!completed)
      return false;
  }
  return true;
}

class NoHistoryTaskStateChanges : public TaskStateChanges {
public:
  using TaskStateChanges::TaskStateChanges;

  virtual StringRef getName() const override { return "no-history"; }
  virtual bool isRebuildForcing() const override { return true; }

  virtual bool visitChanges(TaskStateChangeVisitor visitor) const override {
    if (facts.previous)
      return true;
    return visitor(TaskStateChange(ChangeKind::Other, "",
                                   "No history is available.", true));
  }
};

class PreviousFailureTaskStateChanges : public TaskStateChanges {
public:
  using TaskStateChanges::TaskStateChanges;

  virtual StringRef getName() const override { return "previous-failure"; }
  virtual bool isRebuildForcing() const override { return true; }

  virtual bool visitChanges(TaskStateChangeVisitor visitor) const override {
    if (!facts.previous || facts.previous->successful)
      return true;
    return visitor(TaskStateChange(ChangeKind::Other, "",
                                   "Task has failed previously.", true));
  }
};

class TaskTypeTaskStateChanges : public TaskStateChanges {
public:
  using TaskStateChanges::TaskStateChanges;

  virtual StringRef getName() const override { return "task-type"; }
  virtual bool isRebuildForcing() const override { return true; }

  virtual bool visitChanges(TaskStateChangeVisitor visitor) const override {
    if (!facts.previous || facts.previous->taskType == facts.current->taskType)
      return true;
    return visitor(TaskStateChange(
                       ChangeKind::Other, "",
                       (Twine("Task '") + facts.taskPath + "' has changed type from '" +
                        facts.previous->taskType + "' to '" +
                        facts.current->taskType + "'.").str(),
                       true));
  }
};

class TaskImplementationTaskStateChanges : public TaskStateChanges {
public:
  using TaskStateChanges::TaskStateChanges;

  virtual StringRef getName() const override { return "implementation"; }
  virtual bool isRebuildForcing() const override { return true; }

  virtual bool visitChanges(TaskStateChangeVisitor visitor) const override {
    if (!facts.previous)
      return true;

    // An unknown implementation can never be proven unchanged.
    if (facts.current->implementationHash.isNull()) {
      return visitor(TaskStateChange(
                         ChangeKind::Other, "",
                         (Twine("Task '") + facts.taskPath +
                          "' was implemented with an unknown "
                          "implementation.").str(),
                         true));
    }
    if (facts.previous->implementationHash ==
        facts.current->implementationHash)
      return true;
    return visitor(TaskStateChange(
                       ChangeKind::Other, "",
                       (Twine("Task '") + facts.taskPath +
                        "' has changed implementation.").str(),
                       true));
  }
};

class InputPropertiesTaskStateChanges : public TaskStateChanges {
public:
  using TaskStateChanges::TaskStateChanges;

  virtual StringRef getName() const override { return "input-properties"; }
  virtual bool isRebuildForcing() const override { return true; }

  virtual bool visitChanges(TaskStateChangeVisitor visitor) const override {
    if (!facts.previous)
      return true;

    const auto& previous = facts.previous->inputPropertyHashes;
    const auto& current = facts.current->inputPropertyHashes;
    bool completed = visitAddedAndRemoved(
        previous, current, getKey<basic::HashCode>,
        [&](StringRef name, ChangeKind kind) {
          return visitor(TaskStateChange(
                             kind, "",
                             (Twine("Input property '") + name + "' " +
                              getChangeKindDescription(kind) +
                              " for task '" + facts.taskPath + "'").str(),
                             true));
        });
    if (!completed)
      return false;

    for (const auto& entry: current) {
      auto it = previous.find(entry.first);
      if (it == previous.end() || it->second == entry.second)
        continue;
      if (!visitor(TaskStateChange(
                       ChangeKind::Modified, "",
                       (Twine("Value of input property '") + entry.first +
                        "' has changed for task '" + facts.taskPath +
                        "'").str(),
                       true)))
        return false;
    }
    return true;
  }
};

/// Reports file properties added or removed between runs.
class FilePropertiesTaskStateChanges : public TaskStateChanges {
  StringRef title;

protected:
  virtual bool visitPropertyNames(
      function_ref<bool(StringRef, ChangeKind)> visitor) const = 0;

public:
  FilePropertiesTaskStateChanges(const TaskStateFacts& facts, StringRef title)
      : TaskStateChanges(facts), title(title) {}

  virtual bool isRebuildForcing() const override { return true; }

  virtual bool visitChanges(TaskStateChangeVisitor visitor) const override {
    if (!facts.previous)
      return true;

    return visitPropertyNames([&](StringRef name, ChangeKind kind) {
        return visitor(TaskStateChange(
                           kind, "",
                           (Twine(title) + " '" + name + "' " +
                            getChangeKindDescription(kind) + " for task '" +
                            facts.taskPath + "'").str(),
                           true));
      });
  }
};

class InputFilePropertiesTaskStateChanges
    : public FilePropertiesTaskStateChanges {
protected:
  virtual bool visitPropertyNames(
      function_ref<bool(StringRef, ChangeKind)> visitor) const override {
    return visitAddedAndRemoved(facts.previous->inputFileSnapshots,
                                facts.current->inputFileSnapshots,
                                getKey<FileCollectionSnapshot>, visitor);
  }

public:
  explicit InputFilePropertiesTaskStateChanges(const TaskStateFacts& facts)
      : FilePropertiesTaskStateChanges(facts, "Input file property") {}

  virtual StringRef getName() const override {
    return "input-file-properties";
  }
};

class OutputFilePropertiesTaskStateChanges
    : public FilePropertiesTaskStateChanges {
protected:
  virtual bool visitPropertyNames(
      function_ref<bool(StringRef, ChangeKind)> visitor) const override {
    return visitAddedAndRemoved(facts.previous->outputPropertyNames,
                                facts.current->outputPropertyNames,
                                getElement, visitor);
  }

public:
  explicit OutputFilePropertiesTaskStateChanges(const TaskStateFacts& facts)
      : FilePropertiesTaskStateChanges(facts, "Output file property") {}

  virtual StringRef getName() const override {
    return "output-file-properties";
  }
};

class InputFilesTaskStateChanges : public TaskStateChanges {
public:
  using TaskStateChanges::TaskStateChanges;

  virtual StringRef getName() const override { return "input-files"; }
  virtual bool isRebuildForcing() const override { return false; }

  virtual bool visitChanges(TaskStateChangeVisitor visitor) const override {
    if (!facts.previous)
      return true;
    return visitFileChanges(facts.previous->inputFileSnapshots,
                            facts.current->inputFileSnapshots,
                            "Input file", false, visitor);
  }
};

class OutputFilesTaskStateChanges : public TaskStateChanges {
public:
  using TaskStateChanges::TaskStateChanges;

  virtual StringRef getName() const override { return "output-files"; }
  virtual bool isRebuildForcing() const override { return true; }

  virtual bool visitChanges(TaskStateChangeVisitor visitor) const override {
    if (!facts.previous)
      return true;

    // Outputs recorded by the previous execution are compared against the
    // outputs found before this execution; a difference means they were
    // changed by something other than the task.
    TaskExecution::SnapshotsByProperty previous;
    for (const auto& name: facts.previous->outputPropertyNames) {
      if (!facts.current->outputPropertyNames.count(name))
        continue;
      auto it = facts.previous->outputFileSnapshots.find(name);
      previous[name] = (it == facts.previous->outputFileSnapshots.end() ?
                        FileCollectionSnapshot() : it->second);
    }
    return visitFileChanges(previous, facts.outputsBeforeTask,
                            "Output file", true, visitor);
  }
};

class DiscoveredInputsTaskStateChanges : public TaskStateChanges {
public:
  using TaskStateChanges::TaskStateChanges;

  virtual StringRef getName() const override { return "discovered-inputs"; }
  virtual bool isRebuildForcing() const override { return false; }

  virtual bool visitChanges(TaskStateChangeVisitor visitor) const override {
    if (!facts.previous)
      return true;
    return facts.current->discoveredInputSnapshot.visitChangesSince(
        facts.previous->discoveredInputSnapshot,
        [&](const FileChange& change) {
          return visitor(TaskStateChange(
                             change.kind, change.path,
                             (Twine("Discovered input file ") + change.path + " " +
                              getChangeKindDescription(change.kind) +
                              ".").str(),
                             false));
        });
  }
};

}

TaskStateRuleList core::createTaskStateRules(const TaskStateFacts& facts) {
  TaskStateRuleList rules;
  rules.push_back(std::make_unique<NoHistoryTaskStateChanges>(facts));
  rules.push_back(std::make_unique<PreviousFailureTaskStateChanges>(facts));
  rules.push_back(std::make_unique<TaskTypeTaskStateChanges>(facts));
  rules.push_back(std::make_unique<TaskImplementationTaskStateChanges>(facts));
  rules.push_back(std::make_unique<InputPropertiesTaskStateChanges>(facts));
  rules.push_back(
      std::make_unique<InputFilePropertiesTaskStateChanges>(facts));
  rules.push_back(std::make_unique<InputFilesTaskStateChanges>(facts));
  rules.push_back(
      std::make_unique<OutputFilePropertiesTaskStateChanges>(facts));
  rules.push_back(std::make_unique<OutputFilesTaskStateChanges>(facts));
  rules.push_back(std::make_unique<DiscoveredInputsTaskStateChanges>(facts));
  return rules;
}

bool SummaryTaskStateChanges::accepts(const TaskStateChanges& rule) const {
  switch (filter) {
  case TaskStateChangeFilter::AllChanges:
    return true;
  case TaskStateChangeFilter::RebuildChanges:
    return rule.isRebuildForcing();
  case TaskStateChangeFilter::IncrementalChanges:
    return !rule.isRebuildForcing();
  }
  return false;
}

bool SummaryTaskStateChanges::visitChanges(
    TaskStateChangeVisitor visitor) const {
  unsigned numReported = 0;
  bool stopped = false;
  for (const auto& rule: *rules) {
    if (!accepts(*rule))
      continue;

    bool completed = rule->visitChanges([&](const TaskStateChange& change) {
        if (!visitor(change)) {
          stopped = true;
          return false;
        }
        ++numReported;
        return !(maxReportedChanges && numReported == maxReportedChanges);
      });
    if (stopped)
      return false;

    // The limit was reached.
    if (!completed)
      return true;
  }
  return true;
}

bool SummaryTaskStateChanges::hasChanges() const {
  bool found = false;
  visitChanges([&](const TaskStateChange&) {
      found = true;
      return false;
    });
  return found;
}

std::vector<TaskStateChange> SummaryTaskStateChanges::getChanges() const {
  std::vector<TaskStateChange> result;
  visitChanges([&](const TaskStateChange& change) {
      result.push_back(change);
      return true;
    });
  return result;
}
