//===-- InMemoryTaskHistoryStore.cpp --------------------------------------===//
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

#include "taskstate/State/TaskHistoryStore.h"

#include "taskstate/State/TaskExecution.h"

#include "llvm/Support/raw_ostream.h"

#include <map>
#include <mutex>

using namespace taskstate;
using namespace taskstate::state;

namespace {

class InMemoryTaskHistoryStore : public TaskHistoryStore {
  /// The encoded records, by task path.
  std::map<std::string, std::vector<uint8_t>> records;

  std::mutex recordsMutex;

public:
  virtual bool lookupExecution(StringRef taskPath,
                               TaskExecution* execution_out,
                               std::string* error_out) override {
    std::lock_guard<std::mutex> guard(recordsMutex);
    auto it = records.find(taskPath.str());
    if (it == records.end())
      return false;

    // Records are kept in encoded form, so lookups always hand out a copy that
    // is independent of later updates.
    const auto& data = it->second;
    if (!TaskExecution::fromData(
            StringRef(reinterpret_cast<const char*>(data.data()), data.size()),
            execution_out, error_out))
      return false;
    return true;
  }

  virtual bool setExecution(StringRef taskPath,
                            const TaskExecution& execution,
                            std::string*) override {
    auto data = execution.toData();
    std::lock_guard<std::mutex> guard(recordsMutex);
    records[taskPath.str()] = std::move(data);
    return true;
  }

  virtual bool removeExecution(StringRef taskPath, std::string*) override {
    std::lock_guard<std::mutex> guard(recordsMutex);
    records.erase(taskPath.str());
    return true;
  }

  virtual bool getTaskPaths(std::vector<std::string>& paths_out,
                            std::string*) override {
    std::lock_guard<std::mutex> guard(recordsMutex);
    for (const auto& entry: records)
      paths_out.push_back(entry.first);
    return true;
  }

  virtual bool buildStarted(std::string*) override { return true; }

  virtual bool buildComplete(std::string*) override { return true; }

  virtual void dump(raw_ostream& os) override {
    std::lock_guard<std::mutex> guard(recordsMutex);
    os << "executions:\n";
    for (const auto& entry: records) {
      os << entry.first << " -- " << entry.second.size() << " bytes\n";

      TaskExecution execution;
      std::string error;
      const auto& data = entry.second;
      if (TaskExecution::fromData(
              StringRef(reinterpret_cast<const char*>(data.data()),
                        data.size()),
              &execution, &error)) {
        execution.dump(os);
      } else {
        os << "  error: " << error << "\n";
      }
    }
  }
};

}

std::unique_ptr<TaskHistoryStore> state::createInMemoryTaskHistoryStore() {
  return std::make_unique<InMemoryTaskHistoryStore>();
}
