//===- TaskHistoryStore.h ---------------------------------------*- C++ -*-===//
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

#ifndef TASKSTATE_STATE_TASKHISTORYSTORE_H
#define TASKSTATE_STATE_TASKHISTORYSTORE_H

#include "taskstate/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace taskstate {
namespace state {

struct TaskExecution;

/// The persistent store of task execution records.
///
/// The store holds at most one record per task path, the most recently
/// committed one. All methods must be thread safe; records for distinct tasks
/// may be read and written concurrently.
class TaskHistoryStore {
public:
  virtual ~TaskHistoryStore();

  /// Look up the record for a task.
  ///
  /// \param taskPath The path of the task.
  /// \param execution_out [out] The record, if found.
  /// \param error_out [out] Error string if an error occurred.
  /// \returns True if the store had a record for the task.
  virtual bool lookupExecution(StringRef taskPath,
                               TaskExecution* execution_out,
                               std::string* error_out) = 0;

  /// Replace the record for a task.
  ///
  /// The replacement is atomic with respect to concurrent lookups.
  ///
  /// \param error_out [out] Error string if return value is false.
  virtual bool setExecution(StringRef taskPath,
                            const TaskExecution& execution,
                            std::string* error_out) = 0;

  /// Remove the record for a task, if present.
  ///
  /// \param error_out [out] Error string if return value is false.
  virtual bool removeExecution(StringRef taskPath, std::string* error_out) = 0;

  /// Get the paths of all tasks with a record, in sorted order.
  ///
  /// \param paths_out [out] The known task paths will be appended to this
  /// vector.
  /// \param error_out [out] Error string if return value is false.
  virtual bool getTaskPaths(std::vector<std::string>& paths_out,
                            std::string* error_out) = 0;

  /// Called by the client to indicate that a build has started.
  ///
  /// Stores may batch all updates made until \see buildComplete() into a
  /// single transaction.
  ///
  /// \param error_out [out] Error string if return value is false.
  virtual bool buildStarted(std::string* error_out) = 0;

  /// Called by the client to indicate a build has finished, and results
  /// should be written.
  ///
  /// \param error_out [out] Error string if return value is false.
  virtual bool buildComplete(std::string* error_out) = 0;

  /// Dump a debug view of the store contents
  virtual void dump(raw_ostream& os) { (void)os; }
};

/// Create a TaskHistoryStore instance backed by a SQLite3 database.
///
/// The database is opened lazily, on the first operation.
///
/// \param clientSchemaVersion An uninterpreted version number for use by the
/// client to allow batch changes to the stored records; if the stored schema
/// does not match the provided version the database will be cleared upon
/// opening.
/// \param recreateOnUnmatchedVersion If false, a version mismatch is reported
/// as an error instead of clearing the database.
std::unique_ptr<TaskHistoryStore>
createSQLiteTaskHistoryStore(StringRef path, uint32_t clientSchemaVersion,
                             bool recreateOnUnmatchedVersion,
                             std::string* error_out);

/// Create a TaskHistoryStore instance which keeps records in memory only.
std::unique_ptr<TaskHistoryStore> createInMemoryTaskHistoryStore();

}
}

#endif
