//===- TaskExecution.h ------------------------------------------*- C++ -*-===//
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

#ifndef TASKSTATE_STATE_TASKEXECUTION_H
#define TASKSTATE_STATE_TASKEXECUTION_H

#include "taskstate/Basic/Hashing.h"
#include "taskstate/Basic/LLVM.h"
#include "taskstate/State/FileCollectionSnapshot.h"
#include "taskstate/State/TaskCacheKey.h"

#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace taskstate {
namespace state {

/// The record of one execution of a task.
///
/// The record for the current build is filled in piecemeal by the up-to-date
/// checks and by the post-execution snapshot, and is then committed to the
/// history, where it becomes the baseline for the next build.
struct TaskExecution {
  typedef std::map<std::string, FileCollectionSnapshot> SnapshotsByProperty;

  /// The path of the task.
  std::string taskPath;

  /// The type name of the task.
  std::string taskType;

  /// The hash of the task implementation, null if unknown.
  basic::HashCode implementationHash;

  /// The hashes of the input property values.
  std::map<std::string, basic::HashCode> inputPropertyHashes;

  /// The snapshots of the input files, per property.
  SnapshotsByProperty inputFileSnapshots;

  /// The names of the declared output properties.
  std::set<std::string> outputPropertyNames;

  /// The snapshots of the output files after execution, per property.
  SnapshotsByProperty outputFileSnapshots;

  /// The snapshot of the inputs discovered while executing.
  FileCollectionSnapshot discoveredInputSnapshot;

  /// Whether the execution completed successfully.
  bool successful = true;

  /// The cache key resolved when the record was committed, if any.
  TaskCacheKey cacheKey;

  /// Compute the cache key for the input state in this record.
  ///
  /// The key covers the task type, implementation hash, input property hashes
  /// and input file snapshot hashes. It does not depend on the task path, the
  /// outputs or the discovered inputs. The key is invalid if the
  /// implementation hash is unknown.
  TaskCacheKey calculateCacheKey() const;

  /// Encode the record for persistence.
  std::vector<uint8_t> toData() const;

  /// Decode a record.
  ///
  /// \param execution_out [out] On success, the decoded record.
  /// \param error_out [out] Error string if return value is false.
  static bool fromData(StringRef data, TaskExecution* execution_out,
                       std::string* error_out);

  /// Write a human readable description of the record.
  void dump(raw_ostream& os) const;

  bool operator==(const TaskExecution& rhs) const;
  bool operator!=(const TaskExecution& rhs) const { return !(*this == rhs); }
};

}
}

#endif
