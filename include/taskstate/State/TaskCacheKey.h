//===- TaskCacheKey.h -------------------------------------------*- C++ -*-===//
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

#ifndef TASKSTATE_STATE_TASKCACHEKEY_H
#define TASKSTATE_STATE_TASKCACHEKEY_H

#include "taskstate/Basic/Hashing.h"

#include <string>

namespace taskstate {
namespace state {

/// A fingerprint of the complete input state of a task.
///
/// Two tasks with equal valid cache keys have equal input state, and so may
/// share results. Clients must not look up results for an invalid key.
class TaskCacheKey {
  basic::HashCode hashCode;
  bool valid = false;

  TaskCacheKey(basic::HashCode hashCode, bool valid)
      : hashCode(hashCode), valid(valid) {}

public:
  TaskCacheKey() {}

  static TaskCacheKey make(basic::HashCode hashCode) {
    return TaskCacheKey(hashCode, true);
  }
  static TaskCacheKey invalid() { return TaskCacheKey(); }

  bool isValid() const { return valid; }
  const basic::HashCode& getHashCode() const { return hashCode; }

  /// Get the display form of the key, "INVALID" for an invalid key.
  std::string str() const {
    return valid ? hashCode.str() : "INVALID";
  }

  bool operator==(const TaskCacheKey& rhs) const {
    return valid == rhs.valid && hashCode == rhs.hashCode;
  }
  bool operator!=(const TaskCacheKey& rhs) const { return !(*this == rhs); }
};

}
}

#endif
