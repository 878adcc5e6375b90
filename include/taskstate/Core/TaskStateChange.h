//===- TaskStateChange.h ----------------------------------------*- C++ -*-===//
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

#ifndef TASKSTATE_CORE_TASKSTATECHANGE_H
#define TASKSTATE_CORE_TASKSTATECHANGE_H

#include "taskstate/Basic/LLVM.h"
#include "taskstate/State/FileCollectionSnapshot.h"

#include "llvm/ADT/StringRef.h"

#include <string>

namespace taskstate {
namespace core {

using state::ChangeKind;

/// A single detected difference between the previous and the current state of
/// a task.
class TaskStateChange {
  ChangeKind kind;

  /// The affected path, or empty if the change is not about a file.
  std::string path;

  /// The human readable description of the change.
  std::string message;

  /// Whether the change was produced by a rule which prevents incremental
  /// execution.
  bool rebuildForcing;

public:
  TaskStateChange(ChangeKind kind, StringRef path, StringRef message,
                  bool rebuildForcing)
      : kind(kind), path(path.str()), message(message.str()),
        rebuildForcing(rebuildForcing) {}

  ChangeKind getKind() const { return kind; }
  const std::string& getPath() const { return path; }
  const std::string& getMessage() const { return message; }
  bool isRebuildForcing() const { return rebuildForcing; }

  bool isAdded() const { return kind == ChangeKind::Added; }
  bool isRemoved() const { return kind == ChangeKind::Removed; }
  bool isModified() const { return kind == ChangeKind::Modified; }

  bool operator==(const TaskStateChange& rhs) const {
    return (kind == rhs.kind && path == rhs.path && message == rhs.message &&
            rebuildForcing == rhs.rebuildForcing);
  }
  bool operator!=(const TaskStateChange& rhs) const { return !(*this == rhs); }
};

}
}

#endif
