//===- TaskDescription.h ----------------------------------------*- C++ -*-===//
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

#ifndef TASKSTATE_STATE_TASKDESCRIPTION_H
#define TASKSTATE_STATE_TASKDESCRIPTION_H

#include "taskstate/Basic/Hashing.h"
#include "taskstate/Basic/LLVM.h"
#include "taskstate/State/FileCollectionSnapshotter.h"

#include <map>
#include <memory>
#include <string>

namespace taskstate {
namespace state {

/// The description of a task, as supplied by the build engine.
struct TaskDescription {
  /// The unique path of the task in the build (e.g., ":app:compile"). This is
  /// the key under which the task history is recorded.
  std::string path;

  /// The name of the type of the task.
  std::string type;

  /// The input property values, as their canonical string representation.
  std::map<std::string, std::string> inputProperties;

  /// The declared input file properties.
  std::map<std::string, FileCollectionSpec> inputFiles;

  /// The declared output file properties.
  std::map<std::string, FileCollectionSpec> outputFiles;
};

/// Abstract interface for fingerprinting the implementation of a task.
class TaskImplementationHasher {
public:
  virtual ~TaskImplementationHasher();

  /// Get the hash of the implementation of the given task.
  ///
  /// \returns The implementation hash, or a null hash code if the
  /// implementation cannot be identified.
  virtual basic::HashCode
  getImplementationHash(const TaskDescription& task) = 0;
};

/// Create an implementation hasher which identifies a task implementation by
/// its type name together with a client supplied implementation version.
///
/// An empty \p version denotes an unknown implementation.
std::unique_ptr<TaskImplementationHasher>
createVersionedImplementationHasher(StringRef version);

}
}

#endif
