//===- FileCollectionSnapshotter.h ------------------------------*- C++ -*-===//
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

#ifndef TASKSTATE_STATE_FILECOLLECTIONSNAPSHOTTER_H
#define TASKSTATE_STATE_FILECOLLECTIONSNAPSHOTTER_H

#include "taskstate/Basic/LLVM.h"
#include "taskstate/State/FileCollectionSnapshot.h"

#include <memory>
#include <string>
#include <vector>

namespace taskstate {
namespace basic {
class FileSystem;
}

namespace state {

/// The declared contents of one file property of a task.
///
/// Each root is either a file or a directory; directories are included
/// recursively.
struct FileCollectionSpec {
  std::vector<std::string> roots;

  FileCollectionSpec() {}
  FileCollectionSpec(std::vector<std::string> roots)
      : roots(std::move(roots)) {}

  bool operator==(const FileCollectionSpec& rhs) const {
    return roots == rhs.roots;
  }
};

/// Abstract interface for computing snapshots of file collections.
class FileCollectionSnapshotter {
public:
  virtual ~FileCollectionSnapshotter();

  /// Compute the snapshot of the current state of the file system for the
  /// given collection.
  ///
  /// This may be slow, it performs I/O for every file in the collection.
  ///
  /// \param snapshot_out [out] On success, the computed snapshot.
  /// \param error_out [out] Error string if return value is false.
  virtual bool snapshot(const FileCollectionSpec& spec,
                        FileCollectionSnapshot* snapshot_out,
                        std::string* error_out) = 0;
};

/// Create a snapshotter which hashes file contents read through \p fs.
///
/// The file system must outlive the snapshotter.
std::unique_ptr<FileCollectionSnapshotter>
createLocalFileCollectionSnapshotter(basic::FileSystem& fs);

}
}

#endif
