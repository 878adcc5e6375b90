//===-- FileCollectionSnapshotter.cpp -------------------------------------===//
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

#include "taskstate/State/FileCollectionSnapshotter.h"

#include "taskstate/Basic/FileSystem.h"
#include "taskstate/Basic/Hashing.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"

using namespace taskstate;
using namespace taskstate::state;

FileCollectionSnapshotter::~FileCollectionSnapshotter() {}

namespace {

class LocalFileCollectionSnapshotter : public FileCollectionSnapshotter {
  basic::FileSystem& fs;

  bool snapshotPath(const std::string& path, bool isRoot,
                    FileCollectionSnapshot::SnapshotMap& snapshots,
                    std::string* error_out) {
    // Roots may be missing, in which case we record that fact. Entries found
    // while walking a directory are only recorded if they still exist.
    auto info = fs.getFileInfo(path);
    if (info.isMissing()) {
      if (isRoot)
        snapshots[path] = FileSnapshot::makeMissing();
      return true;
    }

    if (info.isRegularFile()) {
      auto contents = fs.getFileContents(path);
      if (!contents) {
        *error_out = "unable to read file '" + path + "'";
        return false;
      }
      snapshots[path] = FileSnapshot::makeRegularFile(
          info.size, info.modTime, basic::hashString(contents->getBuffer()));
      return true;
    }

    if (!info.isDirectory()) {
      // Sockets, devices and the like are not tracked.
      return true;
    }

    snapshots[path] = FileSnapshot::makeDirectory(info.modTime);

    // Don't descend through symbolic links to directories, they may introduce
    // cycles.
    if (!isRoot && fs.getLinkInfo(path).isSymlink())
      return true;

    std::vector<std::string> names;
    if (!fs.getDirectoryContents(path, &names)) {
      *error_out = "unable to read directory '" + path + "'";
      return false;
    }
    for (const auto& name: names) {
      SmallString<256> child(path);
      llvm::sys::path::append(child, name);
      if (!snapshotPath(child.str().str(), /*isRoot=*/false, snapshots,
                        error_out))
        return false;
    }

    return true;
  }

public:
  LocalFileCollectionSnapshotter(basic::FileSystem& fs) : fs(fs) {}

  virtual bool snapshot(const FileCollectionSpec& spec,
                        FileCollectionSnapshot* snapshot_out,
                        std::string* error_out) override {
    FileCollectionSnapshot::SnapshotMap snapshots;
    for (const auto& root: spec.roots) {
      if (!snapshotPath(root, /*isRoot=*/true, snapshots, error_out))
        return false;
    }

    *snapshot_out = FileCollectionSnapshot(std::move(snapshots));
    return true;
  }
};

}

std::unique_ptr<FileCollectionSnapshotter>
state::createLocalFileCollectionSnapshotter(basic::FileSystem& fs) {
  return std::make_unique<LocalFileCollectionSnapshotter>(fs);
}
