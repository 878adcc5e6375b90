//===-- FileSystem.cpp ----------------------------------------------------===//
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

#include "taskstate/Basic/FileSystem.h"
#include "taskstate/Basic/PlatformUtility.h"
#include "taskstate/Basic/Stat.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"

#include <algorithm>
#include <cerrno>
#include <memory>

using namespace taskstate;
using namespace taskstate::basic;

FileSystem::~FileSystem() {}

bool FileSystem::createDirectories(const std::string& path) {
  // Attempt to create the final directory first, to optimize for the common
  // case where we don't need to recurse.
  if (createDirectory(path))
    return true;

  // If that failed, attempt to create the parent.
  StringRef parent = llvm::sys::path::parent_path(path);
  if (parent.empty())
    return false;
  return createDirectories(parent.str()) && createDirectory(path);
}

namespace {

class LocalFileSystem : public FileSystem {
  bool removeTree(const std::string& path) {
    std::vector<std::string> names;
    if (!getDirectoryContents(path, &names))
      return false;

    for (const auto& name: names) {
      SmallString<256> child(path);
      llvm::sys::path::append(child, name);
      if (!remove(child.str().str()))
        return false;
    }

    return sys::rmdir(path.c_str()) == 0;
  }

public:
  LocalFileSystem() {}

  virtual bool
  createDirectory(const std::string& path) override {
    if (!sys::mkdir(path.c_str())) {
      if (errno != EEXIST) {
        return false;
      }
    }
    return true;
  }

  virtual std::unique_ptr<llvm::MemoryBuffer>
  getFileContents(const std::string& path) override {
    auto result = llvm::MemoryBuffer::getFile(path);
    if (result.getError()) {
      return nullptr;
    }
    return std::move(*result);
  }

  virtual bool remove(const std::string& path) override {
    // Assume `path` is a regular file.
    if (sys::unlink(path.c_str()) == 0) {
      return true;
    }

    // Error can't be that `path` is actually a directory (on Linux `EISDIR`
    // will be returned since 2.1.132).
    if (errno != EPERM && errno != EISDIR) {
      return false;
    }

    // Check if `path` is a directory.
    sys::StatStruct statbuf;
    if (sys::lstat(path.c_str(), &statbuf) != 0) {
      return false;
    }

    if (S_ISDIR(statbuf.st_mode)) {
      if (sys::rmdir(path.c_str()) == 0) {
        return true;
      } else {
        return removeTree(path);
      }
    }

    return false;
  }

  virtual FileInfo getFileInfo(const std::string& path) override {
    return FileInfo::getInfoForPath(path);
  }

  virtual FileInfo getLinkInfo(const std::string& path) override {
    return FileInfo::getInfoForPath(path, /*asLink:*/ true);
  }

  virtual bool
  getDirectoryContents(const std::string& path,
                       std::vector<std::string>* names_out) override {
    std::error_code ec;
    std::vector<std::string> names;
    for (auto it = llvm::sys::fs::directory_iterator(path, ec),
         end = llvm::sys::fs::directory_iterator(); it != end;
         it.increment(ec)) {
      if (ec)
        return false;
      names.push_back(llvm::sys::path::filename(it->path()).str());
    }
    if (ec)
      return false;

    std::sort(names.begin(), names.end());
    *names_out = std::move(names);
    return true;
  }
};

}

std::unique_ptr<FileSystem> basic::createLocalFileSystem() {
  return std::make_unique<LocalFileSystem>();
}
