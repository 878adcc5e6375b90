//===- FileSnapshot.h -------------------------------------------*- C++ -*-===//
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

#ifndef TASKSTATE_STATE_FILESNAPSHOT_H
#define TASKSTATE_STATE_FILESNAPSHOT_H

#include "taskstate/Basic/BinaryCoding.h"
#include "taskstate/Basic/FileInfo.h"
#include "taskstate/Basic/Hashing.h"

#include <cstdint>

namespace taskstate {
namespace state {

enum class FileType : uint8_t {
  Missing = 0,
  RegularFile = 1,
  Directory = 2,
};

/// The recorded state of a single path.
struct FileSnapshot {
  FileType type = FileType::Missing;

  /// The size of the file, for regular files.
  uint64_t size = 0;

  /// The modification time observed when the snapshot was taken.
  basic::FileTimestamp modTime;

  /// The hash of the file contents, for regular files.
  basic::HashCode contentHash;

  FileSnapshot() {}
  FileSnapshot(FileType type, uint64_t size, basic::FileTimestamp modTime,
               basic::HashCode contentHash)
      : type(type), size(size), modTime(modTime), contentHash(contentHash) {}

  static FileSnapshot makeMissing() { return FileSnapshot(); }
  static FileSnapshot makeDirectory(basic::FileTimestamp modTime) {
    return FileSnapshot(FileType::Directory, 0, modTime, basic::HashCode());
  }
  static FileSnapshot makeRegularFile(uint64_t size,
                                      basic::FileTimestamp modTime,
                                      basic::HashCode contentHash) {
    return FileSnapshot(FileType::RegularFile, size, modTime, contentHash);
  }

  bool isMissing() const { return type == FileType::Missing; }
  bool isDirectory() const { return type == FileType::Directory; }
  bool isRegularFile() const { return type == FileType::RegularFile; }

  /// Check whether this snapshot has the same content as \p other.
  ///
  /// Only the type and content hash participate; size and timestamp are
  /// informational.
  bool isContentUpToDate(const FileSnapshot& other) const {
    return type == other.type && contentHash == other.contentHash;
  }

  bool operator==(const FileSnapshot& rhs) const {
    return type == rhs.type && size == rhs.size && modTime == rhs.modTime &&
      contentHash == rhs.contentHash;
  }
  bool operator!=(const FileSnapshot& rhs) const { return !(*this == rhs); }
};

}

namespace basic {

template<>
struct BinaryCodingTraits<state::FileSnapshot> {
  static inline void encode(const state::FileSnapshot& value,
                            BinaryEncoder& coder) {
    coder.write(uint8_t(value.type));
    coder.write(value.size);
    coder.write(value.modTime);
    coder.write(value.contentHash);
  }
  static inline void decode(state::FileSnapshot& value, BinaryDecoder& coder) {
    uint8_t type;
    coder.read(type);
    // Unknown types decode as missing files.
    switch (type) {
    case uint8_t(state::FileType::RegularFile):
      value.type = state::FileType::RegularFile;
      break;
    case uint8_t(state::FileType::Directory):
      value.type = state::FileType::Directory;
      break;
    default:
      value.type = state::FileType::Missing;
      break;
    }
    coder.read(value.size);
    coder.read(value.modTime);
    coder.read(value.contentHash);
  }
};

}
}

#endif
