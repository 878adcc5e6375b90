//===- FileInfo.h -----------------------------------------------*- C++ -*-===//
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

//
// This file contains the FileInfo wrapper, which is the cheap stat-level view
// of a path used by the file system abstraction and by snapshotters.
//
//===----------------------------------------------------------------------===//

#ifndef TASKSTATE_BASIC_FILEINFO_H
#define TASKSTATE_BASIC_FILEINFO_H

#include "taskstate/Basic/BinaryCoding.h"

#include <cstdint>
#include <string>

namespace taskstate {
namespace basic {

/// File timestamp wrapper.
struct FileTimestamp {
  uint64_t seconds = 0;
  uint64_t nanoseconds = 0;

  bool operator==(const FileTimestamp& rhs) const {
    return seconds == rhs.seconds && nanoseconds == rhs.nanoseconds;
  }
  bool operator!=(const FileTimestamp& rhs) const {
    return !(*this == rhs);
  }
  bool operator<(const FileTimestamp& rhs) const {
    return (seconds < rhs.seconds ||
            (seconds == rhs.seconds && nanoseconds < rhs.nanoseconds));
  }
};

/// File information which is intended to be used as a proxy for the state of
/// a path.
///
/// This structure is intentionally sized to have no packing holes.
struct FileInfo {
  /// The device number.
  uint64_t device = 0;
  /// The inode number.
  uint64_t inode = 0;
  /// The mode flags of the file.
  uint64_t mode = 0;
  /// The size of the file.
  uint64_t size = 0;
  /// The modification time of the file.
  FileTimestamp modTime;

  /// Check if this is a FileInfo representing a missing file.
  bool isMissing() const {
    // We use an all-zero FileInfo as a sentinel, under the assumption this can
    // never exist in normal circumstances.
    return (device == 0 && inode == 0 && mode == 0 && size == 0 &&
            modTime.seconds == 0 && modTime.nanoseconds == 0);
  }

  /// Check if the FileInfo corresponds to a directory.
  bool isDirectory() const;

  /// Check if the FileInfo corresponds to a regular file.
  bool isRegularFile() const;

  /// Check if the FileInfo corresponds to a symbolic link (only meaningful for
  /// information obtained without looking through links).
  bool isSymlink() const;

  bool operator==(const FileInfo& rhs) const {
    return (device == rhs.device &&
            inode == rhs.inode &&
            mode == rhs.mode &&
            size == rhs.size &&
            modTime == rhs.modTime);
  }

  bool operator!=(const FileInfo& rhs) const {
    return !(*this == rhs);
  }

  /// Get the information to represent the state of the given node in the file
  /// system.
  ///
  /// \param asLink If yes, checks the information for the file path without
  /// looking through symbolic links.
  ///
  /// \returns The FileInfo for the given path, which will be missing if the
  /// path does not exist (or any error was encountered).
  static FileInfo getInfoForPath(const std::string& path, bool asLink = false);
};

template<>
struct BinaryCodingTraits<FileTimestamp> {
  static inline void encode(const FileTimestamp& value, BinaryEncoder& coder) {
    coder.write(value.seconds);
    coder.write(value.nanoseconds);
  }
  static inline void decode(FileTimestamp& value, BinaryDecoder& coder) {
    coder.read(value.seconds);
    coder.read(value.nanoseconds);
  }
};

template<>
struct BinaryCodingTraits<FileInfo> {
  static inline void encode(const FileInfo& value, BinaryEncoder& coder) {
    coder.write(value.device);
    coder.write(value.inode);
    coder.write(value.mode);
    coder.write(value.size);
    coder.write(value.modTime);
  }
  static inline void decode(FileInfo& value, BinaryDecoder& coder) {
    coder.read(value.device);
    coder.read(value.inode);
    coder.read(value.mode);
    coder.read(value.size);
    coder.read(value.modTime);
  }
};

}
}

#endif
