//===- FileCollectionSnapshot.h ---------------------------------*- C++ -*-===//
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

#ifndef TASKSTATE_STATE_FILECOLLECTIONSNAPSHOT_H
#define TASKSTATE_STATE_FILECOLLECTIONSNAPSHOT_H

#include "taskstate/Basic/BinaryCoding.h"
#include "taskstate/Basic/Hashing.h"
#include "taskstate/Basic/LLVM.h"
#include "taskstate/State/FileSnapshot.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringRef.h"

#include <map>
#include <string>
#include <vector>

namespace taskstate {
namespace state {

/// The kind of a detected change.
enum class ChangeKind : uint8_t {
  Added,
  Removed,
  Modified,

  /// A change which is not about a single path (e.g., a changed task type).
  Other,
};

/// Get a human readable description of a change kind, suitable for use in
/// a sentence ("Input file foo <description>.").
StringRef getChangeKindDescription(ChangeKind kind);

/// A change to a single path between two snapshots.
struct FileChange {
  std::string path;
  ChangeKind kind;

  FileChange(StringRef path, ChangeKind kind) : path(path.str()), kind(kind) {}

  bool operator==(const FileChange& rhs) const {
    return path == rhs.path && kind == rhs.kind;
  }
};

/// An immutable record of the state of a collection of files.
///
/// Entries are keyed and ordered by path, so neither equality, hashing, nor
/// diffing depend on the order in which the files were enumerated.
class FileCollectionSnapshot {
public:
  typedef std::map<std::string, FileSnapshot> SnapshotMap;

private:
  SnapshotMap snapshots;

public:
  FileCollectionSnapshot() {}
  explicit FileCollectionSnapshot(SnapshotMap snapshots)
      : snapshots(std::move(snapshots)) {}

  bool isEmpty() const { return snapshots.empty(); }
  size_t size() const { return snapshots.size(); }

  const SnapshotMap& getSnapshots() const { return snapshots; }

  /// Get the snapshot for a single path, if recorded.
  const FileSnapshot* getSnapshot(StringRef path) const;

  /// Get the paths of all existing regular files, in sorted order.
  std::vector<std::string> getFiles() const;

  /// Get a deterministic hash of the recorded content.
  ///
  /// Only the path, type and content hash of each entry participate.
  basic::HashCode getHash() const;

  /// Visit the changes of this snapshot relative to \p previous.
  ///
  /// Changes are reported in path order. Entries for missing paths are treated
  /// as absent. Visiting stops early if \p visitor returns false.
  ///
  /// \returns False if the visitor requested an early stop.
  bool visitChangesSince(const FileCollectionSnapshot& previous,
                         function_ref<bool(const FileChange&)> visitor) const;

  bool operator==(const FileCollectionSnapshot& rhs) const {
    return snapshots == rhs.snapshots;
  }
  bool operator!=(const FileCollectionSnapshot& rhs) const {
    return !(*this == rhs);
  }
};

}

namespace basic {

template<>
struct BinaryCodingTraits<state::FileCollectionSnapshot> {
  static inline void encode(const state::FileCollectionSnapshot& value,
                            BinaryEncoder& coder) {
    coder.write(value.getSnapshots());
  }
  static inline void decode(state::FileCollectionSnapshot& value,
                            BinaryDecoder& coder) {
    state::FileCollectionSnapshot::SnapshotMap snapshots;
    coder.read(snapshots);
    value = state::FileCollectionSnapshot(std::move(snapshots));
  }
};

}
}

#endif
