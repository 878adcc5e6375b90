//===-- FileCollectionSnapshot.cpp ----------------------------------------===//
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

#include "taskstate/State/FileCollectionSnapshot.h"

using namespace taskstate;
using namespace taskstate::state;

StringRef state::getChangeKindDescription(ChangeKind kind) {
  switch (kind) {
  case ChangeKind::Added:
    return "has been added";
  case ChangeKind::Removed:
    return "has been removed";
  case ChangeKind::Modified:
    return "has changed";
  case ChangeKind::Other:
    return "has changed";
  }
  return "has changed";
}

const FileSnapshot* FileCollectionSnapshot::getSnapshot(StringRef path) const {
  auto it = snapshots.find(path.str());
  if (it == snapshots.end())
    return nullptr;
  return &it->second;
}

std::vector<std::string> FileCollectionSnapshot::getFiles() const {
  std::vector<std::string> result;
  for (const auto& entry: snapshots) {
    if (entry.second.isRegularFile())
      result.push_back(entry.first);
  }
  return result;
}

basic::HashCode FileCollectionSnapshot::getHash() const {
  basic::HashBuilder builder;
  builder.combine(uint64_t(snapshots.size()));
  for (const auto& entry: snapshots) {
    builder.combine(entry.first);
    builder.combine(uint64_t(entry.second.type));
    builder.combine(entry.second.contentHash);
  }
  return builder.finish();
}

bool FileCollectionSnapshot::visitChangesSince(
    const FileCollectionSnapshot& previous,
    function_ref<bool(const FileChange&)> visitor) const {
  // Walk both maps in path order, treating missing entries as absent.
  auto current = snapshots.begin(), currentEnd = snapshots.end();
  auto prior = previous.snapshots.begin(),
    priorEnd = previous.snapshots.end();
  auto skipMissing = [](FileCollectionSnapshot::SnapshotMap::const_iterator it,
                        FileCollectionSnapshot::SnapshotMap::const_iterator end) {
    while (it != end && it->second.isMissing())
      ++it;
    return it;
  };

  current = skipMissing(current, currentEnd);
  prior = skipMissing(prior, priorEnd);
  while (current != currentEnd || prior != priorEnd) {
    if (prior == priorEnd ||
        (current != currentEnd && current->first < prior->first)) {
      if (!visitor(FileChange(current->first, ChangeKind::Added)))
        return false;
      current = skipMissing(++current, currentEnd);
    } else if (current == currentEnd || prior->first < current->first) {
      if (!visitor(FileChange(prior->first, ChangeKind::Removed)))
        return false;
      prior = skipMissing(++prior, priorEnd);
    } else {
      if (!current->second.isContentUpToDate(prior->second)) {
        if (!visitor(FileChange(current->first, ChangeKind::Modified)))
          return false;
      }
      current = skipMissing(++current, currentEnd);
      prior = skipMissing(++prior, priorEnd);
    }
  }

  return true;
}
