//===-- FileCollectionSnapshotTest.cpp ------------------------------------===//
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

#include "gtest/gtest.h"

using namespace taskstate;
using namespace taskstate::basic;
using namespace taskstate::state;

namespace {

FileSnapshot makeFile(StringRef contents) {
  return FileSnapshot::makeRegularFile(contents.size(), FileTimestamp(),
                                       hashString(contents));
}

std::vector<FileChange> getChanges(const FileCollectionSnapshot& current,
                                   const FileCollectionSnapshot& previous) {
  std::vector<FileChange> changes;
  current.visitChangesSince(previous, [&](const FileChange& change) {
      changes.push_back(change);
      return true;
    });
  return changes;
}

TEST(FileCollectionSnapshotTest, basic) {
  FileCollectionSnapshot::SnapshotMap previousMap;
  previousMap["a"] = makeFile("a");
  previousMap["b"] = makeFile("b");
  previousMap["c"] = makeFile("c");
  FileCollectionSnapshot previous(previousMap);

  FileCollectionSnapshot::SnapshotMap currentMap;
  currentMap["a"] = makeFile("a");
  currentMap["b"] = makeFile("b2");
  currentMap["d"] = makeFile("d");
  FileCollectionSnapshot current(currentMap);

  auto changes = getChanges(current, previous);
  ASSERT_EQ(3u, changes.size());
  EXPECT_EQ(FileChange("b", ChangeKind::Modified), changes[0]);
  EXPECT_EQ(FileChange("c", ChangeKind::Removed), changes[1]);
  EXPECT_EQ(FileChange("d", ChangeKind::Added), changes[2]);

  EXPECT_TRUE(getChanges(current, current).empty());
}

TEST(FileCollectionSnapshotTest, timestampsAreIgnored) {
  FileTimestamp later;
  later.seconds = 100;

  FileCollectionSnapshot::SnapshotMap previousMap;
  previousMap["a"] = makeFile("a");
  FileCollectionSnapshot::SnapshotMap currentMap;
  currentMap["a"] = FileSnapshot::makeRegularFile(1, later, hashString("a"));

  EXPECT_TRUE(getChanges(FileCollectionSnapshot(currentMap),
                         FileCollectionSnapshot(previousMap)).empty());
  EXPECT_EQ(FileCollectionSnapshot(currentMap).getHash(),
            FileCollectionSnapshot(previousMap).getHash());
}

TEST(FileCollectionSnapshotTest, missingIsAbsent) {
  FileCollectionSnapshot::SnapshotMap previousMap;
  previousMap["a"] = FileSnapshot::makeMissing();
  previousMap["b"] = makeFile("b");
  FileCollectionSnapshot::SnapshotMap currentMap;
  currentMap["a"] = makeFile("a");
  currentMap["b"] = FileSnapshot::makeMissing();

  auto changes = getChanges(FileCollectionSnapshot(currentMap),
                            FileCollectionSnapshot(previousMap));
  ASSERT_EQ(2u, changes.size());
  EXPECT_EQ(FileChange("a", ChangeKind::Added), changes[0]);
  EXPECT_EQ(FileChange("b", ChangeKind::Removed), changes[1]);

  // Missing on both sides is no change at all.
  FileCollectionSnapshot::SnapshotMap missingMap;
  missingMap["x"] = FileSnapshot::makeMissing();
  EXPECT_TRUE(getChanges(FileCollectionSnapshot(missingMap),
                         FileCollectionSnapshot()).empty());
}

TEST(FileCollectionSnapshotTest, typeChange) {
  FileCollectionSnapshot::SnapshotMap previousMap;
  previousMap["a"] = makeFile("a");
  FileCollectionSnapshot::SnapshotMap currentMap;
  currentMap["a"] = FileSnapshot::makeDirectory(FileTimestamp());

  auto changes = getChanges(FileCollectionSnapshot(currentMap),
                            FileCollectionSnapshot(previousMap));
  ASSERT_EQ(1u, changes.size());
  EXPECT_EQ(FileChange("a", ChangeKind::Modified), changes[0]);
}

TEST(FileCollectionSnapshotTest, earlyStop) {
  FileCollectionSnapshot::SnapshotMap currentMap;
  currentMap["a"] = makeFile("a");
  currentMap["b"] = makeFile("b");
  currentMap["c"] = makeFile("c");

  int numVisited = 0;
  bool completed = FileCollectionSnapshot(currentMap).visitChangesSince(
      FileCollectionSnapshot(), [&](const FileChange&) {
        return ++numVisited < 2;
      });
  EXPECT_FALSE(completed);
  EXPECT_EQ(2, numVisited);
}

TEST(FileCollectionSnapshotTest, getFiles) {
  FileCollectionSnapshot::SnapshotMap map;
  map["dir"] = FileSnapshot::makeDirectory(FileTimestamp());
  map["dir/b"] = makeFile("b");
  map["dir/a"] = makeFile("a");
  map["gone"] = FileSnapshot::makeMissing();
  FileCollectionSnapshot snapshot(map);

  EXPECT_EQ(std::vector<std::string>({ "dir/a", "dir/b" }),
            snapshot.getFiles());
  ASSERT_NE(nullptr, snapshot.getSnapshot("dir/a"));
  EXPECT_TRUE(snapshot.getSnapshot("dir/a")->isRegularFile());
  EXPECT_EQ(nullptr, snapshot.getSnapshot("other"));
}

TEST(FileCollectionSnapshotTest, getHash) {
  FileCollectionSnapshot::SnapshotMap map;
  map["a"] = makeFile("a");
  map["b"] = makeFile("b");

  EXPECT_EQ(FileCollectionSnapshot(map).getHash(),
            FileCollectionSnapshot(map).getHash());
  EXPECT_NE(FileCollectionSnapshot(map).getHash(),
            FileCollectionSnapshot().getHash());

  auto renamed = map;
  renamed.erase("b");
  renamed["c"] = makeFile("b");
  EXPECT_NE(FileCollectionSnapshot(map).getHash(),
            FileCollectionSnapshot(renamed).getHash());
}

}
