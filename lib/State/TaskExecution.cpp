//===-- TaskExecution.cpp -------------------------------------------------===//
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

#include "taskstate/State/TaskExecution.h"

#include "taskstate/Basic/BinaryCoding.h"

#include "llvm/ADT/Twine.h"
#include "llvm/Support/raw_ostream.h"

using namespace taskstate;
using namespace taskstate::basic;
using namespace taskstate::state;

/// The version of the encoded record layout.
///
/// Version History:
/// * 1: Initial version.
static const uint32_t currentRecordVersion = 1;

TaskCacheKey TaskExecution::calculateCacheKey() const {
  if (implementationHash.isNull())
    return TaskCacheKey::invalid();

  HashBuilder builder;
  builder.combine(StringRef(taskType));
  builder.combine(implementationHash);
  builder.combine(uint64_t(inputPropertyHashes.size()));
  for (const auto& entry: inputPropertyHashes) {
    builder.combine(StringRef(entry.first));
    builder.combine(entry.second);
  }
  builder.combine(uint64_t(inputFileSnapshots.size()));
  for (const auto& entry: inputFileSnapshots) {
    builder.combine(StringRef(entry.first));
    builder.combine(entry.second.getHash());
  }
  return TaskCacheKey::make(builder.finish());
}

std::vector<uint8_t> TaskExecution::toData() const {
  BinaryEncoder coder;
  coder.write(currentRecordVersion);
  coder.write(taskPath);
  coder.write(taskType);
  coder.write(implementationHash);
  coder.write(inputPropertyHashes);
  coder.write(inputFileSnapshots);
  coder.write(std::vector<std::string>(outputPropertyNames.begin(),
                                       outputPropertyNames.end()));
  coder.write(outputFileSnapshots);
  coder.write(discoveredInputSnapshot);
  coder.write(successful);
  coder.write(cacheKey.isValid());
  coder.write(cacheKey.getHashCode());
  return coder.contents();
}

bool TaskExecution::fromData(StringRef data, TaskExecution* execution_out,
                             std::string* error_out) {
  BinaryDecoder coder(data);

  uint32_t version;
  coder.read(version);
  if (coder.hasError()) {
    *error_out = "invalid task execution record: truncated header";
    return false;
  }
  if (version != currentRecordVersion) {
    *error_out = (Twine("invalid task execution record: unsupported version ")
                  + Twine(version)).str();
    return false;
  }

  TaskExecution result;
  std::vector<std::string> outputPropertyNames;
  bool hasCacheKey;
  HashCode cacheKeyHash;
  coder.read(result.taskPath);
  coder.read(result.taskType);
  coder.read(result.implementationHash);
  coder.read(result.inputPropertyHashes);
  coder.read(result.inputFileSnapshots);
  coder.read(outputPropertyNames);
  coder.read(result.outputFileSnapshots);
  coder.read(result.discoveredInputSnapshot);
  coder.read(result.successful);
  coder.read(hasCacheKey);
  coder.read(cacheKeyHash);
  if (!coder.finish()) {
    *error_out = "invalid task execution record: malformed contents";
    return false;
  }

  result.outputPropertyNames.insert(outputPropertyNames.begin(),
                                    outputPropertyNames.end());
  if (hasCacheKey)
    result.cacheKey = TaskCacheKey::make(cacheKeyHash);

  *execution_out = std::move(result);
  return true;
}

static StringRef getFileTypeName(FileType type) {
  switch (type) {
  case FileType::Missing:
    return "missing";
  case FileType::RegularFile:
    return "file";
  case FileType::Directory:
    return "directory";
  }
  return "unknown";
}

static void dumpSnapshot(raw_ostream& os, StringRef title,
                         const FileCollectionSnapshot& snapshot) {
  os << "  " << title << " (" << snapshot.getHash().str() << "):\n";
  for (const auto& entry: snapshot.getSnapshots()) {
    os << "    " << entry.first << " -- " << getFileTypeName(entry.second.type);
    if (entry.second.isRegularFile())
      os << ", " << entry.second.size << " bytes, "
         << entry.second.contentHash.str();
    os << "\n";
  }
}

void TaskExecution::dump(raw_ostream& os) const {
  os << "task: " << taskPath << "\n";
  os << "  type: " << taskType << "\n";
  os << "  implementation: "
     << (implementationHash.isNull() ? "unknown" : implementationHash.str())
     << "\n";
  os << "  successful: " << (successful ? "yes" : "no") << "\n";
  os << "  cache-key: " << cacheKey.str() << "\n";
  for (const auto& entry: inputPropertyHashes) {
    os << "  input-property '" << entry.first << "': "
       << entry.second.str() << "\n";
  }
  for (const auto& entry: inputFileSnapshots) {
    dumpSnapshot(os, "input-files '" + entry.first + "'", entry.second);
  }
  for (const auto& name: outputPropertyNames) {
    auto it = outputFileSnapshots.find(name);
    if (it == outputFileSnapshots.end()) {
      os << "  output-files '" << name << "': not recorded\n";
      continue;
    }
    dumpSnapshot(os, "output-files '" + name + "'", it->second);
  }
  if (!discoveredInputSnapshot.isEmpty())
    dumpSnapshot(os, "discovered-inputs", discoveredInputSnapshot);
}

bool TaskExecution::operator==(const TaskExecution& rhs) const {
  return (taskPath == rhs.taskPath &&
          taskType == rhs.taskType &&
          implementationHash == rhs.implementationHash &&
          inputPropertyHashes == rhs.inputPropertyHashes &&
          inputFileSnapshots == rhs.inputFileSnapshots &&
          outputPropertyNames == rhs.outputPropertyNames &&
          outputFileSnapshots == rhs.outputFileSnapshots &&
          discoveredInputSnapshot == rhs.discoveredInputSnapshot &&
          successful == rhs.successful &&
          cacheKey == rhs.cacheKey);
}
