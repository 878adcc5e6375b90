//===-- IncrementalTaskInputs.cpp -----------------------------------------===//
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

#include "taskstate/Core/IncrementalTaskInputs.h"

#include "llvm/ADT/Twine.h"

using namespace taskstate;
using namespace taskstate::core;

IncrementalTaskInputs::~IncrementalTaskInputs() {}

static llvm::Error makeUsageError(const Twine& message) {
  return llvm::make_error<llvm::StringError>(message,
                                             llvm::inconvertibleErrorCode());
}

llvm::Error IncrementalTaskInputs::outOfDate(
    function_ref<void(const TaskStateChange&)> visitor) {
  if (outOfDateProcessed)
    return makeUsageError("Cannot process outOfDate files multiple times");
  outOfDateProcessed = true;

  for (const auto& change: changes) {
    if (change.isAdded() || change.isModified())
      visitor(change);
  }
  return llvm::Error::success();
}

llvm::Error IncrementalTaskInputs::removed(
    function_ref<void(const TaskStateChange&)> visitor) {
  if (!outOfDateProcessed)
    return makeUsageError(
        "Must first process outOfDate files before processing removed files");
  if (removedProcessed)
    return makeUsageError("Cannot process removed files multiple times");
  removedProcessed = true;

  for (const auto& change: changes) {
    if (change.isRemoved())
      visitor(change);
  }
  return llvm::Error::success();
}

std::vector<TaskStateChange> RebuildIncrementalTaskInputs::makeChanges(
    const std::vector<std::string>& inputFiles) {
  std::vector<TaskStateChange> result;
  for (const auto& path: inputFiles) {
    result.emplace_back(ChangeKind::Added, path,
                        (Twine("Input file ") + path +
                         " is out of date.").str(),
                        false);
  }
  return result;
}
