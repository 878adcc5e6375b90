//===-- TaskImplementationHasher.cpp --------------------------------------===//
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

#include "taskstate/State/TaskDescription.h"

using namespace taskstate;
using namespace taskstate::state;

TaskImplementationHasher::~TaskImplementationHasher() {}

namespace {

class VersionedImplementationHasher : public TaskImplementationHasher {
  std::string version;

public:
  VersionedImplementationHasher(StringRef version) : version(version.str()) {}

  virtual basic::HashCode
  getImplementationHash(const TaskDescription& task) override {
    if (version.empty())
      return basic::HashCode();

    return basic::HashBuilder()
      .combine(StringRef(task.type))
      .combine(StringRef(version))
      .finish();
  }
};

}

std::unique_ptr<TaskImplementationHasher>
state::createVersionedImplementationHasher(StringRef version) {
  return std::make_unique<VersionedImplementationHasher>(version);
}
