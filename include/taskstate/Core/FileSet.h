//===- FileSet.h ------------------------------------------------*- C++ -*-===//
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

#ifndef TASKSTATE_CORE_FILESET_H
#define TASKSTATE_CORE_FILESET_H

#include "taskstate/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

#include <string>
#include <vector>

namespace taskstate {
namespace core {

/// A named, sorted collection of file paths handed out to clients.
class FileSet {
  std::string name;
  std::vector<std::string> paths;

public:
  FileSet(StringRef name, std::vector<std::string> paths)
      : name(name.str()), paths(std::move(paths)) {}

  /// Get the display name of the set.
  const std::string& getName() const { return name; }

  const std::vector<std::string>& getPaths() const { return paths; }

  bool isEmpty() const { return paths.empty(); }
  size_t size() const { return paths.size(); }

  bool contains(StringRef path) const;
};

}
}

#endif
