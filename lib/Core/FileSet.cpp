//===-- FileSet.cpp -------------------------------------------------------===//
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

#include "taskstate/Core/FileSet.h"

#include <algorithm>

using namespace taskstate;
using namespace taskstate::core;

bool FileSet::contains(StringRef path) const {
  return std::binary_search(paths.begin(), paths.end(), path.str());
}
