//===-- Version.cpp -------------------------------------------------------===//
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

#include "taskstate/Basic/Version.h"

#include <string>

namespace taskstate {

std::string getTaskStateFullVersion(StringRef productName) {
  std::string result = productName.str() + " version 1.0";

  // Include the additional build version information, if present.
#ifdef TASKSTATE_VENDOR_STRING
  result = std::string(TASKSTATE_VENDOR_STRING) + " " + result;
#endif
#ifdef TASKSTATE_VERSION_STRING
  result = result + " (" + std::string(TASKSTATE_VERSION_STRING) + ")";
#endif

  return result;
}

}
