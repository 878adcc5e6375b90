//===- Commands.h -----------------------------------------------*- C++ -*-===//
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
// This file contains the entry points for the taskstate command line
// subtools.
//
//===----------------------------------------------------------------------===//

#ifndef TASKSTATE_COMMANDS_COMMANDS_H
#define TASKSTATE_COMMANDS_COMMANDS_H

#include "taskstate/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

#include <string>
#include <vector>

namespace taskstate {
namespace commands {

/// Register the program name.
///
/// \param name The program name to use. This must point to static memory or
/// otherwise survive for the duration of the process.
void setProgramName(StringRef name);

/// Get the registered program name, or null if none was registered.
const char* getProgramName();

int executeCheckCommand(const std::vector<std::string>& args);
int executeHistoryCommand(const std::vector<std::string>& args);

}
}

#endif
