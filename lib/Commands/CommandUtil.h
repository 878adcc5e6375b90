//===- CommandUtil.h --------------------------------------------*- C++ -*-===//
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

#ifndef TASKSTATE_COMMANDS_COMMANDUTIL_H
#define TASKSTATE_COMMANDS_COMMANDUTIL_H

#include "taskstate/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

#include <memory>
#include <string>

namespace taskstate {
namespace state {
class TaskHistoryStore;
}

namespace commands {
namespace util {

std::string escapedString(StringRef str);

/// Open the task history store for a command.
///
/// \param dbPath The database path, or empty for an in-memory store.
/// \param error_out [out] Error string if the result is null.
std::unique_ptr<state::TaskHistoryStore>
openHistoryStore(StringRef dbPath, std::string* error_out);

}
}
}

#endif
