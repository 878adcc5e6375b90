//===-- CommandUtil.cpp ---------------------------------------------------===//
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

#include "CommandUtil.h"
#include "taskstate/Commands/Commands.h"

#include "taskstate/Core/TaskArtifactState.h"
#include "taskstate/State/TaskHistoryStore.h"

#include "llvm/Support/raw_ostream.h"

#include <cassert>
#include <cctype>

using namespace taskstate;
using namespace taskstate::commands;

static std::string programName;

void commands::setProgramName(StringRef name) {
  assert(programName.empty());
  programName = name.str();
}

const char* commands::getProgramName() {
  if (programName.empty())
    return nullptr;

  return programName.c_str();
}

static char hexdigit(unsigned input) {
  return (input < 10) ? '0' + input : 'A' + input - 10;
}

std::string util::escapedString(StringRef str) {
  std::string result;
  llvm::raw_string_ostream resultStream(result);
  for (unsigned i = 0; i < str.size(); ++i) {
    char c = str[i];
    if (c == '"') {
      resultStream << "\\\"";
    } else if (isprint(static_cast<unsigned char>(c))) {
      resultStream << c;
    } else if (c == '\n') {
      resultStream << "\\n";
    } else {
      resultStream << "\\x"
             << hexdigit(((unsigned char) c >> 4) & 0xF)
             << hexdigit((unsigned char) c & 0xF);
    }
  }
  resultStream.flush();
  return result;
}

std::unique_ptr<state::TaskHistoryStore>
util::openHistoryStore(StringRef dbPath, std::string* error_out) {
  if (dbPath.empty())
    return state::createInMemoryTaskHistoryStore();

  return state::createSQLiteTaskHistoryStore(
      dbPath, core::TaskArtifactStateRepository::getSchemaVersion(),
      /*recreateOnUnmatchedVersion=*/true, error_out);
}
