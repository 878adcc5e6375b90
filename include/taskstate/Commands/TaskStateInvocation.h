//===- TaskStateInvocation.h ------------------------------------*- C++ -*-===//
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

#ifndef TASKSTATE_COMMANDS_TASKSTATEINVOCATION_H
#define TASKSTATE_COMMANDS_TASKSTATEINVOCATION_H

#include "taskstate/Basic/LLVM.h"
#include "taskstate/State/TaskDescription.h"

#include "llvm/ADT/ArrayRef.h"

#include <map>
#include <string>
#include <vector>

namespace llvm {
class SourceMgr;
}

namespace taskstate {
namespace commands {

/// The parameters of a single `check` invocation.
class TaskStateInvocation {
public:
  /// Whether the command usage should be printed.
  bool showUsage = false;

  /// The path of the database file to use, or empty to keep the history in
  /// memory only.
  std::string dbPath = "taskstate.db";

  /// The path of the trace output file to use, if any.
  std::string traceFilePath = "";

  /// The path identifying the task.
  std::string taskPath = "";

  /// The type name of the task.
  std::string taskType = "task";

  /// The version of the task implementation, or empty if unknown.
  std::string implementationVersion = "1";

  /// The input property values, by name.
  std::map<std::string, std::string> inputProperties;

  /// The input file roots, by property name.
  std::map<std::string, std::vector<std::string>> inputFiles;

  /// The output file roots, by property name.
  std::map<std::string, std::vector<std::string>> outputFiles;

  /// The inputs discovered while executing the task.
  std::vector<std::string> discoveredInputs;

  /// The maximum number of change messages to report, or 0 for no limit.
  unsigned maxReportedChanges = 0;

  /// Whether to record an execution of the task.
  bool commit = false;

  /// Whether the recorded execution failed.
  bool failed = false;

  /// Whether there were any parsing errors.
  bool hadErrors = false;

public:
  /// Get the appropriate "usage" text to use for the arguments.
  static void getUsage(int optionWidth, raw_ostream& os);

  /// Parse the invocation parameters from the given arguments.
  ///
  /// \param sourceMgr The source manager to use for diagnostics.
  void parse(ArrayRef<std::string> args, llvm::SourceMgr& sourceMgr);

  /// Get the description of the task named by the invocation.
  state::TaskDescription getTaskDescription() const;
};

}
}

#endif
