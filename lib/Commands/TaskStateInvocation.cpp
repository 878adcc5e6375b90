//===-- TaskStateInvocation.cpp -------------------------------------------===//
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

#include "taskstate/Commands/TaskStateInvocation.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Format.h"
#include "llvm/Support/SourceMgr.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdlib>

using namespace taskstate;
using namespace taskstate::commands;

void TaskStateInvocation::getUsage(int optionWidth, raw_ostream& os) {
  const struct Options {
    llvm::StringRef option, helpText;
  } options[] = {
    { "--help", "show this help message and exit" },
    { "--db <PATH>", "use the task history database at PATH" },
    { "--no-db", "keep the task history in memory only" },
    { "--trace <PATH>", "trace artifact state operation to PATH" },
    { "--task <PATH>", "the path identifying the task [required]" },
    { "--type <NAME>", "the type of the task" },
    { "--impl-version <VERSION>",
      "the task implementation version, empty if unknown" },
    { "--property <NAME>=<VALUE>", "declare an input property value" },
    { "--input <NAME>=<PATH>", "add an input file root to property NAME" },
    { "--output <NAME>=<PATH>", "add an output file root to property NAME" },
    { "--discovered <PATH>", "record an input discovered by the task" },
    { "--max-changes <N>", "report at most N changes" },
    { "--commit", "record an execution of the task" },
    { "--failed", "record the execution as failed" },
  };

  for (const auto& entry: options) {
    os << "  " << llvm::format("%-*s", optionWidth, entry.option.str().c_str())
       << " " << entry.helpText << "\n";
  }
}

void TaskStateInvocation::parse(ArrayRef<std::string> args,
                                llvm::SourceMgr& sourceMgr) {
  auto error = [&](const Twine &message) {
    sourceMgr.PrintMessage(llvm::SMLoc{}, llvm::SourceMgr::DK_Error, message);
    hadErrors = true;
  };

  // Split a `name=value` argument.
  auto splitAssignment = [&](const std::string& option,
                             const std::string& argument,
                             std::string& name_out,
                             std::string& value_out) -> bool {
    auto split = StringRef(argument).split('=');
    if (split.first.empty() || split.first.size() == argument.size()) {
      error("invalid argument '" + argument + "' to '" + option + "'");
      return false;
    }
    name_out = split.first.str();
    value_out = split.second.str();
    return true;
  };

  while (!args.empty()) {
    const auto& option = args.front();
    args = args.slice(1);

    if (option.empty() || option[0] != '-') {
      error("unexpected argument '" + option + "'");
      break;
    }

    if (option == "--help") {
      showUsage = true;
      break;
    } else if (option == "--no-db") {
      dbPath = "";
    } else if (option == "--commit") {
      commit = true;
    } else if (option == "--failed") {
      failed = true;
    } else if (option == "--db" || option == "--trace" ||
               option == "--task" || option == "--type" ||
               option == "--impl-version" || option == "--discovered") {
      if (args.empty()) {
        error("missing argument to '" + option + "'");
        break;
      }
      const auto& value = args[0];
      args = args.slice(1);

      if (option == "--db") {
        dbPath = value;
      } else if (option == "--trace") {
        traceFilePath = value;
      } else if (option == "--task") {
        taskPath = value;
      } else if (option == "--type") {
        taskType = value;
      } else if (option == "--impl-version") {
        implementationVersion = value;
      } else {
        discoveredInputs.push_back(value);
      }
    } else if (option == "--property" || option == "--input" ||
               option == "--output") {
      if (args.empty()) {
        error("missing argument to '" + option + "'");
        break;
      }
      std::string name, value;
      if (!splitAssignment(option, args[0], name, value))
        break;
      args = args.slice(1);

      if (option == "--property") {
        inputProperties[name] = value;
      } else if (option == "--input") {
        inputFiles[name].push_back(value);
      } else {
        outputFiles[name].push_back(value);
      }
    } else if (option == "--max-changes") {
      if (args.empty()) {
        error("missing argument to '" + option + "'");
        break;
      }
      char *end;
      long value = ::strtol(args[0].c_str(), &end, 10);
      if (args[0].empty() || *end != '\0' || value < 0) {
        error("invalid argument '" + args[0] + "' to '" + option + "'");
        break;
      }
      maxReportedChanges = unsigned(value);
      args = args.slice(1);
    } else {
      error("invalid option '" + option + "'");
      break;
    }
  }

  if (!showUsage && !hadErrors && taskPath.empty())
    error("missing required option '--task'");
}

state::TaskDescription TaskStateInvocation::getTaskDescription() const {
  state::TaskDescription task;
  task.path = taskPath;
  task.type = taskType;
  task.inputProperties = inputProperties;
  for (const auto& entry: inputFiles)
    task.inputFiles[entry.first] = state::FileCollectionSpec(entry.second);
  for (const auto& entry: outputFiles)
    task.outputFiles[entry.first] = state::FileCollectionSpec(entry.second);
  return task;
}
