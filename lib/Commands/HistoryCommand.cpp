//===-- HistoryCommand.cpp ------------------------------------------------===//
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

#include "taskstate/Commands/Commands.h"

#include "taskstate/State/TaskExecution.h"
#include "taskstate/State/TaskHistoryStore.h"

#include "CommandUtil.h"

#include "llvm/Support/raw_ostream.h"

#include <cstdio>
#include <cstdlib>

using namespace taskstate;
using namespace taskstate::commands;
using namespace taskstate::state;

static void historyUsage(int exitCode) {
  int optionWidth = 20;
  fprintf(stderr, "Usage: %s history [options] [action]\n",
          getProgramName());
  fprintf(stderr, "\nOptions:\n");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "--help",
          "show this help message and exit");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "--db <path>",
          "database path [default: 'taskstate.db']");
  fprintf(stderr, "\nActions:\n");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "list",
          "list the tasks known by the database");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "show <task>...",
          "show the recorded execution of the specified tasks");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "remove <task>...",
          "forget the recorded execution of the specified tasks");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "dump",
          "dump debug database contents");
  ::exit(exitCode);
}

int commands::executeHistoryCommand(const std::vector<std::string>& arguments) {
  std::vector<std::string> args = arguments;
  std::string dbPath = "taskstate.db";

  // Parse options
  while (!args.empty() && !args[0].empty() && args[0][0] == '-') {
    const std::string option = args[0];
    args.erase(args.begin());

    if (option == "--")
      break;

    if (option == "--help") {
      historyUsage(0);
    } else if (option == "--db") {
      if (args.empty()) {
        fprintf(stderr, "error: %s: missing db path\n\n",
                getProgramName());
        historyUsage(1);
      }
      dbPath = args[0];
      args.erase(args.begin());
    } else {
      fprintf(stderr, "error: %s: invalid option: '%s'\n\n",
              getProgramName(), option.c_str());
      historyUsage(1);
    }
  }

  if (args.size() < 1) {
    fprintf(stderr, "error: %s: invalid number of arguments\n",
            getProgramName());
    historyUsage(1);
  }

  // Load database
  std::string error;
  std::unique_ptr<TaskHistoryStore> store =
    util::openHistoryStore(dbPath, &error);
  if (!store) {
    fprintf(stderr, "error: %s: failed to load task history: %s\n",
            getProgramName(), error.c_str());
    return 1;
  }

  // Process requested action
  const std::string action = args[0];
  args.erase(args.begin());

  if ((action == "show" || action == "remove") && args.empty()) {
    fprintf(stderr, "error: %s: missing task path\n\n", getProgramName());
    historyUsage(1);
  }

  if (action == "list") {
    std::vector<std::string> paths;
    if (!store->getTaskPaths(paths, &error)) {
      fprintf(stderr, "error: %s: failed to get tasks: %s\n",
              getProgramName(), error.c_str());
      return 1;
    }

    for (const auto& path: paths) {
      printf("%s\n", path.c_str());
    }
  } else if (action == "show") {
    for (const auto& taskPath: args) {
      TaskExecution execution;
      if (!store->lookupExecution(taskPath, &execution, &error)) {
        if (error.length()) {
          fprintf(stderr, "error: %s: failed to lookup task: %s\n",
                  getProgramName(), error.c_str());
          return 1;
        }
        printf("task: \"%s\"\n  not found\n",
               util::escapedString(taskPath).c_str());
        continue;
      }

      fflush(stdout);
      execution.dump(llvm::outs());
      llvm::outs().flush();
    }
  } else if (action == "remove") {
    for (const auto& taskPath: args) {
      if (!store->removeExecution(taskPath, &error)) {
        fprintf(stderr, "error: %s: failed to remove task: %s\n",
                getProgramName(), error.c_str());
        return 1;
      }
    }
  } else if (action == "dump") {
    store->dump(llvm::outs());
    llvm::outs().flush();
  } else {
    fprintf(stderr, "error: %s: invalid action: '%s'\n\n",
            getProgramName(), action.c_str());
    historyUsage(1);
  }

  return 0;
}
