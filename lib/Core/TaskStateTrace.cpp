//===-- TaskStateTrace.cpp ------------------------------------------------===//
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

#include "taskstate/Core/TaskStateTrace.h"

#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/raw_ostream.h"

#include <cassert>
#include <cstdio>
#include <cstring>

#include <errno.h>

using namespace taskstate;
using namespace taskstate::core;

/// Escape a string for use inside a quoted trace field.
static std::string escapeField(StringRef value) {
  std::string result;
  llvm::raw_string_ostream os(result);
  llvm::printEscapedString(value, os);
  return os.str();
}

TaskStateTrace::TaskStateTrace() {}

TaskStateTrace::~TaskStateTrace() {
  if (isOpen()) {
    std::string error;
    (void)close(&error);
  }
}

bool TaskStateTrace::open(const std::string& filename,
                          std::string* error_out) {
  assert(!isOpen());

  FILE *fp = fopen(filename.c_str(), "wb");
  if (!fp) {
    *error_out = "unable to open '" + filename + "' (" +
      ::strerror(errno) + ")";
    return false;
  }
  outputPtr = fp;
  assert(isOpen());

  // Write the opening header.
  fprintf(fp, "[\n");
  return true;
}

bool TaskStateTrace::close(std::string* error_out) {
  assert(isOpen());

  FILE *fp = static_cast<FILE*>(outputPtr);

  // Write the footer.
  fprintf(fp, "]\n");

  bool success = fclose(fp) == 0;
  outputPtr = nullptr;
  assert(!isOpen());

  if (!success) {
    *error_out = "unable to close file";
    return false;
  }

  return true;
}

#pragma mark - Tracing APIs

const char* TaskStateTrace::getTaskName(StringRef taskPath) {
  FILE *fp = static_cast<FILE*>(outputPtr);

  // See if we have already assigned a name.
  auto it = taskNames.find(taskPath.str());
  if (it != taskNames.end())
    return it->second.c_str();

  // Otherwise, create a name.
  char name[64];
  snprintf(name, sizeof(name), "T%u", ++numNamedTasks);
  auto result = taskNames.emplace(taskPath.str(), name);

  // Report the newly seen task.
  fprintf(fp, "{ \"new-task\", \"%s\", \"%s\" },\n", name,
          escapeField(taskPath).c_str());

  return result.first->second.c_str();
}

void TaskStateTrace::sessionCreated(StringRef taskPath, bool hasHistory) {
  if (!isOpen()) return;
  std::lock_guard<std::mutex> guard(traceMutex);
  FILE *fp = static_cast<FILE*>(outputPtr);

  fprintf(fp, "{ \"session-created\", \"%s\", \"%s\" },\n",
          getTaskName(taskPath), hasHistory ? "has-history" : "no-history");
}

void TaskStateTrace::checkedUpToDate(StringRef taskPath, bool upToDate,
                                     unsigned numChanges) {
  if (!isOpen()) return;
  std::lock_guard<std::mutex> guard(traceMutex);
  FILE *fp = static_cast<FILE*>(outputPtr);

  fprintf(fp, "{ \"checked-up-to-date\", \"%s\", \"%s\", %u },\n",
          getTaskName(taskPath), upToDate ? "up-to-date" : "out-of-date",
          numChanges);
}

void TaskStateTrace::computedInputChanges(StringRef taskPath, bool incremental,
                                          unsigned numChanges) {
  if (!isOpen()) return;
  std::lock_guard<std::mutex> guard(traceMutex);
  FILE *fp = static_cast<FILE*>(outputPtr);

  fprintf(fp, "{ \"computed-input-changes\", \"%s\", \"%s\", %u },\n",
          getTaskName(taskPath), incremental ? "incremental" : "rebuild",
          numChanges);
}

void TaskStateTrace::computedCacheKey(StringRef taskPath, StringRef cacheKey) {
  if (!isOpen()) return;
  std::lock_guard<std::mutex> guard(traceMutex);
  FILE *fp = static_cast<FILE*>(outputPtr);

  fprintf(fp, "{ \"computed-cache-key\", \"%s\", \"%s\" },\n",
          getTaskName(taskPath), cacheKey.str().c_str());
}

void TaskStateTrace::committedExecution(StringRef taskPath, bool successful) {
  if (!isOpen()) return;
  std::lock_guard<std::mutex> guard(traceMutex);
  FILE *fp = static_cast<FILE*>(outputPtr);

  fprintf(fp, "{ \"committed-execution\", \"%s\", \"%s\" },\n",
          getTaskName(taskPath), successful ? "successful" : "failed");
}

void TaskStateTrace::sessionFailed(StringRef taskPath) {
  if (!isOpen()) return;
  std::lock_guard<std::mutex> guard(traceMutex);
  FILE *fp = static_cast<FILE*>(outputPtr);

  fprintf(fp, "{ \"session-failed\", \"%s\" },\n", getTaskName(taskPath));
}

void TaskStateTrace::sessionFinished(StringRef taskPath) {
  if (!isOpen()) return;
  std::lock_guard<std::mutex> guard(traceMutex);
  FILE *fp = static_cast<FILE*>(outputPtr);

  fprintf(fp, "{ \"session-finished\", \"%s\" },\n", getTaskName(taskPath));
}
