//===- TaskStateTrace.h -----------------------------------------*- C++ -*-===//
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

#ifndef TASKSTATE_CORE_TASKSTATETRACE_H
#define TASKSTATE_CORE_TASKSTATETRACE_H

#include "taskstate/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

#include <mutex>
#include <string>
#include <unordered_map>

namespace taskstate {
namespace core {

/// This class assists in writing artifact state tracing information to an
/// external log file, suitable for ex post facto debugging and analysis.
///
/// Sessions for different tasks may record events concurrently.
class TaskStateTrace {
    /// The output file pointer.
    void* outputPtr = nullptr;

    std::mutex traceMutex;

    unsigned numNamedTasks = 0;
    std::unordered_map<std::string, std::string> taskNames;

private:
    const char* getTaskName(StringRef taskPath);

public:
    TaskStateTrace();
    ~TaskStateTrace();

    /// Open an output file for writing, must be called prior to any trace
    /// recording, and may only be called once per trace object.
    ///
    /// \returns True on success.
    bool open(const std::string& path, std::string* error_out);

    /// Close the output file; no subsequent trace recording may be done.
    ///
    /// \returns True on success.
    bool close(std::string* error_out);

    /// Check if the trace output is open.
    bool isOpen() const { return outputPtr != nullptr; }

    /// @name Trace Recording APIs
    /// @{

    void sessionCreated(StringRef taskPath, bool hasHistory);
    void checkedUpToDate(StringRef taskPath, bool upToDate,
                         unsigned numChanges);
    void computedInputChanges(StringRef taskPath, bool incremental,
                              unsigned numChanges);
    void computedCacheKey(StringRef taskPath, StringRef cacheKey);
    void committedExecution(StringRef taskPath, bool successful);
    void sessionFailed(StringRef taskPath);
    void sessionFinished(StringRef taskPath);

    /// @}
};

}
}

#endif
