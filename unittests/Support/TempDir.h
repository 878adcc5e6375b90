//===- TempDir.h ------------------------------------------------*- C++ -*-===//
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

#ifndef TASKSTATE_UNITTESTS_TEMPDIR_H
#define TASKSTATE_UNITTESTS_TEMPDIR_H

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringRef.h"

#include <string>

namespace taskstate {

/// A uniquely named temporary directory, removed with its contents on
/// destruction.
class TmpDir {
private:
    TmpDir(const TmpDir&) = delete;
    TmpDir& operator=(const TmpDir&) = delete;

    llvm::SmallString<256> tempDir;

public:
    TmpDir(llvm::StringRef namePrefix = "");
    ~TmpDir();

    const char *c_str();
    std::string str() const;

    /// Get the path of an entry inside the directory.
    std::string path(llvm::StringRef name) const;

    /// Write a file inside the directory, creating parent directories as
    /// needed, and return its path.
    std::string writeFile(llvm::StringRef name, llvm::StringRef contents);
};

}

#endif
