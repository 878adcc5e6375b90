//===- Stat.h ---------------------------------------------------*- C++ -*-===//
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

#ifndef TASKSTATE_BASIC_STAT_H
#define TASKSTATE_BASIC_STAT_H

#include <sys/stat.h>

namespace taskstate {
namespace basic {
namespace sys {

#if !defined(S_ISREG)
#define S_ISREG(mode) (((mode) & _S_IFMT) == _S_IFREG)
#endif

#if !defined(S_ISDIR)
#define S_ISDIR(mode) (((mode) & _S_IFMT) == _S_IFDIR)
#endif

#if !defined(S_ISLNK)
#define S_ISLNK(mode) 0
#endif

#if defined(_WIN32)
using StatStruct = struct ::_stat;
#else
using StatStruct = struct ::stat;
#endif

int lstat(const char *fileName, StatStruct *buf);
int stat(const char *fileName, StatStruct *buf);

}
}
}

#endif // TASKSTATE_BASIC_STAT_H
