//===-- PlatformUtility.cpp -----------------------------------------------===//
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

#include "taskstate/Basic/PlatformUtility.h"
#include "taskstate/Basic/Stat.h"

#if defined(_WIN32)
#include <direct.h>
#include <io.h>
#else
#include <unistd.h>
#endif

#include <cstring>

using namespace taskstate;
using namespace taskstate::basic;

int sys::lstat(const char *fileName, sys::StatStruct *buf) {
#if defined(_WIN32)
  // Symbolic links are not distinguished on Windows.
  return ::_stat(fileName, buf);
#else
  return ::lstat(fileName, buf);
#endif
}

int sys::stat(const char *fileName, sys::StatStruct *buf) {
#if defined(_WIN32)
  return ::_stat(fileName, buf);
#else
  return ::stat(fileName, buf);
#endif
}

bool sys::mkdir(const char* fileName) {
#if defined(_WIN32)
  return ::_mkdir(fileName) == 0;
#else
  return ::mkdir(fileName, S_IRWXU | S_IRWXG |  S_IRWXO) == 0;
#endif
}

int sys::rmdir(const char *path) {
#if defined(_WIN32)
  return ::_rmdir(path);
#else
  return ::rmdir(path);
#endif
}

int sys::unlink(const char *fileName) {
#if defined(_WIN32)
  return ::_unlink(fileName);
#else
  return ::unlink(fileName);
#endif
}

std::string sys::strerror(int error) {
  return ::strerror(error);
}
