//===- Compiler.h -----------------------------------------------*- C++ -*-===//
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

//
// Compiler support and compatibility macros. Liberally taken from LLVM.
//
//===----------------------------------------------------------------------===//

#ifndef TASKSTATE_BASIC_COMPILER_H
#define TASKSTATE_BASIC_COMPILER_H

#if !defined(__has_feature)
#define __has_feature(x) 0
#endif

/// \macro TASKSTATE_MSC_PREREQ
/// \brief Is the compiler MSVC of at least the specified version?
/// The common \param version values to check for are:
///  * 1900: Microsoft Visual Studio 2015 / 14.0
#ifdef _MSC_VER
#define TASKSTATE_MSC_PREREQ(version) (_MSC_VER >= (version))

// We require at least MSVC 2015.
#if !TASKSTATE_MSC_PREREQ(1900)
#error taskstate requires at least MSVC 2015.
#endif

#else
#define TASKSTATE_MSC_PREREQ(version) 0
#endif

/// TASKSTATE_DELETED_FUNCTION - Expands to = delete if the compiler supports
/// it. Use to mark functions as uncallable. Member functions with this should
/// be declared private.
///
/// class DontCopy {
/// private:
///   DontCopy(const DontCopy&) TASKSTATE_DELETED_FUNCTION;
///   DontCopy &operator =(const DontCopy&) TASKSTATE_DELETED_FUNCTION;
/// public:
///   ...
/// };
#if __has_feature(cxx_deleted_functions) || \
    defined(__GXX_EXPERIMENTAL_CXX0X__) || TASKSTATE_MSC_PREREQ(1900) || \
    __cplusplus >= 201103L
#define TASKSTATE_DELETED_FUNCTION = delete
#else
#define TASKSTATE_DELETED_FUNCTION
#endif

#endif
