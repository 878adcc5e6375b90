//===- Hashing.h ------------------------------------------------*- C++ -*-===//
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

#ifndef TASKSTATE_BASIC_HASHING_H
#define TASKSTATE_BASIC_HASHING_H

#include "taskstate/Basic/BinaryCoding.h"
#include "taskstate/Basic/LLVM.h"

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/MD5.h"

#include <array>
#include <cstdint>
#include <string>

namespace taskstate {
namespace basic {

/// A stable content hash.
///
/// Hash codes are persisted in the task history, so they must be identical
/// across processes and hosts. They are always derived from MD5 and never from
/// `llvm::hash_value`, which is seeded per execution.
class HashCode {
public:
  static constexpr size_t NumBytes = 16;

private:
  std::array<uint8_t, NumBytes> bytes;

public:
  /// Create the null hash code, which is used to represent an unknown value.
  HashCode() { bytes.fill(0); }
  explicit HashCode(const std::array<uint8_t, NumBytes>& bytes)
      : bytes(bytes) {}

  bool isNull() const {
    for (auto byte: bytes) {
      if (byte != 0)
        return false;
    }
    return true;
  }

  const std::array<uint8_t, NumBytes>& getBytes() const { return bytes; }

  /// Get the lowercase hexadecimal representation.
  std::string str() const;

  /// Parse a hash code from its hexadecimal representation.
  ///
  /// \returns The hash code, or None if \p hex is malformed.
  static Optional<HashCode> fromString(StringRef hex);

  bool operator==(const HashCode& rhs) const { return bytes == rhs.bytes; }
  bool operator!=(const HashCode& rhs) const { return bytes != rhs.bytes; }
  bool operator<(const HashCode& rhs) const { return bytes < rhs.bytes; }
};

/// Incrementally build a HashCode from a sequence of values.
///
/// Variable length values are framed with their length, so that the sequence
/// ("ab", "c") does not hash the same as ("a", "bc").
class HashBuilder {
  llvm::MD5 hasher;

public:
  HashBuilder() {}

  HashBuilder& combine(StringRef string);
  HashBuilder& combine(uint64_t value);
  HashBuilder& combine(bool value);
  HashBuilder& combine(const HashCode& value);

  /// Compute the final hash code.
  ///
  /// The builder must not be used after this call.
  HashCode finish();
};

/// Hash a single string.
HashCode hashString(StringRef value);

template<>
struct BinaryCodingTraits<HashCode> {
  static inline void encode(const HashCode& value, BinaryEncoder& coder) {
    for (auto byte: value.getBytes())
      coder.write(byte);
  }
  static inline void decode(HashCode& value, BinaryDecoder& coder) {
    std::array<uint8_t, HashCode::NumBytes> bytes;
    for (auto& byte: bytes)
      coder.read(byte);
    value = HashCode(bytes);
  }
};

}
}

#endif
