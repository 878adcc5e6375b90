//===-- Hashing.cpp -------------------------------------------------------===//
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

#include "taskstate/Basic/Hashing.h"

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringExtras.h"

using namespace taskstate;
using namespace taskstate::basic;

constexpr size_t HashCode::NumBytes;

std::string HashCode::str() const {
  return llvm::toHex(ArrayRef<uint8_t>(bytes.data(), bytes.size()),
                     /*LowerCase=*/true);
}

Optional<HashCode> HashCode::fromString(StringRef hex) {
  if (hex.size() != NumBytes * 2)
    return None;

  std::array<uint8_t, NumBytes> result;
  for (size_t i = 0; i != NumBytes; ++i) {
    unsigned hi = llvm::hexDigitValue(hex[2 * i]);
    unsigned lo = llvm::hexDigitValue(hex[2 * i + 1]);
    if (hi == ~0U || lo == ~0U)
      return None;
    result[i] = uint8_t((hi << 4) | lo);
  }
  return HashCode(result);
}

HashBuilder& HashBuilder::combine(StringRef string) {
  combine(uint64_t(string.size()));
  hasher.update(string);
  return *this;
}

HashBuilder& HashBuilder::combine(uint64_t value) {
  uint8_t buffer[8];
  for (unsigned i = 0; i != 8; ++i)
    buffer[i] = uint8_t(value >> (8 * i));
  hasher.update(ArrayRef<uint8_t>(buffer, sizeof(buffer)));
  return *this;
}

HashBuilder& HashBuilder::combine(bool value) {
  uint8_t byte = value ? 1 : 0;
  hasher.update(ArrayRef<uint8_t>(&byte, 1));
  return *this;
}

HashBuilder& HashBuilder::combine(const HashCode& value) {
  hasher.update(ArrayRef<uint8_t>(value.getBytes().data(),
                                  value.getBytes().size()));
  return *this;
}

HashCode HashBuilder::finish() {
  llvm::MD5::MD5Result result;
  hasher.final(result);
  return HashCode(result.Bytes);
}

HashCode basic::hashString(StringRef value) {
  return HashBuilder().combine(value).finish();
}
