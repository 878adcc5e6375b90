//===- BinaryCoding.h -------------------------------------------*- C++ -*-===//
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

#ifndef TASKSTATE_BASIC_BINARYCODING_H
#define TASKSTATE_BASIC_BINARYCODING_H

#include "taskstate/Basic/Compiler.h"
#include "taskstate/Basic/LLVM.h"

#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace taskstate {
namespace basic {

template<typename T>
struct BinaryCodingTraits {
  // static inline void encode(const T&, BinaryEncoder&);
  // static inline void decode(T&, BinaryDecoder&);
};

/// A basic binary encoding utility.
///
/// This encoder is designed for small, relatively efficient coding of objects
/// which are persisted across builds. It is endian-neutral, and should be
/// paired with \see BinaryDecoder for decoding. Any change to the encoding of
/// a persisted type must be paired with a schema version bump by the client.
///
/// The utility supports coding of user-defined types via specialization of the
/// BinaryCodingTraits type.
class BinaryEncoder {
private:
  // Copying is disabled.
  BinaryEncoder(const BinaryEncoder&) TASKSTATE_DELETED_FUNCTION;
  void operator=(const BinaryEncoder&) TASKSTATE_DELETED_FUNCTION;

  /// The encoded data.
  llvm::SmallVector<uint8_t, 256> encdata;

public:
  /// Construct a new binary encoder.
  BinaryEncoder() {}

  /// Encode a value to the stream.
  void write(bool value) {
    write(uint8_t(value ? 1 : 0));
  }

  /// Encode a value to the stream.
  void write(uint8_t value) {
    encdata.push_back(value);
  }

  /// Encode a value to the stream.
  void write(uint16_t value) {
    write(uint8_t(value >> 0));
    write(uint8_t(value >> 8));
  }

  /// Encode a value to the stream.
  void write(uint32_t value) {
    write(uint16_t(value >> 0));
    write(uint16_t(value >> 16));
  }

  /// Encode a value to the stream.
  void write(uint64_t value) {
    write(uint32_t(value >> 0));
    write(uint32_t(value >> 32));
  }

  /// Encode a sequence of bytes to the stream.
  void writeBytes(StringRef bytes) {
    encdata.insert(encdata.end(), bytes.begin(), bytes.end());
  }

  /// Encode a length-prefixed string to the stream.
  void write(const std::string& value) {
    write(uint32_t(value.size()));
    writeBytes(value);
  }

  /// Encode a value to the stream.
  template<typename T>
  void write(const T& value) {
    BinaryCodingTraits<T>::encode(value, *this);
  }

  /// Encode a length-prefixed list of values to the stream.
  template<typename T>
  void write(const std::vector<T>& values) {
    write(uint32_t(values.size()));
    for (const auto& value: values)
      write(value);
  }

  /// Encode a length-prefixed map to the stream, in key order.
  template<typename K, typename V>
  void write(const std::map<K, V>& values) {
    write(uint32_t(values.size()));
    for (const auto& entry: values) {
      write(entry.first);
      write(entry.second);
    }
  }

  /// Get the encoded binary data.
  std::vector<uint8_t> contents() {
    return std::vector<uint8_t>(encdata.begin(), encdata.end());
  }

  /// Get the encoded binary data (in place)
  const uint8_t* data() const {
    return encdata.data();
  }

  /// Get the size of the encoded binary data
  uint64_t size() const {
    return encdata.size();
  }
};

/// A basic binary decoding utility.
///
/// Unlike the encoder, the decoder must tolerate arbitrary input, since the
/// data it reads comes from disk. Any attempt to read beyond the end of the
/// data moves the decoder into an error state, after which all reads produce
/// zero values. Clients check \see hasError() (or the result of \see finish())
/// once decoding is complete.
///
/// \see BinaryEncoder.
class BinaryDecoder {
private:
  // Copying is disabled.
  BinaryDecoder(const BinaryDecoder&) TASKSTATE_DELETED_FUNCTION;
  void operator=(const BinaryDecoder&) TASKSTATE_DELETED_FUNCTION;

  /// The data being decoded.
  StringRef data;

  /// The current position in the stream.
  uint64_t pos = 0;

  /// Whether a read has failed.
  bool failed = false;

  bool ensureAvailable(uint64_t count) {
    if (failed || count > data.size() - pos) {
      failed = true;
      return false;
    }
    return true;
  }

  uint8_t read8() {
    if (!ensureAvailable(1))
      return 0;
    return uint8_t(data[pos++]);
  }
  uint16_t read16() {
    uint16_t result = read8();
    result |= uint16_t(read8()) << 8;
    return result;
  }
  uint32_t read32() {
    uint32_t result = read16();
    result |= uint32_t(read16()) << 16;
    return result;
  }
  uint64_t read64() {
    uint64_t result = read32();
    result |= uint64_t(read32()) << 32;
    return result;
  }

public:
  /// Construct a binary decoder.
  BinaryDecoder(StringRef data) : data(data) {}

  /// Construct a binary decoder.
  ///
  /// NOTE: The input data is supplied by reference, and its lifetime must
  /// exceed that of the decoder.
  BinaryDecoder(const std::vector<uint8_t>& data) : BinaryDecoder(
      StringRef(reinterpret_cast<const char*>(data.data()), data.size())) {}

  /// Check if the decoder is at the end of the stream.
  bool isEmpty() const {
    return pos == data.size();
  }

  /// Check if any read has failed.
  bool hasError() const {
    return failed;
  }

  /// Decode a value from the stream.
  void read(bool& value) { value = read8() != 0; }

  /// Decode a value from the stream.
  void read(uint8_t& value) { value = read8(); }

  /// Decode a value from the stream.
  void read(uint16_t& value) { value = read16(); }

  /// Decode a value from the stream.
  void read(uint32_t& value) { value = read32(); }

  /// Decode a value from the stream.
  void read(uint64_t& value) { value = read64(); }

  /// Decode a byte string from the stream.
  ///
  /// NOTE: The return value points into the decode stream, and must be copied
  /// by clients if it is to last longer than the lifetime of the decoder.
  void readBytes(size_t count, StringRef& value) {
    if (!ensureAvailable(count)) {
      value = StringRef();
      return;
    }
    value = StringRef(data.begin() + pos, count);
    pos += count;
  }

  /// Decode a length-prefixed string from the stream.
  void read(std::string& value) {
    uint32_t count;
    read(count);
    StringRef bytes;
    readBytes(count, bytes);
    value = bytes.str();
  }

  /// Decode a value from the stream.
  template<typename T>
  void read(T& value) {
    BinaryCodingTraits<T>::decode(value, *this);
  }

  /// Decode a length-prefixed list of values from the stream.
  template<typename T>
  void read(std::vector<T>& values) {
    uint32_t count;
    read(count);
    values.clear();
    for (uint32_t i = 0; i != count && !failed; ++i) {
      T value{};
      read(value);
      values.push_back(std::move(value));
    }
  }

  /// Decode a length-prefixed map from the stream.
  template<typename K, typename V>
  void read(std::map<K, V>& values) {
    uint32_t count;
    read(count);
    values.clear();
    for (uint32_t i = 0; i != count && !failed; ++i) {
      K key{};
      V value{};
      read(key);
      read(value);
      values[std::move(key)] = std::move(value);
    }
  }

  /// Finish decoding.
  ///
  /// \returns True if no read failed and the whole stream was consumed.
  bool finish() {
    return !failed && isEmpty();
  }
};

}
}

#endif
