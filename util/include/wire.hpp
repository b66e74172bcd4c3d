// Cloak
//
// Copyright (c) 2024 VMware, Inc. All Rights Reserved.
//
// This product is licensed to you under the Apache 2.0 license (the "License").
// You may not use this product except in compliance with the Apache 2.0
// License.
//
// This product may include a number of subcomponents with separate copyright
// notices and license terms. Your use of these subcomponents is subject to the
// terms and conditions of the subcomponent's license, as noted in the
// LICENSE file.
//
// Binary encoding for everything cloak exchanges as bytes: resources, paths, witnesses, journals and receipts.
//
//   integers        big-endian, fixed width
//   bool            one byte, 0 or 1; anything else is rejected
//   std::array<T,N> the N elements back to back, no length
//   std::vector<T>  uint32_t element count followed by the elements
//   std::string     uint32_t byte count followed by the bytes
//   std::optional   bool presence flag followed by the value when present

#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <iterator>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace cloak::wire {

class DeserializeError : public std::runtime_error {
 public:
  DeserializeError(const std::string& error) : std::runtime_error("DeserializeError: " + error) {}
};

class NoDataLeftError : public DeserializeError {
 public:
  NoDataLeftError() : DeserializeError("Data left in buffer is less than what is needed for deserialization") {}
};

class BadDataError : public DeserializeError {
 public:
  BadDataError(const std::string& expected, const std::string& got) : DeserializeError(str(expected, got)) {}

 private:
  static std::string str(const std::string& expected, const std::string& actual) {
    std::ostringstream oss;
    oss << "Expected " << expected << ", got " << actual;
    return oss.str();
  }
};

class TrailingDataError : public DeserializeError {
 public:
  TrailingDataError(size_t left) : DeserializeError(std::to_string(left) + " unexpected bytes after the value") {}
};

class LengthOverflowError : public std::length_error {
 public:
  LengthOverflowError(size_t size) : std::length_error("length " + std::to_string(size) + " does not fit in 32 bits") {}
};

/******************************************************************************
 * Integers and bools
 ******************************************************************************/
template <typename T, typename std::enable_if<std::is_integral<T>::value>::type* = nullptr>
void serialize(std::vector<uint8_t>& output, const T& t) {
  if constexpr (std::is_same_v<T, bool>) {
    output.push_back(t ? 1 : 0);
  } else {
    for (auto i = sizeof(T); i > 0; i--) {
      output.push_back(static_cast<uint8_t>(255 & (t >> ((i - 1) * 8))));
    }
  }
}

template <typename T, typename std::enable_if<std::is_integral<T>::value>::type* = nullptr>
void deserialize(const uint8_t*& start, const uint8_t* end, T& t) {
  if constexpr (std::is_same_v<T, bool>) {
    if (end - start < 1) throw NoDataLeftError();
    if (*start > 1) throw BadDataError("0 or 1", std::to_string(*start));
    t = (*start == 1);
    start += 1;
  } else {
    if (static_cast<size_t>(end - start) < sizeof(T)) throw NoDataLeftError();
    std::make_unsigned_t<T> v = 0;
    for (auto i = 0u; i < sizeof(T); i++) {
      v = static_cast<std::make_unsigned_t<T>>((v << 8) | start[i]);
    }
    t = static_cast<T>(v);
    start += sizeof(T);
  }
}

/******************************************************************************
 * Lengths
 ******************************************************************************/
inline void serializeLength(std::vector<uint8_t>& output, size_t size) {
  if (size > 0xFFFFFFFF) throw LengthOverflowError(size);
  serialize(output, static_cast<uint32_t>(size));
}

inline uint32_t deserializeLength(const uint8_t*& start, const uint8_t* end) {
  uint32_t length = 0;
  deserialize(start, end, length);
  return length;
}

/******************************************************************************
 * Forward declarations needed by nested types
 ******************************************************************************/
template <typename T>
void serialize(std::vector<uint8_t>& output, const std::vector<T>& v);
template <typename T>
void deserialize(const uint8_t*& start, const uint8_t* end, std::vector<T>& v);
template <typename T, std::size_t N>
void serialize(std::vector<uint8_t>& output, const std::array<T, N>& a);
template <typename T, std::size_t N>
void deserialize(const uint8_t*& start, const uint8_t* end, std::array<T, N>& a);
template <typename T>
void serialize(std::vector<uint8_t>& output, const std::optional<T>& t);
template <typename T>
void deserialize(const uint8_t*& start, const uint8_t* end, std::optional<T>& t);

/******************************************************************************
 * Strings
 ******************************************************************************/
inline void serialize(std::vector<uint8_t>& output, const std::string& s) {
  serializeLength(output, s.size());
  std::copy(s.begin(), s.end(), std::back_inserter(output));
}

inline void deserialize(const uint8_t*& start, const uint8_t* end, std::string& s) {
  const uint32_t length = deserializeLength(start, end);
  if (static_cast<size_t>(end - start) < length) throw NoDataLeftError();
  s.assign(reinterpret_cast<const char*>(start), length);
  start += length;
}

/******************************************************************************
 * Lists
 ******************************************************************************/
template <typename T>
void serialize(std::vector<uint8_t>& output, const std::vector<T>& v) {
  serializeLength(output, v.size());
  if constexpr (std::is_same_v<T, uint8_t>) {
    output.insert(output.end(), v.begin(), v.end());
  } else {
    for (const auto& it : v) serialize(output, it);
  }
}

template <typename T>
void deserialize(const uint8_t*& start, const uint8_t* end, std::vector<T>& v) {
  const uint32_t length = deserializeLength(start, end);
  v.clear();
  if constexpr (std::is_same_v<T, uint8_t>) {
    if (static_cast<size_t>(end - start) < length) throw NoDataLeftError();
    v.assign(start, start + length);
    start += length;
  } else {
    for (auto i = 0u; i < length; i++) {
      T t;
      deserialize(start, end, t);
      v.push_back(std::move(t));
    }
  }
}

template <typename T, std::size_t N>
void serialize(std::vector<uint8_t>& output, const std::array<T, N>& a) {
  if constexpr (std::is_same_v<T, uint8_t>) {
    output.insert(output.end(), a.begin(), a.end());
  } else {
    for (const auto& it : a) serialize(output, it);
  }
}

template <typename T, std::size_t N>
void deserialize(const uint8_t*& start, const uint8_t* end, std::array<T, N>& a) {
  if constexpr (std::is_same_v<T, uint8_t>) {
    if (static_cast<size_t>(end - start) < N) throw NoDataLeftError();
    std::copy_n(start, N, a.begin());
    start += N;
  } else {
    for (auto& t : a) deserialize(start, end, t);
  }
}

/******************************************************************************
 * Optionals
 ******************************************************************************/
template <typename T>
void serialize(std::vector<uint8_t>& output, const std::optional<T>& t) {
  serialize(output, t.has_value());
  if (t.has_value()) serialize(output, *t);
}

template <typename T>
void deserialize(const uint8_t*& start, const uint8_t* end, std::optional<T>& t) {
  bool has_value = false;
  deserialize(start, end, has_value);
  if (has_value) {
    T value;
    deserialize(start, end, value);
    t = std::move(value);
  } else {
    t = std::nullopt;
  }
}

// Throws TrailingDataError unless the whole input was consumed.
inline void expectEnd(const uint8_t* start, const uint8_t* end) {
  if (start != end) throw TrailingDataError(static_cast<size_t>(end - start));
}

}  // namespace cloak::wire
