// Copyright 2024 VMware, all rights reserved

#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace cloak::util {

std::ostream &hexPrint(std::ostream &s, const uint8_t *data, size_t size);

struct HexPrintBuffer {
  const uint8_t *bytes;
  const size_t size;
};

// Print a byte buffer as lowercase hex.
inline std::ostream &operator<<(std::ostream &s, const HexPrintBuffer p) { return hexPrint(s, p.bytes, p.size); }

std::string bufferToHex(const uint8_t *data, size_t size);
std::string vectorToHex(const std::vector<uint8_t> &data);

// Converts a hex string into bytes. Accepts an optional 0x prefix; throws std::invalid_argument on malformed input.
std::vector<uint8_t> unhex(const std::string &hex);

}  // namespace cloak::util
