// Copyright 2024 VMware, all rights reserved

#include "hex_tools.h"
#include "string.hpp"

#include <boost/algorithm/hex.hpp>

#include <iterator>
#include <stdexcept>

namespace cloak::util {

std::ostream &hexPrint(std::ostream &s, const uint8_t *data, size_t size) {
  std::string out;
  out.reserve(size * 2);
  boost::algorithm::hex_lower(data, data + size, std::back_inserter(out));
  return s << out;
}

std::string bufferToHex(const uint8_t *data, size_t size) {
  std::string out;
  out.reserve(size * 2);
  boost::algorithm::hex_lower(data, data + size, std::back_inserter(out));
  return out;
}

std::string vectorToHex(const std::vector<uint8_t> &data) { return bufferToHex(data.data(), data.size()); }

std::vector<uint8_t> unhex(const std::string &hex) {
  auto start = std::string::size_type{0};
  if (hex.rfind("0x", 0) == 0 || hex.rfind("0X", 0) == 0) start = 2;
  const auto digits = hex.substr(start);
  if (!isValidHexString(digits)) {
    throw std::invalid_argument{"Invalid hex string: " + hex};
  }
  std::vector<uint8_t> result;
  result.reserve(digits.size() / 2);
  boost::algorithm::unhex(digits.begin(), digits.end(), std::back_inserter(result));
  return result;
}

}  // namespace cloak::util
