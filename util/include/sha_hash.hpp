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

#pragma once

#include "evp_hash.hpp"

namespace cloak {
namespace util {

using SHA2_256 = detail::EVPHash<EVP_sha256, 32>;

// SHA-256 over the concatenation of all arguments. Each argument is anything SHA2_256::update() accepts.
template <typename... Parts>
SHA2_256::Digest sha256Of(const Parts&... parts) {
  SHA2_256 sha;
  sha.init();
  (sha.update(parts), ...);
  return sha.finish();
}

}  // namespace util
}  // namespace cloak
