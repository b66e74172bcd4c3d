// Cloak
//
// Copyright (c) 2024 VMware, Inc. All Rights Reserved.
//
// This product is licensed to you under the Apache 2.0 license (the "License").  You may not use this product except in
// compliance with the Apache 2.0 License.
//
// This product may include a number of subcomponents with separate copyright notices and license terms. Your use of
// these subcomponents is subject to the terms and conditions of the subcomponent's license, as noted in the LICENSE
// file.

#pragma once

// KVARGS(a, b) expands to ("a", a, "b", b): every argument is preceded by its own spelling, which makes the
// result usable as a key-value argument list for the variadic KvLog templates. Up to 8 values are supported.
//
// Example usage:
// #define WRAPPER_MACRO(...) SomeCPPFunction KVARGS(__VA_ARGS__)
#define GET_MACRO(_1, _2, _3, _4, _5, _6, _7, _8, NAME, ...) NAME
#define KVARGS(...) \
  GET_MACRO(__VA_ARGS__, KVARGS8, KVARGS7, KVARGS6, KVARGS5, KVARGS4, KVARGS3, KVARGS2, KVARGS1, UNUSED)(__VA_ARGS__)

#define KVARGS1(_1) (#_1, _1)
#define KVARGS2(_1, _2) (#_1, _1, #_2, _2)
#define KVARGS3(_1, _2, _3) (#_1, _1, #_2, _2, #_3, _3)
#define KVARGS4(_1, _2, _3, _4) (#_1, _1, #_2, _2, #_3, _3, #_4, _4)
#define KVARGS5(_1, _2, _3, _4, _5) (#_1, _1, #_2, _2, #_3, _3, #_4, _4, #_5, _5)
#define KVARGS6(_1, _2, _3, _4, _5, _6) (#_1, _1, #_2, _2, #_3, _3, #_4, _4, #_5, _5, #_6, _6)
#define KVARGS7(_1, _2, _3, _4, _5, _6, _7) (#_1, _1, #_2, _2, #_3, _3, #_4, _4, #_5, _5, #_6, _6, #_7, _7)
#define KVARGS8(_1, _2, _3, _4, _5, _6, _7, _8) \
  (#_1, _1, #_2, _2, #_3, _3, #_4, _4, #_5, _5, #_6, _6, #_7, _7, #_8, _8)
