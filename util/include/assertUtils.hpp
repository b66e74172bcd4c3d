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
// terms and conditions of the subcomponent's license, as noted in the LICENSE
// file.
//
// Invariant checks for programming errors. A failed check logs the expression, the offending values and a
// demangled backtrace to CLOAK_LOG, then terminates. Errors caused by caller input are reported with exceptions
// instead (see cloak/errors.hpp).

#pragma once

#include <cxxabi.h>
#include <execinfo.h>

#include <cstdlib>
#include <cstring>
#include <exception>
#include <sstream>

#include "kvstream.h"
#include "Logger.hpp"

inline void printCallStack() {
  constexpr int MAX_FRAMES = 64;
  constexpr size_t MAX_FUNC_NAME_SIZE = 256;
  void *addrlist[MAX_FRAMES];
  int addrLen = backtrace(addrlist, MAX_FRAMES);
  if (addrLen <= 0) return;
  char **symbolsList = backtrace_symbols(addrlist, addrLen);
  if (!symbolsList) return;

  std::ostringstream os;
  // Frame 0 is this function.
  for (int i = 1; i < addrLen; i++) {
    char *beginName = std::strchr(symbolsList[i], '(');
    char *beginOffset = beginName ? std::strchr(beginName, '+') : nullptr;
    char *endOffset = beginOffset ? std::strchr(beginOffset, ')') : nullptr;
    if (!beginName || !beginOffset || !endOffset) {
      os << " [bt] " << symbolsList[i] << std::endl;
      continue;
    }
    *beginName++ = '\0';
    *beginOffset++ = '\0';
    *endOffset = '\0';
    int status = -1;
    size_t demangledSize = 0;
    char *demangled = abi::__cxa_demangle(beginName, nullptr, &demangledSize, &status);
    if (status == 0 && demangled) {
      if (demangledSize > MAX_FUNC_NAME_SIZE) demangled[MAX_FUNC_NAME_SIZE] = '\0';
      os << " [bt] " << demangled << "+" << beginOffset << std::endl;
    } else {
      os << " [bt] " << beginName << "+" << beginOffset << std::endl;
    }
    std::free(demangled);
  }
  LOG_FATAL(CLOAK_LOG, "\n" << os.str());
  std::free(symbolsList);
}

#define CLOAK_ASSERT_FAIL(description)                                                                        \
  {                                                                                                           \
    LOG_FATAL(CLOAK_LOG, description << " in function " << __FUNCTION__ << " (" << __FILE__ << " " << __LINE__ \
                                     << ")");                                                                 \
    printCallStack();                                                                                         \
    std::terminate();                                                                                         \
  }

#define CLOAK_ASSERT_CMP(expr1, expr2, failed, name)                      \
  {                                                                       \
    if (failed) CLOAK_ASSERT_FAIL(" " << name << KVLOG_FOR_ASSERT(expr1, expr2)); \
  }

#define CloakAssert(expr)                                                        \
  {                                                                              \
    if ((expr) != true) CLOAK_ASSERT_FAIL(" Assert: expression '" << #expr << "' is false"); \
  }
#define CloakAssertEQ(expr1, expr2) CLOAK_ASSERT_CMP(expr1, expr2, (expr1) != (expr2), "AssertEQ")
#define CloakAssertNE(expr1, expr2) CLOAK_ASSERT_CMP(expr1, expr2, (expr1) == (expr2), "AssertNE")
#define CloakAssertGE(expr1, expr2) CLOAK_ASSERT_CMP(expr1, expr2, (expr1) < (expr2), "AssertGE")
#define CloakAssertGT(expr1, expr2) CLOAK_ASSERT_CMP(expr1, expr2, (expr1) <= (expr2), "AssertGT")
#define CloakAssertLT(expr1, expr2) CLOAK_ASSERT_CMP(expr1, expr2, (expr1) >= (expr2), "AssertLT")
#define CloakAssertLE(expr1, expr2) CLOAK_ASSERT_CMP(expr1, expr2, (expr1) > (expr2), "AssertLE")
