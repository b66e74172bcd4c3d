// Cloak
//
// Copyright (c) 2024 VMware, Inc. All Rights Reserved.
//
// This product is licensed to you under the Apache 2.0 license (the "License").
// You may not use this product except in compliance with the Apache 2.0 License.
//
// This product may include a number of subcomponents with separate copyright
// notices and license terms. Your use of these subcomponents is subject to the
// terms and conditions of the subcomponent's license, as noted in the
// LICENSE file.

#pragma once

#include <sys/time.h>

#include <array>
#include <atomic>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>
#include <string>

namespace logging {

enum LogLevel { trace, debug, info, warn, error, fatal };

/**
 * Mapped Diagnostic Context, one per thread.
 */
class MDC {
 public:
  void put(const std::string& key, const std::string& val) { mdc_map_.insert_or_assign(key, val); }
  std::string get(const std::string& key) const {
    auto it = mdc_map_.find(key);
    return it == mdc_map_.end() ? std::string{} : it->second;
  }
  void remove(const std::string& key) { mdc_map_.erase(key); }
  void clear() { mdc_map_.clear(); }

 private:
  std::map<std::string, std::string> mdc_map_;
};

class ThreadContext {
 public:
  MDC& getMDC() { return mdc_; }

 private:
  MDC mdc_;
};

class LoggerImpl {
 public:
  LoggerImpl(const std::string& name) : name_(name) {}
  LoggerImpl(const LoggerImpl&) = delete;
  LoggerImpl& operator=(const LoggerImpl&) = delete;
  ~LoggerImpl() = default;

  // Lines are assembled per thread and flushed under a single lock so that
  // prover workers do not interleave their output.
  void write(LogLevel l, const char* func, const std::string& msg) const {
    struct timeval cur_time;
    gettimeofday(&cur_time, NULL);
    struct tm local_time;
    localtime_r(&cur_time.tv_sec, &local_time);
    auto& mdc = getThreadContext().getMDC();

    std::ostringstream line;
    // clang-format off
    line << std::put_time(&local_time, "%FT%T.") << std::setw(3) << std::setfill('0') << (int)cur_time.tv_usec / 1000
         << "|" << LoggerImpl::LEVELS_STRINGS[l]
         << "|" << name_
         << "|" << mdc.get(MDC_THREAD_KEY)
         << "|" << mdc.get(MDC_OPERATION_KEY)
         << "|" << mdc.get(MDC_IMAGE_ID_KEY)
         << "|" << mdc.get(MDC_JOB_ID_KEY)
         << "|" << func
         << "|" << msg;
    // clang-format on
    std::lock_guard<std::mutex> g(outputLock());
    std::cout << line.str() << std::endl;
  }

 private:
  friend class Logger;

  static ThreadContext& getThreadContext() {
    static thread_local ThreadContext t_;
    return t_;
  }

  static std::mutex& outputLock() {
    static std::mutex m;
    return m;
  }

  std::string name_;
  std::atomic<LogLevel> level_{LogLevel::info};
  static std::array<std::string, 6> LEVELS_STRINGS;
};

/**
 * Copyable handle around a LoggerImpl owned by the logger registry.
 */
class Logger {
 public:
  Logger(LoggerImpl& logger) : logger_{&logger} {}
  void write(LogLevel l, const char* func, const std::string& msg) const { logger_->write(l, func, msg); }
  LogLevel getLogLevel() const { return logger_->level_; }
  void setLogLevel(LogLevel l) { logger_->level_ = l; }
  static ThreadContext& getThreadContext() { return LoggerImpl::getThreadContext(); }
  static bool config(const std::string& configFileName);

 private:
  LoggerImpl* logger_;
};

}  // namespace logging

#define LOG_COMMON(logger, level, s)                                                       \
  if ((logger).getLogLevel() <= level) {                                                   \
    std::ostringstream __log_ss__;                                                         \
    __log_ss__ << s << " | [SQ:" << getSeq() << "]";                                       \
    (logger).write(level, __PRETTY_FUNCTION__, __log_ss__.str());                          \
  }

#define LOG_TRACE(l, s) LOG_COMMON(l, logging::LogLevel::trace, s)
#define LOG_DEBUG(l, s) LOG_COMMON(l, logging::LogLevel::debug, s)
#define LOG_INFO(l, s) LOG_COMMON(l, logging::LogLevel::info, s)
#define LOG_WARN(l, s) LOG_COMMON(l, logging::LogLevel::warn, s)
#define LOG_ERROR(l, s) LOG_COMMON(l, logging::LogLevel::error, s)
#define LOG_FATAL(l, s) LOG_COMMON(l, logging::LogLevel::fatal, s)

#define MDC_PUT(k, v) logging::Logger::getThreadContext().getMDC().put(k, v);
#define MDC_REMOVE(k) logging::Logger::getThreadContext().getMDC().remove(k);
#define MDC_CLEAR logging::Logger::getThreadContext().getMDC().clear();
#define MDC_GET(k) logging::Logger::getThreadContext().getMDC().get(k)

#define LOG_CONFIGURE_AND_WATCH(config_file, millis) \
  {                                                  \
    logging::initLogger(config_file);                \
    (void)(millis);                                  \
  }
