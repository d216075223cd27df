// Voile
//
// Copyright (c) 2023 VMware, Inc. All Rights Reserved.
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

#include <array>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <sys/time.h>

namespace logging {

enum LogLevel { trace, debug, info, warn, error, fatal };

// Mapped diagnostic context, one per thread.
class MDC {
 public:
  void put(const std::string& key, const std::string& val) { mdc_map_.insert_or_assign(key, val); }
  std::string get(const std::string& key) const {
    auto it = mdc_map_.find(key);
    return it == mdc_map_.end() ? std::string{} : it->second;
  }
  void remove(const std::string& key) { mdc_map_.erase(key); }

 private:
  std::map<std::string, std::string> mdc_map_;
};

class LoggerImpl {
 public:
  LoggerImpl(const std::string& name) : name_(name) {}
  LoggerImpl(const LoggerImpl&) = delete;
  LoggerImpl& operator=(const LoggerImpl&) = delete;
  ~LoggerImpl() = default;

  // Writes the line prefix and returns the locked stream. The caller terminates the line.
  std::ostream& print(logging::LogLevel l, const char* func) const {
    struct timeval cur_time;
    gettimeofday(&cur_time, nullptr);
    struct tm local_time;
    localtime_r(&cur_time.tv_sec, &local_time);

    // clang-format off
    std::cout << std::put_time(&local_time, "%FT%T.") << std::setw(3) << std::setfill('0')
              << static_cast<int>(cur_time.tv_usec / 1000)
              << "|" << LoggerImpl::LEVELS_STRINGS[l]
              << "|" << name_
              << "|" << mdc().get(MDC_THREAD_KEY)
              << "|" << mdc().get(MDC_NULLIFIER_KEY)
              << "|" << mdc().get(MDC_COMMITMENT_KEY)
              << "|" << func
              << "|";
    // clang-format on
    return std::cout;
  }

  static MDC& mdc() {
    static thread_local MDC mdc_;
    return mdc_;
  }

  static std::mutex& outputMutex() {
    static std::mutex mutex_;
    return mutex_;
  }

 private:
  friend class Logger;

  std::string name_;
  LogLevel level_ = LogLevel::info;
  static std::array<std::string, 6> LEVELS_STRINGS;
};

// Lightweight handle copied around by value; the implementation lives in the logger registry.
class Logger {
 public:
  Logger(LoggerImpl& logger) : logger_{&logger} {}
  std::ostream& print(logging::LogLevel l, const char* func) const { return logger_->print(l, func); }
  LogLevel getLogLevel() const { return logger_->level_; }
  void setLogLevel(LogLevel l) { logger_->level_ = l; }
  static MDC& getMDC() { return LoggerImpl::mdc(); }
  static bool config(const std::string& configFileName);

 private:
  LoggerImpl* logger_;
};

}  // namespace logging

#define LOG_COMMON(logger, level, s)                                                                     \
  if ((logger).getLogLevel() <= level) {                                                                 \
    std::lock_guard<std::mutex> __log_lock__(logging::LoggerImpl::outputMutex());                        \
    (logger).print(level, __func__) << s << " | [SQ:" << std::to_string(getSeq()) << "]" << std::endl; \
  }

#define LOG_TRACE(l, s) LOG_COMMON(l, logging::LogLevel::trace, s)
#define LOG_DEBUG(l, s) LOG_COMMON(l, logging::LogLevel::debug, s)
#define LOG_INFO(l, s) LOG_COMMON(l, logging::LogLevel::info, s)
#define LOG_WARN(l, s) LOG_COMMON(l, logging::LogLevel::warn, s)
#define LOG_ERROR(l, s) LOG_COMMON(l, logging::LogLevel::error, s)
#define LOG_FATAL(l, s) LOG_COMMON(l, logging::LogLevel::fatal, s)

#define MDC_PUT(k, v) logging::Logger::getMDC().put(k, v)
#define MDC_REMOVE(k) logging::Logger::getMDC().remove(k)
#define MDC_GET(k) logging::Logger::getMDC().get(k)
