// Copyright Open Logistics Foundation
//
// Licensed under the Open Logistics Foundation License 1.3.
// For details on the licensing terms, see the LICENSE file.
// SPDX-License-Identifier: OLFL-1.3
//
// This file contains the shared logger

#ifndef COLOUREDPTN_INCLUDE_COLOUREDPTN_LOG_HPP_
#define COLOUREDPTN_INCLUDE_COLOUREDPTN_LOG_HPP_

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace cptn::log {

inline constexpr const char *k_logger_name = "cptn";

namespace detail {
inline std::shared_ptr<spdlog::logger> &instance() {
  static std::shared_ptr<spdlog::logger> logger;
  return logger;
}
}  // namespace detail

///
///\brief Get the shared "cptn" logger
///
/// Reuses a logger registered under that name, otherwise creates one logging
/// to stderr.
///
///\return std::shared_ptr<spdlog::logger>
///
inline std::shared_ptr<spdlog::logger> get() {
  auto &logger = detail::instance();
  if (logger == nullptr) {
    logger = spdlog::get(k_logger_name);
    if (logger == nullptr) {
      logger = spdlog::stderr_color_mt(k_logger_name);
    }
  }
  return logger;
}

///
///\brief Replace the shared logger (nets created afterwards pick it up)
///
///\param logger the new logger, nullptr restores the default
///
inline void set(std::shared_ptr<spdlog::logger> logger) {
  detail::instance() = std::move(logger);
}

}  // namespace cptn::log

#endif  // COLOUREDPTN_INCLUDE_COLOUREDPTN_LOG_HPP_
