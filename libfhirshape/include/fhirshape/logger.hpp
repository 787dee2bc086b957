//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "fhirshape/config.hpp"
#include "fhirshape/error.hpp"

#include <caf/detail/scope_guard.hpp>
#include <caf/expected.hpp>

#include <memory>
#include <string>
#include <string_view>

// FHIRSHAPE_INFO -> spdlog::info
// FHIRSHAPE_VERBOSE -> spdlog::debug
// FHIRSHAPE_DEBUG -> spdlog::trace
// FHIRSHAPE_TRACE -> spdlog::trace

#if FHIRSHAPE_LOG_LEVEL == FHIRSHAPE_LOG_LEVEL_TRACE
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#elif FHIRSHAPE_LOG_LEVEL == FHIRSHAPE_LOG_LEVEL_DEBUG
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#elif FHIRSHAPE_LOG_LEVEL == FHIRSHAPE_LOG_LEVEL_VERBOSE
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#elif FHIRSHAPE_LOG_LEVEL == FHIRSHAPE_LOG_LEVEL_INFO
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#elif FHIRSHAPE_LOG_LEVEL == FHIRSHAPE_LOG_LEVEL_WARNING
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_WARN
#elif FHIRSHAPE_LOG_LEVEL == FHIRSHAPE_LOG_LEVEL_ERROR
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_ERROR
#elif FHIRSHAPE_LOG_LEVEL == FHIRSHAPE_LOG_LEVEL_CRITICAL
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_CRITICAL
#elif FHIRSHAPE_LOG_LEVEL == FHIRSHAPE_LOG_LEVEL_QUIET
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_OFF
#endif

// Important: keep this below the log level mapping.
#include <spdlog/spdlog.h>

namespace fhirshape {

/// Converts a verbosity name to one of the FHIRSHAPE_LOG_LEVEL_* constants.
/// @returns *default_value* if *x* does not name a log level.
auto loglevel_to_int(std::string x, int default_value = -1) -> int;

/// Installs the global logger for the lifetime of the returned guard.
/// @param verbosity The console verbosity, e.g., `info` or `debug`.
auto create_log_context(std::string_view verbosity)
  -> caf::expected<caf::detail::scope_guard<void (*)() noexcept>>;

namespace detail {

/// @returns the global logger. Before setup, this is a logger that discards
/// everything.
auto logger() -> std::shared_ptr<spdlog::logger>&;

/// Replaces the global logger with a colored console logger.
auto setup_spdlog(std::string_view verbosity) -> caf::error;

/// Flushes and tears down the global logger.
void shutdown_spdlog() noexcept;

} // namespace detail
} // namespace fhirshape

#define FHIRSHAPE_DISCARD_ARGS(...)                                            \
  do {                                                                         \
  } while (false)

#if FHIRSHAPE_LOG_LEVEL >= FHIRSHAPE_LOG_LEVEL_TRACE
#  define FHIRSHAPE_TRACE(...)                                                 \
    SPDLOG_LOGGER_TRACE(::fhirshape::detail::logger(), __VA_ARGS__)
#else
#  define FHIRSHAPE_TRACE(...) FHIRSHAPE_DISCARD_ARGS(__VA_ARGS__)
#endif

#if FHIRSHAPE_LOG_LEVEL >= FHIRSHAPE_LOG_LEVEL_DEBUG
#  define FHIRSHAPE_DEBUG(...)                                                 \
    SPDLOG_LOGGER_TRACE(::fhirshape::detail::logger(), __VA_ARGS__)
#else
#  define FHIRSHAPE_DEBUG(...) FHIRSHAPE_DISCARD_ARGS(__VA_ARGS__)
#endif

#if FHIRSHAPE_LOG_LEVEL >= FHIRSHAPE_LOG_LEVEL_VERBOSE
#  define FHIRSHAPE_VERBOSE(...)                                               \
    SPDLOG_LOGGER_DEBUG(::fhirshape::detail::logger(), __VA_ARGS__)
#else
#  define FHIRSHAPE_VERBOSE(...) FHIRSHAPE_DISCARD_ARGS(__VA_ARGS__)
#endif

#if FHIRSHAPE_LOG_LEVEL >= FHIRSHAPE_LOG_LEVEL_INFO
#  define FHIRSHAPE_INFO(...)                                                  \
    SPDLOG_LOGGER_INFO(::fhirshape::detail::logger(), __VA_ARGS__)
#else
#  define FHIRSHAPE_INFO(...) FHIRSHAPE_DISCARD_ARGS(__VA_ARGS__)
#endif

#if FHIRSHAPE_LOG_LEVEL >= FHIRSHAPE_LOG_LEVEL_WARNING
#  define FHIRSHAPE_WARN(...)                                                  \
    SPDLOG_LOGGER_WARN(::fhirshape::detail::logger(), __VA_ARGS__)
#else
#  define FHIRSHAPE_WARN(...) FHIRSHAPE_DISCARD_ARGS(__VA_ARGS__)
#endif

#if FHIRSHAPE_LOG_LEVEL >= FHIRSHAPE_LOG_LEVEL_ERROR
#  define FHIRSHAPE_ERROR(...)                                                 \
    SPDLOG_LOGGER_ERROR(::fhirshape::detail::logger(), __VA_ARGS__)
#else
#  define FHIRSHAPE_ERROR(...) FHIRSHAPE_DISCARD_ARGS(__VA_ARGS__)
#endif

#if FHIRSHAPE_LOG_LEVEL >= FHIRSHAPE_LOG_LEVEL_CRITICAL
#  define FHIRSHAPE_CRITICAL(...)                                              \
    SPDLOG_LOGGER_CRITICAL(::fhirshape::detail::logger(), __VA_ARGS__)
#else
#  define FHIRSHAPE_CRITICAL(...) FHIRSHAPE_DISCARD_ARGS(__VA_ARGS__)
#endif
