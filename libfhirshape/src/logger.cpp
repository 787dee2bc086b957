//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "fhirshape/logger.hpp"

#include "fhirshape/defaults.hpp"
#include "fhirshape/detail/assert.hpp"

#include <spdlog/common.h>
#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <algorithm>
#include <cctype>
#include <memory>

namespace fhirshape {

auto loglevel_to_int(std::string x, int default_value) -> int {
  std::ranges::transform(x, x.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (x == "quiet") {
    return FHIRSHAPE_LOG_LEVEL_QUIET;
  }
  if (x == "critical") {
    return FHIRSHAPE_LOG_LEVEL_CRITICAL;
  }
  if (x == "error") {
    return FHIRSHAPE_LOG_LEVEL_ERROR;
  }
  if (x == "warning") {
    return FHIRSHAPE_LOG_LEVEL_WARNING;
  }
  if (x == "info") {
    return FHIRSHAPE_LOG_LEVEL_INFO;
  }
  if (x == "verbose") {
    return FHIRSHAPE_LOG_LEVEL_VERBOSE;
  }
  if (x == "debug") {
    return FHIRSHAPE_LOG_LEVEL_DEBUG;
  }
  if (x == "trace") {
    return FHIRSHAPE_LOG_LEVEL_TRACE;
  }
  return default_value;
}

auto create_log_context(std::string_view verbosity)
  -> caf::expected<caf::detail::scope_guard<void (*)() noexcept>> {
  if (auto err = detail::setup_spdlog(verbosity)) {
    return err;
  }
  return caf::detail::make_scope_guard(
    std::addressof(detail::shutdown_spdlog));
}

namespace {

/// Converts a libfhirshape log level to an spdlog level.
auto fhirshape_loglevel_to_spd(int value) -> spdlog::level::level_enum {
  switch (value) {
    case FHIRSHAPE_LOG_LEVEL_QUIET:
      return spdlog::level::off;
    case FHIRSHAPE_LOG_LEVEL_CRITICAL:
      return spdlog::level::critical;
    case FHIRSHAPE_LOG_LEVEL_ERROR:
      return spdlog::level::err;
    case FHIRSHAPE_LOG_LEVEL_WARNING:
      return spdlog::level::warn;
    case FHIRSHAPE_LOG_LEVEL_INFO:
      return spdlog::level::info;
    case FHIRSHAPE_LOG_LEVEL_VERBOSE:
      return spdlog::level::debug;
    case FHIRSHAPE_LOG_LEVEL_DEBUG:
    case FHIRSHAPE_LOG_LEVEL_TRACE:
      return spdlog::level::trace;
  }
  FHIRSHAPE_UNREACHABLE();
}

auto make_null_logger() -> std::shared_ptr<spdlog::logger> {
  return std::make_shared<spdlog::logger>(
    "/dev/null", std::make_shared<spdlog::sinks::null_sink_mt>());
}

} // namespace

namespace detail {

auto setup_spdlog(std::string_view verbosity) -> caf::error try {
  if (logger()->name() != "/dev/null") {
    return caf::make_error(ec::logic_error, "logger is already initialized");
  }
  auto level = loglevel_to_int(std::string{verbosity});
  if (level < 0) {
    return caf::make_error(ec::invalid_configuration,
                           fmt::format("invalid verbosity '{}'", verbosity));
  }
  auto sink = std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>(
    spdlog::color_mode::automatic);
  sink->set_pattern(std::string{defaults::logger::console_format});
  sink->set_level(fhirshape_loglevel_to_spd(level));
  auto result = std::make_shared<spdlog::logger>("fhirshape", std::move(sink));
  result->set_level(fhirshape_loglevel_to_spd(level));
  result->flush_on(spdlog::level::warn);
  logger() = std::move(result);
  return {};
} catch (const spdlog::spdlog_ex& err) {
  return caf::make_error(ec::unspecified,
                         fmt::format("failed to start logger: {}", err.what()));
}

void shutdown_spdlog() noexcept {
  FHIRSHAPE_DEBUG("shut down logging");
  logger()->flush();
  logger() = make_null_logger();
}

auto logger() -> std::shared_ptr<spdlog::logger>& {
  static auto fhirshape_logger = make_null_logger();
  return fhirshape_logger;
}

} // namespace detail
} // namespace fhirshape
