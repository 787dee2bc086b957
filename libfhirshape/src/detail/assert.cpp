//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "fhirshape/detail/assert.hpp"

#include "fhirshape/logger.hpp"

#include <fmt/format.h>

#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <thread>

namespace fhirshape::detail {

void panic_impl(std::string message, std::source_location source) {
  FHIRSHAPE_ERROR("panic: {}", message);
  FHIRSHAPE_ERROR("version: {}", version::version);
  FHIRSHAPE_ERROR("source: {}:{}", source.file_name(), source.line());
  FHIRSHAPE_ERROR("this is a bug, we would appreciate a report - thank you!");
  if (const auto* e = std::getenv("FHIRSHAPE_ABORT_ON_PANIC");
      e != nullptr && *e != '\0' && std::string_view{e} != "0") {
    logger()->flush();
    std::this_thread::sleep_for(std::chrono::milliseconds{100});
    std::_Exit(1);
  }
  message += fmt::format(" @ {}:{}", source.file_name(), source.line());
  throw std::runtime_error(message);
}

void fail_assertion_impl(const char* expr, std::string_view explanation,
                         std::source_location source) {
  auto message = fmt::format("assertion `{}` failed", expr);
  if (not explanation.empty()) {
    message += ": ";
    message += explanation;
  }
  panic_impl(std::move(message), source);
}

} // namespace fhirshape::detail
