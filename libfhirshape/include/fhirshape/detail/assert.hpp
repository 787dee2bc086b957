//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "fhirshape/config.hpp"

#include <source_location>
#include <string>
#include <string_view>

namespace fhirshape::detail {

/// Logs the message and throws a `std::runtime_error`. When the environment
/// variable `FHIRSHAPE_ABORT_ON_PANIC` is set to a value other than `0`, the
/// process exits instead.
[[noreturn]] FHIRSHAPE_NO_INLINE void
panic_impl(std::string message, std::source_location source
                                = std::source_location::current());

[[noreturn]] FHIRSHAPE_NO_INLINE void
fail_assertion_impl(const char* expr, std::string_view explanation,
                    std::source_location source);

} // namespace fhirshape::detail

/// Checks an internal invariant. A failing assertion is a bug, never an input
/// error.
#define FHIRSHAPE_ASSERT(expr, ...)                                            \
  do {                                                                         \
    if (not static_cast<bool>(expr)) [[unlikely]] {                            \
      ::fhirshape::detail::fail_assertion_impl(                                \
        #expr, ::std::string_view{__VA_ARGS__},                                \
        ::std::source_location::current());                                    \
    }                                                                          \
  } while (false)

#define FHIRSHAPE_UNREACHABLE()                                                \
  ::fhirshape::detail::panic_impl("unreachable code was reached")
