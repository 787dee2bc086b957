//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "fhirshape/fwd.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <caf/inspector_access.hpp>
#include <fmt/format.h>

#include <string>
#include <string_view>
#include <type_traits>

namespace fhirshape {

/// The error codes of libfhirshape.
enum class ec : uint8_t {
  /// No error.
  no_error = 0,
  /// The unspecified default error code.
  unspecified,
  /// A value handed to the schema inference is not a record.
  invalid_record,
  /// Failure during parsing.
  parse_error,
  /// An error while accessing the filesystem.
  filesystem_error,
  /// An operation received an invalid argument.
  invalid_argument,
  /// A configuration or reference table is malformed.
  invalid_configuration,
  /// An error caused by wrong internal application logic.
  logic_error,
  /// No error; number of error codes.
  ec_count,
};

/// @relates ec
auto to_string(ec x) -> std::string;

/// @relates ec
auto from_string(std::string_view str, ec& x) -> bool;

/// @relates ec
auto from_integer(std::underlying_type_t<ec> value, ec& x) -> bool;

/// @relates ec
template <class Inspector>
auto inspect(Inspector& f, ec& x) -> bool {
  return caf::default_enum_inspect(f, x);
}

/// Converts an error into a human-readable string.
/// @relates ec
auto render(const caf::error& err) -> std::string;

auto add_context_impl(const caf::error& error, std::string str) -> caf::error;

/// Prefixes the message of an error with additional context.
template <class... Ts>
auto add_context(const caf::error& error, fmt::format_string<Ts...> fmt,
                 Ts&&... args) -> caf::error {
  return add_context_impl(error, fmt::format(std::move(fmt),
                                             std::forward<Ts>(args)...));
}

} // namespace fhirshape

CAF_ERROR_CODE_ENUM(fhirshape::ec)

template <>
struct fmt::formatter<caf::error> : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(const caf::error& x, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(fhirshape::render(x), ctx);
  }
};
