//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "fhirshape/fwd.hpp"

#include <cstddef>
#include <string_view>

namespace fhirshape::defaults {

// -- global constants ---------------------------------------------------------

/// The field in which a FHIR resource names its own record kind.
inline constexpr std::string_view kind_field = "resourceType";

/// The number of threads that fold records into partial schemas.
inline constexpr size_t workers = 1;

/// The number of records that are read before they fold on multiple workers.
inline constexpr size_t batch_size = 16'384;

/// The maximum nesting depth of a decoded JSON document.
inline constexpr size_t max_json_depth = 256;

/// The Arrow schema metadata key that carries the record kind.
inline constexpr std::string_view record_kind_metadata_key
  = "fhirshape.record-kind";

// -- constants for the logger -------------------------------------------------

namespace logger {

/// Verbosity of the console sink.
inline constexpr std::string_view console_verbosity = "info";

/// Format string for the console sink.
inline constexpr std::string_view console_format = "%^[%T.%e] %v%$";

} // namespace logger

} // namespace fhirshape::defaults
