//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "fhirshape/fwd.hpp"

#include <caf/expected.hpp>
#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace fhirshape {

/// One key of a field path.
struct path_segment {
  /// The field name.
  std::string name;

  /// The number of sequence levels entered at this key. A value of zero means
  /// the key maps directly to the value; a positive value means the value sits
  /// inside that many nested lists.
  uint32_t list_depth = 0;

  /// @returns whether the value at this key was inside a list.
  auto in_list() const -> bool {
    return list_depth > 0;
  }

  friend auto operator==(const path_segment&, const path_segment&) -> bool
    = default;
};

/// The location of a field inside a record, from the root down. List elements
/// share the path of their list; there are no positional segments.
class field_path {
public:
  field_path() = default;

  explicit field_path(std::vector<path_segment> segments);

  /// Parses the notation produced by `to_string`, e.g., `code.coding[].system`.
  /// Field names must not contain `.` or `[`.
  static auto parse(std::string_view str) -> caf::expected<field_path>;

  auto segments() const -> std::span<const path_segment> {
    return segments_;
  }

  auto empty() const -> bool {
    return segments_.empty();
  }

  auto size() const -> size_t {
    return segments_.size();
  }

  /// @returns this path extended by the field *name*.
  auto child(std::string name) const -> field_path;

  /// @returns this path with one more list level at its last segment.
  /// @pre `not empty()`
  auto nested() const -> field_path;

  friend auto operator==(const field_path&, const field_path&) -> bool
    = default;

  friend auto to_string(const field_path& x) -> std::string;

private:
  std::vector<path_segment> segments_;
};

} // namespace fhirshape

template <>
struct std::hash<fhirshape::field_path> {
  auto operator()(const fhirshape::field_path& x) const noexcept -> size_t;
};

template <>
struct fmt::formatter<fhirshape::field_path>
  : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(const fhirshape::field_path& x, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(to_string(x), ctx);
  }
};
