//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "fhirshape/fwd.hpp"

#include "fhirshape/path_walker.hpp"
#include "fhirshape/shape.hpp"

#include <caf/error.hpp>
#include <fmt/format.h>

#include <cstddef>
#include <span>
#include <string>

namespace fhirshape {

/// The merged shape of all records of one kind. The root is always a record.
class schema_tree {
public:
  explicit schema_tree(std::string kind);

  /// Merges one observation into the tree, creating intermediate records and
  /// lists along its path.
  void add(const observation& x);

  void add(std::span<const observation> xs);

  /// Merges another tree of the same kind into this one.
  /// @returns `ec::invalid_argument` if the kinds differ.
  auto merge(const schema_tree& other) -> caf::error;

  /// Adds every default field of this kind that is not yet a top-level field.
  /// Added fields use the hint of the default field or the null shape.
  /// Observed values of a field with an element type gain the missing fields
  /// of that element, at any depth.
  /// @returns the number of added top-level fields.
  auto widen(const reference_defaults& defaults) -> size_t;

  /// @returns the shape at *path*, or `nullptr` if the path was never
  /// observed.
  auto find(const field_path& path) const -> const shape*;

  auto kind() const -> const std::string& {
    return kind_;
  }

  auto root() const -> const record_shape&;

  /// Compares kinds and roots, ignoring the order of record fields.
  friend auto operator==(const schema_tree& lhs, const schema_tree& rhs)
    -> bool;

private:
  std::string kind_;
  shape root_;
};

/// Compares kinds and roots, including the order of record fields.
/// @relates schema_tree
auto identical(const schema_tree& lhs, const schema_tree& rhs) -> bool;

/// @relates schema_tree
auto to_string(const schema_tree& x) -> std::string;

} // namespace fhirshape

template <>
struct fmt::formatter<fhirshape::schema_tree>
  : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(const fhirshape::schema_tree& x, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(fhirshape::to_string(x),
                                                    ctx);
  }
};
