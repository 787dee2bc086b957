//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "fhirshape/fwd.hpp"

#include "fhirshape/shape.hpp"

#include <caf/expected.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace fhirshape {

/// A field that every record of a kind, or every element of a type, is known
/// to have.
struct default_field {
  std::string name;

  /// The shape to assume when no record carried the field. For a field of an
  /// element type, the innermost shape is an empty record in place of the
  /// element.
  std::optional<shape> hint = {};

  /// The element type of the field's values, e.g., `CodeableConcept`.
  std::string element = {};

  friend auto operator==(const default_field&, const default_field&) -> bool
    = default;
};

/// A lookup from record kind to the ordered top-level fields of that kind,
/// and from element type to the fields of that element.
///
/// Element types are complete: once any part of an element is observed, the
/// schema carries all of its fields.
class reference_defaults {
public:
  reference_defaults() = default;

  /// Creates a table from a YAML-like value of the form:
  ///
  ///     Patient:
  ///       - id
  ///       - active: bool
  ///       - maritalStatus: CodeableConcept
  ///       - name
  ///     elements:
  ///       CodeableConcept:
  ///         - coding: list<Coding>
  ///         - text: string
  ///       Coding:
  ///         - system: string
  ///         - code: string
  ///
  /// Hints are `bool`, `int`, `float`, `string`, the name of an element type,
  /// or `list<hint>`. Every element type that a hint names must have an entry
  /// under `elements`.
  static auto make(const data& x) -> caf::expected<reference_defaults>;

  /// Loads a table from a YAML file.
  static auto load(const std::filesystem::path& file)
    -> caf::expected<reference_defaults>;

  /// Adds fields to a kind. Names the kind already has are ignored.
  void add(std::string kind, std::vector<default_field> fields);

  /// @returns the fields of *kind*, or none if the kind is unknown.
  auto fields(std::string_view kind) const -> std::span<const default_field>;

  auto contains(std::string_view kind) const -> bool;

  /// Adds fields to an element type. Names the type already has are ignored.
  void add_element(std::string type, std::vector<default_field> fields);

  /// @returns the fields of the element *type*, or none if it is unknown.
  auto element_fields(std::string_view type) const
    -> std::span<const default_field>;

  auto contains_element(std::string_view type) const -> bool;

  /// @returns the number of kinds.
  auto size() const -> size_t;

  auto empty() const -> bool;

  friend auto operator==(const reference_defaults&, const reference_defaults&)
    -> bool
    = default;

private:
  std::map<std::string, std::vector<default_field>, std::less<>> table_;
  std::map<std::string, std::vector<default_field>, std::less<>> elements_;
};

/// Parses a type hint such as `int`, `string` or `list<float>`.
/// @relates reference_defaults
auto parse_hint(std::string_view str) -> std::optional<shape>;

} // namespace fhirshape
