//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "fhirshape/fwd.hpp"

#include "fhirshape/field_path.hpp"
#include "fhirshape/shape.hpp"

#include <caf/expected.hpp>

#include <string_view>
#include <vector>

namespace fhirshape {

/// A single fact derived from one record: the shape of the value found at a
/// field path.
struct observation {
  field_path path;
  shape type;

  friend auto operator==(const observation&, const observation&) -> bool
    = default;
};

/// Extracts all field paths of a record together with the shapes of their
/// values.
///
/// The traversal visits fields in pre-order and in the order of the record's
/// keys, and the result lists every path once, in the order it was first
/// reached. Lists do not add positional segments: all elements of a list share
/// the path of the list with one more list level, so repeated sightings of a
/// path are merged into one observation. A nested record also yields an
/// observation of an empty record at its own path, and an empty list yields a
/// null observation one list level down.
///
/// Scalars are classified by their decoded kind. A string that looks like a
/// number stays a string.
///
/// @param value The decoded record.
/// @param record_kind The kind of the record, used for error messages.
/// @returns the observations, or `ec::invalid_record` if *value* is not a
/// record.
auto walk(const data& value, std::string_view record_kind)
  -> caf::expected<std::vector<observation>>;

} // namespace fhirshape
