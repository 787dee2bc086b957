//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "fhirshape/fwd.hpp"

#include <arrow/type_fwd.h>

#include <memory>
#include <string_view>

namespace fhirshape {

/// Controls how shapes turn into Arrow types.
struct render_options {
  /// Drop record fields that have no children, since some consumers reject
  /// empty structs.
  bool omit_empty_records = false;
};

/// Converts a shape into the corresponding Arrow type. Records become structs,
/// lists become lists with an `item` field, and null shapes become strings.
auto to_arrow_type(const shape& x, const render_options& options = {})
  -> std::shared_ptr<arrow::DataType>;

/// Converts a named shape into a nullable Arrow field.
/// @returns `nullptr` if the field is dropped per *options*.
auto to_arrow_field(std::string_view name, const shape& x,
                    const render_options& options = {})
  -> std::shared_ptr<arrow::Field>;

/// Converts a schema tree into an Arrow schema whose metadata carries the
/// record kind.
auto to_arrow_schema(const schema_tree& tree,
                     const render_options& options = {})
  -> std::shared_ptr<arrow::Schema>;

} // namespace fhirshape
