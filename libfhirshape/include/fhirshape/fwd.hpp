//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "fhirshape/config.hpp"

#include <caf/fwd.hpp>
#include <caf/type_id.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace fhirshape {

// -- classes ------------------------------------------------------------------

class data;
class field_path;
class list_shape;
class ndjson_reader;
class record_shape;
class reference_defaults;
class schema_builder;
class schema_tree;
class shape;

// -- structs ------------------------------------------------------------------

struct bool_shape;
struct build_options;
struct configuration;
struct default_field;
struct double_shape;
struct int64_shape;
struct null_shape;
struct observation;
struct path_segment;
struct render_options;
struct string_shape;

// -- enums --------------------------------------------------------------------

enum class ec : uint8_t;

// -- aliases ------------------------------------------------------------------

using list = std::vector<data>;

} // namespace fhirshape

// -- type announcements -------------------------------------------------------

constexpr inline caf::type_id_t first_fhirshape_type_id = 800;

CAF_BEGIN_TYPE_ID_BLOCK(fhirshape_types, first_fhirshape_type_id)

  CAF_ADD_TYPE_ID(fhirshape_types, (fhirshape::ec))

CAF_END_TYPE_ID_BLOCK(fhirshape_types)
