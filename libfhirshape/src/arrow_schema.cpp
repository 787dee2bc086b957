//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "fhirshape/arrow_schema.hpp"

#include "fhirshape/defaults.hpp"
#include "fhirshape/schema_tree.hpp"
#include "fhirshape/shape.hpp"

#include <arrow/type.h>
#include <arrow/util/key_value_metadata.h>

#include <string>
#include <vector>

namespace fhirshape {

namespace {

auto render(const shape& x, const render_options& options)
  -> std::shared_ptr<arrow::DataType>;

auto render_fields(const record_shape& x, const render_options& options)
  -> arrow::FieldVector {
  auto result = arrow::FieldVector{};
  result.reserve(x.num_fields());
  for (const auto& field : x.fields()) {
    if (auto type = render(field.type, options)) {
      result.push_back(arrow::field(field.name, std::move(type)));
    }
  }
  return result;
}

// Returns nullptr for a type that must be left out.
auto render(const shape& x, const render_options& options)
  -> std::shared_ptr<arrow::DataType> {
  return match(
    x,
    [](const null_shape&) -> std::shared_ptr<arrow::DataType> {
      return arrow::utf8();
    },
    [](const bool_shape&) -> std::shared_ptr<arrow::DataType> {
      return arrow::boolean();
    },
    [](const int64_shape&) -> std::shared_ptr<arrow::DataType> {
      return arrow::int64();
    },
    [](const double_shape&) -> std::shared_ptr<arrow::DataType> {
      return arrow::float64();
    },
    [](const string_shape&) -> std::shared_ptr<arrow::DataType> {
      return arrow::utf8();
    },
    [&](const list_shape& xs) -> std::shared_ptr<arrow::DataType> {
      auto element = render(xs.element(), options);
      if (not element) {
        return nullptr;
      }
      return arrow::list(arrow::field("item", std::move(element)));
    },
    [&](const record_shape& xs) -> std::shared_ptr<arrow::DataType> {
      auto fields = render_fields(xs, options);
      if (fields.empty() and options.omit_empty_records) {
        return nullptr;
      }
      return arrow::struct_(fields);
    });
}

} // namespace

auto to_arrow_type(const shape& x, const render_options& options)
  -> std::shared_ptr<arrow::DataType> {
  if (auto result = render(x, options)) {
    return result;
  }
  return arrow::struct_({});
}

auto to_arrow_field(std::string_view name, const shape& x,
                    const render_options& options)
  -> std::shared_ptr<arrow::Field> {
  auto type = render(x, options);
  if (not type) {
    return nullptr;
  }
  return arrow::field(std::string{name}, std::move(type));
}

auto to_arrow_schema(const schema_tree& tree, const render_options& options)
  -> std::shared_ptr<arrow::Schema> {
  auto metadata = arrow::KeyValueMetadata::Make(
    {std::string{defaults::record_kind_metadata_key}}, {tree.kind()});
  return arrow::schema(render_fields(tree.root(), options),
                       std::move(metadata));
}

} // namespace fhirshape
