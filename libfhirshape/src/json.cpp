//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "fhirshape/json.hpp"

#include "fhirshape/defaults.hpp"
#include "fhirshape/detail/assert.hpp"
#include "fhirshape/error.hpp"
#include "fhirshape/logger.hpp"

#include <simdjson.h>

#include <concepts>

namespace fhirshape {

namespace {

auto make_parse_error(std::string_view what, simdjson::error_code code)
  -> caf::error {
  return caf::make_error(ec::parse_error,
                         fmt::format("failed to parse {}: {}", what,
                                     simdjson::error_message(code)));
}

auto parse_value(auto&& val, size_t depth) -> caf::expected<data>;

auto parse_number(auto&& val) -> caf::expected<data> {
  auto kind = val.get_number_type();
  if (kind.error()) {
    return make_parse_error("a number", kind.error());
  }
  switch (kind.value_unsafe()) {
    case simdjson::ondemand::number_type::floating_point_number: {
      auto result = val.get_double();
      if (result.error()) {
        return make_parse_error("a floating-point number", result.error());
      }
      return data{result.value_unsafe()};
    }
    case simdjson::ondemand::number_type::signed_integer: {
      auto result = val.get_int64();
      if (result.error()) {
        return make_parse_error("an integer", result.error());
      }
      return data{result.value_unsafe()};
    }
    case simdjson::ondemand::number_type::unsigned_integer: {
      auto result = val.get_uint64();
      if (result.error()) {
        return make_parse_error("an unsigned integer", result.error());
      }
      return data{result.value_unsafe()};
    }
    case simdjson::ondemand::number_type::big_integer: {
      // A document and a value expose the raw token differently.
      auto raw = val.raw_json_token();
      auto token = std::string_view{};
      if constexpr (std::same_as<decltype(raw), std::string_view>) {
        token = raw;
      } else {
        if (raw.error()) {
          return make_parse_error("a big integer", raw.error());
        }
        token = raw.value_unsafe();
      }
      while (not token.empty()
             and (token.back() == ' ' or token.back() == '\t'
                  or token.back() == '\n' or token.back() == '\r')) {
        token.remove_suffix(1);
      }
      return data{std::string{token}};
    }
  }
  FHIRSHAPE_UNREACHABLE();
}

auto parse_array(auto&& val, size_t depth) -> caf::expected<data> {
  auto arr = val.get_array();
  if (arr.error()) {
    return make_parse_error("an array", arr.error());
  }
  auto result = list{};
  for (auto element : arr) {
    if (element.error()) {
      return make_parse_error("an array element", element.error());
    }
    auto x = parse_value(element.value_unsafe(), depth + 1);
    if (not x) {
      return x;
    }
    result.push_back(std::move(*x));
  }
  return data{std::move(result)};
}

auto parse_object(auto&& val, size_t depth) -> caf::expected<data> {
  auto obj = val.get_object();
  if (obj.error()) {
    return make_parse_error("an object", obj.error());
  }
  auto result = record{};
  for (auto field : obj) {
    if (field.error()) {
      return make_parse_error("a key-value pair", field.error());
    }
    auto key = field.unescaped_key();
    if (key.error()) {
      return make_parse_error("a key", key.error());
    }
    auto name = std::string{key.value_unsafe()};
    auto value = field.value();
    if (value.error()) {
      return make_parse_error(fmt::format("the value of '{}'", name),
                              value.error());
    }
    auto x = parse_value(value.value_unsafe(), depth + 1);
    if (not x) {
      return add_context(x.error(), "in field '{}'", name);
    }
    result[name] = std::move(*x);
  }
  return data{std::move(result)};
}

auto parse_value(auto&& val, size_t depth) -> caf::expected<data> {
  if (depth > defaults::max_json_depth) {
    return caf::make_error(ec::parse_error,
                           fmt::format("JSON nesting exceeds {} levels",
                                       defaults::max_json_depth));
  }
  auto type = val.type();
  if (type.error()) {
    return make_parse_error("a value", type.error());
  }
  switch (type.value_unsafe()) {
    case simdjson::ondemand::json_type::null: {
      auto null = val.is_null();
      if (null.error()) {
        return make_parse_error("null", null.error());
      }
      return data{};
    }
    case simdjson::ondemand::json_type::number:
      return parse_number(val);
    case simdjson::ondemand::json_type::boolean: {
      auto result = val.get_bool();
      if (result.error()) {
        return make_parse_error("a boolean", result.error());
      }
      return data{result.value_unsafe()};
    }
    case simdjson::ondemand::json_type::string: {
      auto result = val.get_string();
      if (result.error()) {
        return make_parse_error("a string", result.error());
      }
      return data{std::string{result.value_unsafe()}};
    }
    case simdjson::ondemand::json_type::array:
      return parse_array(val, depth);
    case simdjson::ondemand::json_type::object:
      return parse_object(val, depth);
    case simdjson::ondemand::json_type::unknown:
      return caf::make_error(ec::parse_error, "unknown JSON value");
  }
  FHIRSHAPE_UNREACHABLE();
}

} // namespace

auto from_json(std::string_view str) -> caf::expected<data> {
  auto parser = simdjson::ondemand::parser{};
  auto padded = simdjson::padded_string{str};
  auto doc = simdjson::ondemand::document{};
  if (auto error = parser.iterate(padded).get(doc)) {
    return make_parse_error("a JSON document", error);
  }
  auto result = parse_value(doc, 0);
  if (not result) {
    return result;
  }
  if (not doc.at_end()) {
    return caf::make_error(ec::parse_error,
                           "trailing content after the JSON document");
  }
  return result;
}

ndjson_reader::ndjson_reader(std::istream& input,
                             std::optional<std::string> kind, std::string name)
  : input_{input}, kind_{std::move(kind)}, name_{std::move(name)} {
  // nop
}

auto ndjson_reader::next() -> std::optional<data> {
  while (std::getline(input_, line_)) {
    ++num_lines_;
    if (not line_.empty() and line_.back() == '\r') {
      line_.pop_back();
    }
    if (line_.find_first_not_of(" \t") == std::string::npos) {
      continue;
    }
    auto x = from_json(line_);
    if (not x) {
      FHIRSHAPE_WARN("{}:{}: skipping line: {}", name_, num_lines_, x.error());
      ++num_skipped_;
      continue;
    }
    const auto* xs = try_as<record>(&*x);
    if (xs == nullptr) {
      FHIRSHAPE_WARN("{}:{}: skipping line: expected an object but got {}",
                     name_, num_lines_, kind_name(*x));
      ++num_skipped_;
      continue;
    }
    if (kind_) {
      auto it = xs->find(defaults::kind_field);
      const auto* kind
        = it != xs->end() ? try_as<std::string>(&it->second) : nullptr;
      if (kind == nullptr or *kind != *kind_) {
        FHIRSHAPE_TRACE("{}:{}: skipping record of another kind", name_,
                        num_lines_);
        ++num_skipped_;
        continue;
      }
    }
    ++num_records_;
    return std::move(*x);
  }
  return std::nullopt;
}

} // namespace fhirshape
