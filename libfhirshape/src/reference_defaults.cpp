//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "fhirshape/reference_defaults.hpp"

#include "fhirshape/data.hpp"
#include "fhirshape/error.hpp"
#include "fhirshape/logger.hpp"

#include <algorithm>
#include <cctype>

namespace fhirshape {

namespace {

/// The key that holds the element types instead of a record kind.
constexpr auto elements_key = std::string_view{"elements"};

auto is_element_name(std::string_view str) -> bool {
  if (str.empty() or not std::isupper(static_cast<unsigned char>(str[0]))) {
    return false;
  }
  return std::ranges::all_of(str, [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
  });
}

auto strip_list(std::string_view& str) -> bool {
  if (not str.starts_with("list<") or not str.ends_with('>')) {
    return false;
  }
  str = str.substr(5, str.size() - 6);
  return true;
}

auto make_field(std::string_view owner, const data& entry)
  -> caf::expected<default_field> {
  if (const auto* name = try_as<std::string>(&entry)) {
    return default_field{*name};
  }
  const auto* xs = try_as<record>(&entry);
  if (xs == nullptr or xs->size() != 1) {
    return caf::make_error(ec::invalid_configuration,
                           fmt::format("{}: expected a field name or a "
                                       "single 'name: hint' pair, got {}",
                                       owner, entry));
  }
  const auto& [name, value] = *xs->begin();
  const auto* hint_name = try_as<std::string>(&value);
  if (hint_name == nullptr) {
    return caf::make_error(ec::invalid_configuration,
                           fmt::format("{}.{}: type hint must be a string, "
                                       "got {}",
                                       owner, name, value));
  }
  if (auto hint = parse_hint(*hint_name)) {
    return default_field{name, std::move(hint)};
  }
  // Anything else must name an element type, possibly inside lists.
  auto type = std::string_view{*hint_name};
  auto depth = size_t{0};
  while (strip_list(type)) {
    ++depth;
  }
  if (not is_element_name(type)) {
    return caf::make_error(ec::invalid_configuration,
                           fmt::format("{}.{}: unknown type hint '{}'", owner,
                                       name, *hint_name));
  }
  auto skeleton = shape{record_shape{}};
  for (auto i = size_t{0}; i < depth; ++i) {
    skeleton = list_shape{std::move(skeleton)};
  }
  return default_field{name, std::move(skeleton), std::string{type}};
}

auto make_fields(std::string_view owner, const data& entries)
  -> caf::expected<std::vector<default_field>> {
  const auto* xs = try_as<list>(&entries);
  if (xs == nullptr) {
    return caf::make_error(ec::invalid_configuration,
                           fmt::format("{}: expected a list of fields, got {}",
                                       owner, kind_name(entries)));
  }
  auto result = std::vector<default_field>{};
  result.reserve(xs->size());
  for (const auto& entry : *xs) {
    auto field = make_field(owner, entry);
    if (not field) {
      return std::move(field.error());
    }
    if (std::ranges::find(result, field->name, &default_field::name)
        != result.end()) {
      return caf::make_error(ec::invalid_configuration,
                             fmt::format("{}: duplicate field '{}'", owner,
                                         field->name));
    }
    result.push_back(std::move(*field));
  }
  return result;
}

} // namespace

auto parse_hint(std::string_view str) -> std::optional<shape> {
  if (strip_list(str)) {
    auto element = parse_hint(str);
    if (not element) {
      return std::nullopt;
    }
    return list_shape{std::move(*element)};
  }
  if (str == "bool" or str == "boolean") {
    return bool_shape{};
  }
  if (str == "int" or str == "integer") {
    return int64_shape{};
  }
  if (str == "float" or str == "double") {
    return double_shape{};
  }
  if (str == "string") {
    return string_shape{};
  }
  return std::nullopt;
}

auto reference_defaults::make(const data& x)
  -> caf::expected<reference_defaults> {
  const auto* kinds = try_as<record>(&x);
  if (kinds == nullptr) {
    return caf::make_error(ec::invalid_configuration,
                           fmt::format("reference defaults must map record "
                                       "kinds to field lists, got {}",
                                       kind_name(x)));
  }
  auto result = reference_defaults{};
  for (const auto& [kind, entries] : *kinds) {
    if (kind == elements_key) {
      const auto* types = try_as<record>(&entries);
      if (types == nullptr) {
        return caf::make_error(ec::invalid_configuration,
                               fmt::format("{}: expected a mapping from "
                                           "element types to field lists, "
                                           "got {}",
                                           kind, kind_name(entries)));
      }
      for (const auto& [type, type_entries] : *types) {
        if (not is_element_name(type)) {
          return caf::make_error(ec::invalid_configuration,
                                 fmt::format("{}: invalid element type name "
                                             "'{}'",
                                             kind, type));
        }
        auto fields = make_fields(type, type_entries);
        if (not fields) {
          return std::move(fields.error());
        }
        result.add_element(type, std::move(*fields));
      }
      continue;
    }
    auto fields = make_fields(kind, entries);
    if (not fields) {
      return std::move(fields.error());
    }
    result.add(kind, std::move(*fields));
  }
  // Every referenced element type must be defined.
  for (const auto* table : {&result.table_, &result.elements_}) {
    for (const auto& [owner, fields] : *table) {
      for (const auto& field : fields) {
        if (not field.element.empty()
            and not result.contains_element(field.element)) {
          return caf::make_error(ec::invalid_configuration,
                                 fmt::format("{}.{}: unknown element type "
                                             "'{}'",
                                             owner, field.name,
                                             field.element));
        }
      }
    }
  }
  return result;
}

auto reference_defaults::load(const std::filesystem::path& file)
  -> caf::expected<reference_defaults> {
  auto yaml = load_yaml(file);
  if (not yaml) {
    return std::move(yaml.error());
  }
  auto result = make(*yaml);
  if (not result) {
    return add_context(result.error(), "failed to load reference defaults "
                                       "from {}",
                       file.string());
  }
  FHIRSHAPE_VERBOSE("loaded reference defaults for {} record kinds from {}",
                    result->size(), file.string());
  return result;
}

void reference_defaults::add(std::string kind,
                             std::vector<default_field> fields) {
  auto& existing = table_[std::move(kind)];
  for (auto& field : fields) {
    if (std::ranges::find(existing, field.name, &default_field::name)
        == existing.end()) {
      existing.push_back(std::move(field));
    }
  }
}

auto reference_defaults::fields(std::string_view kind) const
  -> std::span<const default_field> {
  auto it = table_.find(kind);
  if (it == table_.end()) {
    return {};
  }
  return it->second;
}

auto reference_defaults::contains(std::string_view kind) const -> bool {
  return table_.find(kind) != table_.end();
}

void reference_defaults::add_element(std::string type,
                                     std::vector<default_field> fields) {
  auto& existing = elements_[std::move(type)];
  for (auto& field : fields) {
    if (std::ranges::find(existing, field.name, &default_field::name)
        == existing.end()) {
      existing.push_back(std::move(field));
    }
  }
}

auto reference_defaults::element_fields(std::string_view type) const
  -> std::span<const default_field> {
  auto it = elements_.find(type);
  if (it == elements_.end()) {
    return {};
  }
  return it->second;
}

auto reference_defaults::contains_element(std::string_view type) const
  -> bool {
  return elements_.find(type) != elements_.end();
}

auto reference_defaults::size() const -> size_t {
  return table_.size();
}

auto reference_defaults::empty() const -> bool {
  return table_.empty();
}

} // namespace fhirshape
