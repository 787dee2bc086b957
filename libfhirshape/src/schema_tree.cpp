//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "fhirshape/schema_tree.hpp"

#include "fhirshape/detail/assert.hpp"
#include "fhirshape/error.hpp"
#include "fhirshape/reference_defaults.hpp"

#include <algorithm>
#include <string_view>
#include <vector>

namespace fhirshape {

schema_tree::schema_tree(std::string kind)
  : kind_{std::move(kind)}, root_{record_shape{}} {
  // nop
}

void schema_tree::add(const observation& x) {
  // Build the nesting of the path around the observed shape from the inside
  // out, then fold it into the root like any other record.
  auto skeleton = x.type;
  auto segments = x.path.segments();
  for (auto it = segments.rbegin(); it != segments.rend(); ++it) {
    for (auto i = uint32_t{0}; i < it->list_depth; ++i) {
      skeleton = list_shape{std::move(skeleton)};
    }
    auto wrapper = record_shape{};
    wrapper.append(it->name, std::move(skeleton));
    skeleton = std::move(wrapper);
  }
  fhirshape::merge(root_, skeleton);
  FHIRSHAPE_ASSERT(is<record_shape>(root_));
}

void schema_tree::add(std::span<const observation> xs) {
  for (const auto& x : xs) {
    add(x);
  }
}

auto schema_tree::merge(const schema_tree& other) -> caf::error {
  if (kind_ != other.kind_) {
    return caf::make_error(ec::invalid_argument,
                           fmt::format("cannot merge a {} schema into a {} "
                                       "schema",
                                       other.kind_, kind_));
  }
  fhirshape::merge(root_, other.root_);
  return {};
}

namespace {

/// The element types that enclose the node being widened.
using element_chain = std::vector<std::string_view>;

auto materialize(const default_field& field,
                 const reference_defaults& defaults, element_chain& chain)
  -> shape;

/// Builds a record with all fields of *type*. An element type never nests
/// into itself: a field that would recurse stays null.
auto materialize_element(std::string_view type,
                         const reference_defaults& defaults,
                         element_chain& chain) -> shape {
  if (not defaults.contains_element(type)
      or std::ranges::find(chain, type) != chain.end()) {
    return null_shape{};
  }
  chain.push_back(type);
  auto result = record_shape{};
  for (const auto& field : defaults.element_fields(type)) {
    result.append(field.name, materialize(field, defaults, chain));
  }
  chain.pop_back();
  return result;
}

auto materialize(const default_field& field,
                 const reference_defaults& defaults, element_chain& chain)
  -> shape {
  if (field.element.empty()) {
    return field.hint.value_or(null_shape{});
  }
  auto result = materialize_element(field.element, defaults, chain);
  const auto* hint = field.hint ? &*field.hint : nullptr;
  while (const auto* xs = try_as<list_shape>(hint)) {
    result = list_shape{std::move(result)};
    hint = &xs->element();
  }
  return result;
}

/// Adds the missing fields of *type* to the observed *node* and to every
/// observed element below it.
void complete(shape& node, std::string_view type,
              const reference_defaults& defaults) {
  struct pending {
    shape* node;
    std::string_view type;
    element_chain chain;
  };
  auto stack = std::vector<pending>{};
  stack.push_back({&node, type, {}});
  while (not stack.empty()) {
    auto [current, element, chain] = std::move(stack.back());
    stack.pop_back();
    if (std::ranges::find(chain, element) != chain.end()) {
      continue;
    }
    while (auto* xs = try_as<list_shape>(current)) {
      current = &xs->element();
    }
    if (is<null_shape>(*current)) {
      *current = materialize_element(element, defaults, chain);
      continue;
    }
    auto* xs = try_as<record_shape>(current);
    if (xs == nullptr) {
      // A scalar where an element was expected keeps its observed shape.
      continue;
    }
    chain.push_back(element);
    // Append first: appending may move the fields we descend into next.
    auto nested = std::vector<const default_field*>{};
    for (const auto& field : defaults.element_fields(element)) {
      if (xs->find(field.name) == nullptr) {
        xs->append(field.name, materialize(field, defaults, chain));
      } else if (not field.element.empty()) {
        nested.push_back(&field);
      }
    }
    for (const auto* field : nested) {
      stack.push_back({xs->find(field->name), field->element, chain});
    }
  }
}

} // namespace

auto schema_tree::widen(const reference_defaults& defaults) -> size_t {
  auto& root = std::get<record_shape>(root_.get_data());
  auto result = size_t{0};
  for (const auto& field : defaults.fields(kind_)) {
    if (root.find(field.name) != nullptr) {
      continue;
    }
    auto chain = element_chain{};
    root.append(field.name, materialize(field, defaults, chain));
    ++result;
  }
  for (const auto& field : defaults.fields(kind_)) {
    if (not field.element.empty()) {
      complete(*root.find(field.name), field.element, defaults);
    }
  }
  return result;
}

auto schema_tree::find(const field_path& path) const -> const shape* {
  const auto* current = &root_;
  for (const auto& segment : path.segments()) {
    const auto* xs = try_as<record_shape>(current);
    if (xs == nullptr) {
      return nullptr;
    }
    current = xs->find(segment.name);
    if (current == nullptr) {
      return nullptr;
    }
    for (auto i = uint32_t{0}; i < segment.list_depth; ++i) {
      const auto* list = try_as<list_shape>(current);
      if (list == nullptr) {
        return nullptr;
      }
      current = &list->element();
    }
  }
  return current;
}

auto schema_tree::root() const -> const record_shape& {
  return std::get<record_shape>(root_.get_data());
}

auto operator==(const schema_tree& lhs, const schema_tree& rhs) -> bool {
  return lhs.kind_ == rhs.kind_ and lhs.root_ == rhs.root_;
}

auto identical(const schema_tree& lhs, const schema_tree& rhs) -> bool {
  return lhs.kind() == rhs.kind()
         and identical(shape{lhs.root()}, shape{rhs.root()});
}

auto to_string(const schema_tree& x) -> std::string {
  return fmt::format("{}: {}", x.kind(), shape{x.root()});
}

} // namespace fhirshape
