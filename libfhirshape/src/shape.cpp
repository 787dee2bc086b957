//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "fhirshape/shape.hpp"

#include "fhirshape/detail/assert.hpp"

#include <algorithm>
#include <utility>

namespace fhirshape {

// -- list_shape ---------------------------------------------------------------

list_shape::list_shape() : element_{std::make_unique<shape>()} {
  // nop
}

list_shape::list_shape(shape element)
  : element_{std::make_unique<shape>(std::move(element))} {
  // nop
}

list_shape::list_shape(const list_shape& other)
  : element_{std::make_unique<shape>(*other.element_)} {
  // nop
}

auto list_shape::operator=(const list_shape& other) -> list_shape& {
  if (this != &other) {
    element_ = std::make_unique<shape>(*other.element_);
  }
  return *this;
}

list_shape::list_shape(list_shape&& other) noexcept = default;

auto list_shape::operator=(list_shape&& other) noexcept
  -> list_shape& = default;

list_shape::~list_shape() noexcept = default;

auto list_shape::element() const -> const shape& {
  return *element_;
}

auto list_shape::element() -> shape& {
  return *element_;
}

auto list_shape::is_unknown() const -> bool {
  return is<null_shape>(*element_);
}

auto operator==(const list_shape& lhs, const list_shape& rhs) -> bool {
  return *lhs.element_ == *rhs.element_;
}

// -- record_shape -------------------------------------------------------------

record_shape::record_shape() = default;

record_shape::record_shape(std::initializer_list<record_field> fields)
  : record_shape(std::vector<record_field>(fields)) {
  // nop
}

record_shape::record_shape(std::vector<record_field> fields) {
  fields_.reserve(fields.size());
  for (auto& field : fields) {
    if (auto* existing = find(field.name)) {
      merge(*existing, field.type);
      continue;
    }
    fields_.push_back(std::move(field));
  }
}

record_shape::record_shape(const record_shape& other) = default;

auto record_shape::operator=(const record_shape& other)
  -> record_shape& = default;

record_shape::record_shape(record_shape&& other) noexcept = default;

auto record_shape::operator=(record_shape&& other) noexcept
  -> record_shape& = default;

record_shape::~record_shape() noexcept = default;

auto record_shape::fields() const -> std::span<const record_field> {
  return fields_;
}

auto record_shape::fields() -> std::span<record_field> {
  return fields_;
}

auto record_shape::num_fields() const -> size_t {
  return fields_.size();
}

auto record_shape::find(std::string_view name) const -> const shape* {
  auto it = std::ranges::find(fields_, name, &record_field::name);
  return it != fields_.end() ? &it->type : nullptr;
}

auto record_shape::find(std::string_view name) -> shape* {
  auto it = std::ranges::find(fields_, name, &record_field::name);
  return it != fields_.end() ? &it->type : nullptr;
}

auto record_shape::append(std::string name, shape type) -> shape& {
  FHIRSHAPE_ASSERT(find(name) == nullptr, "record fields must be unique");
  fields_.push_back(record_field{std::move(name), std::move(type)});
  return fields_.back().type;
}

auto operator==(const record_shape& lhs, const record_shape& rhs) -> bool {
  if (lhs.fields_.size() != rhs.fields_.size()) {
    return false;
  }
  return std::ranges::all_of(lhs.fields_, [&](const record_field& field) {
    const auto* other = rhs.find(field.name);
    return other != nullptr and *other == field.type;
  });
}

// -- shape --------------------------------------------------------------------

auto operator==(const shape& lhs, const shape& rhs) -> bool {
  return lhs.shape_ == rhs.shape_;
}

auto identical(const shape& lhs, const shape& rhs) -> bool {
  auto f = detail::overload{
    [](const list_shape& a, const list_shape& b) {
      return identical(a.element(), b.element());
    },
    [](const record_shape& a, const record_shape& b) {
      return std::ranges::equal(a.fields(), b.fields(),
                                [](const record_field& x,
                                   const record_field& y) {
                                  return x.name == y.name
                                         and identical(x.type, y.type);
                                });
    },
    []<class T, class U>(const T&, const U&) {
      return std::same_as<T, U>;
    },
  };
  return std::visit(f, lhs.get_data(), rhs.get_data());
}

namespace {

/// What to do with the destination when merging a source into it.
enum class merge_action {
  /// Leave the destination as is.
  keep,
  /// Replace the destination with a copy of the source.
  take,
  /// Replace the destination with a double.
  widen_to_double,
  /// Replace the destination with a string.
  fall_back_to_string,
  /// Merge the children of two records or two lists.
  descend,
};

auto resolve(const shape& dst, const shape& src) -> merge_action {
  auto f = detail::overload{
    [](const null_shape&, const null_shape&) {
      return merge_action::keep;
    },
    [](const auto&, const null_shape&) {
      return merge_action::keep;
    },
    [](const null_shape&, const auto&) {
      return merge_action::take;
    },
    [](const null_shape&, const list_shape&) {
      return merge_action::take;
    },
    [](const list_shape&, const null_shape&) {
      return merge_action::keep;
    },
    [](const record_shape&, const record_shape&) {
      return merge_action::descend;
    },
    [](const list_shape&, const list_shape&) {
      return merge_action::descend;
    },
    [](const int64_shape&, const double_shape&) {
      return merge_action::widen_to_double;
    },
    [](const double_shape&, const int64_shape&) {
      return merge_action::keep;
    },
    [](const list_shape& a, const auto&) {
      return a.is_unknown() ? merge_action::take
                            : merge_action::fall_back_to_string;
    },
    [](const auto&, const list_shape& b) {
      return b.is_unknown() ? merge_action::keep
                            : merge_action::fall_back_to_string;
    },
    []<class T, class U>(const T&, const U&) {
      return std::same_as<T, U> ? merge_action::keep
                                : merge_action::fall_back_to_string;
    },
  };
  return std::visit(f, dst.get_data(), src.get_data());
}

} // namespace

void merge(shape& dst, const shape& src) {
  if (&dst == &src) {
    return;
  }
  auto stack = std::vector<std::pair<shape*, const shape*>>{};
  stack.emplace_back(&dst, &src);
  while (not stack.empty()) {
    auto [x, y] = stack.back();
    stack.pop_back();
    switch (resolve(*x, *y)) {
      case merge_action::keep:
        break;
      case merge_action::take:
        *x = *y;
        break;
      case merge_action::widen_to_double:
        *x = double_shape{};
        break;
      case merge_action::fall_back_to_string:
        *x = string_shape{};
        break;
      case merge_action::descend: {
        if (auto* xs = try_as<list_shape>(x)) {
          stack.emplace_back(&xs->element(),
                             &try_as<list_shape>(y)->element());
          break;
        }
        auto& xr = std::get<record_shape>(x->get_data());
        const auto& yr = std::get<record_shape>(y->get_data());
        // Append first: pointers into the field vector of the destination
        // must stay valid while they sit on the stack.
        for (const auto& field : yr.fields()) {
          if (xr.find(field.name) == nullptr) {
            xr.append(field.name, field.type);
          }
        }
        for (const auto& field : yr.fields()) {
          auto* existing = xr.find(field.name);
          FHIRSHAPE_ASSERT(existing != nullptr);
          if (existing != &field.type) {
            stack.emplace_back(existing, &field.type);
          }
        }
        break;
      }
    }
  }
}

auto unify(const shape& a, const shape& b) -> shape {
  auto result = a;
  merge(result, b);
  return result;
}

auto kind_name(const shape& x) -> std::string_view {
  return match(
    x,
    [](const null_shape&) -> std::string_view {
      return "null";
    },
    [](const bool_shape&) -> std::string_view {
      return "bool";
    },
    [](const int64_shape&) -> std::string_view {
      return "int64";
    },
    [](const double_shape&) -> std::string_view {
      return "double";
    },
    [](const string_shape&) -> std::string_view {
      return "string";
    },
    [](const list_shape&) -> std::string_view {
      return "list";
    },
    [](const record_shape&) -> std::string_view {
      return "record";
    });
}

namespace {

void print(std::string& out, const shape& x) {
  if (const auto* xs = try_as<list_shape>(&x)) {
    out += "list<";
    print(out, xs->element());
    out += '>';
    return;
  }
  if (const auto* xr = try_as<record_shape>(&x)) {
    out += "record{";
    auto first = true;
    for (const auto& field : xr->fields()) {
      if (not first) {
        out += ", ";
      }
      first = false;
      out += field.name;
      out += ": ";
      print(out, field.type);
    }
    out += '}';
    return;
  }
  out += kind_name(x);
}

} // namespace

auto to_string(const shape& x) -> std::string {
  auto result = std::string{};
  print(result, x);
  return result;
}

} // namespace fhirshape
