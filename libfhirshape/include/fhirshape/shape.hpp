//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "fhirshape/fwd.hpp"

#include "fhirshape/concepts.hpp"
#include "fhirshape/detail/overload.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace fhirshape {

/// The shape of a value that was null, or of a field that is known to exist
/// without any evidence of its type.
struct null_shape {
  friend auto operator==(const null_shape&, const null_shape&) -> bool
    = default;
};

struct bool_shape {
  friend auto operator==(const bool_shape&, const bool_shape&) -> bool
    = default;
};

struct int64_shape {
  friend auto operator==(const int64_shape&, const int64_shape&) -> bool
    = default;
};

struct double_shape {
  friend auto operator==(const double_shape&, const double_shape&) -> bool
    = default;
};

struct string_shape {
  friend auto operator==(const string_shape&, const string_shape&) -> bool
    = default;
};

struct record_field;

/// The shape of a sequence. All elements share one element shape. A list whose
/// element shape is null has never seen an element and is considered unknown.
class list_shape {
public:
  /// Constructs an unknown list.
  list_shape();

  explicit list_shape(shape element);

  list_shape(const list_shape& other);
  auto operator=(const list_shape& other) -> list_shape&;
  list_shape(list_shape&& other) noexcept;
  auto operator=(list_shape&& other) noexcept -> list_shape&;
  ~list_shape() noexcept;

  auto element() const -> const shape&;
  auto element() -> shape&;

  /// @returns whether the element shape is null.
  auto is_unknown() const -> bool;

  friend auto operator==(const list_shape& lhs, const list_shape& rhs) -> bool;

private:
  std::unique_ptr<shape> element_;
};

/// The shape of a mapping: named child shapes in the order of first sighting.
class record_shape {
public:
  record_shape();
  record_shape(std::initializer_list<record_field> fields);
  explicit record_shape(std::vector<record_field> fields);

  record_shape(const record_shape& other);
  auto operator=(const record_shape& other) -> record_shape&;
  record_shape(record_shape&& other) noexcept;
  auto operator=(record_shape&& other) noexcept -> record_shape&;
  ~record_shape() noexcept;

  auto fields() const -> std::span<const record_field>;
  auto fields() -> std::span<record_field>;

  auto num_fields() const -> size_t;

  /// @returns the shape of the field *name*, or `nullptr`.
  auto find(std::string_view name) const -> const shape*;
  auto find(std::string_view name) -> shape*;

  /// Adds a new field after all existing ones.
  /// @pre `find(name) == nullptr`
  auto append(std::string name, shape type) -> shape&;

  /// Compares the fields as a set, ignoring their order.
  friend auto operator==(const record_shape& lhs, const record_shape& rhs)
    -> bool;

private:
  std::vector<record_field> fields_;
};

/// The type observed for one field path, or the union of all types observed
/// so far. This is a closed set of alternatives.
class shape {
public:
  // clang-format off
  using variant = std::variant<
    null_shape,
    bool_shape,
    int64_shape,
    double_shape,
    string_shape,
    list_shape,
    record_shape
  >;
  // clang-format on

  /// Default-constructs a null shape.
  shape() = default;

  template <class T>
    requires concepts::one_of<std::remove_cvref_t<T>, null_shape, bool_shape,
                              int64_shape, double_shape, string_shape,
                              list_shape, record_shape>
  shape(T&& x) : shape_{std::forward<T>(x)} {
    // nop
  }

  auto get_data() const -> const variant& {
    return shape_;
  }

  auto get_data() -> variant& {
    return shape_;
  }

  /// Structural equality that ignores the order of record fields.
  friend auto operator==(const shape& lhs, const shape& rhs) -> bool;

private:
  variant shape_;
};

/// A named child of a record shape.
struct record_field {
  std::string name;
  shape type;
};

/// @relates shape
template <class T>
auto is(const shape& x) -> bool {
  return std::holds_alternative<T>(x.get_data());
}

/// @relates shape
template <class T>
auto try_as(const shape* x) -> const T* {
  return x != nullptr ? std::get_if<T>(&x->get_data()) : nullptr;
}

/// @relates shape
template <class T>
auto try_as(shape* x) -> T* {
  return x != nullptr ? std::get_if<T>(&x->get_data()) : nullptr;
}

/// @relates shape
template <class... Fs>
auto match(const shape& x, Fs&&... fs) -> decltype(auto) {
  return std::visit(detail::overload{std::forward<Fs>(fs)...}, x.get_data());
}

/// Order-sensitive equality: record fields must appear in the same order.
/// @relates shape
auto identical(const shape& lhs, const shape& rhs) -> bool;

/// Merges *src* into *dst* in place. The merge is total, associative,
/// commutative and idempotent:
/// - null is the identity, and an unknown list yields to any non-null shape
/// - records merge field by field, lists merge their element shapes
/// - an integer merged with a double becomes a double
/// - every other mismatch becomes a string
/// New record fields are appended to *dst* in the order of *src*. The merge
/// walks nested shapes with an explicit stack and never recurses.
/// @pre *src* is either *dst* itself or not part of *dst*.
/// @relates shape
void merge(shape& dst, const shape& src);

/// @returns the merge of *a* and *b* as a new shape.
/// @relates shape
auto unify(const shape& a, const shape& b) -> shape;

/// @returns the short name of the alternative, e.g., `int64`.
/// @relates shape
auto kind_name(const shape& x) -> std::string_view;

/// @relates shape
auto to_string(const shape& x) -> std::string;

} // namespace fhirshape

template <>
struct fmt::formatter<fhirshape::shape> : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(const fhirshape::shape& x, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(fhirshape::to_string(x),
                                                    ctx);
  }
};
