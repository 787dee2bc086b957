//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "fhirshape/fwd.hpp"

#include "fhirshape/detail/overload.hpp"
#include "fhirshape/detail/stable_map.hpp"

#include <caf/expected.hpp>
#include <caf/none.hpp>
#include <fmt/format.h>

#include <concepts>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace fhirshape {

/// A field-name-to-value mapping that preserves the order of its fields.
using record = detail::stable_map<std::string, data>;

/// A decoded semi-structured value, e.g., one parsed JSON document.
class data {
public:
  // clang-format off
  using variant = std::variant<
    caf::none_t,
    bool,
    int64_t,
    uint64_t,
    double,
    std::string,
    list,
    record
  >;
  // clang-format on

  /// Default-constructs null.
  data() = default;

  data(const data&) = default;
  data& operator=(const data&) = default;
  data(data&&) noexcept = default;
  data& operator=(data&&) noexcept = default;
  ~data() noexcept = default;

  data(caf::none_t) {
    // nop
  }

  data(bool x) : data_{x} {
    // nop
  }

  template <std::signed_integral T>
    requires(not std::same_as<T, bool>)
  data(T x) : data_{int64_t{x}} {
    // nop
  }

  template <std::unsigned_integral T>
    requires(not std::same_as<T, bool>)
  data(T x) : data_{uint64_t{x}} {
    // nop
  }

  template <std::floating_point T>
  data(T x) : data_{double{x}} {
    // nop
  }

  data(std::string x) : data_{std::move(x)} {
    // nop
  }

  data(std::string_view x) : data_{std::string{x}} {
    // nop
  }

  data(const char* x) : data_{std::string{x}} {
    // nop
  }

  data(list x) : data_{std::move(x)} {
    // nop
  }

  data(record x) : data_{std::move(x)} {
    // nop
  }

  auto get_data() -> variant& {
    return data_;
  }

  auto get_data() const -> const variant& {
    return data_;
  }

  friend auto operator==(const data& lhs, const data& rhs) -> bool;

private:
  variant data_;
};

/// @returns whether *x* holds a value of type `T`.
/// @relates data
template <class T>
auto is(const data& x) -> bool {
  return std::holds_alternative<T>(x.get_data());
}

/// @returns a pointer to the `T` inside *x*, or `nullptr` if *x* holds a
/// different type.
/// @relates data
template <class T>
auto try_as(const data* x) -> const T* {
  return x != nullptr ? std::get_if<T>(&x->get_data()) : nullptr;
}

/// @relates data
template <class T>
auto try_as(data* x) -> T* {
  return x != nullptr ? std::get_if<T>(&x->get_data()) : nullptr;
}

/// Applies a set of lambdas to the alternative held by *x*.
/// @relates data
template <class... Fs>
auto match(const data& x, Fs&&... fs) -> decltype(auto) {
  return std::visit(detail::overload{std::forward<Fs>(fs)...}, x.get_data());
}

/// @returns a short name for the type of *x*, e.g., `record` or `int64`.
/// @relates data
auto kind_name(const data& x) -> std::string_view;

/// Prints *x* in a JSON-like notation.
/// @relates data
auto to_string(const data& x) -> std::string;

/// Parses YAML into data.
/// @param str The YAML document.
/// @relates data
auto from_yaml(std::string_view str) -> caf::expected<data>;

/// Loads and parses a YAML file.
/// @param file The file to load.
/// @relates data
auto load_yaml(const std::filesystem::path& file) -> caf::expected<data>;

} // namespace fhirshape

template <>
struct fmt::formatter<fhirshape::data> : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(const fhirshape::data& x, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(fhirshape::to_string(x),
                                                    ctx);
  }
};
