//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "fhirshape/error.hpp"

#include "fhirshape/detail/assert.hpp"

#include <caf/message.hpp>

#include <array>
#include <string>

namespace fhirshape {
namespace {

constexpr auto descriptions = std::array{
  std::string_view{"no_error"},
  std::string_view{"unspecified"},
  std::string_view{"invalid_record"},
  std::string_view{"parse_error"},
  std::string_view{"filesystem_error"},
  std::string_view{"invalid_argument"},
  std::string_view{"invalid_configuration"},
  std::string_view{"logic_error"},
};

static_assert(ec{descriptions.size()} == ec::ec_count,
              "Mismatch between number of error codes and descriptions");

/// Joins all string elements of an error context.
auto render_context(const caf::message& ctx) -> std::string {
  auto result = std::string{};
  for (size_t i = 0; i < ctx.size(); ++i) {
    if (not ctx.match_element<std::string>(i)) {
      continue;
    }
    if (not result.empty()) {
      result += ' ';
    }
    result += ctx.get_as<std::string>(i);
  }
  return result;
}

} // namespace

auto to_string(ec x) -> std::string {
  auto index = static_cast<size_t>(x);
  FHIRSHAPE_ASSERT(index < descriptions.size());
  return std::string{descriptions[index]};
}

auto from_string(std::string_view str, ec& x) -> bool {
  for (size_t i = 0; i < descriptions.size(); ++i) {
    if (descriptions[i] == str) {
      x = static_cast<ec>(i);
      return true;
    }
  }
  return false;
}

auto from_integer(std::underlying_type_t<ec> value, ec& x) -> bool {
  if (value >= static_cast<std::underlying_type_t<ec>>(ec::ec_count)) {
    return false;
  }
  x = static_cast<ec>(value);
  return true;
}

auto render(const caf::error& err) -> std::string {
  if (not err) {
    return "";
  }
  if (err.category() != caf::type_id_v<ec>) {
    return caf::to_string(err);
  }
  auto result = to_string(static_cast<ec>(err.code()));
  if (auto context = render_context(err.context()); not context.empty()) {
    result += ": ";
    result += context;
  }
  return result;
}

auto add_context_impl(const caf::error& error, std::string str) -> caf::error {
  if (not error) {
    return error;
  }
  if (error.category() != caf::type_id_v<ec>) {
    return caf::make_error(ec::unspecified,
                           fmt::format("{}: {}", str, caf::to_string(error)));
  }
  auto context = render_context(error.context());
  if (not context.empty()) {
    str += ": ";
    str += context;
  }
  return caf::make_error(static_cast<ec>(error.code()), std::move(str));
}

} // namespace fhirshape
