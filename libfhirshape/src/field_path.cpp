//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "fhirshape/field_path.hpp"

#include "fhirshape/detail/assert.hpp"
#include "fhirshape/error.hpp"

namespace fhirshape {

field_path::field_path(std::vector<path_segment> segments)
  : segments_{std::move(segments)} {
  // nop
}

auto field_path::parse(std::string_view str) -> caf::expected<field_path> {
  auto result = std::vector<path_segment>{};
  if (str.empty()) {
    return field_path{};
  }
  while (true) {
    auto end = str.find('.');
    auto part = str.substr(0, end);
    auto segment = path_segment{};
    while (part.ends_with("[]")) {
      ++segment.list_depth;
      part.remove_suffix(2);
    }
    if (part.empty() or part.find_first_of("[]") != std::string_view::npos) {
      return caf::make_error(ec::parse_error,
                             fmt::format("invalid field path segment in '{}'",
                                         str));
    }
    segment.name = std::string{part};
    result.push_back(std::move(segment));
    if (end == std::string_view::npos) {
      break;
    }
    str.remove_prefix(end + 1);
  }
  return field_path{std::move(result)};
}

auto field_path::child(std::string name) const -> field_path {
  auto result = *this;
  result.segments_.push_back({std::move(name), 0});
  return result;
}

auto field_path::nested() const -> field_path {
  FHIRSHAPE_ASSERT(not segments_.empty(), "the root cannot be a list");
  auto result = *this;
  ++result.segments_.back().list_depth;
  return result;
}

auto to_string(const field_path& x) -> std::string {
  auto result = std::string{};
  for (const auto& segment : x.segments_) {
    if (not result.empty()) {
      result += '.';
    }
    result += segment.name;
    for (auto i = uint32_t{0}; i < segment.list_depth; ++i) {
      result += "[]";
    }
  }
  return result;
}

} // namespace fhirshape

auto std::hash<fhirshape::field_path>::operator()(
  const fhirshape::field_path& x) const noexcept -> size_t {
  auto result = size_t{0};
  for (const auto& segment : x.segments()) {
    auto h = std::hash<std::string>{}(segment.name) ^ segment.list_depth;
    result ^= h + 0x9e3779b97f4a7c15 + (result << 6) + (result >> 2);
  }
  return result;
}
