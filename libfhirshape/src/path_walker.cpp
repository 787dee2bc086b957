//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "fhirshape/path_walker.hpp"

#include "fhirshape/data.hpp"
#include "fhirshape/error.hpp"
#include "fhirshape/logger.hpp"

#include <unordered_map>

namespace fhirshape {

namespace {

struct frame {
  const data* value;
  field_path path;
};

} // namespace

auto walk(const data& value, std::string_view record_kind)
  -> caf::expected<std::vector<observation>> {
  const auto* root = try_as<record>(&value);
  if (root == nullptr) {
    return caf::make_error(ec::invalid_record,
                           fmt::format("{} record must be a mapping but got "
                                       "{}",
                                       record_kind, kind_name(value)));
  }
  auto result = std::vector<observation>{};
  auto index = std::unordered_map<field_path, size_t>{};
  auto emit = [&](field_path path, shape type) {
    auto [it, inserted] = index.try_emplace(path, result.size());
    if (inserted) {
      result.push_back({std::move(path), std::move(type)});
      return;
    }
    merge(result[it->second].type, type);
  };
  auto stack = std::vector<frame>{};
  // Children go on the stack in reverse so that they come off in key order.
  auto push_fields = [&](const record& xs, const field_path& path) {
    for (auto it = xs.rbegin(); it != xs.rend(); ++it) {
      stack.push_back({&it->second, path.child(it->first)});
    }
  };
  push_fields(*root, field_path{});
  while (not stack.empty()) {
    auto current = std::move(stack.back());
    stack.pop_back();
    auto& path = current.path;
    match(
      *current.value,
      [&](caf::none_t) {
        emit(std::move(path), null_shape{});
      },
      [&](bool) {
        emit(std::move(path), bool_shape{});
      },
      [&](int64_t) {
        emit(std::move(path), int64_shape{});
      },
      [&](uint64_t) {
        emit(std::move(path), int64_shape{});
      },
      [&](double) {
        emit(std::move(path), double_shape{});
      },
      [&](const std::string&) {
        emit(std::move(path), string_shape{});
      },
      [&](const list& xs) {
        auto nested = path.nested();
        if (xs.empty()) {
          emit(std::move(nested), null_shape{});
          return;
        }
        for (auto it = xs.rbegin(); it != xs.rend(); ++it) {
          stack.push_back({&*it, nested});
        }
      },
      [&](const record& xs) {
        emit(path, record_shape{});
        push_fields(xs, path);
      });
  }
  FHIRSHAPE_TRACE("walked {} record into {} field paths", record_kind,
                  result.size());
  return result;
}

} // namespace fhirshape
