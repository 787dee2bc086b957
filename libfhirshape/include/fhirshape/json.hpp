//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "fhirshape/fwd.hpp"

#include "fhirshape/data.hpp"

#include <caf/expected.hpp>

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <string_view>

namespace fhirshape {

/// Decodes one JSON document. Numbers become `int64_t`, `uint64_t` or
/// `double`; integers beyond 64 bits keep their literal text as a string.
/// For duplicate keys the last value wins.
auto from_json(std::string_view str) -> caf::expected<data>;

/// Reads records from newline-delimited JSON. Lines that are empty are
/// ignored, lines that fail to decode or hold no object are skipped with a
/// warning.
class ndjson_reader {
public:
  /// @param input The stream to read from.
  /// @param kind If set, keep only records whose `resourceType` equals it.
  /// @param name A name for the input in log messages.
  explicit ndjson_reader(std::istream& input,
                         std::optional<std::string> kind = std::nullopt,
                         std::string name = "<input>");

  /// @returns the next record, or `std::nullopt` at the end of the input.
  auto next() -> std::optional<data>;

  /// @returns the number of lines read so far.
  auto num_lines() const -> size_t {
    return num_lines_;
  }

  /// @returns the number of records returned so far.
  auto num_records() const -> size_t {
    return num_records_;
  }

  /// @returns the number of non-empty lines that were not returned.
  auto num_skipped() const -> size_t {
    return num_skipped_;
  }

private:
  std::istream& input_;
  std::optional<std::string> kind_;
  std::string name_;
  std::string line_;
  size_t num_lines_ = 0;
  size_t num_records_ = 0;
  size_t num_skipped_ = 0;
};

} // namespace fhirshape
