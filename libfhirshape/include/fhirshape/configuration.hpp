//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "fhirshape/fwd.hpp"

#include "fhirshape/defaults.hpp"
#include "fhirshape/schema_builder.hpp"

#include <caf/error.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fhirshape {

/// The settings of the command-line tool.
///
/// Values come from three layers, where later layers win:
/// 1. the `fhirshape` section of the YAML file given by `--config`
/// 2. `FHIRSHAPE_*` environment variables, e.g., `FHIRSHAPE_WORKERS=4`
/// 3. the command line
struct configuration {
  /// NDJSON files to read; `-` stands for standard input.
  std::vector<std::string> inputs = {};

  /// Infer the schema of this record kind only.
  std::optional<std::string> kind = {};

  /// Path to a YAML file with reference defaults.
  std::optional<std::string> reference_defaults = {};

  /// Path to the YAML configuration file.
  std::optional<std::string> config_file = {};

  std::string verbosity = std::string{defaults::logger::console_verbosity};

  int64_t workers = static_cast<int64_t>(defaults::workers);

  bool omit_empty_records = false;

  bool help = false;

  /// Fills the configuration from the command line, the environment and the
  /// configuration file.
  auto parse(int argc, char** argv) -> caf::error;

  /// Fills the configuration from a list of arguments without the program
  /// name.
  auto parse(std::vector<std::string> args) -> caf::error;

  /// @returns the options for the schema builder.
  auto make_build_options() const -> build_options;
};

/// @returns the usage text of the command-line tool.
auto help_text() -> std::string;

} // namespace fhirshape
