//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "fhirshape/configuration.hpp"

#include "fhirshape/data.hpp"
#include "fhirshape/error.hpp"
#include "fhirshape/logger.hpp"

#include <caf/config_option_adder.hpp>
#include <caf/config_option_set.hpp>
#include <caf/pec.hpp>
#include <caf/settings.hpp>

#include <array>
#include <cctype>
#include <cstdlib>
#include <iterator>
#include <string_view>

namespace fhirshape {

namespace {

/// Options that may also come from the environment or the configuration file.
constexpr auto layered_options = std::array<std::string_view, 5>{
  "kind", "reference-defaults", "workers", "omit-empty-records", "verbosity",
};

auto make_options() -> caf::config_option_set {
  auto result = caf::config_option_set{};
  caf::config_option_adder{result, "?fhirshape"}
    .add<std::string>("config,c", "path to a YAML configuration file")
    .add<std::string>("kind,k", "infer the schema of this record kind only")
    .add<std::string>("reference-defaults,r",
                      "path to a YAML file with top-level fields per kind")
    .add<int64_t>("workers,w", "number of threads that fold records")
    .add<bool>("omit-empty-records", "drop struct fields without children")
    .add<std::string>("verbosity,v",
                      "console verbosity: quiet, error, warning, info, "
                      "verbose, debug or trace")
    .add<bool>("help,h?", "print this text and exit");
  return result;
}

auto parse_arguments(const caf::config_option_set& options,
                     caf::settings& settings,
                     const std::vector<std::string>& args) -> caf::error {
  auto [state, position] = options.parse(settings, args);
  if (state != caf::pec::success) {
    auto argument
      = position != args.end() ? *position : std::string{"(unknown)"};
    return caf::make_error(ec::invalid_argument,
                           fmt::format("failed to parse option '{}': {}",
                                       argument, caf::to_string(state)));
  }
  return {};
}

/// Translates an option name into its environment variable, e.g.,
/// `reference-defaults` into `FHIRSHAPE_REFERENCE_DEFAULTS`.
auto to_environment_variable(std::string_view name) -> std::string {
  auto result = std::string{"FHIRSHAPE_"};
  for (auto c : name) {
    result += c == '-' ? '_'
                       : static_cast<char>(
                         std::toupper(static_cast<unsigned char>(c)));
  }
  return result;
}

/// Translates the `fhirshape` section of a configuration file into
/// command-line arguments.
auto to_arguments(const data& config) -> caf::expected<std::vector<std::string>> {
  const auto* root = try_as<record>(&config);
  if (root == nullptr) {
    return caf::make_error(ec::invalid_configuration,
                           fmt::format("configuration must be a mapping but "
                                       "got {}",
                                       kind_name(config)));
  }
  auto result = std::vector<std::string>{};
  auto section = root->find("fhirshape");
  if (section == root->end()) {
    return result;
  }
  const auto* xs = try_as<record>(&section->second);
  if (xs == nullptr) {
    return caf::make_error(ec::invalid_configuration,
                           "the 'fhirshape' section must be a mapping");
  }
  for (const auto& field : *xs) {
    const auto& key = field.first;
    const auto& value = field.second;
    auto argument = match(
      value,
      [&](const std::string& x) -> caf::expected<std::string> {
        return fmt::format("--{}={}", key, x);
      },
      [&](bool x) -> caf::expected<std::string> {
        return fmt::format("--{}={}", key, x);
      },
      [&](int64_t x) -> caf::expected<std::string> {
        return fmt::format("--{}={}", key, x);
      },
      [&](uint64_t x) -> caf::expected<std::string> {
        return fmt::format("--{}={}", key, x);
      },
      [&](const auto&) -> caf::expected<std::string> {
        return caf::make_error(ec::invalid_configuration,
                               fmt::format("fhirshape.{} has an unsupported "
                                           "value: {}",
                                           key, value));
      });
    if (not argument) {
      return std::move(argument.error());
    }
    result.push_back(std::move(*argument));
  }
  return result;
}

} // namespace

auto configuration::parse(int argc, char** argv) -> caf::error {
  auto args = std::vector<std::string>{};
  for (auto i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return parse(std::move(args));
}

auto configuration::parse(std::vector<std::string> args) -> caf::error {
  auto options = make_options();
  auto command_line = std::vector<std::string>{};
  inputs.clear();
  for (auto i = size_t{0}; i < args.size(); ++i) {
    if (args[i].size() < 2 or args[i].front() != '-') {
      inputs.push_back(std::move(args[i]));
      continue;
    }
    // A short option such as `-k` may take its value from the next argument.
    const auto* option = args[i].size() == 2 and args[i][1] != '-'
                           ? options.cli_short_name_lookup(args[i][1])
                           : nullptr;
    command_line.push_back(std::move(args[i]));
    if (option != nullptr and not option->is_flag() and i + 1 < args.size()) {
      command_line.push_back(std::move(args[++i]));
    }
  }
  // The command line decides which configuration file to read, so it gets
  // parsed once on its own before all layers are parsed together.
  auto settings = caf::settings{};
  if (auto err = parse_arguments(options, settings, command_line)) {
    return err;
  }
  if (auto x = caf::get_if<std::string>(&settings, "fhirshape.config")) {
    config_file = *x;
  }
  auto layered = std::vector<std::string>{};
  if (config_file) {
    auto yaml = load_yaml(*config_file);
    if (not yaml) {
      return add_context(yaml.error(), "failed to read configuration file {}",
                         *config_file);
    }
    auto file_args = to_arguments(*yaml);
    if (not file_args) {
      return add_context(file_args.error(), "invalid configuration file {}",
                         *config_file);
    }
    layered = std::move(*file_args);
    FHIRSHAPE_DEBUG("read {} settings from {}", layered.size(), *config_file);
  }
  for (auto name : layered_options) {
    auto variable = to_environment_variable(name);
    if (const auto* value = std::getenv(variable.c_str())) {
      layered.push_back(fmt::format("--{}={}", name, value));
    }
  }
  std::move(command_line.begin(), command_line.end(),
            std::back_inserter(layered));
  settings.clear();
  if (auto err = parse_arguments(options, settings, layered)) {
    return err;
  }
  if (auto x = caf::get_if<std::string>(&settings, "fhirshape.kind")) {
    kind = *x;
  }
  if (auto x
      = caf::get_if<std::string>(&settings, "fhirshape.reference-defaults")) {
    reference_defaults = *x;
  }
  if (auto x = caf::get_if<std::string>(&settings, "fhirshape.verbosity")) {
    verbosity = *x;
  }
  if (auto x = caf::get_if<int64_t>(&settings, "fhirshape.workers")) {
    workers = *x;
  }
  if (auto x = caf::get_if<bool>(&settings, "fhirshape.omit-empty-records")) {
    omit_empty_records = *x;
  }
  if (auto x = caf::get_if<bool>(&settings, "fhirshape.help")) {
    help = *x;
  }
  if (loglevel_to_int(verbosity) < 0) {
    return caf::make_error(ec::invalid_configuration,
                           fmt::format("invalid verbosity '{}'", verbosity));
  }
  if (workers < 1) {
    return caf::make_error(ec::invalid_configuration,
                           fmt::format("workers must be at least 1, got {}",
                                       workers));
  }
  return {};
}

auto configuration::make_build_options() const -> build_options {
  auto result = build_options{};
  result.workers = static_cast<size_t>(workers);
  result.render.omit_empty_records = omit_empty_records;
  return result;
}

auto help_text() -> std::string {
  return fmt::format("usage: fhirshape [options] FILE...\n\n"
                     "Infers Arrow schemas from newline-delimited FHIR "
                     "resources.\nUse - to read from standard input.\n\n{}",
                     make_options().help_text(false));
}

} // namespace fhirshape
