//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "fhirshape/arrow_schema.hpp"
#include "fhirshape/configuration.hpp"
#include "fhirshape/data.hpp"
#include "fhirshape/defaults.hpp"
#include "fhirshape/error.hpp"
#include "fhirshape/json.hpp"
#include "fhirshape/logger.hpp"
#include "fhirshape/reference_defaults.hpp"
#include "fhirshape/schema_builder.hpp"
#include "fhirshape/schema_tree.hpp"

#include <arrow/type.h>
#include <caf/init_global_meta_objects.hpp>

#include <cstddef>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace {

using namespace fhirshape;

/// Folds records into one builder per kind as the readers produce them.
class schema_collector {
public:
  explicit schema_collector(size_t workers)
    : workers_{workers},
      capacity_{workers > 1 ? defaults::batch_size : size_t{1}} {
    batch_.reserve(capacity_);
  }

  /// Starts a builder for *kind* so that it yields a schema without input.
  void expect(const std::string& kind) {
    builders_.try_emplace(kind, kind);
  }

  auto add(data x) -> caf::error {
    batch_.push_back(std::move(x));
    if (batch_.size() < capacity_) {
      return {};
    }
    return flush();
  }

  auto flush() -> caf::error {
    auto err = add_by_kind(builders_, batch_, workers_);
    batch_.clear();
    return err;
  }

  auto finish(const reference_defaults& defaults) &&
    -> std::map<std::string, schema_tree> {
    auto result = std::map<std::string, schema_tree>{};
    for (auto& [kind, builder] : builders_) {
      result.emplace(kind, std::move(builder).finish(defaults));
    }
    return result;
  }

private:
  size_t workers_;
  size_t capacity_;
  std::vector<data> batch_;
  std::map<std::string, schema_builder> builders_;
};

auto read_ndjson(const std::string& input,
                 const std::optional<std::string>& kind,
                 schema_collector& collector) -> caf::error {
  auto file = std::ifstream{};
  auto* stream = static_cast<std::istream*>(&std::cin);
  auto name = std::string{"<stdin>"};
  if (input != "-") {
    file.open(input);
    if (not file) {
      return caf::make_error(ec::filesystem_error,
                             fmt::format("failed to open {}", input));
    }
    stream = &file;
    name = input;
  }
  auto reader = ndjson_reader{*stream, kind, name};
  while (auto x = reader.next()) {
    if (auto err = collector.add(std::move(*x))) {
      return add_context(err, "failed to fold records of {}", name);
    }
  }
  if (stream->bad()) {
    return caf::make_error(ec::filesystem_error,
                           fmt::format("failed to read {}", name));
  }
  FHIRSHAPE_VERBOSE("read {} records from {} lines of {} ({} skipped)",
                    reader.num_records(), reader.num_lines(), name,
                    reader.num_skipped());
  return {};
}

/// Reports a fatal error on stderr regardless of the log verbosity.
void report(const caf::error& err) {
  fmt::print(stderr, "fhirshape: {}\n", err);
}

} // namespace

auto main(int argc, char** argv) -> int try {
  using namespace fhirshape;
  caf::core::init_global_meta_objects();
  caf::init_global_meta_objects<caf::id_block::fhirshape_types>();
  auto cfg = configuration{};
  if (auto err = cfg.parse(argc, argv)) {
    fmt::print(stderr, "failed to parse configuration: {}\n", err);
    return EXIT_FAILURE;
  }
  if (cfg.help) {
    fmt::print("{}", help_text());
    return EXIT_SUCCESS;
  }
  auto log_context = create_log_context(cfg.verbosity);
  if (not log_context) {
    fmt::print(stderr, "{}\n", log_context.error());
    return EXIT_FAILURE;
  }
  if (cfg.inputs.empty()) {
    report(caf::make_error(ec::invalid_argument,
                           "no input files given, see --help"));
    return EXIT_FAILURE;
  }
  auto defaults = reference_defaults{};
  if (cfg.reference_defaults) {
    auto loaded = reference_defaults::load(*cfg.reference_defaults);
    if (not loaded) {
      report(loaded.error());
      return EXIT_FAILURE;
    }
    defaults = std::move(*loaded);
  } else {
    FHIRSHAPE_VERBOSE("no reference defaults given, schemas contain only "
                      "observed fields");
  }
  auto options = cfg.make_build_options();
  auto collector = schema_collector{options.workers};
  if (cfg.kind) {
    collector.expect(*cfg.kind);
  }
  for (const auto& input : cfg.inputs) {
    if (auto err = read_ndjson(input, cfg.kind, collector)) {
      report(err);
      return EXIT_FAILURE;
    }
  }
  if (auto err = collector.flush()) {
    report(err);
    return EXIT_FAILURE;
  }
  auto trees = std::move(collector).finish(defaults);
  for (const auto& [kind, tree] : trees) {
    auto schema = to_arrow_schema(tree, options.render);
    fmt::print("{}:\n{}\n", kind, schema->ToString());
  }
  return EXIT_SUCCESS;
} catch (const std::exception& err) {
  fmt::print(stderr, "unexpected error: {}\n", err.what());
  return EXIT_FAILURE;
}
