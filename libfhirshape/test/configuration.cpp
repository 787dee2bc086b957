//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "fhirshape/configuration.hpp"

#include "fhirshape/error.hpp"
#include "fhirshape/test/test.hpp"

#include <fmt/format.h>

#include <array>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <unistd.h>

using namespace fhirshape;

namespace {

constexpr auto variables = std::array{
  "FHIRSHAPE_KIND",    "FHIRSHAPE_REFERENCE_DEFAULTS",
  "FHIRSHAPE_WORKERS", "FHIRSHAPE_OMIT_EMPTY_RECORDS",
  "FHIRSHAPE_VERBOSITY",
};

struct fixture {
  fixture() {
    for (const auto* variable : variables) {
      ::unsetenv(variable);
    }
    directory = std::filesystem::temp_directory_path()
                / fmt::format("fhirshape-configuration-{}", ::getpid());
    std::filesystem::create_directories(directory);
  }

  ~fixture() {
    for (const auto* variable : variables) {
      ::unsetenv(variable);
    }
    auto err = std::error_code{};
    std::filesystem::remove_all(directory, err);
  }

  auto write(std::string_view name, std::string_view contents)
    -> std::string {
    auto file = directory / name;
    auto out = std::ofstream{file};
    out << contents;
    return file.string();
  }

  std::filesystem::path directory;
};

} // namespace

WITH_FIXTURE(fixture) {
  TEST("defaults") {
    auto cfg = configuration{};
    REQUIRE_SUCCESS(cfg.parse(std::vector<std::string>{}));
    CHECK(cfg.inputs.empty());
    CHECK(not cfg.kind);
    CHECK(not cfg.reference_defaults);
    CHECK(not cfg.config_file);
    CHECK_EQUAL(cfg.verbosity, "info");
    CHECK_EQUAL(cfg.workers, 1);
    CHECK(not cfg.omit_empty_records);
    CHECK(not cfg.help);
  }

  TEST("command line") {
    auto cfg = configuration{};
    REQUIRE_SUCCESS(cfg.parse({"a.ndjson", "--kind=Patient", "-w", "4",
                               "--omit-empty-records", "-", "b.ndjson",
                               "-rdefaults.yaml"}));
    auto inputs = std::vector<std::string>{"a.ndjson", "-", "b.ndjson"};
    CHECK(cfg.inputs == inputs);
    CHECK_EQUAL(cfg.kind.value_or(""), "Patient");
    CHECK_EQUAL(cfg.reference_defaults.value_or(""), "defaults.yaml");
    CHECK_EQUAL(cfg.workers, 4);
    CHECK(cfg.omit_empty_records);
    auto options = cfg.make_build_options();
    CHECK_EQUAL(options.workers, 4u);
    CHECK(options.render.omit_empty_records);
  }

  TEST("short option with separate value") {
    auto cfg = configuration{};
    REQUIRE_SUCCESS(cfg.parse({"-k", "Condition", "in.ndjson"}));
    CHECK_EQUAL(cfg.kind.value_or(""), "Condition");
    REQUIRE_EQUAL(cfg.inputs.size(), 1u);
    CHECK_EQUAL(cfg.inputs[0], "in.ndjson");
  }

  TEST("help") {
    auto cfg = configuration{};
    REQUIRE_SUCCESS(cfg.parse({"--help"}));
    CHECK(cfg.help);
    auto text = help_text();
    CHECK(text.find("usage: fhirshape") != std::string::npos);
    CHECK(text.find("reference-defaults") != std::string::npos);
  }

  TEST("invalid arguments") {
    auto cfg = configuration{};
    CHECK_EQUAL(cfg.parse({"--no-such-option"}), ec::invalid_argument);
    CHECK_EQUAL(cfg.parse({"--workers=many"}), ec::invalid_argument);
    CHECK_EQUAL(cfg.parse({"--workers=0"}), ec::invalid_configuration);
    CHECK_EQUAL(cfg.parse({"--verbosity=loud"}), ec::invalid_configuration);
  }

  TEST("environment") {
    ::setenv("FHIRSHAPE_KIND", "Observation", 1);
    ::setenv("FHIRSHAPE_WORKERS", "3", 1);
    auto cfg = configuration{};
    REQUIRE_SUCCESS(cfg.parse({"x.ndjson"}));
    CHECK_EQUAL(cfg.kind.value_or(""), "Observation");
    CHECK_EQUAL(cfg.workers, 3);
    REQUIRE_SUCCESS(cfg.parse({"x.ndjson", "--workers=5"}));
    CHECK_EQUAL(cfg.workers, 5);
    ::setenv("FHIRSHAPE_WORKERS", "-2", 1);
    CHECK_EQUAL(cfg.parse({"x.ndjson"}), ec::invalid_configuration);
  }

  TEST("configuration file") {
    auto file = write("fhirshape.yaml", R"__(
  fhirshape:
    kind: Patient
    workers: 2
    omit-empty-records: true
    verbosity: debug
  other:
    ignored: 1
  )__");
    auto cfg = configuration{};
    REQUIRE_SUCCESS(cfg.parse({"--config=" + file, "x.ndjson"}));
    CHECK_EQUAL(cfg.config_file.value_or(""), file);
    CHECK_EQUAL(cfg.kind.value_or(""), "Patient");
    CHECK_EQUAL(cfg.workers, 2);
    CHECK(cfg.omit_empty_records);
    CHECK_EQUAL(cfg.verbosity, "debug");
    ::setenv("FHIRSHAPE_WORKERS", "6", 1);
    REQUIRE_SUCCESS(cfg.parse({"-c", file, "--kind=Condition"}));
    CHECK_EQUAL(cfg.workers, 6);
    CHECK_EQUAL(cfg.kind.value_or(""), "Condition");
    CHECK(cfg.inputs.empty());
  }

  TEST("invalid configuration file") {
    auto cfg = configuration{};
    auto missing = (directory / "missing.yaml").string();
    CHECK_EQUAL(cfg.parse({"--config=" + missing}), ec::filesystem_error);
    auto scalar = write("scalar.yaml", "fhirshape: 42\n");
    CHECK_EQUAL(cfg.parse({"--config=" + scalar}), ec::invalid_configuration);
    auto nested = write("nested.yaml", "fhirshape:\n  kind: [a, b]\n");
    CHECK_EQUAL(cfg.parse({"--config=" + nested}), ec::invalid_configuration);
    auto unknown = write("unknown.yaml", "fhirshape:\n  colour: red\n");
    CHECK_EQUAL(cfg.parse({"--config=" + unknown}), ec::invalid_argument);
  }
}
