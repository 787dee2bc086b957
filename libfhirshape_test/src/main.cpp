//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "fhirshape/fwd.hpp"
#include "fhirshape/logger.hpp"
#include "fhirshape/test/test.hpp"

#include <caf/config_option_set.hpp>
#include <caf/init_global_meta_objects.hpp>
#include <caf/settings.hpp>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace caf::test {

int main(int, char**);

} // namespace caf::test

namespace {

std::vector<std::string> get_test_args(int argc, const char* const* argv) {
  // Parse everything after after '--'.
  constexpr std::string_view delimiter = "--";
  auto start = argv + 1;
  auto end = argv + argc;
  auto args_start = std::find(start, end, delimiter);
  if (args_start == end) {
    return {};
  }
  return {args_start + 1, end};
}

} // namespace

int main(int argc, char** argv) {
  ::setenv("FHIRSHAPE_ABORT_ON_PANIC", "1", 1);
  caf::core::init_global_meta_objects();
  caf::init_global_meta_objects<caf::id_block::fhirshape_types>();
  std::string fhirshape_loglevel = "quiet";
  auto test_args = get_test_args(argc, argv);
  if (not test_args.empty()) {
    auto options = caf::config_option_set{}
                     .add(fhirshape_loglevel, "fhirshape-verbosity",
                          "console verbosity for libfhirshape")
                     .add<bool>("help", "print this help text");
    caf::settings cfg;
    auto res = options.parse(cfg, test_args);
    if (res.first != caf::pec::success) {
      std::cout << "error while parsing argument \"" << *res.second
                << "\": " << to_string(res.first) << "\n\n";
      std::cout << options.help_text() << std::endl;
      return 1;
    }
    if (caf::get_or(cfg, "help", false)) {
      std::cout << options.help_text() << std::endl;
      return 0;
    }
  }
  auto log_context = fhirshape::create_log_context(fhirshape_loglevel);
  if (not log_context) {
    std::cerr << "failed to create log context: "
              << fhirshape::render(log_context.error()) << std::endl;
    return 1;
  }
  return caf::test::main(argc, argv);
}
