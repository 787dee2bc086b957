//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "fhirshape/data.hpp"

#include "fhirshape/error.hpp"
#include "fhirshape/test/test.hpp"

#include <fmt/format.h>

#include <string>

using namespace fhirshape;

TEST("kind names") {
  CHECK_EQUAL(kind_name(data{}), "null");
  CHECK_EQUAL(kind_name(data{true}), "bool");
  CHECK_EQUAL(kind_name(data{-1}), "int64");
  CHECK_EQUAL(kind_name(data{uint64_t{1}}), "uint64");
  CHECK_EQUAL(kind_name(data{0.5}), "double");
  CHECK_EQUAL(kind_name(data{"x"}), "string");
  CHECK_EQUAL(kind_name(data{list{}}), "list");
  CHECK_EQUAL(kind_name(data{record{}}), "record");
}

TEST("printing") {
  auto x = data{record{
    {"id", "a\"b"},
    {"n", 42},
    {"xs", list{true, caf::none, 2.5}},
    {"empty", record{}},
  }};
  auto expected = std::string{R"({"id": "a\"b", "n": 42, )"
                              R"("xs": [true, null, 2.5], "empty": {}})"};
  CHECK_EQUAL(fmt::format("{}", x), expected);
}

TEST("equality") {
  CHECK_EQUAL(data{1}, data{int64_t{1}});
  CHECK(data{1} != data{1.0});
  CHECK(data{"1"} != data{1});
  auto lhs = data{record{{"a", 1}, {"b", 2}}};
  auto rhs = data{record{{"a", 1}, {"b", 2}}};
  CHECK_EQUAL(lhs, rhs);
  try_as<record>(&rhs)->at("b") = 3;
  CHECK(lhs != rhs);
}

TEST("YAML scalars") {
  CHECK_EQUAL(unbox(from_yaml("true")), data{true});
  CHECK_EQUAL(unbox(from_yaml("42")), data{int64_t{42}});
  CHECK_EQUAL(unbox(from_yaml("4.5")), data{4.5});
  CHECK_EQUAL(unbox(from_yaml("foo")), data{"foo"});
  CHECK_EQUAL(unbox(from_yaml("'42'")), data{"42"});
  CHECK_EQUAL(unbox(from_yaml("~")), data{});
}

TEST("YAML containers") {
  auto x = unbox(from_yaml(R"__(
Patient:
  - id
  - active: boolean
workers: 4
)__"));
  auto expected = data{record{
    {"Patient", list{"id", record{{"active", "boolean"}}}},
    {"workers", 4},
  }};
  CHECK_EQUAL(x, expected);
}

TEST("YAML errors") {
  CHECK_EQUAL(from_yaml("a: [1, 2").error(), ec::parse_error);
  auto missing = load_yaml("/nonexistent/fhirshape.yaml");
  REQUIRE(not missing);
  CHECK_EQUAL(missing.error(), ec::filesystem_error);
}
