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
#include "fhirshape/test/test.hpp"

#include <fmt/format.h>

#include <string>
#include <vector>

using namespace fhirshape;

namespace {

auto path(std::string_view str) -> field_path {
  return unbox(field_path::parse(str));
}

/// Renders observations as `path: shape` lines for compact comparisons.
auto render(const std::vector<observation>& xs) -> std::string {
  auto result = std::string{};
  for (const auto& x : xs) {
    result += fmt::format("{}: {}\n", x.path, x.type);
  }
  return result;
}

} // namespace

TEST("walk flat record") {
  auto x = data{record{
    {"resourceType", "Patient"},
    {"id", "p1"},
    {"active", true},
    {"age", 42},
    {"weight", 71.5},
    {"deceased", caf::none},
  }};
  auto xs = unbox(walk(x, "Patient"));
  CHECK_EQUAL(render(xs), "resourceType: string\n"
                          "id: string\n"
                          "active: bool\n"
                          "age: int64\n"
                          "weight: double\n"
                          "deceased: null\n");
}

TEST("walk classifies by decoded kind") {
  auto x = data{record{
    {"n", "42"},
    {"u", uint64_t{18446744073709551615u}},
  }};
  auto xs = unbox(walk(x, "Observation"));
  REQUIRE_EQUAL(xs.size(), 2u);
  CHECK_EQUAL(xs[0].type, shape{string_shape{}});
  CHECK_EQUAL(xs[1].type, shape{int64_shape{}});
}

TEST("walk nested records and lists") {
  auto x = data{record{
    {"extension",
     list{
       record{
         {"url", "a"},
         {"extension",
          list{
            record{
              {"valueCoding", record{{"system", "urn:oid:1.2.3"}}},
            },
          }},
       },
     }},
  }};
  auto xs = unbox(walk(x, "Patient"));
  CHECK_EQUAL(render(xs), "extension[]: record{}\n"
                          "extension[].url: string\n"
                          "extension[].extension[]: record{}\n"
                          "extension[].extension[].valueCoding: record{}\n"
                          "extension[].extension[].valueCoding.system: "
                          "string\n");
}

TEST("walk merges list elements at one path") {
  auto x = data{record{
    {"n", list{1, 2.5, caf::none}},
    {"mixed", list{true, "yes"}},
    {"names",
     list{
       record{{"given", list{"Ann"}}},
       record{{"family", "Smith"}},
     }},
  }};
  auto xs = unbox(walk(x, "Patient"));
  CHECK_EQUAL(render(xs), "n[]: double\n"
                          "mixed[]: string\n"
                          "names[]: record{}\n"
                          "names[].given[]: string\n"
                          "names[].family: string\n");
}

TEST("walk empty containers") {
  auto x = data{record{
    {"empty_list", list{}},
    {"empty_record", record{}},
    {"nested_empty", list{list{}}},
  }};
  auto xs = unbox(walk(x, "Patient"));
  REQUIRE_EQUAL(xs.size(), 3u);
  CHECK_EQUAL(xs[0].path, path("empty_list[]"));
  CHECK_EQUAL(xs[0].type, shape{null_shape{}});
  CHECK_EQUAL(xs[1].path, path("empty_record"));
  CHECK_EQUAL(xs[1].type, shape{record_shape{}});
  CHECK_EQUAL(xs[2].path, path("nested_empty[][]"));
  CHECK_EQUAL(xs[2].type, shape{null_shape{}});
}

TEST("walk of an empty record") {
  auto xs = unbox(walk(data{record{}}, "Patient"));
  CHECK(xs.empty());
}

TEST("walk rejects non-records") {
  for (const auto& x : {data{}, data{1}, data{"x"}, data{list{record{}}}}) {
    auto xs = walk(x, "Patient");
    REQUIRE(not xs);
    CHECK_EQUAL(xs.error(), ec::invalid_record);
    CHECK(render(xs.error()).find("Patient") != std::string::npos);
  }
}

TEST("walk is deterministic") {
  auto x = data{record{
    {"a", list{record{{"b", 1}}, record{{"b", "x"}, {"c", list{}}}}},
    {"d", record{{"e", caf::none}}},
  }};
  auto first = unbox(walk(x, "Patient"));
  auto second = unbox(walk(x, "Patient"));
  CHECK(first == second);
}
