//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "fhirshape/field_path.hpp"

#include "fhirshape/error.hpp"
#include "fhirshape/test/test.hpp"

#include <unordered_set>

using namespace fhirshape;

TEST("field path construction") {
  auto root = field_path{};
  CHECK(root.empty());
  auto path = root.child("extension").nested().child("valueCoding");
  REQUIRE_EQUAL(path.size(), 2u);
  CHECK_EQUAL(path.segments()[0].name, "extension");
  CHECK(path.segments()[0].in_list());
  CHECK_EQUAL(path.segments()[1].name, "valueCoding");
  CHECK(not path.segments()[1].in_list());
  // Deriving paths leaves the original untouched.
  CHECK(root.empty());
}

TEST("field path equality includes list levels") {
  auto x = field_path{}.child("a").child("b");
  auto y = field_path{}.child("a").nested().child("b");
  auto z = field_path{}.child("a").nested().nested().child("b");
  CHECK_NOT_EQUAL(x, y);
  CHECK_NOT_EQUAL(y, z);
  CHECK_EQUAL(y, field_path{}.child("a").nested().child("b"));
  auto set = std::unordered_set<field_path>{x, y, z, y};
  CHECK_EQUAL(set.size(), 3u);
}

TEST("field path printing") {
  auto path = field_path{}
                .child("extension")
                .nested()
                .child("extension")
                .nested()
                .child("valueCoding")
                .child("system");
  CHECK_EQUAL(to_string(path), "extension[].extension[].valueCoding.system");
  CHECK_EQUAL(fmt::format("{}", field_path{}.child("x").nested().nested()),
              "x[][]");
  CHECK_EQUAL(to_string(field_path{}), "");
}

TEST("field path parsing") {
  auto path = unbox(field_path::parse("code.coding[].system"));
  CHECK_EQUAL(path,
              field_path{}.child("code").child("coding").nested().child(
                "system"));
  CHECK_EQUAL(unbox(field_path::parse("a[][]")),
              field_path{}.child("a").nested().nested());
  CHECK(unbox(field_path::parse("")).empty());
  CHECK_EQUAL(field_path::parse("a..b").error(), ec::parse_error);
  CHECK_EQUAL(field_path::parse("a[0]").error(), ec::parse_error);
  CHECK_EQUAL(field_path::parse("[]").error(), ec::parse_error);
}
