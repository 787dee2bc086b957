//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "fhirshape/shape.hpp"

#include "fhirshape/test/test.hpp"

#include <fmt/format.h>

#include <type_traits>
#include <vector>

using namespace fhirshape;

namespace {

auto list_of(shape element) -> shape {
  return list_shape{std::move(element)};
}

auto samples() -> std::vector<shape> {
  return {
    null_shape{},
    bool_shape{},
    int64_shape{},
    double_shape{},
    string_shape{},
    list_shape{},
    list_of(int64_shape{}),
    list_of(double_shape{}),
    list_of(list_shape{}),
    list_of(record_shape{{"a", int64_shape{}}}),
    record_shape{},
    record_shape{{"a", int64_shape{}}},
    record_shape{{"a", string_shape{}}, {"b", list_of(bool_shape{})}},
    record_shape{{"b", record_shape{{"c", double_shape{}}}}},
    record_shape{{"a", null_shape{}}},
  };
}

} // namespace

TEST("construction from alternatives") {
  static_assert(std::is_convertible_v<list_shape, shape>);
  static_assert(std::is_convertible_v<const list_shape&, shape>);
  static_assert(std::is_convertible_v<record_shape&&, shape>);
  static_assert(not std::is_constructible_v<shape, int>);
  static_assert(not std::is_constructible_v<shape, record_field>);
  const auto xs = list_shape{shape{int64_shape{}}};
  auto x = shape{xs};
  auto y = shape{list_shape{xs}};
  REQUIRE(is<list_shape>(x));
  CHECK_EQUAL(try_as<list_shape>(&x)->element(), shape{int64_shape{}});
  CHECK_EQUAL(x, y);
  auto nested = shape{list_shape{shape{xs}}};
  CHECK_EQUAL(to_string(nested), "list<list<int64>>");
}

TEST("null is the identity") {
  for (const auto& x : samples()) {
    CHECK_EQUAL(unify(null_shape{}, x), x);
    CHECK_EQUAL(unify(x, null_shape{}), x);
  }
}

TEST("equal scalars stay") {
  CHECK_EQUAL(unify(bool_shape{}, bool_shape{}), shape{bool_shape{}});
  CHECK_EQUAL(unify(int64_shape{}, int64_shape{}), shape{int64_shape{}});
  CHECK_EQUAL(unify(double_shape{}, double_shape{}), shape{double_shape{}});
  CHECK_EQUAL(unify(string_shape{}, string_shape{}), shape{string_shape{}});
}

TEST("integers widen to doubles") {
  CHECK_EQUAL(unify(int64_shape{}, double_shape{}), shape{double_shape{}});
  CHECK_EQUAL(unify(double_shape{}, int64_shape{}), shape{double_shape{}});
  CHECK_EQUAL(unify(list_of(int64_shape{}), list_of(double_shape{})),
              list_of(double_shape{}));
}

TEST("scalar mismatches fall back to string") {
  CHECK_EQUAL(unify(bool_shape{}, string_shape{}), shape{string_shape{}});
  CHECK_EQUAL(unify(int64_shape{}, string_shape{}), shape{string_shape{}});
  CHECK_EQUAL(unify(bool_shape{}, int64_shape{}), shape{string_shape{}});
  CHECK_EQUAL(unify(double_shape{}, bool_shape{}), shape{string_shape{}});
}

TEST("structure mismatches fall back to string") {
  auto r = shape{record_shape{{"a", int64_shape{}}}};
  auto l = list_of(int64_shape{});
  CHECK_EQUAL(unify(r, int64_shape{}), shape{string_shape{}});
  CHECK_EQUAL(unify(string_shape{}, r), shape{string_shape{}});
  CHECK_EQUAL(unify(l, bool_shape{}), shape{string_shape{}});
  CHECK_EQUAL(unify(double_shape{}, l), shape{string_shape{}});
  CHECK_EQUAL(unify(r, l), shape{string_shape{}});
  CHECK_EQUAL(unify(l, r), shape{string_shape{}});
}

TEST("unknown lists yield to anything") {
  auto unknown = shape{list_shape{}};
  CHECK(std::get<list_shape>(unknown.get_data()).is_unknown());
  CHECK_EQUAL(unify(unknown, null_shape{}), unknown);
  CHECK_EQUAL(unify(null_shape{}, unknown), unknown);
  CHECK_EQUAL(unify(unknown, int64_shape{}), shape{int64_shape{}});
  CHECK_EQUAL(unify(string_shape{}, unknown), shape{string_shape{}});
  auto r = shape{record_shape{{"a", int64_shape{}}}};
  CHECK_EQUAL(unify(unknown, r), r);
  CHECK_EQUAL(unify(r, unknown), r);
  CHECK_EQUAL(unify(unknown, list_of(bool_shape{})), list_of(bool_shape{}));
  CHECK_EQUAL(unify(list_of(bool_shape{}), unknown), list_of(bool_shape{}));
}

TEST("records merge field by field") {
  auto a = shape{record_shape{
    {"a", int64_shape{}},
    {"b", bool_shape{}},
    {"nested", record_shape{{"x", string_shape{}}}},
  }};
  auto b = shape{record_shape{
    {"c", string_shape{}},
    {"a", double_shape{}},
    {"nested", record_shape{{"y", int64_shape{}}}},
  }};
  auto expected = shape{record_shape{
    {"a", double_shape{}},
    {"b", bool_shape{}},
    {"nested", record_shape{{"x", string_shape{}}, {"y", int64_shape{}}}},
    {"c", string_shape{}},
  }};
  auto ab = unify(a, b);
  CHECK(identical(ab, expected));
  CHECK_EQUAL(ab, expected);
  // The other direction yields the same fields in a different order.
  auto ba = unify(b, a);
  CHECK_EQUAL(ba, expected);
  CHECK(not identical(ba, expected));
  CHECK_EQUAL(fmt::format("{}", ba),
              "record{c: string, a: double, nested: record{y: int64, x: "
              "string}, b: bool}");
}

TEST("record equality ignores field order") {
  auto x = shape{record_shape{{"a", int64_shape{}}, {"b", bool_shape{}}}};
  auto y = shape{record_shape{{"b", bool_shape{}}, {"a", int64_shape{}}}};
  CHECK_EQUAL(x, y);
  CHECK(not identical(x, y));
  CHECK(identical(x, x));
  auto z = shape{record_shape{{"a", int64_shape{}}}};
  CHECK_NOT_EQUAL(x, z);
  CHECK_NOT_EQUAL(z, x);
}

TEST("unify is commutative") {
  auto xs = samples();
  for (const auto& a : xs) {
    for (const auto& b : xs) {
      CHECK_EQUAL(unify(a, b), unify(b, a));
    }
  }
}

TEST("unify is associative") {
  auto xs = samples();
  for (const auto& a : xs) {
    for (const auto& b : xs) {
      for (const auto& c : xs) {
        CHECK_EQUAL(unify(unify(a, b), c), unify(a, unify(b, c)));
      }
    }
  }
}

TEST("unify is idempotent") {
  for (const auto& x : samples()) {
    CHECK(identical(unify(x, x), x));
    auto y = x;
    merge(y, y);
    CHECK(identical(y, x));
  }
}

TEST("merging a result again changes nothing") {
  auto xs = samples();
  for (const auto& a : xs) {
    for (const auto& b : xs) {
      auto ab = unify(a, b);
      CHECK(identical(unify(ab, b), ab));
      CHECK(identical(unify(ab, a), ab));
    }
  }
}

TEST("merge of deeply nested shapes") {
  constexpr auto depth = 500;
  auto a = shape{int64_shape{}};
  auto b = shape{double_shape{}};
  for (auto i = 0; i < depth; ++i) {
    a = record_shape{{"x", std::move(a)}};
    b = record_shape{{"y", bool_shape{}}, {"x", std::move(b)}};
  }
  merge(a, b);
  const auto* current = &a;
  for (auto i = 0; i < depth; ++i) {
    const auto* xs = try_as<record_shape>(current);
    REQUIRE(xs != nullptr);
    CHECK_EQUAL(xs->num_fields(), 2u);
    current = xs->find("x");
    REQUIRE(current != nullptr);
  }
  CHECK_EQUAL(*current, shape{double_shape{}});
}

TEST("record shapes collapse duplicate fields") {
  auto x = record_shape{{"a", int64_shape{}}, {"a", double_shape{}}};
  CHECK_EQUAL(x.num_fields(), 1u);
  auto expected = shape{record_shape{{"a", double_shape{}}}};
  CHECK_EQUAL(shape{x}, expected);
}

TEST("shape formatting") {
  auto x = shape{record_shape{
    {"id", string_shape{}},
    {"n", list_of(double_shape{})},
    {"empty", list_shape{}},
    {"nothing", null_shape{}},
    {"flag", bool_shape{}},
    {"count", int64_shape{}},
  }};
  CHECK_EQUAL(fmt::format("{}", x),
              "record{id: string, n: list<double>, empty: list<null>, "
              "nothing: null, flag: bool, count: int64}");
  CHECK_EQUAL(kind_name(x), "record");
  CHECK_EQUAL(kind_name(list_shape{}), "list");
}
