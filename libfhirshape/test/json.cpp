//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "fhirshape/json.hpp"

#include "fhirshape/data.hpp"
#include "fhirshape/defaults.hpp"
#include "fhirshape/error.hpp"
#include "fhirshape/test/test.hpp"

#include <fmt/format.h>

#include <sstream>
#include <string>
#include <vector>

using namespace fhirshape;

namespace {

auto parse(std::string_view str) -> data {
  return unbox(from_json(str));
}

auto read_all(ndjson_reader& reader) -> std::vector<data> {
  auto result = std::vector<data>{};
  while (auto x = reader.next()) {
    result.push_back(std::move(*x));
  }
  return result;
}

} // namespace

TEST("JSON scalars") {
  CHECK_EQUAL(parse("null"), data{});
  CHECK_EQUAL(parse("true"), data{true});
  CHECK_EQUAL(parse("false"), data{false});
  CHECK_EQUAL(parse("-42"), data{int64_t{-42}});
  CHECK_EQUAL(parse("42"), data{int64_t{42}});
  CHECK_EQUAL(parse("2.5"), data{2.5});
  CHECK_EQUAL(parse("1e3"), data{1000.0});
  CHECK_EQUAL(parse(R"("foo\nbar")"), data{"foo\nbar"});
  CHECK_EQUAL(parse(" \"padded\" "), data{"padded"});
}

TEST("JSON large numbers") {
  CHECK(is<uint64_t>(parse("18446744073709551615")));
  CHECK_EQUAL(parse("[123456789012345678901234567890]"),
              data{list{"123456789012345678901234567890"}});
}

TEST("JSON containers") {
  auto x = parse(R"({"resourceType": "Patient", "name": [{"given": ["A", "B"]}],
                     "active": true, "meta": {}, "link": []})");
  auto expected = data{record{
    {"resourceType", "Patient"},
    {"name", list{record{{"given", list{"A", "B"}}}}},
    {"active", true},
    {"meta", record{}},
    {"link", list{}},
  }};
  CHECK_EQUAL(x, expected);
  CHECK_EQUAL(to_string(x), R"({"resourceType": "Patient", "name": [{"given": )"
                            R"(["A", "B"]}], "active": true, "meta": {}, )"
                            R"("link": []})");
}

TEST("JSON duplicate keys") {
  auto x = parse(R"({"a": 1, "b": 2, "a": "x"})");
  auto expected = data{record{{"a", "x"}, {"b", 2}}};
  CHECK_EQUAL(x, expected);
}

TEST("JSON errors") {
  CHECK_EQUAL(from_json("").error(), ec::parse_error);
  CHECK_EQUAL(from_json("{").error(), ec::parse_error);
  CHECK_EQUAL(from_json(R"({"a": })").error(), ec::parse_error);
  CHECK_EQUAL(from_json("[1, 2").error(), ec::parse_error);
  CHECK_EQUAL(from_json("nul").error(), ec::parse_error);
  auto trailing = from_json(R"({"a": 1} {"b": 2})");
  REQUIRE(not trailing);
  CHECK_EQUAL(trailing.error(), ec::parse_error);
}

TEST("JSON nesting limit") {
  auto deep = [](size_t depth) {
    return std::string(depth, '[') + std::string(depth, ']');
  };
  CHECK(from_json(deep(defaults::max_json_depth)));
  auto err = from_json(deep(defaults::max_json_depth + 2)).error();
  CHECK_EQUAL(err, ec::parse_error);
}

TEST("NDJSON lines") {
  auto input = std::istringstream{
    "{\"resourceType\": \"Patient\", \"id\": \"a\"}\n"
    "\n"
    "   \t\n"
    "{\"resourceType\": \"Patient\", \"id\": \"b\"}\r\n"
    "{\"resourceType\": \"Condition\", \"id\": \"c\"}"};
  auto reader = ndjson_reader{input};
  auto records = read_all(reader);
  REQUIRE_EQUAL(records.size(), 3u);
  CHECK_EQUAL(records[1], data(record{{"resourceType", "Patient"}, {"id", "b"}}));
  CHECK_EQUAL(reader.num_lines(), 5u);
  CHECK_EQUAL(reader.num_records(), 3u);
  CHECK_EQUAL(reader.num_skipped(), 0u);
  CHECK(not reader.next());
}

TEST("NDJSON skips invalid lines") {
  auto input = std::istringstream{
    "{\"id\": \"a\"}\n"
    "{\"id\": \n"
    "[1, 2, 3]\n"
    "42\n"
    "{\"id\": \"b\"}\n"};
  auto reader = ndjson_reader{input, std::nullopt, "test.ndjson"};
  auto records = read_all(reader);
  REQUIRE_EQUAL(records.size(), 2u);
  CHECK_EQUAL(records[0], data(record{{"id", "a"}}));
  CHECK_EQUAL(records[1], data(record{{"id", "b"}}));
  CHECK_EQUAL(reader.num_lines(), 5u);
  CHECK_EQUAL(reader.num_skipped(), 3u);
}

TEST("NDJSON kind filter") {
  auto input = std::istringstream{
    "{\"resourceType\": \"Patient\", \"id\": \"a\"}\n"
    "{\"resourceType\": \"Condition\", \"id\": \"b\"}\n"
    "{\"id\": \"c\"}\n"
    "{\"resourceType\": 7, \"id\": \"d\"}\n"
    "{\"resourceType\": \"Patient\", \"id\": \"e\"}\n"};
  auto reader = ndjson_reader{input, "Patient"};
  auto records = read_all(reader);
  REQUIRE_EQUAL(records.size(), 2u);
  const auto* first = try_as<record>(&records[0]);
  const auto* second = try_as<record>(&records[1]);
  REQUIRE(first != nullptr);
  REQUIRE(second != nullptr);
  CHECK_EQUAL(first->at("id"), data{"a"});
  CHECK_EQUAL(second->at("id"), data{"e"});
  CHECK_EQUAL(reader.num_records(), 2u);
  CHECK_EQUAL(reader.num_skipped(), 3u);
}
