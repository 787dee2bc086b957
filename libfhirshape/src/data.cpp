//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "fhirshape/data.hpp"

#include "fhirshape/error.hpp"

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <iterator>
#include <sstream>

namespace fhirshape {

auto operator==(const data& lhs, const data& rhs) -> bool {
  return lhs.data_ == rhs.data_;
}

auto kind_name(const data& x) -> std::string_view {
  return match(
    x,
    [](caf::none_t) {
      return std::string_view{"null"};
    },
    [](bool) {
      return std::string_view{"bool"};
    },
    [](int64_t) {
      return std::string_view{"int64"};
    },
    [](uint64_t) {
      return std::string_view{"uint64"};
    },
    [](double) {
      return std::string_view{"double"};
    },
    [](const std::string&) {
      return std::string_view{"string"};
    },
    [](const list&) {
      return std::string_view{"list"};
    },
    [](const record&) {
      return std::string_view{"record"};
    });
}

namespace {

void print_string(std::string& out, std::string_view str) {
  out += '"';
  for (auto c : str) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        out += c;
    }
  }
  out += '"';
}

void print(std::string& out, const data& x) {
  match(
    x,
    [&](caf::none_t) {
      out += "null";
    },
    [&](bool y) {
      out += y ? "true" : "false";
    },
    [&](int64_t y) {
      fmt::format_to(std::back_inserter(out), "{}", y);
    },
    [&](uint64_t y) {
      fmt::format_to(std::back_inserter(out), "{}", y);
    },
    [&](double y) {
      fmt::format_to(std::back_inserter(out), "{}", y);
    },
    [&](const std::string& y) {
      print_string(out, y);
    },
    [&](const list& xs) {
      out += '[';
      auto first = true;
      for (const auto& element : xs) {
        if (not first) {
          out += ", ";
        }
        first = false;
        print(out, element);
      }
      out += ']';
    },
    [&](const record& xs) {
      out += '{';
      auto first = true;
      for (const auto& [key, value] : xs) {
        if (not first) {
          out += ", ";
        }
        first = false;
        print_string(out, key);
        out += ": ";
        print(out, value);
      }
      out += '}';
    });
}

auto parse(const YAML::Node& node) -> data {
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      return {};
    case YAML::NodeType::Scalar: {
      // Quoted scalars carry the non-specific tag "!" and stay strings.
      if (node.Tag() == "!") {
        return node.Scalar();
      }
      if (auto x = bool{}; YAML::convert<bool>::decode(node, x)) {
        return x;
      }
      if (auto x = int64_t{}; YAML::convert<int64_t>::decode(node, x)) {
        return x;
      }
      if (auto x = double{}; YAML::convert<double>::decode(node, x)) {
        return x;
      }
      return node.Scalar();
    }
    case YAML::NodeType::Sequence: {
      auto result = list{};
      result.reserve(node.size());
      for (const auto& element : node) {
        result.push_back(parse(element));
      }
      return result;
    }
    case YAML::NodeType::Map: {
      auto result = record{};
      for (const auto& field : node) {
        result[field.first.as<std::string>()] = parse(field.second);
      }
      return result;
    }
  }
  return {};
}

} // namespace

auto to_string(const data& x) -> std::string {
  auto result = std::string{};
  print(result, x);
  return result;
}

auto from_yaml(std::string_view str) -> caf::expected<data> {
  try {
    auto node = YAML::Load(std::string{str});
    return parse(node);
  } catch (const YAML::Exception& e) {
    return caf::make_error(
      ec::parse_error,
      fmt::format("failed to parse YAML at line {} column {}: {}",
                  e.mark.line + 1, e.mark.column + 1, e.msg));
  }
}

auto load_yaml(const std::filesystem::path& file) -> caf::expected<data> {
  auto input = std::ifstream{file};
  if (not input) {
    return caf::make_error(ec::filesystem_error,
                           fmt::format("failed to open {}", file.string()));
  }
  auto buffer = std::stringstream{};
  buffer << input.rdbuf();
  auto yaml = from_yaml(buffer.str());
  if (not yaml) {
    return add_context(yaml.error(), "failed to load YAML file {}",
                       file.string());
  }
  return yaml;
}

} // namespace fhirshape
