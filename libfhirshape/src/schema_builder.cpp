//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "fhirshape/schema_builder.hpp"

#include "fhirshape/data.hpp"
#include "fhirshape/detail/assert.hpp"
#include "fhirshape/error.hpp"
#include "fhirshape/logger.hpp"
#include "fhirshape/path_walker.hpp"
#include "fhirshape/reference_defaults.hpp"

#include <algorithm>
#include <optional>
#include <string_view>
#include <thread>
#include <vector>

namespace fhirshape {

schema_builder::schema_builder(std::string kind) : tree_{std::move(kind)} {
  // nop
}

auto schema_builder::add(const data& x) -> caf::error {
  auto observations = walk(x, tree_.kind());
  if (not observations) {
    return std::move(observations.error());
  }
  tree_.add(*observations);
  ++num_records_;
  return {};
}

auto schema_builder::merge(const schema_builder& other) -> caf::error {
  if (auto err = tree_.merge(other.tree_)) {
    return err;
  }
  num_records_ += other.num_records_;
  return {};
}

auto schema_builder::finish(const reference_defaults& defaults) && -> schema_tree {
  auto widened = tree_.widen(defaults);
  FHIRSHAPE_VERBOSE("inferred {} schema from {} records with {} top-level "
                    "fields of which {} were widened",
                    tree_.kind(), num_records_, tree_.root().num_fields(),
                    widened);
  return std::move(tree_);
}

namespace {

auto deref(const data& x) -> const data& {
  return x;
}

auto deref(const data* x) -> const data& {
  return *x;
}

template <class T>
auto fold(const std::string& kind, std::span<const T> records)
  -> caf::expected<schema_builder> {
  auto builder = schema_builder{kind};
  for (const auto& x : records) {
    if (auto err = builder.add(deref(x))) {
      return err;
    }
  }
  return builder;
}

template <class T>
auto parallel_fold(const std::string& kind, std::span<const T> records,
                   size_t workers) -> caf::expected<schema_builder> {
  workers = std::clamp(workers, size_t{1}, std::max(records.size(), size_t{1}));
  if (workers == 1) {
    return fold(kind, records);
  }
  auto chunk_size = records.size() / workers;
  auto remainder = records.size() % workers;
  auto partials = std::vector<std::optional<caf::expected<schema_builder>>>(
    workers);
  auto threads = std::vector<std::thread>{};
  threads.reserve(workers);
  auto offset = size_t{0};
  for (auto i = size_t{0}; i < workers; ++i) {
    auto size = chunk_size + (i < remainder ? 1 : 0);
    auto chunk = records.subspan(offset, size);
    offset += size;
    threads.emplace_back([&kind, chunk, &partial = partials[i]] {
      partial.emplace(fold(kind, chunk));
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  FHIRSHAPE_DEBUG("merging {} partial {} schemas", workers, kind);
  auto result = schema_builder{kind};
  for (auto& partial : partials) {
    FHIRSHAPE_ASSERT(partial.has_value());
    if (not *partial) {
      return std::move(partial->error());
    }
    if (auto err = result.merge(**partial)) {
      return err;
    }
  }
  return result;
}

} // namespace

auto schema_builder::add_batch(std::span<const data> records, size_t workers)
  -> caf::error {
  auto partial = parallel_fold(tree_.kind(), records, workers);
  if (not partial) {
    return std::move(partial.error());
  }
  return merge(*partial);
}

auto add_by_kind(std::map<std::string, schema_builder>& builders,
                 std::span<const data> records, size_t workers) -> caf::error {
  auto groups = std::map<std::string_view, std::vector<const data*>>{};
  for (const auto& x : records) {
    const auto* xs = try_as<record>(&x);
    if (xs == nullptr) {
      return caf::make_error(ec::invalid_record,
                             fmt::format("record must be a mapping but got {}",
                                         kind_name(x)));
    }
    auto it = xs->find(defaults::kind_field);
    const auto* kind
      = it != xs->end() ? try_as<std::string>(&it->second) : nullptr;
    if (kind == nullptr) {
      return caf::make_error(ec::invalid_record,
                             fmt::format("record lacks a string '{}' field",
                                         defaults::kind_field));
    }
    groups[*kind].push_back(&x);
  }
  for (const auto& [kind, group] : groups) {
    auto builder
      = builders.try_emplace(std::string{kind}, std::string{kind}).first;
    auto partial = parallel_fold(builder->first,
                                 std::span<const data* const>{group}, workers);
    if (not partial) {
      return add_context(partial.error(), "failed to infer {} schema", kind);
    }
    if (auto err = builder->second.merge(*partial)) {
      return err;
    }
  }
  return {};
}

auto infer(std::string kind, std::span<const data> records,
           const reference_defaults& defaults, const build_options& options)
  -> caf::expected<schema_tree> {
  auto builder = parallel_fold(kind, records, options.workers);
  if (not builder) {
    return std::move(builder.error());
  }
  return std::move(*builder).finish(defaults);
}

auto build(std::string kind, std::span<const data> records,
           const reference_defaults& defaults, const build_options& options)
  -> caf::expected<std::shared_ptr<arrow::Schema>> {
  auto tree = infer(std::move(kind), records, defaults, options);
  if (not tree) {
    return std::move(tree.error());
  }
  return to_arrow_schema(*tree, options.render);
}

auto infer_by_kind(std::span<const data> records,
                   const reference_defaults& defaults,
                   const build_options& options)
  -> caf::expected<std::map<std::string, schema_tree>> {
  auto builders = std::map<std::string, schema_builder>{};
  if (auto err = add_by_kind(builders, records, options.workers)) {
    return err;
  }
  auto result = std::map<std::string, schema_tree>{};
  for (auto& [kind, builder] : builders) {
    result.emplace(kind, std::move(builder).finish(defaults));
  }
  return result;
}

} // namespace fhirshape
