//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "fhirshape/fwd.hpp"

#include "fhirshape/arrow_schema.hpp"
#include "fhirshape/defaults.hpp"
#include "fhirshape/schema_tree.hpp"

#include <arrow/type_fwd.h>
#include <caf/error.hpp>
#include <caf/expected.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <span>
#include <string>

namespace fhirshape {

/// Tuning knobs for schema inference.
struct build_options {
  /// The number of threads that fold records. Each thread folds a contiguous
  /// chunk of the records into its own tree; the trees are merged in chunk
  /// order afterwards.
  size_t workers = defaults::workers;

  /// Options for rendering the final schema.
  render_options render = {};
};

/// Folds records of one kind into a schema tree.
class schema_builder {
public:
  explicit schema_builder(std::string kind);

  /// Walks a record and merges all of its observations.
  /// @returns `ec::invalid_record` if *x* is not a record.
  auto add(const data& x) -> caf::error;

  /// Folds a batch of records, split into contiguous chunks across up to
  /// *workers* threads, and merges the chunks in order. The builder is
  /// unchanged if any record of the batch is invalid.
  auto add_batch(std::span<const data> records, size_t workers = 1)
    -> caf::error;

  /// Merges the state of another builder of the same kind.
  auto merge(const schema_builder& other) -> caf::error;

  /// @returns the number of records added so far, including merged ones.
  auto num_records() const -> size_t {
    return num_records_;
  }

  /// @returns the tree before widening.
  auto tree() const -> const schema_tree& {
    return tree_;
  }

  /// Widens the tree with the defaults of its kind and hands it out.
  auto finish(const reference_defaults& defaults) && -> schema_tree;

private:
  schema_tree tree_;
  size_t num_records_ = 0;
};

/// Infers the widened schema tree of records of one kind.
auto infer(std::string kind, std::span<const data> records,
           const reference_defaults& defaults,
           const build_options& options = {}) -> caf::expected<schema_tree>;

/// Infers the schema of records of one kind and renders it for Arrow.
auto build(std::string kind, std::span<const data> records,
           const reference_defaults& defaults,
           const build_options& options = {})
  -> caf::expected<std::shared_ptr<arrow::Schema>>;

/// Folds records into one builder per `resourceType`, creating builders for
/// kinds not seen before. The records of each kind fold like
/// `schema_builder::add_batch` with *workers* threads.
/// @returns `ec::invalid_record` for a record without a string
/// `resourceType`, before any builder changes.
auto add_by_kind(std::map<std::string, schema_builder>& builders,
                 std::span<const data> records, size_t workers = 1)
  -> caf::error;

/// Groups records by their `resourceType` and infers one tree per kind.
/// @returns `ec::invalid_record` for a record without a string
/// `resourceType`.
auto infer_by_kind(std::span<const data> records,
                   const reference_defaults& defaults,
                   const build_options& options = {})
  -> caf::expected<std::map<std::string, schema_tree>>;

} // namespace fhirshape
