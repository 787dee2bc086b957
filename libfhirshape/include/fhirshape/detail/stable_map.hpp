//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <utility>
#include <tuple>
#include <vector>

namespace fhirshape::detail {

/// A map that keeps its entries in insertion order. Lookup is linear, which
/// is the right trade-off for the small field counts of JSON objects.
/// Heterogeneous lookup works for every key type comparable to `Key`.
template <class Key, class T>
class stable_map {
public:
  using key_type = Key;
  using mapped_type = T;
  using value_type = std::pair<Key, T>;
  using vector_type = std::vector<value_type>;
  using size_type = typename vector_type::size_type;
  using iterator = typename vector_type::iterator;
  using const_iterator = typename vector_type::const_iterator;
  using reverse_iterator = typename vector_type::reverse_iterator;
  using const_reverse_iterator = typename vector_type::const_reverse_iterator;

  stable_map() = default;

  stable_map(std::initializer_list<value_type> xs) {
    xs_.reserve(xs.size());
    for (const auto& x : xs) {
      insert(x);
    }
  }

  // -- iterators --------------------------------------------------------------

  auto begin() -> iterator {
    return xs_.begin();
  }

  auto begin() const -> const_iterator {
    return xs_.begin();
  }

  auto end() -> iterator {
    return xs_.end();
  }

  auto end() const -> const_iterator {
    return xs_.end();
  }

  auto rbegin() -> reverse_iterator {
    return xs_.rbegin();
  }

  auto rbegin() const -> const_reverse_iterator {
    return xs_.rbegin();
  }

  auto rend() -> reverse_iterator {
    return xs_.rend();
  }

  auto rend() const -> const_reverse_iterator {
    return xs_.rend();
  }

  // -- capacity ---------------------------------------------------------------

  auto empty() const -> bool {
    return xs_.empty();
  }

  auto size() const -> size_type {
    return xs_.size();
  }

  void reserve(size_type n) {
    xs_.reserve(n);
  }

  // -- lookup -----------------------------------------------------------------

  template <class K>
  auto find(const K& key) -> iterator {
    return std::find_if(xs_.begin(), xs_.end(), [&](const value_type& x) {
      return x.first == key;
    });
  }

  template <class K>
  auto find(const K& key) const -> const_iterator {
    return std::find_if(xs_.begin(), xs_.end(), [&](const value_type& x) {
      return x.first == key;
    });
  }

  template <class K>
  auto contains(const K& key) const -> bool {
    return find(key) != end();
  }

  template <class K>
  auto at(const K& key) -> T& {
    auto i = find(key);
    if (i == end()) {
      throw std::out_of_range{"fhirshape::detail::stable_map::at"};
    }
    return i->second;
  }

  template <class K>
  auto at(const K& key) const -> const T& {
    auto i = find(key);
    if (i == end()) {
      throw std::out_of_range{"fhirshape::detail::stable_map::at"};
    }
    return i->second;
  }

  auto operator[](const Key& key) -> T& {
    return try_emplace(key).first->second;
  }

  // -- modifiers --------------------------------------------------------------

  auto insert(value_type x) -> std::pair<iterator, bool> {
    if (auto i = find(x.first); i != end()) {
      return {i, false};
    }
    xs_.push_back(std::move(x));
    return {std::prev(xs_.end()), true};
  }

  template <class... Ts>
  auto try_emplace(const Key& key, Ts&&... xs) -> std::pair<iterator, bool> {
    if (auto i = find(key); i != end()) {
      return {i, false};
    }
    xs_.emplace_back(std::piecewise_construct, std::forward_as_tuple(key),
                     std::forward_as_tuple(std::forward<Ts>(xs)...));
    return {std::prev(xs_.end()), true};
  }

  template <class... Ts>
  auto emplace(Ts&&... xs) -> std::pair<iterator, bool> {
    return insert(value_type{std::forward<Ts>(xs)...});
  }

  auto erase(const_iterator i) -> iterator {
    return xs_.erase(i);
  }

  template <class K>
  auto erase(const K& key) -> size_type {
    auto i = find(key);
    if (i == end()) {
      return 0;
    }
    xs_.erase(i);
    return 1;
  }

  void clear() {
    xs_.clear();
  }

  // -- comparison -------------------------------------------------------------

  friend auto operator==(const stable_map& x, const stable_map& y) -> bool {
    return x.xs_ == y.xs_;
  }

private:
  vector_type xs_;
};

} // namespace fhirshape::detail
