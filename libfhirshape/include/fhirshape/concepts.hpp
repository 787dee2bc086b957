//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <concepts>

namespace fhirshape::concepts {

template <class T, class... Ts>
concept one_of = (std::same_as<T, Ts> or ...);

} // namespace fhirshape::concepts
