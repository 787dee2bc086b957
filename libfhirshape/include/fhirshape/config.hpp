//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

// Log levels, ordered by increasing verbosity. The build system selects the
// maximum level that is compiled in via FHIRSHAPE_LOG_LEVEL.
#define FHIRSHAPE_LOG_LEVEL_QUIET 0
#define FHIRSHAPE_LOG_LEVEL_CRITICAL 1
#define FHIRSHAPE_LOG_LEVEL_ERROR 2
#define FHIRSHAPE_LOG_LEVEL_WARNING 3
#define FHIRSHAPE_LOG_LEVEL_INFO 4
#define FHIRSHAPE_LOG_LEVEL_VERBOSE 5
#define FHIRSHAPE_LOG_LEVEL_DEBUG 6
#define FHIRSHAPE_LOG_LEVEL_TRACE 7

#ifndef FHIRSHAPE_LOG_LEVEL
#  define FHIRSHAPE_LOG_LEVEL FHIRSHAPE_LOG_LEVEL_DEBUG
#endif

#ifndef FHIRSHAPE_VERSION
#  define FHIRSHAPE_VERSION "0.0.0"
#endif

#define FHIRSHAPE_NO_INLINE __attribute__((noinline))

namespace fhirshape::version {

inline constexpr const char* version = FHIRSHAPE_VERSION;

} // namespace fhirshape::version
