// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file record_patch_config.h
/// @brief Centralized configuration for record_patch and its dependencies
///
/// This file defines the compile-time configuration for the third-party
/// libraries used by record_patch:
///   - immer: persistent containers backing record values
///   - lager: lenses focusing the container addressed by a pointer
///   - zug: functional utilities (identity lens, composition)
///   - boost: date_time for datetime literal validation
///
/// It MUST be included before any library headers. All record_patch public
/// headers include it first, so users of record_patch headers don't need to
/// do anything special.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(RECORD_PATCH_CONFIGURED)
#error "immer headers were included before record_patch/record_patch_config.h. " \
       "Please include record_patch headers before any direct immer includes."
#endif

#define RECORD_PATCH_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// @brief Atomic reference counts are required
///
/// One Patch may be applied from several threads, each to its own record,
/// so immer's default policy must keep its atomic refcounts.
#if defined(IMMER_NO_THREAD_SAFETY) && IMMER_NO_THREAD_SAFETY
#error "record_patch requires immer's thread-safe memory policy; do not define IMMER_NO_THREAD_SAFETY."
#endif

// ============================================================
// Lager Library Configuration
// ============================================================

/// @brief Disable store dependency SFINAE checks
///
/// The library only uses lenses; the example store declares no dependencies.
#ifndef LAGER_DISABLE_STORE_DEPENDENCY_CHECKS
#define LAGER_DISABLE_STORE_DEPENDENCY_CHECKS 1
#endif

// ============================================================
// Zug Library Configuration
// ============================================================

/// @brief Force zug to use std::variant instead of boost::variant
#ifndef ZUG_VARIANT_STD
#define ZUG_VARIANT_STD 1
#endif

// ============================================================
// Boost Library Configuration
// ============================================================

/// @brief Disable Boost auto-linking for date_time (MSVC)
///
/// Datetime validation only uses the header-only gregorian/posix_time
/// parts of boost::date_time.
#ifndef BOOST_DATE_TIME_NO_LIB
#define BOOST_DATE_TIME_NO_LIB 1
#endif

#ifndef BOOST_ALL_NO_LIB
#define BOOST_ALL_NO_LIB 1
#endif

// ============================================================
// Verbose Logging
//
// When RECORD_PATCH_VERBOSE_LOG is non-zero:
//   - Value::at() and Value::set() log access errors to stderr
//   - Patch::apply() logs failed "test" operations
//   - the navigator logs record data errors before throwing
//
// Enabled in debug builds, disabled when NDEBUG is defined.
// ============================================================

#ifndef RECORD_PATCH_VERBOSE_LOG
#  if defined(NDEBUG)
#    define RECORD_PATCH_VERBOSE_LOG 0
#  else
#    define RECORD_PATCH_VERBOSE_LOG 1
#  endif
#endif
