// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file jsondiff_config.h
/// @brief Centralized configuration for jsondiff and its dependencies
///
/// This file defines the compile-time configuration for the third-party libraries
/// used by jsondiff:
///   - immer: Immutable data structures (Value tree, diff paths)
///   - lager: Store for the compare session
///   - zug: Transducers used by lager
///
/// It MUST be included before any library headers to ensure consistent settings.
/// All jsondiff public headers already include this file.
///
/// Unlike a single-threaded editor store, diff results are routinely built on a
/// worker thread and handed to the UI thread, so immer keeps its thread-safe
/// reference counting here.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(JSONDIFF_CONFIGURED)
#error "immer headers were included before jsondiff/jsondiff_config.h. " \
       "Please include jsondiff headers before any direct immer includes."
#endif

#define JSONDIFF_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// @brief Disable tagged node assertions
///
/// When enabled (=1), immer stores type tags in nodes for runtime
/// assertion checks. Disabling this reduces node memory size.
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

/// @brief Disable debug trace output
#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

/// @brief Disable debug print output
#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

/// @brief Disable deep data structure consistency checks
#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

// ============================================================
// Lager Library Configuration
// ============================================================

/// @brief Disable store dependency SFINAE checks
///
/// The compare store has no dependencies; skipping the checks keeps
/// template instantiation cheap on every platform.
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
// Verbose Logging Configuration
//
// When JSONDIFF_VERBOSE_LOG is 1:
//   - pointer lookups, pointer parse errors and pretty-print
//     fallbacks are reported on stderr
//
// By default, verbose logging is DISABLED in release builds
// and ENABLED in debug builds.
// ============================================================

#ifndef JSONDIFF_VERBOSE_LOG
#  if defined(NDEBUG)
#    define JSONDIFF_VERBOSE_LOG 0
#  else
#    define JSONDIFF_VERBOSE_LOG 1
#  endif
#endif

// ============================================================
// Configuration Summary (compile-time message)
// ============================================================

#ifdef JSONDIFF_CONFIG_VERBOSE
#if IMMER_TAGGED_NODE
#pragma message("jsondiff: Tagged nodes ENABLED (debug mode)")
#else
#pragma message("jsondiff: Tagged nodes DISABLED (optimized)")
#endif

#if JSONDIFF_VERBOSE_LOG
#pragma message("jsondiff: Verbose logging ENABLED")
#endif
#endif // JSONDIFF_CONFIG_VERBOSE
