// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file protodict_config.h
/// @brief Centralized configuration for protodict and its dependencies
///
/// This file defines the compile-time configuration for the third-party
/// libraries used by protodict:
///   - immer: persistent containers backing TypedValue
///   - boost: date_time (timestamps) and core (type name demangling)
///
/// It MUST be included before any library headers to ensure consistent settings.
/// All protodict public headers include it first.

#pragma once

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(PROTODICT_CONFIGURED)
#error "immer headers were included before protodict/protodict_config.h. " \
       "Please include protodict headers before any direct immer includes."
#endif

#define PROTODICT_CONFIGURED 1

// ============================================================
// Threading Model
// ============================================================

/// @brief Select immer's thread-safe memory policy for TypedValue trees.
///
/// Containers are single-threaded by default (non-atomic refcounts).
/// Define PROTODICT_ENABLE_THREAD_SAFE=1 to share immutable TypedValue
/// trees between threads.
#ifndef PROTODICT_ENABLE_THREAD_SAFE
#define PROTODICT_ENABLE_THREAD_SAFE 0
#endif

#if !PROTODICT_ENABLE_THREAD_SAFE
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 1
#endif
#endif

/// @brief Disable tagged node assertions (smaller nodes, no checks)
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

// ============================================================
// Boost Library Configuration
// ============================================================

/// @brief Disable Boost auto-linking for date_time (MSVC)
///
/// Only the header-only posix_time arithmetic is used.
#ifndef BOOST_DATE_TIME_NO_LIB
#define BOOST_DATE_TIME_NO_LIB 1
#endif

#ifndef BOOST_ALL_NO_LIB
#define BOOST_ALL_NO_LIB 1
#endif

// ============================================================
// Diagnostics
// ============================================================

/// @brief Log classification fallbacks and access errors to stderr.
///
/// Enabled in debug builds, disabled when NDEBUG is defined.
/// Define PROTODICT_VERBOSE_LOG to 0 or 1 to override.
#ifndef PROTODICT_VERBOSE_LOG
#  if defined(NDEBUG)
#    define PROTODICT_VERBOSE_LOG 0
#  else
#    define PROTODICT_VERBOSE_LOG 1
#  endif
#endif

#ifdef PROTODICT_CONFIG_VERBOSE
#if PROTODICT_ENABLE_THREAD_SAFE
#pragma message("protodict: Thread-safe TypedValue ENABLED")
#else
#pragma message("protodict: Thread safety DISABLED (optimized for single-thread)")
#endif
#endif
