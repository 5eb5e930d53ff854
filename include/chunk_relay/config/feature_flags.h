// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Feature flags for chunk_relay
 *
 * Central entry point for the integration flags of the library. The build
 * sets BUILD_WITH_* definitions from its options; this header turns them
 * into KCENON_WITH_* values that are always defined (0 or 1).
 *
 * @code
 * #include <chunk_relay/config/feature_flags.h>
 *
 * #if KCENON_WITH_NETWORK_SYSTEM
 *     client_->get(url, query, headers);
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// System Integration Flags
//==============================================================================

// common_system integration (required by logger_system forwarding)
#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// thread_system integration (thread_pool for destination puts)
#ifndef KCENON_WITH_THREAD_SYSTEM
    #if defined(BUILD_WITH_THREAD_SYSTEM)
        #define KCENON_WITH_THREAD_SYSTEM 1
    #else
        #define KCENON_WITH_THREAD_SYSTEM 0
    #endif
#endif

// logger_system integration (structured logging)
#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

// network_system integration (HTTP client for the remote stores)
#ifndef KCENON_WITH_NETWORK_SYSTEM
    #if defined(BUILD_WITH_NETWORK_SYSTEM)
        #define KCENON_WITH_NETWORK_SYSTEM 1
    #else
        #define KCENON_WITH_NETWORK_SYSTEM 0
    #endif
#endif

//==============================================================================
// Logger System Integration Helper
//==============================================================================

/**
 * @brief Whether log records are forwarded to logger_system
 *
 * logger_system depends on common_system, so both must be enabled.
 */
#ifndef CHUNK_RELAY_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define CHUNK_RELAY_USE_LOGGER_SYSTEM 1
    #else
        #define CHUNK_RELAY_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef CHUNK_RELAY_PRINT_FEATURE_SUMMARY

#pragma message("=== chunk_relay Feature Summary ===")

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system: Available")
#else
    #pragma message("  thread_system: Not Available (standalone workers)")
#endif

#if CHUNK_RELAY_USE_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available (stderr)")
#endif

#if KCENON_WITH_NETWORK_SYSTEM
    #pragma message("  network_system: Available")
#else
    #pragma message("  network_system: Not Available (stores need an injected client)")
#endif

#pragma message("===================================")

#endif  // CHUNK_RELAY_PRINT_FEATURE_SUMMARY
