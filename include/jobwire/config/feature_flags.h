// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for jobwire
 *
 * Central entry point for the integration flags that select which kcenon
 * ecosystem systems back the HTTP, streaming and logging layers.
 *
 * Feature categories:
 * - KCENON_WITH_*        : System integration flags (set by CMake)
 * - JOBWIRE_USE_*        : Derived switches used inside jobwire
 *
 * @code
 * #include <jobwire/config/feature_flags.h>
 *
 * #if KCENON_WITH_NETWORK_SYSTEM
 *     auto client = std::make_shared<kcenon::network::core::http_client>(timeout);
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// System Integration Flags
//==============================================================================

// common_system integration (result types, required by logger_system)
#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
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

// network_system integration (HTTP client and WebSocket client)
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
 * @brief Unified flag for logger_system usage in jobwire
 *
 * logger_system depends on common_system, so both must be present.
 */
#ifndef JOBWIRE_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define JOBWIRE_USE_LOGGER_SYSTEM 1
    #else
        #define JOBWIRE_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef JOBWIRE_PRINT_FEATURE_SUMMARY

#pragma message("=== jobwire Feature Summary ===")

#if KCENON_WITH_NETWORK_SYSTEM
    #pragma message("  network_system: Available")
#else
    #pragma message("  network_system: Not Available")
#endif

#if JOBWIRE_USE_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available")
#endif

#pragma message("===============================")

#endif // JOBWIRE_PRINT_FEATURE_SUMMARY
