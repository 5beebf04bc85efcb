// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Build-time integration switches for media_relay_system
 *
 * CMake defines BUILD_WITH_<SYSTEM> for every kcenon system it located.
 * This header normalizes them to KCENON_WITH_<SYSTEM> (0 or 1), then
 * derives the relay switches the sources test:
 *
 * | switch                          | set when                          |
 * |---------------------------------|-----------------------------------|
 * | MEDIA_RELAY_USE_THREAD_SYSTEM   | thread_system runs the I/O pool   |
 * | MEDIA_RELAY_USE_LOGGER_SYSTEM   | logger_system backs the logger    |
 * | MEDIA_RELAY_HAS_TCP_CONNECTION  | network_system provides TCP       |
 *
 * Any switch may be predefined to force it off.
 */

#pragma once

#if defined(BUILD_WITH_COMMON_SYSTEM)
#include <kcenon/common/config/feature_flags.h>
#endif

//==============================================================================
// kcenon systems
//==============================================================================

#if !defined(KCENON_WITH_COMMON_SYSTEM) && defined(BUILD_WITH_COMMON_SYSTEM)
    #define KCENON_WITH_COMMON_SYSTEM 1
#endif
#if !defined(KCENON_WITH_THREAD_SYSTEM) && defined(BUILD_WITH_THREAD_SYSTEM)
    #define KCENON_WITH_THREAD_SYSTEM 1
#endif
#if !defined(KCENON_WITH_LOGGER_SYSTEM) && defined(BUILD_WITH_LOGGER_SYSTEM)
    #define KCENON_WITH_LOGGER_SYSTEM 1
#endif
#if !defined(KCENON_WITH_NETWORK_SYSTEM) && defined(BUILD_WITH_NETWORK_SYSTEM)
    #define KCENON_WITH_NETWORK_SYSTEM 1
#endif

// Whatever was not found is off
#ifndef KCENON_WITH_COMMON_SYSTEM
    #define KCENON_WITH_COMMON_SYSTEM 0
#endif
#ifndef KCENON_WITH_THREAD_SYSTEM
    #define KCENON_WITH_THREAD_SYSTEM 0
#endif
#ifndef KCENON_WITH_LOGGER_SYSTEM
    #define KCENON_WITH_LOGGER_SYSTEM 0
#endif
#ifndef KCENON_WITH_NETWORK_SYSTEM
    #define KCENON_WITH_NETWORK_SYSTEM 0
#endif

//==============================================================================
// Relay switches
//==============================================================================

#ifndef MEDIA_RELAY_USE_THREAD_SYSTEM
    #define MEDIA_RELAY_USE_THREAD_SYSTEM KCENON_WITH_THREAD_SYSTEM
#endif

// logger_system returns common_system results from its builder
#ifndef MEDIA_RELAY_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define MEDIA_RELAY_USE_LOGGER_SYSTEM 1
    #else
        #define MEDIA_RELAY_USE_LOGGER_SYSTEM 0
    #endif
#endif

// Without it the transport still runs over any other stream_connection
#ifndef MEDIA_RELAY_HAS_TCP_CONNECTION
    #define MEDIA_RELAY_HAS_TCP_CONNECTION KCENON_WITH_NETWORK_SYSTEM
#endif
