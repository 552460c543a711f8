/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

// Note: these constants are treated as tri-state variables, so they can be 0, 1, or undefined.

// Linux
#if defined(__linux__)
    #define TEMPO_LINUX 1
    #define TEMPO_POSIX 1  // Most distributions are mostly POSIX compliant.
#else
    #define TEMPO_LINUX 0
#endif

// Apple
#if defined(__APPLE__)
    #define TEMPO_APPLE 1
    #define TEMPO_POSIX 1  // POSIX-certified.
#else
    #define TEMPO_APPLE 0
#endif

// Posix
#ifndef TEMPO_POSIX
    #if defined(_POSIX_VERSION)
        #define TEMPO_POSIX 1
    #else
        #define TEMPO_POSIX 0
    #endif
#endif

#if !TEMPO_LINUX
    #error "tempokit relies on Linux timestamping and clock steering facilities."
#endif

#if defined(__GNUC__) || defined(__clang__)
    #define TEMPO_FUNCTION __PRETTY_FUNCTION__
#else
    #define TEMPO_FUNCTION __func__
#endif
