/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2024 Owllab. All rights reserved.
 */

#pragma once

#include <cstdlib>
#include <iostream>

#include "exception.hpp"
#include "log.hpp"

/**
 * When TEMPO_LOG_ON_ASSERT is defined as true (1), a log message will be emitted when an assertion is hit. Default is
 * on.
 */
#ifndef TEMPO_LOG_ON_ASSERT
    #define TEMPO_LOG_ON_ASSERT 1
#endif

/**
 * When TEMPO_THROW_EXCEPTION_ON_ASSERT is defined as true (1), an exception will be thrown when an assertion is hit.
 * Default is off.
 */
#ifndef TEMPO_THROW_EXCEPTION_ON_ASSERT
    #define TEMPO_THROW_EXCEPTION_ON_ASSERT 0
#endif

/**
 * When TEMPO_ABORT_ON_ASSERT is defined as true (1), program execution will abort when an assertion is hit. Default is
 * off.
 */
#ifndef TEMPO_ABORT_ON_ASSERT
    #define TEMPO_ABORT_ON_ASSERT 0
#endif

#define TEMPO_LOG_IF_ENABLED(msg) \
    if (TEMPO_LOG_ON_ASSERT) {    \
        TEMPO_CRITICAL(msg);      \
    }

#define TEMPO_THROW_EXCEPTION_IF_ENABLED(msg) \
    if (TEMPO_THROW_EXCEPTION_ON_ASSERT) {    \
        TEMPO_THROW_EXCEPTION(msg);           \
    }

#define TEMPO_ABORT_IF_ENABLED(msg)                                \
    if (TEMPO_ABORT_ON_ASSERT) {                                   \
        std::cerr << "Abort on assertion: " << (msg) << std::endl; \
        std::abort();                                              \
    }

/**
 * Assert condition to be true, otherwise:
 *  - Logs if enabled
 *  - Throws if enabled
 *  - Aborts if enabled
 * @param condition The condition to test.
 * @param message The message for logging, throwing and/or aborting.
 */
#define TEMPO_ASSERT(condition, message)                                    \
    do {                                                                    \
        if (!(condition)) {                                                 \
            TEMPO_LOG_IF_ENABLED("Assertion failure: " message)             \
            TEMPO_THROW_EXCEPTION_IF_ENABLED("Assertion failure: " message) \
            TEMPO_ABORT_IF_ENABLED(message)                                 \
        }                                                                   \
    } while (false)

/**
 * Same as TEMPO_ASSERT, but returns from the current (void) function when `condition` is false.
 * @param condition The condition to test.
 * @param message The message for logging, throwing and/or aborting.
 */
#define TEMPO_ASSERT_RETURN(condition, message)                             \
    do {                                                                    \
        if (!(condition)) {                                                 \
            TEMPO_LOG_IF_ENABLED("Assertion failure: " message)             \
            TEMPO_THROW_EXCEPTION_IF_ENABLED("Assertion failure: " message) \
            TEMPO_ABORT_IF_ENABLED(message)                                 \
            return;                                                         \
        }                                                                   \
    } while (false)

/**
 * Same as TEMPO_ASSERT, but returns given `return_value` when `condition` is false.
 * @param condition The condition to test.
 * @param message The message for logging, throwing and/or aborting.
 * @param return_value The value to return.
 */
#define TEMPO_ASSERT_RETURN_WITH(condition, message, return_value)          \
    do {                                                                    \
        if (!(condition)) {                                                 \
            TEMPO_LOG_IF_ENABLED("Assertion failure: " message)             \
            TEMPO_THROW_EXCEPTION_IF_ENABLED("Assertion failure: " message) \
            TEMPO_ABORT_IF_ENABLED(message)                                 \
            return return_value;                                            \
        }                                                                   \
    } while (false)

/**
 * Asserts given condition, but never throws. Useful for places where an exception cannot be thrown like destructors.
 * @param condition The condition to test.
 * @param message The message to log or abort with.
 */
#define TEMPO_ASSERT_NO_THROW(condition, message)               \
    do {                                                        \
        if (!(condition)) {                                     \
            TEMPO_LOG_IF_ENABLED("Assertion failure: " message) \
            TEMPO_ABORT_IF_ENABLED(message)                     \
        }                                                       \
    } while (false)

/**
 * Asserts with false, entering the TEMPO_ASSERT procedure as a quick way to assert that a branch is invalid.
 * @param message The message to log, throw, abort with.
 */
#define TEMPO_ASSERT_FALSE(message) TEMPO_ASSERT(false, message)
