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

#include "platform.hpp"
#include "env.hpp"
#include "string.hpp"

#include <atomic>
#include <cstdlib>

#ifndef TEMPO_ENABLE_SPDLOG
    #define TEMPO_ENABLE_SPDLOG 0
#endif

#if TEMPO_ENABLE_SPDLOG

    #define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE

    #include <spdlog/spdlog.h>

    #ifndef TEMPO_TRACE
        #define TEMPO_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
    #endif

    #ifndef TEMPO_DEBUG
        #define TEMPO_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
    #endif

    #ifndef TEMPO_CRITICAL
        #define TEMPO_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)
    #endif

    #ifndef TEMPO_ERROR
        #define TEMPO_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
    #endif

    #ifndef TEMPO_WARNING
        #define TEMPO_WARNING(...) SPDLOG_WARN(__VA_ARGS__)
    #endif

    #ifndef TEMPO_INFO
        #define TEMPO_INFO(...) SPDLOG_INFO(__VA_ARGS__)
    #endif

#else

    #include <fmt/format.h>

namespace tempo {
enum class LogLevel { off, critical, error, warning, info, debug, trace };

inline std::atomic log_level = LogLevel::info;
}  // namespace tempo

    #ifndef TEMPO_TRACE
        #define TEMPO_TRACE(...)                                            \
            if (tempo::log_level.load() >= tempo::LogLevel::trace) {        \
                fmt::println("[T] " __VA_ARGS__);                           \
            }
    #endif

    #ifndef TEMPO_DEBUG
        #define TEMPO_DEBUG(...)                                            \
            if (tempo::log_level.load() >= tempo::LogLevel::debug) {        \
                fmt::println("[D] " __VA_ARGS__);                           \
            }
    #endif

    #ifndef TEMPO_CRITICAL
        #define TEMPO_CRITICAL(...)                                         \
            if (tempo::log_level.load() >= tempo::LogLevel::critical) {     \
                fmt::println("[C] " __VA_ARGS__);                           \
            }
    #endif

    #ifndef TEMPO_ERROR
        #define TEMPO_ERROR(...)                                            \
            if (tempo::log_level.load() >= tempo::LogLevel::error) {        \
                fmt::println("[E] " __VA_ARGS__);                           \
            }
    #endif

    #ifndef TEMPO_WARNING
        #define TEMPO_WARNING(...)                                          \
            if (tempo::log_level.load() >= tempo::LogLevel::warning) {      \
                fmt::println("[W] " __VA_ARGS__);                           \
            }
    #endif

    #ifndef TEMPO_INFO
        #define TEMPO_INFO(...)                                             \
            if (tempo::log_level.load() >= tempo::LogLevel::info) {         \
                fmt::println("[I] " __VA_ARGS__);                           \
            }
    #endif

#endif

namespace tempo {

/**
 * Sets the log level for the application based on the given string.
 * The following are valid values:
 *  - TRACE
 *  - DEBUG
 *  - INFO (default)
 *  - WARN
 *  - ERROR
 *  - CRITICAL
 *  - OFF
 * @param level The log level as string, case-insensitive.
 * @return True if the level was recognized, false if the level fell back to INFO.
 */
inline bool set_log_level(const char* level) {
#if TEMPO_ENABLE_SPDLOG
    if (string_compare_case_insensitive(level, "TRACE")) {
        spdlog::set_level(spdlog::level::trace);
    } else if (string_compare_case_insensitive(level, "DEBUG")) {
        spdlog::set_level(spdlog::level::debug);
    } else if (string_compare_case_insensitive(level, "INFO")) {
        spdlog::set_level(spdlog::level::info);
    } else if (string_compare_case_insensitive(level, "WARN")) {
        spdlog::set_level(spdlog::level::warn);
    } else if (string_compare_case_insensitive(level, "ERROR")) {
        spdlog::set_level(spdlog::level::err);
    } else if (string_compare_case_insensitive(level, "CRITICAL")) {
        spdlog::set_level(spdlog::level::critical);
    } else if (string_compare_case_insensitive(level, "OFF")) {
        spdlog::set_level(spdlog::level::off);
    } else {
        spdlog::set_level(spdlog::level::info);
        SPDLOG_WARN("Invalid log level: {}. Setting log level to info.", level);
        return false;
    }
#else
    if (string_compare_case_insensitive(level, "TRACE")) {
        log_level = LogLevel::trace;
    } else if (string_compare_case_insensitive(level, "DEBUG")) {
        log_level = LogLevel::debug;
    } else if (string_compare_case_insensitive(level, "INFO")) {
        log_level = LogLevel::info;
    } else if (string_compare_case_insensitive(level, "WARN")) {
        log_level = LogLevel::warning;
    } else if (string_compare_case_insensitive(level, "ERROR")) {
        log_level = LogLevel::error;
    } else if (string_compare_case_insensitive(level, "CRITICAL")) {
        log_level = LogLevel::critical;
    } else if (string_compare_case_insensitive(level, "OFF")) {
        log_level = LogLevel::off;
    } else {
        fmt::println("Invalid log level: {}. Setting log level to info.", level);
        log_level = LogLevel::info;
        return false;
    }
#endif
    return true;
}

/**
 * Tries to find given environment variable and set the log level accordingly. See set_log_level for valid values.
 * By default the log level is set to INFO.
 * @param env_var The environment variable to read the log level from.
 */
inline void set_log_level_from_env(const char* env_var = "TEMPO_LOG_LEVEL") {
    if (const auto env_value = get_env(env_var)) {
        set_log_level(env_value->c_str());
    } else {
        set_log_level("INFO");
    }
}

}  // namespace tempo
