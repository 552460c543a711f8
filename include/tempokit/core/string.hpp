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

#include <cctype>
#include <string>
#include <string_view>

namespace tempo {

/**
 * Compares two strings case-insensitively.
 * @param lhs Left hand side string.
 * @param rhs Right hand side string.
 * @return True if both strings are equal ignoring case.
 */
inline bool string_compare_case_insensitive(const std::string_view lhs, const std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }

    for (size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) != std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }

    return true;
}

/**
 * Removes leading and trailing whitespace (spaces, tabs, carriage returns and newlines).
 * @param string The string to trim.
 * @return A view into the trimmed part of the string.
 */
inline std::string_view string_trim(std::string_view string) {
    constexpr std::string_view k_whitespace = " \t\r\n";
    const auto begin = string.find_first_not_of(k_whitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = string.find_last_not_of(k_whitespace);
    return string.substr(begin, end - begin + 1);
}

}  // namespace tempo
