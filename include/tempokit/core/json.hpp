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

#include "expected.hpp"

#include <boost/json.hpp>
#include <boost/json/value_to.hpp>    // Don't remove or suffer the errors
#include <boost/json/value_from.hpp>  // Don't remove or suffer the errors

#include <string>
#include <string_view>

namespace tempo {

/**
 * Parses given string as json and converts it to T using the tag_invoke converters of T.
 * @tparam T The type to convert to.
 * @param json_str The json text.
 * @return The converted value, or a description of the parse or conversion failure.
 */
template<typename T>
tl::expected<T, std::string> parse_json(const std::string_view json_str) {
    boost::system::error_code ec;
    const auto jv = boost::json::parse(json_str, ec);
    if (ec) {
        return tl::unexpected(ec.message());
    }
    try {
        return boost::json::value_to<T>(jv);
    } catch (const std::exception& e) {
        return tl::unexpected(std::string(e.what()));
    }
}

/**
 * Serializes given value to a compact json string using the tag_invoke converters of T.
 * @param value The value to serialize.
 * @return The json text.
 */
template<typename T>
std::string to_json_string(const T& value) {
    return boost::json::serialize(boost::json::value_from(value));
}

}  // namespace tempo
