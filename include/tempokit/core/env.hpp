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
#include <optional>
#include <string>

namespace tempo {

/**
 * Gets the value of an environment variable.
 * @param name The name of the variable to retrieve. Pointer must be non-null and \0 terminated.
 * @return The environment variable value, or an empty optional if the variable was not found.
 */
inline std::optional<std::string> get_env(const char* name) {
    if (auto* value = std::getenv(name)) {
        return value;
    }
    return {};
}

}  // namespace tempo
