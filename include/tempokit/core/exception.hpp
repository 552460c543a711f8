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

#include <exception>
#include <string>

#define TEMPO_THROW_EXCEPTION(msg) throw tempo::Exception(msg, __FILE__, __LINE__, TEMPO_FUNCTION)

namespace tempo {

/**
 * Exception type for unrecoverable programming errors. Recoverable conditions are reported through tl::expected.
 */
class Exception: public std::exception {
  public:
    explicit
    Exception(const char* msg, const char* file = nullptr, const int line = -1, const char* function_name = nullptr) :
        error_(msg), file_(file), line_(line), function_name_(function_name) {}

    explicit
    Exception(std::string msg, const char* file = nullptr, const int line = -1, const char* function_name = nullptr) :
        error_(std::move(msg)), file_(file), line_(line), function_name_(function_name) {}

    /**
     * @returns The error message.
     */
    [[nodiscard]] const char* what() const noexcept override {
        return error_.c_str();
    }

    /**
     * @return The file where the exception was thrown, or nullptr if unknown.
     */
    [[nodiscard]] const char* file() const {
        return file_;
    }

    /**
     * @return The line number where the exception was thrown, or -1 if unknown.
     */
    [[nodiscard]] int line() const {
        return line_;
    }

    /**
     * @return The name of the function which threw the exception, or nullptr if unknown.
     */
    [[nodiscard]] const char* function_name() const {
        return function_name_;
    }

  private:
    std::string error_;
    const char* file_ {};
    int line_ {};
    const char* function_name_ {};
};

}  // namespace tempo
