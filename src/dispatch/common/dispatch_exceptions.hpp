/*
 * dispatch_exceptions.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef HELIUM_DISPATCH_COMMON_DISPATCH_EXCEPTIONS_HPP
#define HELIUM_DISPATCH_COMMON_DISPATCH_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

#include "dispatch_error.hpp"

namespace helium::dispatch {

/**
 * @brief Exception form of DispatchError for callers that prefer throwing
 */
class DispatchException : public std::runtime_error {
public:
    explicit DispatchException(const std::string& message,
                               DispatchErrorCode code = DispatchErrorCode::Unknown)
        : std::runtime_error(message), error_(code, message) {}

    explicit DispatchException(const DispatchError& error)
        : std::runtime_error(error.toString()), error_(error) {}

    [[nodiscard]] auto error() const noexcept -> const DispatchError& {
        return error_;
    }

    [[nodiscard]] auto code() const noexcept -> DispatchErrorCode {
        return error_.code;
    }

private:
    DispatchError error_;
};

}  // namespace helium::dispatch

#endif  // HELIUM_DISPATCH_COMMON_DISPATCH_EXCEPTIONS_HPP
