/*
 * dispatch_result.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-01

Description: Dispatch operation result types using std::expected

**************************************************/

#ifndef HELIUM_DISPATCH_COMMON_DISPATCH_RESULT_HPP
#define HELIUM_DISPATCH_COMMON_DISPATCH_RESULT_HPP

#include <expected>
#include <type_traits>

#include "dispatch_error.hpp"
#include "dispatch_exceptions.hpp"

namespace helium::dispatch {

/**
 * @brief Result type for engine operations
 *
 * Holds either the value or the DispatchError explaining why the operation
 * was rejected.
 */
template <typename T>
using DispatchResult = std::expected<T, DispatchError>;

using DispatchVoidResult = DispatchResult<void>;

template <typename T>
[[nodiscard]] inline auto success(T&& value)
    -> DispatchResult<std::decay_t<T>> {
    return DispatchResult<std::decay_t<T>>(std::forward<T>(value));
}

[[nodiscard]] inline auto success() -> DispatchVoidResult {
    return DispatchVoidResult();
}

template <typename T>
[[nodiscard]] inline auto failure(const DispatchError& error)
    -> DispatchResult<T> {
    return std::unexpected(error);
}

template <typename T>
[[nodiscard]] inline auto failure(DispatchErrorCode code,
                                  const std::string& message)
    -> DispatchResult<T> {
    return std::unexpected(DispatchError(code, message));
}

[[nodiscard]] inline auto failure(DispatchErrorCode code,
                                  const std::string& message)
    -> DispatchVoidResult {
    return std::unexpected(DispatchError(code, message));
}

template <typename T>
auto throwIfError(DispatchResult<T>&& result) -> T {
    if (!result) {
        throw DispatchException(result.error());
    }
    return std::move(*result);
}

inline void throwIfError(DispatchVoidResult&& result) {
    if (!result) {
        throw DispatchException(result.error());
    }
}

}  // namespace helium::dispatch

#endif  // HELIUM_DISPATCH_COMMON_DISPATCH_RESULT_HPP
