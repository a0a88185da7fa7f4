/*
 * dispatch_error.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-01

Description: Error codes and structures for command dispatch

**************************************************/

#ifndef HELIUM_DISPATCH_COMMON_DISPATCH_ERROR_HPP
#define HELIUM_DISPATCH_COMMON_DISPATCH_ERROR_HPP

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace helium::dispatch {

/**
 * @brief Error codes surfaced by the dispatch engine
 */
enum class DispatchErrorCode {
    Unknown = 0,

    // Submission errors
    QueueFull = 10,
    NotRunning = 11,
    UnknownCommand = 12,
    InvalidArgument = 13,

    // Execution errors
    CommandTimeout = 100,
    CommandFailed = 101,
    TransportUnavailable = 102,

    // Lookup errors
    DeviceNotFound = 200,

    // Persistence errors
    IoError = 300
};

[[nodiscard]] inline auto dispatchErrorCodeToString(DispatchErrorCode code)
    -> std::string {
    switch (code) {
        case DispatchErrorCode::Unknown:
            return "Unknown";
        case DispatchErrorCode::QueueFull:
            return "QueueFull";
        case DispatchErrorCode::NotRunning:
            return "NotRunning";
        case DispatchErrorCode::UnknownCommand:
            return "UnknownCommand";
        case DispatchErrorCode::InvalidArgument:
            return "InvalidArgument";
        case DispatchErrorCode::CommandTimeout:
            return "CommandTimeout";
        case DispatchErrorCode::CommandFailed:
            return "CommandFailed";
        case DispatchErrorCode::TransportUnavailable:
            return "TransportUnavailable";
        case DispatchErrorCode::DeviceNotFound:
            return "DeviceNotFound";
        case DispatchErrorCode::IoError:
            return "IoError";
        default:
            return "Unknown(" + std::to_string(static_cast<int>(code)) + ")";
    }
}

/**
 * @brief Check if a per-attempt error is worth another attempt
 */
[[nodiscard]] inline auto isRetryable(DispatchErrorCode code) -> bool {
    switch (code) {
        case DispatchErrorCode::CommandTimeout:
        case DispatchErrorCode::CommandFailed:
        case DispatchErrorCode::TransportUnavailable:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Dispatch error with context
 */
struct DispatchError {
    DispatchErrorCode code{DispatchErrorCode::Unknown};
    std::string message;
    std::optional<std::string> deviceSerial;
    std::chrono::system_clock::time_point timestamp{
        std::chrono::system_clock::now()};

    DispatchError() = default;

    explicit DispatchError(DispatchErrorCode errorCode,
                           std::string errorMessage = "")
        : code(errorCode), message(std::move(errorMessage)) {}

    DispatchError(DispatchErrorCode errorCode, std::string errorMessage,
                  std::string serial)
        : code(errorCode),
          message(std::move(errorMessage)),
          deviceSerial(std::move(serial)) {}

    [[nodiscard]] auto toString() const -> std::string {
        std::string result =
            "[" + dispatchErrorCodeToString(code) + "] " + message;
        if (deviceSerial) {
            result += " (device: " + *deviceSerial + ")";
        }
        return result;
    }

    [[nodiscard]] auto toJson() const -> nlohmann::json {
        nlohmann::json j;
        j["code"] = static_cast<int>(code);
        j["codeName"] = dispatchErrorCodeToString(code);
        j["message"] = message;
        if (deviceSerial) {
            j["deviceSerial"] = *deviceSerial;
        }
        j["timestamp"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                             timestamp.time_since_epoch())
                             .count();
        return j;
    }

    [[nodiscard]] auto isRetryable() const -> bool {
        return helium::dispatch::isRetryable(code);
    }
};

}  // namespace helium::dispatch

#endif  // HELIUM_DISPATCH_COMMON_DISPATCH_ERROR_HPP
