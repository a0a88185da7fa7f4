/*
 * bridge_transport.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-01

Description: Abstract invocation seam for the device bridge executable

**************************************************/

#ifndef HELIUM_TRANSPORT_BRIDGE_TRANSPORT_HPP
#define HELIUM_TRANSPORT_BRIDGE_TRANSPORT_HPP

#include <chrono>
#include <string>
#include <vector>

#include "dispatch/command.hpp"
#include "dispatch/common/dispatch_result.hpp"

namespace helium::transport {

/**
 * @brief Captured output of one bridge invocation
 */
struct ProcessOutput {
    int exitCode{-1};
    std::string stdOut;
    std::string stdErr;
    std::chrono::milliseconds duration{0};

    [[nodiscard]] auto success() const noexcept -> bool {
        return exitCode == 0;
    }
};

/**
 * @brief Runs the bridge executable
 *
 * run() reports a spawn failure as TransportUnavailable and an expired
 * deadline as CommandTimeout. A process that ran to completion is a value,
 * whatever its exit code.
 */
class BridgeTransport {
public:
    virtual ~BridgeTransport() = default;

    [[nodiscard]] virtual auto run(const std::vector<std::string>& args,
                                   std::chrono::milliseconds timeout)
        -> dispatch::DispatchResult<ProcessOutput> = 0;

    /**
     * @brief Invoke `version` and return its first output line
     */
    [[nodiscard]] virtual auto probe(std::chrono::milliseconds timeout)
        -> dispatch::DispatchResult<std::string>;

    [[nodiscard]] virtual auto executable() const -> std::string = 0;
};

/**
 * @brief Full bridge argument list for a command, device selector first
 */
[[nodiscard]] auto bridgeArguments(const dispatch::Command& command)
    -> std::vector<std::string>;

}  // namespace helium::transport

#endif  // HELIUM_TRANSPORT_BRIDGE_TRANSPORT_HPP
