/*
 * process_bridge.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-01

Description: Bridge transport backed by fork/exec of a local executable

**************************************************/

#ifndef HELIUM_TRANSPORT_PROCESS_BRIDGE_HPP
#define HELIUM_TRANSPORT_PROCESS_BRIDGE_HPP

#include <optional>
#include <string>

#include "bridge_transport.hpp"
#include "config/engine_config.hpp"

namespace helium::transport {

/**
 * @brief Spawns the bridge as a child process in its own process group
 *
 * Stdout and stderr are captured through pipes. When the deadline passes
 * the whole process group receives SIGKILL and the child is reaped before
 * run() returns.
 */
class ProcessBridge : public BridgeTransport {
public:
    explicit ProcessBridge(std::string executable);

    ProcessBridge(const ProcessBridge&) = delete;
    ProcessBridge& operator=(const ProcessBridge&) = delete;

    [[nodiscard]] auto run(const std::vector<std::string>& args,
                           std::chrono::milliseconds timeout)
        -> dispatch::DispatchResult<ProcessOutput> override;

    [[nodiscard]] auto executable() const -> std::string override {
        return executable_;
    }

private:
    std::string executable_;
};

/**
 * @brief Resolve the bridge executable
 *
 * Tries the configured path (searched on PATH when it has no slash), then
 * each of the configured search paths with a leading "~" expanded to $HOME.
 */
[[nodiscard]] auto locateBridge(const config::TransportConfig& config)
    -> std::optional<std::string>;

}  // namespace helium::transport

#endif  // HELIUM_TRANSPORT_PROCESS_BRIDGE_HPP
