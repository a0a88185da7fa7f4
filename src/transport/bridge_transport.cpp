/*
 * bridge_transport.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "bridge_transport.hpp"

namespace helium::transport {

using dispatch::DispatchErrorCode;

auto BridgeTransport::probe(std::chrono::milliseconds timeout)
    -> dispatch::DispatchResult<std::string> {
    auto output = run({"version"}, timeout);
    if (!output) {
        return std::unexpected(output.error());
    }
    if (!output->success()) {
        return dispatch::failure<std::string>(
            DispatchErrorCode::TransportUnavailable,
            "Bridge version check exited with code " +
                std::to_string(output->exitCode));
    }
    auto firstLine = output->stdOut.substr(0, output->stdOut.find('\n'));
    return firstLine;
}

auto bridgeArguments(const dispatch::Command& command)
    -> std::vector<std::string> {
    std::vector<std::string> args;
    args.reserve(command.argv.size() + 2);
    if (command.deviceSerial) {
        args.emplace_back("-s");
        args.push_back(*command.deviceSerial);
    }
    args.insert(args.end(), command.argv.begin(), command.argv.end());
    return args;
}

}  // namespace helium::transport
