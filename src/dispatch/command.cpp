/*
 * command.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "command.hpp"

namespace helium::dispatch {

auto commandKindToString(CommandKind kind) -> std::string {
    switch (kind) {
        case CommandKind::Shell:
            return "shell";
        case CommandKind::Push:
            return "push";
        case CommandKind::Pull:
            return "pull";
        case CommandKind::Install:
            return "install";
        case CommandKind::Uninstall:
            return "uninstall";
        case CommandKind::Screenshot:
            return "screenshot";
        case CommandKind::Input:
            return "input";
        case CommandKind::Property:
            return "property";
        case CommandKind::Other:
            return "other";
    }
    return "other";
}

auto commandKindFromString(const std::string& str) -> CommandKind {
    if (str == "shell") return CommandKind::Shell;
    if (str == "push") return CommandKind::Push;
    if (str == "pull") return CommandKind::Pull;
    if (str == "install") return CommandKind::Install;
    if (str == "uninstall") return CommandKind::Uninstall;
    if (str == "screenshot") return CommandKind::Screenshot;
    if (str == "input") return CommandKind::Input;
    if (str == "property") return CommandKind::Property;
    return CommandKind::Other;
}

auto Command::joined() const -> std::string {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) {
            out += ' ';
        }
        out += arg;
    }
    return out;
}

auto Command::deviceKey() const -> std::string {
    return deviceSerial.value_or("default");
}

auto makeFailedResult(std::shared_ptr<const Command> command,
                      std::string reason, int attempts,
                      std::chrono::milliseconds elapsed) -> CommandResult {
    CommandResult result;
    result.command = std::move(command);
    result.returnCode = -1;
    result.stdErr = std::move(reason);
    result.executionTime = elapsed;
    result.success = false;
    result.attemptCount = attempts;
    return result;
}

}  // namespace helium::dispatch
