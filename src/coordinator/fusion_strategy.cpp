/*
 * fusion_strategy.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "fusion_strategy.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_map>

namespace helium::coordinator {

namespace {

auto splitWhitespace(const std::vector<std::string>& argv)
    -> std::vector<std::string> {
    std::vector<std::string> tokens;
    for (const auto& arg : argv) {
        std::istringstream stream(arg);
        std::string token;
        while (stream >> token) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

auto isPropertyKey(const std::string& key) -> bool {
    return !key.empty() &&
           std::all_of(key.begin(), key.end(), [](unsigned char c) {
               return std::isalnum(c) || c == '.' || c == '_' || c == '-';
           });
}

/// Parses `[key]: [value]` lines
auto parseListing(const std::string& text)
    -> std::unordered_map<std::string, std::string> {
    std::unordered_map<std::string, std::string> props;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.size() < 7 || line.front() != '[') {
            continue;
        }
        auto keyEnd = line.find("]: [");
        if (keyEnd == std::string::npos || line.back() != ']') {
            continue;
        }
        auto key = line.substr(1, keyEnd - 1);
        auto valueStart = keyEnd + 4;
        props[key] = line.substr(valueStart, line.size() - valueStart - 1);
    }
    return props;
}

}  // namespace

auto PropertyFusion::propertyKey(const dispatch::Command& command)
    -> std::optional<std::string> {
    if (command.kind != dispatch::CommandKind::Shell &&
        command.kind != dispatch::CommandKind::Property) {
        return std::nullopt;
    }
    auto tokens = splitWhitespace(command.argv);
    if (tokens.size() != 3 || tokens[0] != "shell" || tokens[1] != "getprop" ||
        !isPropertyKey(tokens[2])) {
        return std::nullopt;
    }
    return tokens[2];
}

auto PropertyFusion::canFuse(const dispatch::Command& command) const -> bool {
    return propertyKey(command).has_value();
}

auto PropertyFusion::fuse(
    const std::vector<std::shared_ptr<const dispatch::Command>>& commands) const
    -> dispatch::Command {
    dispatch::Command fused({"shell", "getprop"},
                            commands.empty() ? std::nullopt
                                             : commands.front()->deviceSerial,
                            dispatch::CommandKind::Shell);
    for (size_t i = 0; i < commands.size(); ++i) {
        const auto& cmd = *commands[i];
        if (i == 0) {
            fused.timeout = cmd.timeout;
            fused.retryCount = cmd.retryCount;
            fused.priority = cmd.priority;
            continue;
        }
        fused.timeout = std::max(fused.timeout, cmd.timeout);
        fused.retryCount = std::max(fused.retryCount, cmd.retryCount);
        fused.priority = std::min(fused.priority, cmd.priority);
    }
    return fused;
}

auto PropertyFusion::split(
    const dispatch::CommandResult& fused,
    const std::vector<std::shared_ptr<const dispatch::Command>>& commands) const
    -> std::vector<std::optional<dispatch::CommandResult>> {
    std::vector<std::optional<dispatch::CommandResult>> results(
        commands.size());
    if (!fused.success) {
        return results;
    }

    auto props = parseListing(fused.stdOut);
    for (size_t i = 0; i < commands.size(); ++i) {
        auto key = propertyKey(*commands[i]);
        if (!key) {
            continue;
        }
        auto it = props.find(*key);
        if (it == props.end()) {
            continue;
        }
        dispatch::CommandResult result;
        result.command = commands[i];
        result.returnCode = 0;
        result.stdOut = it->second + "\n";
        result.executionTime = fused.executionTime;
        result.success = true;
        result.attemptCount = fused.attemptCount;
        results[i] = std::move(result);
    }
    return results;
}

}  // namespace helium::coordinator
