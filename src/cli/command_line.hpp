/*
 * command_line.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-01

Description: Command line options of the helium tool

**************************************************/

#ifndef HELIUM_CLI_COMMAND_LINE_HPP
#define HELIUM_CLI_COMMAND_LINE_HPP

#include <optional>
#include <string>
#include <vector>

#include "dispatch/common/dispatch_result.hpp"

namespace helium::cli {

/**
 * @brief Parsed invocation of `helium`
 *
 * Everything after a `--` separator is passed through untouched, so bridge
 * arguments may start with a dash.
 */
struct CommandLine {
    std::optional<std::string> configPath;
    std::optional<std::string> serial;
    std::string command;
    std::vector<std::string> arguments;  ///< Operand, then the tail after `--`
    bool showHelp{false};
};

/**
 * @brief Parse argv, including the program name at index 0
 * @return InvalidArgument on malformed options or a missing command
 */
auto parseCommandLine(const std::vector<std::string>& argv)
    -> dispatch::DispatchResult<CommandLine>;

/// Usage text printed for --help and on errors
auto usage() -> std::string;

}  // namespace helium::cli

#endif  // HELIUM_CLI_COMMAND_LINE_HPP
