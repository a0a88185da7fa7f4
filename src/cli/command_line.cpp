/*
 * command_line.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "command_line.hpp"

#include <algorithm>

#include "atom/utils/argsview.hpp"

using namespace std::string_literals;

namespace helium::cli {

using dispatch::DispatchErrorCode;

auto parseCommandLine(const std::vector<std::string>& argv)
    -> dispatch::DispatchResult<CommandLine> {
    auto separator = std::find(argv.begin(), argv.end(), "--"s);
    std::vector<std::string> options(argv.begin(), separator);

    atom::utils::ArgumentParser program("helium"s);
    program.addArgument("config", atom::utils::ArgumentParser::ArgType::STRING,
                        false, ""s, "Path to a JSON or YAML config file",
                        {"c"});
    program.addArgument("serial", atom::utils::ArgumentParser::ArgType::STRING,
                        false, ""s, "Target device serial", {"s"});
    program.addArgument("help", atom::utils::ArgumentParser::ArgType::BOOLEAN,
                        false, false, "Show usage", {"h"});
    program.addArgument("command", atom::utils::ArgumentParser::ArgType::STRING,
                        false, ""s, "devices, run, profile, report, health, "
                        "save or load", {}, true);
    program.addArgument("operand", atom::utils::ArgumentParser::ArgType::STRING,
                        false, ""s, "Device serial or data file", {}, true);
    program.addDescription("helium device command dispatcher:");
    program.addEpilog("Bridge arguments for run follow a -- separator.");

    try {
        program.parse(static_cast<int>(options.size()), options);
    } catch (const std::exception& e) {
        return dispatch::failure<CommandLine>(DispatchErrorCode::InvalidArgument,
                                              e.what());
    }

    CommandLine line;
    line.showHelp = program.get<bool>("help").value_or(false);
    if (auto config = program.get<std::string>("config");
        config && !config->empty()) {
        line.configPath = *config;
    }
    if (auto serial = program.get<std::string>("serial");
        serial && !serial->empty()) {
        line.serial = *serial;
    }
    line.command = program.get<std::string>("command").value_or("");
    if (auto operand = program.get<std::string>("operand");
        operand && !operand->empty()) {
        line.arguments.push_back(*operand);
    }
    if (separator != argv.end()) {
        line.arguments.insert(line.arguments.end(), std::next(separator),
                              argv.end());
    }

    if (line.command.empty() && !line.showHelp) {
        return dispatch::failure<CommandLine>(DispatchErrorCode::InvalidArgument,
                                              "No command given");
    }
    return line;
}

auto usage() -> std::string {
    return "Usage: helium [-c FILE] [-s SERIAL] <command> [OPERAND] "
           "[-- ARGS...]\n"
           "\n"
           "Commands:\n"
           "  devices                 scan and list known devices\n"
           "  run [-s SERIAL] -- ARGS execute one bridge command\n"
           "  profile [SERIAL]        profile one or every connected device\n"
           "  report                  print the performance report\n"
           "  health                  print the health check\n"
           "  save FILE               write optimization data\n"
           "  load FILE               read optimization data\n";
}

}  // namespace helium::cli
