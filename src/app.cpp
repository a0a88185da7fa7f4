#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "cli/command_line.hpp"
#include "config/engine_config.hpp"
#include "dispatch/command.hpp"
#include "dispatch/common/dispatch_result.hpp"
#include "engine.hpp"
#include "logging/logging.hpp"

using json = nlohmann::json;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;

auto resultToJson(const helium::dispatch::CommandResult& result) -> json {
    json j = {{"success", result.success},
              {"return_code", result.returnCode},
              {"stdout", result.stdOut},
              {"stderr", result.stdErr},
              {"execution_time", result.executionSeconds()},
              {"attempt_count", result.attemptCount}};
    if (result.command) {
        j["command"] = result.command->argv;
        j["device"] = result.command->deviceKey();
    }
    return j;
}

void printJson(const json& j) { std::cout << j.dump(2) << std::endl; }

auto runDevices(helium::Engine& engine) -> int {
    auto scanned = engine.registry()->scan();
    if (!scanned) {
        std::cerr << scanned.error().toString() << "\n";
        return EXIT_FAILED;
    }
    json devices = json::array();
    for (const auto& device : engine.registry()->snapshot()) {
        devices.push_back(device.toJson());
    }
    printJson(devices);
    return EXIT_OK;
}

auto runCommand(helium::Engine& engine, const helium::cli::CommandLine& line)
    -> int {
    const auto& serial = line.serial;
    const auto& bridgeArgs = line.arguments;
    if (bridgeArgs.empty()) {
        std::cerr << "run: no bridge arguments given\n";
        return EXIT_FAILED;
    }

    if (serial) {
        // Populate the registry so the device gets its profile adjustments.
        if (auto scanned = engine.registry()->scan(); !scanned) {
            spdlog::warn("Device scan failed: {}", scanned.error().message);
        }
    }

    helium::dispatch::Command command(
        bridgeArgs, serial,
        helium::dispatch::commandKindFromString(bridgeArgs.front()));
    command.timeout = std::chrono::milliseconds(
        engine.engineConfig().transport.defaultTimeoutMs);

    auto result = engine.commandCoordinator()->execute(std::move(command));
    if (!result) {
        std::cerr << result.error().toString() << "\n";
        return EXIT_FAILED;
    }
    printJson(resultToJson(*result));
    return result->success ? EXIT_OK : EXIT_FAILED;
}

auto runProfile(helium::Engine& engine, const helium::cli::CommandLine& line)
    -> int {
    if (auto scanned = engine.registry()->scan(); !scanned) {
        std::cerr << scanned.error().toString() << "\n";
        return EXIT_FAILED;
    }
    auto serial = line.arguments.empty()
                      ? line.serial
                      : std::optional<std::string>(line.arguments.front());
    if (serial) {
        auto profile = engine.deviceProfiler()->profile(*serial);
        if (!profile) {
            std::cerr << profile.error().toString() << "\n";
            return EXIT_FAILED;
        }
        printJson(profile->toJson());
        return EXIT_OK;
    }

    json profiles = json::array();
    for (const auto& profile : engine.profileAllDevices()) {
        profiles.push_back(profile.toJson());
    }
    printJson(profiles);
    return EXIT_OK;
}

auto runPersistence(helium::Engine& engine, const std::string& command,
                    const std::vector<std::string>& args) -> int {
    if (args.empty()) {
        std::cerr << command << ": missing FILE\n";
        return EXIT_FAILED;
    }
    auto coordinator = engine.commandCoordinator();
    helium::dispatch::throwIfError(
        command == "save" ? coordinator->saveOptimizationData(args.front())
                          : coordinator->loadOptimizationData(args.front()));
    printJson({{"status", "ok"}, {"action", command}, {"file", args.front()}});
    return EXIT_OK;
}

auto dispatchCommand(helium::Engine& engine,
                     const helium::cli::CommandLine& line) -> int {
    const auto& command = line.command;
    if (command == "devices") {
        return runDevices(engine);
    }
    if (command == "run") {
        return runCommand(engine, line);
    }
    if (command == "profile") {
        return runProfile(engine, line);
    }
    if (command == "report") {
        printJson(engine.commandCoordinator()->performanceReport());
        return EXIT_OK;
    }
    if (command == "health") {
        auto report = engine.commandCoordinator()->healthCheck(
            std::chrono::milliseconds(
                engine.engineConfig().transport.probeTimeoutMs));
        printJson(report.toJson());
        return report.status == helium::coordinator::HealthStatus::Critical
                   ? EXIT_FAILED
                   : EXIT_OK;
    }
    if (command == "save" || command == "load") {
        return runPersistence(engine, command, line.arguments);
    }
    std::cerr << "Unknown command: " << command << "\n"
              << helium::cli::usage();
    return EXIT_FAILED;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv, argv + argc);
    auto options = helium::cli::parseCommandLine(args);
    if (!options) {
        std::cerr << options.error().message << "\n" << helium::cli::usage();
        return EXIT_FAILED;
    }
    if (options->showHelp) {
        std::cout << helium::cli::usage();
        return EXIT_OK;
    }

    helium::config::EngineConfig config;
    if (options->configPath) {
        auto loaded = helium::config::loadConfig(*options->configPath);
        if (!loaded) {
            std::cerr << "Failed to load configuration: "
                      << loaded.error().toString() << "\n";
            return EXIT_FAILED;
        }
        config = std::move(*loaded);
    }
    helium::logging::initialize(config.logging);

    int code = EXIT_FAILED;
    try {
        helium::Engine engine(config);
        if (auto started = engine.start(); !started) {
            spdlog::warn("{}", started.error().message);
        }
        code = dispatchCommand(engine, *options);
        engine.stop();
    } catch (const helium::dispatch::DispatchException& e) {
        spdlog::error("{}", e.error().toString());
        std::cerr << e.error().toString() << "\n";
        code = EXIT_FAILED;
    } catch (const std::exception& e) {
        spdlog::critical("Unhandled exception: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        code = EXIT_FAILED;
    }

    helium::logging::shutdown();
    return code;
}
