/*
 * engine_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "engine_config.hpp"

#include <fstream>

#include <spdlog/spdlog.h>

#include "yaml_parser.hpp"

namespace helium::config {

using dispatch::DispatchErrorCode;

auto EngineConfig::toJson() const -> json {
    return {{"transport", transport.toJson()},
            {"workerPool", workerPool.toJson()},
            {"scanner", scanner.toJson()},
            {"cache", cache.toJson()},
            {"analyzer", analyzer.toJson()},
            {"profiler", profiler.toJson()},
            {"coordinator", coordinator.toJson()},
            {"logging", logging.toJson()}};
}

auto EngineConfig::fromJson(const json& j) -> EngineConfig {
    EngineConfig cfg;
    if (!j.is_object()) {
        return cfg;
    }
    if (j.contains("transport")) {
        cfg.transport = TransportConfig::fromJson(j["transport"]);
    }
    if (j.contains("workerPool")) {
        cfg.workerPool = WorkerPoolConfig::fromJson(j["workerPool"]);
    }
    if (j.contains("scanner")) {
        cfg.scanner = ScannerConfig::fromJson(j["scanner"]);
    }
    if (j.contains("cache")) {
        cfg.cache = CacheConfig::fromJson(j["cache"]);
    }
    if (j.contains("analyzer")) {
        cfg.analyzer = AnalyzerConfig::fromJson(j["analyzer"]);
    }
    if (j.contains("profiler")) {
        cfg.profiler = ProfilerConfig::fromJson(j["profiler"]);
    }
    if (j.contains("coordinator")) {
        cfg.coordinator = CoordinatorConfig::fromJson(j["coordinator"]);
    }
    if (j.contains("logging")) {
        cfg.logging = LoggingConfig::fromJson(j["logging"]);
    }
    return cfg;
}

auto loadConfig(const std::filesystem::path& path)
    -> dispatch::DispatchResult<EngineConfig> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return dispatch::failure<EngineConfig>(
            DispatchErrorCode::IoError,
            "Config file not found: " + path.string());
    }

    auto ext = path.extension().string();
    json root;

    if (ext == ".yaml" || ext == ".yml") {
        auto parsed = YamlParser::parseFile(path);
        if (!parsed) {
            return dispatch::failure<EngineConfig>(
                DispatchErrorCode::InvalidArgument, YamlParser::lastError());
        }
        root = std::move(*parsed);
    } else {
        std::ifstream file(path);
        if (!file.is_open()) {
            return dispatch::failure<EngineConfig>(
                DispatchErrorCode::IoError,
                "Cannot open config file: " + path.string());
        }
        try {
            file >> root;
        } catch (const json::parse_error& e) {
            return dispatch::failure<EngineConfig>(
                DispatchErrorCode::InvalidArgument,
                std::string("Invalid JSON config: ") + e.what());
        }
    }

    try {
        auto cfg = EngineConfig::fromJson(root);
        spdlog::info("Loaded engine configuration from {}", path.string());
        return cfg;
    } catch (const json::exception& e) {
        return dispatch::failure<EngineConfig>(
            DispatchErrorCode::InvalidArgument,
            std::string("Invalid config value: ") + e.what());
    }
}

}  // namespace helium::config
