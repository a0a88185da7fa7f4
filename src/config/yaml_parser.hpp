/*
 * yaml_parser.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-01

Description: YAML front-end for the JSON based engine configuration

**************************************************/

#ifndef HELIUM_CONFIG_YAML_PARSER_HPP
#define HELIUM_CONFIG_YAML_PARSER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace helium::config {

using json = nlohmann::json;

/**
 * @brief Converts YAML documents into the JSON tree the config sections read
 *
 * Plain scalars are typed through yaml-cpp's own converters: booleans,
 * integers and floats are recognised, everything else stays a string. Quoted
 * scalars are always strings.
 */
class YamlParser {
public:
    [[nodiscard]] static auto parse(std::string_view content,
                                    size_t maxDepth = 100)
        -> std::optional<json>;

    [[nodiscard]] static auto parseFile(const std::filesystem::path& path,
                                        size_t maxDepth = 100)
        -> std::optional<json>;

    /// Error message of the last failed parse on this thread
    [[nodiscard]] static auto lastError() -> const std::string&;

private:
    static thread_local std::string lastError_;
};

}  // namespace helium::config

#endif  // HELIUM_CONFIG_YAML_PARSER_HPP
