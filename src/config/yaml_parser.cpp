/*
 * yaml_parser.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "yaml_parser.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace helium::config {

thread_local std::string YamlParser::lastError_;

namespace {

// Non-specific tag yaml-cpp gives quoted scalars
constexpr const char* QUOTED_TAG = "!";

auto typedScalar(const YAML::Node& node) -> json {
    if (node.Tag() == QUOTED_TAG) {
        return node.Scalar();
    }
    if (bool flag = false; YAML::convert<bool>::decode(node, flag)) {
        return flag;
    }
    if (long long integer = 0; YAML::convert<long long>::decode(node, integer)) {
        return integer;
    }
    if (double real = 0.0; YAML::convert<double>::decode(node, real)) {
        return real;
    }
    return node.Scalar();
}

class TreeBuilder {
public:
    explicit TreeBuilder(size_t maxDepth) : maxDepth_(maxDepth) {}

    auto build(const YAML::Node& node, size_t depth = 0) const -> json {
        if (depth > maxDepth_) {
            throw std::runtime_error("nesting deeper than " +
                                     std::to_string(maxDepth_) + " levels");
        }

        if (node.IsScalar()) {
            return typedScalar(node);
        }
        if (node.IsSequence()) {
            json items = json::array();
            for (const auto& item : node) {
                items.push_back(build(item, depth + 1));
            }
            return items;
        }
        if (node.IsMap()) {
            json section = json::object();
            for (const auto& entry : node) {
                section[entry.first.Scalar()] = build(entry.second, depth + 1);
            }
            return section;
        }
        return nullptr;
    }

private:
    size_t maxDepth_;
};

template <typename Loader>
auto convertDocument(Loader&& load, size_t maxDepth,
                     const std::string& source, std::string& error)
    -> std::optional<json> {
    error.clear();
    try {
        return TreeBuilder(maxDepth).build(load());
    } catch (const YAML::Exception& e) {
        error = "YAML parse error: " + std::string(e.what());
    } catch (const std::runtime_error& e) {
        error = "YAML conversion error: " + std::string(e.what());
    }
    spdlog::error("YamlParser: {} ({})", error, source);
    return std::nullopt;
}

}  // namespace

auto YamlParser::parse(std::string_view content, size_t maxDepth)
    -> std::optional<json> {
    return convertDocument([&] { return YAML::Load(std::string(content)); },
                           maxDepth, "inline document", lastError_);
}

auto YamlParser::parseFile(const std::filesystem::path& path, size_t maxDepth)
    -> std::optional<json> {
    return convertDocument([&] { return YAML::LoadFile(path.string()); },
                           maxDepth, path.string(), lastError_);
}

auto YamlParser::lastError() -> const std::string& { return lastError_; }

}  // namespace helium::config
