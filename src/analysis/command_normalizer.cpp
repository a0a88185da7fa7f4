/*
 * command_normalizer.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "command_normalizer.hpp"

namespace helium::analysis {

RegexRule::RegexRule(std::string name, const std::string& pattern,
                     std::string replacement)
    : name_(std::move(name)),
      pattern_(pattern, std::regex::ECMAScript | std::regex::optimize),
      replacement_(std::move(replacement)) {}

auto RegexRule::apply(const std::string& text) const -> std::string {
    return std::regex_replace(text, pattern_, replacement_);
}

auto CommandNormalizer::withDefaultRules()
    -> std::shared_ptr<CommandNormalizer> {
    auto normalizer = std::make_shared<CommandNormalizer>();
    normalizer->addRule(std::make_unique<RegexRule>(
        "app_data", R"(/data/data/[^/\s]+)", "/data/data/APP"));
    normalizer->addRule(std::make_unique<RegexRule>(
        "sdcard", R"(/sdcard/[^/\s]+)", "/sdcard/FILE"));
    normalizer->addRule(std::make_unique<RegexRule>(
        "ipv4", R"(\b\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}\b)", "IP_ADDRESS"));
    normalizer->addRule(
        std::make_unique<RegexRule>("number", R"(\d{4,})", "NUMBER"));
    normalizer->addRule(std::make_unique<RegexRule>(
        "double_quoted", R"("[^"]*")", "STRING"));
    normalizer->addRule(std::make_unique<RegexRule>(
        "single_quoted", R"('[^']*')", "STRING"));
    return normalizer;
}

void CommandNormalizer::addRule(std::unique_ptr<NormalizationRule> rule) {
    if (rule) {
        rules_.push_back(std::move(rule));
    }
}

auto CommandNormalizer::normalize(const std::string& text) const
    -> std::string {
    std::string result = text;
    for (const auto& rule : rules_) {
        result = rule->apply(result);
    }
    return result;
}

auto CommandNormalizer::signature(const dispatch::Command& command) const
    -> std::string {
    return dispatch::commandKindToString(command.kind) + ":" +
           normalize(command.joined());
}

}  // namespace helium::analysis
