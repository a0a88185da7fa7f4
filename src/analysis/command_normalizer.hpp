/*
 * command_normalizer.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-01

Description: Ordered rewrite rules turning commands into pattern signatures

**************************************************/

#ifndef HELIUM_ANALYSIS_COMMAND_NORMALIZER_HPP
#define HELIUM_ANALYSIS_COMMAND_NORMALIZER_HPP

#include <memory>
#include <regex>
#include <string>
#include <vector>

#include "dispatch/command.hpp"

namespace helium::analysis {

/**
 * @brief One rewrite step applied to the joined argv
 */
class NormalizationRule {
public:
    virtual ~NormalizationRule() = default;

    [[nodiscard]] virtual auto apply(const std::string& text) const
        -> std::string = 0;
    [[nodiscard]] virtual auto name() const -> std::string = 0;
};

/**
 * @brief Replaces every match of a regular expression with a placeholder
 */
class RegexRule : public NormalizationRule {
public:
    RegexRule(std::string name, const std::string& pattern,
              std::string replacement);

    [[nodiscard]] auto apply(const std::string& text) const
        -> std::string override;
    [[nodiscard]] auto name() const -> std::string override { return name_; }

private:
    std::string name_;
    std::regex pattern_;
    std::string replacement_;
};

/**
 * @brief Applies rules in insertion order
 *
 * The default set collapses app data paths, sdcard paths, IPv4 addresses,
 * numbers of four or more digits and quoted literals.
 */
class CommandNormalizer {
public:
    CommandNormalizer() = default;

    [[nodiscard]] static auto withDefaultRules()
        -> std::shared_ptr<CommandNormalizer>;

    void addRule(std::unique_ptr<NormalizationRule> rule);

    [[nodiscard]] auto normalize(const std::string& text) const -> std::string;

    /// "<kind>:<normalized argv>"
    [[nodiscard]] auto signature(const dispatch::Command& command) const
        -> std::string;

    [[nodiscard]] auto ruleCount() const -> size_t { return rules_.size(); }

private:
    std::vector<std::unique_ptr<NormalizationRule>> rules_;
};

}  // namespace helium::analysis

#endif  // HELIUM_ANALYSIS_COMMAND_NORMALIZER_HPP
