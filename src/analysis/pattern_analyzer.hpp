/*
 * pattern_analyzer.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-01

Description: Execution statistics per normalized command signature

**************************************************/

#ifndef HELIUM_ANALYSIS_PATTERN_ANALYZER_HPP
#define HELIUM_ANALYSIS_PATTERN_ANALYZER_HPP

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "command_normalizer.hpp"
#include "config/engine_config.hpp"
#include "dispatch/command.hpp"

namespace helium::analysis {

using json = nlohmann::json;

/**
 * @brief Running statistics of one command signature
 */
struct CommandPattern {
    std::string pattern;
    uint64_t frequency{0};
    double averageExecutionTime{0.0};  ///< Seconds
    double successRate{1.0};
    int optimalBatchSize{1};
    double cacheTtl{0.0};  ///< Seconds, 0 when caching is not suggested

    [[nodiscard]] auto toJson() const -> json {
        return {{"pattern", pattern},
                {"frequency", frequency},
                {"average_execution_time", averageExecutionTime},
                {"success_rate", successRate},
                {"optimal_batch_size", optimalBatchSize},
                {"cache_ttl", cacheTtl}};
    }

    [[nodiscard]] static auto fromJson(const json& j) -> CommandPattern {
        CommandPattern p;
        p.pattern = j.value("pattern", p.pattern);
        p.frequency = j.value("frequency", p.frequency);
        p.averageExecutionTime =
            j.value("average_execution_time", p.averageExecutionTime);
        p.successRate = j.value("success_rate", p.successRate);
        p.optimalBatchSize = j.value("optimal_batch_size", p.optimalBatchSize);
        p.cacheTtl = j.value("cache_ttl", p.cacheTtl);
        return p;
    }
};

/**
 * @brief Entry of the bounded recent-execution history
 */
struct ExecutionRecord {
    std::string signature;
    double executionTime{0.0};
    bool success{false};
    std::chrono::system_clock::time_point timestamp;
};

enum class SuggestionType { Caching, Batching };

struct OptimizationSuggestion {
    SuggestionType type{SuggestionType::Caching};
    std::string pattern;
    uint64_t frequency{0};
    double averageExecutionTime{0.0};
    double recommendedTtl{0.0};  ///< Caching only
    int batchSize{0};            ///< Batching only

    [[nodiscard]] auto toJson() const -> json {
        json j = {{"type", type == SuggestionType::Caching ? "caching"
                                                           : "batching"},
                  {"pattern", pattern},
                  {"frequency", frequency},
                  {"average_execution_time", averageExecutionTime}};
        if (type == SuggestionType::Caching) {
            j["recommended_ttl"] = recommendedTtl;
        } else {
            j["batch_size"] = batchSize;
        }
        return j;
    }
};

/**
 * @brief Accumulates per-signature frequency, latency and success rate
 *
 * Averages are updated incrementally; only the last historyCapacity
 * executions are retained.
 */
class PatternAnalyzer {
public:
    explicit PatternAnalyzer(
        config::AnalyzerConfig config = {},
        std::shared_ptr<const CommandNormalizer> normalizer =
            CommandNormalizer::withDefaultRules());

    void record(const dispatch::Command& command,
                std::chrono::duration<double> executionTime, bool success);
    void record(const dispatch::CommandResult& result);

    /**
     * @brief Caching and batching suggestions for the most frequent patterns
     *
     * Also stores the recommended TTL and batch size on each pattern.
     */
    auto suggestions() -> std::vector<OptimizationSuggestion>;

    [[nodiscard]] auto signatureOf(const dispatch::Command& command) const
        -> std::string;
    [[nodiscard]] auto pattern(const std::string& signature) const
        -> std::optional<CommandPattern>;
    [[nodiscard]] auto patterns() const -> std::vector<CommandPattern>;
    [[nodiscard]] auto recentExecutions() const -> std::vector<ExecutionRecord>;
    [[nodiscard]] auto patternCount() const -> size_t;

    /// Patterns keyed by signature
    [[nodiscard]] auto toJson() const -> json;

    /**
     * @brief Replace patterns with the ones in @p j
     * @return Number of patterns loaded
     */
    auto loadJson(const json& j) -> size_t;

    void clear();

private:
    config::AnalyzerConfig config_;
    std::shared_ptr<const CommandNormalizer> normalizer_;

    std::unordered_map<std::string, CommandPattern> patterns_;
    std::deque<ExecutionRecord> history_;
    mutable std::shared_mutex mutex_;
};

}  // namespace helium::analysis

#endif  // HELIUM_ANALYSIS_PATTERN_ANALYZER_HPP
