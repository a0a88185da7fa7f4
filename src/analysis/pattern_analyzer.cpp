/*
 * pattern_analyzer.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "pattern_analyzer.hpp"

#include <algorithm>
#include <mutex>

#include <spdlog/spdlog.h>

namespace helium::analysis {

PatternAnalyzer::PatternAnalyzer(
    config::AnalyzerConfig config,
    std::shared_ptr<const CommandNormalizer> normalizer)
    : config_(config), normalizer_(std::move(normalizer)) {
    if (!normalizer_) {
        normalizer_ = CommandNormalizer::withDefaultRules();
    }
}

auto PatternAnalyzer::signatureOf(const dispatch::Command& command) const
    -> std::string {
    return normalizer_->signature(command);
}

void PatternAnalyzer::record(const dispatch::Command& command,
                             std::chrono::duration<double> executionTime,
                             bool success) {
    auto signature = signatureOf(command);
    double seconds = executionTime.count();

    std::unique_lock lock(mutex_);
    auto [it, inserted] = patterns_.try_emplace(signature);
    auto& p = it->second;
    if (inserted) {
        p.pattern = signature;
    }

    p.frequency++;
    auto n = static_cast<double>(p.frequency);
    p.averageExecutionTime += (seconds - p.averageExecutionTime) / n;
    p.successRate += ((success ? 1.0 : 0.0) - p.successRate) / n;

    history_.push_back(ExecutionRecord{signature, seconds, success,
                                       std::chrono::system_clock::now()});
    while (history_.size() > config_.historyCapacity) {
        history_.pop_front();
    }
}

void PatternAnalyzer::record(const dispatch::CommandResult& result) {
    if (!result.command) {
        return;
    }
    record(*result.command, result.executionTime, result.success);
}

auto PatternAnalyzer::suggestions() -> std::vector<OptimizationSuggestion> {
    std::unique_lock lock(mutex_);

    std::vector<CommandPattern*> ranked;
    ranked.reserve(patterns_.size());
    for (auto& [signature, p] : patterns_) {
        ranked.push_back(&p);
    }
    std::sort(ranked.begin(), ranked.end(),
              [](const CommandPattern* a, const CommandPattern* b) {
                  if (a->frequency != b->frequency) {
                      return a->frequency > b->frequency;
                  }
                  return a->pattern < b->pattern;
              });
    if (ranked.size() > config_.topPatterns) {
        ranked.resize(config_.topPatterns);
    }

    std::vector<OptimizationSuggestion> result;
    for (auto* p : ranked) {
        if (p->frequency <= config_.minOccurrences) {
            continue;
        }

        if (p->averageExecutionTime > config_.slowCommandSeconds) {
            p->cacheTtl = std::min(300.0, p->averageExecutionTime * 10.0);
            OptimizationSuggestion s;
            s.type = SuggestionType::Caching;
            s.pattern = p->pattern;
            s.frequency = p->frequency;
            s.averageExecutionTime = p->averageExecutionTime;
            s.recommendedTtl = p->cacheTtl;
            result.push_back(std::move(s));
        }

        if (p->frequency > config_.highFrequency) {
            p->optimalBatchSize = static_cast<int>(std::min<uint64_t>(
                10, std::max<uint64_t>(2, p->frequency / 20)));
            OptimizationSuggestion s;
            s.type = SuggestionType::Batching;
            s.pattern = p->pattern;
            s.frequency = p->frequency;
            s.averageExecutionTime = p->averageExecutionTime;
            s.batchSize = p->optimalBatchSize;
            result.push_back(std::move(s));
        }
    }
    return result;
}

auto PatternAnalyzer::pattern(const std::string& signature) const
    -> std::optional<CommandPattern> {
    std::shared_lock lock(mutex_);
    auto it = patterns_.find(signature);
    if (it == patterns_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto PatternAnalyzer::patterns() const -> std::vector<CommandPattern> {
    std::shared_lock lock(mutex_);
    std::vector<CommandPattern> result;
    result.reserve(patterns_.size());
    for (const auto& [signature, p] : patterns_) {
        result.push_back(p);
    }
    return result;
}

auto PatternAnalyzer::recentExecutions() const
    -> std::vector<ExecutionRecord> {
    std::shared_lock lock(mutex_);
    return std::vector<ExecutionRecord>(history_.begin(), history_.end());
}

auto PatternAnalyzer::patternCount() const -> size_t {
    std::shared_lock lock(mutex_);
    return patterns_.size();
}

auto PatternAnalyzer::toJson() const -> json {
    std::shared_lock lock(mutex_);
    json j = json::object();
    for (const auto& [signature, p] : patterns_) {
        j[signature] = p.toJson();
    }
    return j;
}

auto PatternAnalyzer::loadJson(const json& j) -> size_t {
    if (!j.is_object()) {
        return 0;
    }

    std::unordered_map<std::string, CommandPattern> loaded;
    for (const auto& [signature, value] : j.items()) {
        auto p = CommandPattern::fromJson(value);
        if (p.pattern.empty()) {
            p.pattern = signature;
        }
        loaded.emplace(signature, std::move(p));
    }

    std::unique_lock lock(mutex_);
    patterns_ = std::move(loaded);
    spdlog::debug("Loaded {} command patterns", patterns_.size());
    return patterns_.size();
}

void PatternAnalyzer::clear() {
    std::unique_lock lock(mutex_);
    patterns_.clear();
    history_.clear();
}

}  // namespace helium::analysis
