/*
 * test_pattern_analyzer.cpp - Tests for command pattern statistics
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "analysis/pattern_analyzer.hpp"

using namespace helium;
using namespace helium::analysis;
using namespace helium::dispatch;
using namespace std::chrono_literals;

class PatternAnalyzerTest : public ::testing::Test {
protected:
    void recordMany(PatternAnalyzer& analyzer, const Command& command,
                    int count, std::chrono::duration<double> duration,
                    bool success = true) {
        for (int i = 0; i < count; ++i) {
            analyzer.record(command, duration, success);
        }
    }

    config::AnalyzerConfig config_;
};

// ========== Recording ==========

TEST_F(PatternAnalyzerTest, Record_GroupsBySignature) {
    PatternAnalyzer analyzer(config_);
    analyzer.record(Command({"shell", "kill", "12345"}), 100ms, true);
    analyzer.record(Command({"shell", "kill", "99999"}), 300ms, false);

    EXPECT_EQ(analyzer.patternCount(), 1u);
    auto pattern = analyzer.pattern("shell:shell kill NUMBER");
    ASSERT_TRUE(pattern.has_value());
    EXPECT_EQ(pattern->frequency, 2u);
    EXPECT_NEAR(pattern->averageExecutionTime, 0.2, 1e-9);
    EXPECT_NEAR(pattern->successRate, 0.5, 1e-9);
}

TEST_F(PatternAnalyzerTest, Record_FromResultUsesCommand) {
    PatternAnalyzer analyzer(config_);
    CommandResult result;
    result.command = std::make_shared<const Command>(
        std::vector<std::string>{"shell", "getprop", "ro.serialno"});
    result.executionTime = 40ms;
    result.success = true;
    analyzer.record(result);

    auto pattern = analyzer.pattern(analyzer.signatureOf(*result.command));
    ASSERT_TRUE(pattern.has_value());
    EXPECT_NEAR(pattern->averageExecutionTime, 0.04, 1e-9);
}

TEST_F(PatternAnalyzerTest, History_IsBounded) {
    config_.historyCapacity = 5;
    PatternAnalyzer analyzer(config_);
    recordMany(analyzer, Command({"shell", "ls"}), 12, 10ms);

    EXPECT_EQ(analyzer.recentExecutions().size(), 5u);
    EXPECT_EQ(analyzer.pattern("shell:shell ls")->frequency, 12u);
}

// ========== Suggestions ==========

TEST_F(PatternAnalyzerTest, Suggestions_RequireMoreThanMinOccurrences) {
    PatternAnalyzer analyzer(config_);
    recordMany(analyzer, Command({"shell", "dumpsys", "battery"}), 10, 2s);
    EXPECT_TRUE(analyzer.suggestions().empty());

    analyzer.record(Command({"shell", "dumpsys", "battery"}), 2s, true);
    EXPECT_FALSE(analyzer.suggestions().empty());
}

TEST_F(PatternAnalyzerTest, Suggestions_CachingForSlowPatterns) {
    PatternAnalyzer analyzer(config_);
    recordMany(analyzer, Command({"shell", "dumpsys", "battery"}), 20, 2s);

    auto suggestions = analyzer.suggestions();
    ASSERT_EQ(suggestions.size(), 1u);
    EXPECT_EQ(suggestions[0].type, SuggestionType::Caching);
    EXPECT_NEAR(suggestions[0].recommendedTtl, 20.0, 1e-9);
    EXPECT_NEAR(analyzer.pattern("shell:shell dumpsys battery")->cacheTtl,
                20.0, 1e-9);
}

TEST_F(PatternAnalyzerTest, Suggestions_CachingTtlIsCapped) {
    PatternAnalyzer analyzer(config_);
    recordMany(analyzer, Command({"shell", "bugreport"}), 11, 60s);

    auto suggestions = analyzer.suggestions();
    ASSERT_EQ(suggestions.size(), 1u);
    EXPECT_DOUBLE_EQ(suggestions[0].recommendedTtl, 300.0);
}

TEST_F(PatternAnalyzerTest, Suggestions_BatchingForFrequentPatterns) {
    PatternAnalyzer analyzer(config_);
    recordMany(analyzer, Command({"shell", "getprop", "ro.serialno"}), 120,
               10ms);

    auto suggestions = analyzer.suggestions();
    ASSERT_EQ(suggestions.size(), 1u);
    EXPECT_EQ(suggestions[0].type, SuggestionType::Batching);
    EXPECT_EQ(suggestions[0].batchSize, 6);
    EXPECT_EQ(suggestions[0].toJson()["type"], "batching");
}

TEST_F(PatternAnalyzerTest, Suggestions_BatchSizeIsClamped) {
    PatternAnalyzer analyzer(config_);
    recordMany(analyzer, Command({"shell", "ls"}), 51, 10ms);
    recordMany(analyzer, Command({"shell", "ps"}), 400, 10ms);

    auto suggestions = analyzer.suggestions();
    ASSERT_EQ(suggestions.size(), 2u);
    // Ranked by frequency
    EXPECT_EQ(suggestions[0].pattern, "shell:shell ps");
    EXPECT_EQ(suggestions[0].batchSize, 10);
    EXPECT_EQ(suggestions[1].batchSize, 2);
}

TEST_F(PatternAnalyzerTest, Suggestions_OnlyTopPatterns) {
    config_.topPatterns = 1;
    PatternAnalyzer analyzer(config_);
    recordMany(analyzer, Command({"shell", "dumpsys", "battery"}), 30, 2s);
    recordMany(analyzer, Command({"shell", "dumpsys", "wifi"}), 20, 2s);

    auto suggestions = analyzer.suggestions();
    ASSERT_EQ(suggestions.size(), 1u);
    EXPECT_EQ(suggestions[0].pattern, "shell:shell dumpsys battery");
}

// ========== Persistence ==========

TEST_F(PatternAnalyzerTest, Json_PreservesPatterns) {
    PatternAnalyzer analyzer(config_);
    recordMany(analyzer, Command({"shell", "ls"}), 3, 100ms);
    auto saved = analyzer.toJson();
    ASSERT_TRUE(saved.contains("shell:shell ls"));
    EXPECT_EQ(saved["shell:shell ls"]["frequency"], 3);

    PatternAnalyzer restored(config_);
    EXPECT_EQ(restored.loadJson(saved), 1u);
    auto pattern = restored.pattern("shell:shell ls");
    ASSERT_TRUE(pattern.has_value());
    EXPECT_EQ(pattern->frequency, 3u);
    EXPECT_NEAR(pattern->averageExecutionTime, 0.1, 1e-9);
}

TEST_F(PatternAnalyzerTest, LoadJson_RejectsNonObject) {
    PatternAnalyzer analyzer(config_);
    analyzer.record(Command({"shell", "ls"}), 10ms, true);
    EXPECT_EQ(analyzer.loadJson(json::array()), 0u);
    EXPECT_EQ(analyzer.patternCount(), 1u);
}

TEST_F(PatternAnalyzerTest, Clear_RemovesEverything) {
    PatternAnalyzer analyzer(config_);
    analyzer.record(Command({"shell", "ls"}), 10ms, true);
    analyzer.clear();
    EXPECT_EQ(analyzer.patternCount(), 0u);
    EXPECT_TRUE(analyzer.recentExecutions().empty());
}
