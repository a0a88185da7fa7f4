/*
 * test_command_normalizer.cpp - Tests for command signature normalization
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "analysis/command_normalizer.hpp"

using namespace helium::analysis;
using namespace helium::dispatch;

class CommandNormalizerTest : public ::testing::Test {
protected:
    void SetUp() override { normalizer_ = CommandNormalizer::withDefaultRules(); }

    std::shared_ptr<CommandNormalizer> normalizer_;
};

TEST_F(CommandNormalizerTest, DefaultRules_AreInstalled) {
    EXPECT_EQ(normalizer_->ruleCount(), 6u);
}

TEST_F(CommandNormalizerTest, Normalize_AppDataPath) {
    EXPECT_EQ(normalizer_->normalize("ls /data/data/com.example.app/files"),
              "ls /data/data/APP/files");
}

TEST_F(CommandNormalizerTest, Normalize_SdcardPath) {
    EXPECT_EQ(normalizer_->normalize("cat /sdcard/photo.jpg"),
              "cat /sdcard/FILE");
}

TEST_F(CommandNormalizerTest, Normalize_PathStopsAtWhitespace) {
    EXPECT_EQ(normalizer_->normalize("cp /sdcard/a.txt /sdcard/b.txt"),
              "cp /sdcard/FILE /sdcard/FILE");
}

TEST_F(CommandNormalizerTest, Normalize_IpAddress) {
    EXPECT_EQ(normalizer_->normalize("ping -c 1 192.168.1.20"),
              "ping -c 1 IP_ADDRESS");
}

TEST_F(CommandNormalizerTest, Normalize_LongNumbersOnly) {
    EXPECT_EQ(normalizer_->normalize("kill 12345"), "kill NUMBER");
    EXPECT_EQ(normalizer_->normalize("sleep 5"), "sleep 5");
}

TEST_F(CommandNormalizerTest, Normalize_QuotedStrings) {
    EXPECT_EQ(normalizer_->normalize(R"(input text "hello world")"),
              "input text STRING");
    EXPECT_EQ(normalizer_->normalize("echo 'a b c'"), "echo STRING");
}

TEST_F(CommandNormalizerTest, Signature_IncludesKind) {
    Command a({"shell", "kill", "12345"});
    Command b({"shell", "kill", "67890"});
    EXPECT_EQ(normalizer_->signature(a), "shell:shell kill NUMBER");
    EXPECT_EQ(normalizer_->signature(a), normalizer_->signature(b));

    Command pushed({"push", "/tmp/x", "/sdcard/x"}, std::nullopt,
                   CommandKind::Push);
    EXPECT_EQ(normalizer_->signature(pushed), "push:push /tmp/x /sdcard/FILE");
}

TEST_F(CommandNormalizerTest, AddRule_AppliesCustomRule) {
    CommandNormalizer normalizer;
    normalizer.addRule(
        std::make_unique<RegexRule>("package", R"(com\.[a-z.]+)", "PKG"));
    EXPECT_EQ(normalizer.ruleCount(), 1u);
    EXPECT_EQ(normalizer.normalize("am force-stop com.example.app"),
              "am force-stop PKG");
}
