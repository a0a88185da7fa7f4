/*
 * test_command_line.cpp - Tests for helium command line parsing
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "cli/command_line.hpp"

using namespace helium::cli;
using namespace helium::dispatch;

// ========== Options ==========

TEST(CommandLineTest, Parse_ConfigAndCommand) {
    auto line = parseCommandLine({"helium", "--config", "helium.yaml", "devices"});
    ASSERT_TRUE(line.has_value()) << line.error().toString();
    ASSERT_TRUE(line->configPath.has_value());
    EXPECT_EQ(*line->configPath, "helium.yaml");
    EXPECT_EQ(line->command, "devices");
    EXPECT_FALSE(line->serial.has_value());
    EXPECT_TRUE(line->arguments.empty());
}

TEST(CommandLineTest, Parse_ShortConfigAlias) {
    auto line = parseCommandLine({"helium", "-c", "helium.json", "report"});
    ASSERT_TRUE(line.has_value()) << line.error().toString();
    EXPECT_EQ(line->configPath.value_or(""), "helium.json");
    EXPECT_EQ(line->command, "report");
}

TEST(CommandLineTest, Parse_OperandBecomesFirstArgument) {
    auto line = parseCommandLine({"helium", "save", "optimization.json"});
    ASSERT_TRUE(line.has_value()) << line.error().toString();
    EXPECT_EQ(line->command, "save");
    EXPECT_EQ(line->arguments, (std::vector<std::string>{"optimization.json"}));
}

// ========== Bridge arguments ==========

TEST(CommandLineTest, Parse_RunPassesTailThroughUntouched) {
    auto line = parseCommandLine({"helium", "run", "-s", "emulator-5554", "--",
                                  "shell", "ls", "-l", "-s", "/sdcard"});
    ASSERT_TRUE(line.has_value()) << line.error().toString();
    EXPECT_EQ(line->command, "run");
    EXPECT_EQ(line->serial.value_or(""), "emulator-5554");
    EXPECT_EQ(line->arguments, (std::vector<std::string>{
                                   "shell", "ls", "-l", "-s", "/sdcard"}));
}

TEST(CommandLineTest, Parse_SerialBeforeCommand) {
    auto line = parseCommandLine(
        {"helium", "-s", "R58M123ABC", "run", "--", "shell", "getprop"});
    ASSERT_TRUE(line.has_value()) << line.error().toString();
    EXPECT_EQ(line->serial.value_or(""), "R58M123ABC");
    EXPECT_EQ(line->arguments,
              (std::vector<std::string>{"shell", "getprop"}));
}

// ========== Errors ==========

TEST(CommandLineTest, Parse_MissingCommandIsInvalidArgument) {
    auto line = parseCommandLine({"helium"});
    ASSERT_FALSE(line.has_value());
    EXPECT_EQ(line.error().code, DispatchErrorCode::InvalidArgument);
}

TEST(CommandLineTest, Usage_ListsEveryCommand) {
    auto text = usage();
    for (const auto* command :
         {"devices", "run", "profile", "report", "health", "save", "load"}) {
        EXPECT_NE(text.find(command), std::string::npos) << command;
    }
}
