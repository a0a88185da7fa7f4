/*
 * test_process_bridge.cpp - Tests for the fork/exec bridge transport
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "transport/process_bridge.hpp"

using namespace helium::transport;
using namespace helium::dispatch;
using namespace std::chrono_literals;

// ========== Invocation ==========

TEST(ProcessBridgeTest, Run_CapturesStdout) {
    ProcessBridge bridge("sh");
    auto output = bridge.run({"-c", "echo hello"}, 5000ms);
    ASSERT_TRUE(output.has_value()) << output.error().toString();
    EXPECT_EQ(output->exitCode, 0);
    EXPECT_TRUE(output->success());
    EXPECT_EQ(output->stdOut, "hello\n");
    EXPECT_TRUE(output->stdErr.empty());
}

TEST(ProcessBridgeTest, Run_CapturesStderrAndExitCode) {
    ProcessBridge bridge("sh");
    auto output = bridge.run({"-c", "echo oops >&2; exit 3"}, 5000ms);
    ASSERT_TRUE(output.has_value());
    EXPECT_EQ(output->exitCode, 3);
    EXPECT_FALSE(output->success());
    EXPECT_EQ(output->stdErr, "oops\n");
}

TEST(ProcessBridgeTest, Run_LargeOutputIsNotTruncated) {
    ProcessBridge bridge("sh");
    auto output = bridge.run({"-c", "seq 1 20000"}, 5000ms);
    ASSERT_TRUE(output.has_value());
    EXPECT_EQ(output->exitCode, 0);
    EXPECT_EQ(output->stdOut.substr(0, 2), "1\n");
    EXPECT_NE(output->stdOut.find("\n20000\n"), std::string::npos);
}

TEST(ProcessBridgeTest, Run_TimeoutKillsProcess) {
    ProcessBridge bridge("sh");
    auto start = std::chrono::steady_clock::now();
    auto output = bridge.run({"-c", "sleep 5"}, 100ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(output.has_value());
    EXPECT_EQ(output.error().code, DispatchErrorCode::CommandTimeout);
    EXPECT_LT(elapsed, 3s);
}

TEST(ProcessBridgeTest, Run_ClosedStreamsStillTimeOut) {
    ProcessBridge bridge("sh");
    auto start = std::chrono::steady_clock::now();
    auto output = bridge.run({"-c", "exec >&- 2>&-; sleep 3"}, 300ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(output.has_value());
    EXPECT_EQ(output.error().code, DispatchErrorCode::CommandTimeout);
    EXPECT_LT(elapsed, 2s);
}

TEST(ProcessBridgeTest, Run_MissingExecutableIsTransportUnavailable) {
    ProcessBridge bridge("/nonexistent/helium-bridge");
    auto output = bridge.run({"devices"}, 1000ms);
    ASSERT_FALSE(output.has_value());
    EXPECT_EQ(output.error().code, DispatchErrorCode::TransportUnavailable);
}

// ========== Probe ==========

TEST(ProcessBridgeTest, Probe_ReturnsFirstLine) {
    ProcessBridge bridge("echo");
    auto version = bridge.probe(1000ms);
    ASSERT_TRUE(version.has_value());
    EXPECT_EQ(*version, "version");
}

TEST(ProcessBridgeTest, Probe_NonZeroExitIsTransportUnavailable) {
    ProcessBridge bridge("false");
    auto version = bridge.probe(1000ms);
    ASSERT_FALSE(version.has_value());
    EXPECT_EQ(version.error().code, DispatchErrorCode::TransportUnavailable);
}

// ========== Arguments ==========

TEST(BridgeArgumentsTest, SelectorPrecedesArguments) {
    Command command({"shell", "getprop", "ro.serialno"}, "emulator-5554");
    EXPECT_EQ(bridgeArguments(command),
              (std::vector<std::string>{"-s", "emulator-5554", "shell",
                                        "getprop", "ro.serialno"}));
}

TEST(BridgeArgumentsTest, NoSerialMeansNoSelector) {
    Command command({"devices", "-l"});
    EXPECT_EQ(bridgeArguments(command),
              (std::vector<std::string>{"devices", "-l"}));
}

// ========== Location ==========

TEST(LocateBridgeTest, AbsolutePath) {
    helium::config::TransportConfig config;
    config.bridgePath = "/bin/sh";
    config.searchPaths.clear();
    EXPECT_EQ(locateBridge(config), "/bin/sh");
}

TEST(LocateBridgeTest, FallsBackToSearchPaths) {
    helium::config::TransportConfig config;
    config.bridgePath = "/nonexistent/adb";
    config.searchPaths = {"/nonexistent/other", "/bin/sh"};
    EXPECT_EQ(locateBridge(config), "/bin/sh");
}

TEST(LocateBridgeTest, NameIsSearchedOnPath) {
    helium::config::TransportConfig config;
    config.bridgePath = "sh";
    config.searchPaths.clear();
    auto found = locateBridge(config);
    ASSERT_TRUE(found.has_value());
    EXPECT_NE(found->find("sh"), std::string::npos);
}

TEST(LocateBridgeTest, NothingFound) {
    helium::config::TransportConfig config;
    config.bridgePath = "helium-no-such-bridge";
    config.searchPaths = {"/nonexistent/adb"};
    EXPECT_FALSE(locateBridge(config).has_value());
}
