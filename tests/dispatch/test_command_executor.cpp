/*
 * test_command_executor.cpp - Tests for per-command retry execution
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../common/fake_bridge.hpp"
#include "device/device_connection_pool.hpp"
#include "device/device_registry.hpp"
#include "dispatch/command_executor.hpp"

using namespace helium;
using namespace helium::dispatch;
using namespace helium::test;
using namespace testing;
using namespace std::chrono_literals;

class CommandExecutorTest : public Test {
protected:
    void SetUp() override {
        mock_ = std::make_shared<NiceMock<MockBridgeTransport>>();
        retry_.initialDelayMs = 1;
        retry_.multiplier = 2.0;
        retry_.maxDelayMs = 4;
        executor_ = std::make_shared<CommandExecutor>(mock_, retry_);
    }

    static auto makeCommand(std::vector<std::string> argv, int retries,
                            std::optional<std::string> serial = std::nullopt)
        -> std::shared_ptr<const Command> {
        auto command = std::make_shared<Command>(std::move(argv), serial);
        command->retryCount = retries;
        return command;
    }

    std::shared_ptr<NiceMock<MockBridgeTransport>> mock_;
    config::RetryConfig retry_;
    std::shared_ptr<CommandExecutor> executor_;
};

// ========== Success ==========

TEST_F(CommandExecutorTest, Execute_SuccessOnFirstAttempt) {
    EXPECT_CALL(*mock_, run(ElementsAre("shell", "echo", "hi"), 30000ms))
        .WillOnce(Return(exitWith(0, "hi\n", "", 12ms)));

    auto result = executor_->execute(makeCommand({"shell", "echo", "hi"}, 3));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.returnCode, 0);
    EXPECT_EQ(result.stdOut, "hi\n");
    EXPECT_EQ(result.attemptCount, 1);
    EXPECT_EQ(result.executionTime, 12ms);
    ASSERT_NE(result.command, nullptr);
}

TEST_F(CommandExecutorTest, Execute_PrependsDeviceSelector) {
    EXPECT_CALL(*mock_, run(ElementsAre("-s", "emulator-5554", "shell", "ls"), _))
        .WillOnce(Return(exitWith(0)));

    auto result =
        executor_->execute(makeCommand({"shell", "ls"}, 1, "emulator-5554"));
    EXPECT_TRUE(result.success);
}

// ========== Retry ==========

TEST_F(CommandExecutorTest, Execute_ExhaustsRetryBudget) {
    EXPECT_CALL(*mock_, run(_, _))
        .Times(3)
        .WillRepeatedly(Return(exitWith(1, "", "error: device offline")));

    auto result = executor_->execute(makeCommand({"shell", "false"}, 3));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.attemptCount, 3);
    EXPECT_EQ(result.returnCode, 1);
    EXPECT_EQ(result.stdErr, "error: device offline");
}

TEST_F(CommandExecutorTest, Execute_SucceedsOnThirdAttempt) {
    EXPECT_CALL(*mock_, run(_, _))
        .WillOnce(Return(exitWith(1, "", "failed")))
        .WillOnce(Return(
            bridgeError(DispatchErrorCode::CommandTimeout, "timed out")))
        .WillOnce(Return(exitWith(0, "ok\n")));

    auto result = executor_->execute(
        makeCommand({"push", "a.txt", "/sdcard/a.txt"}, 3));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.attemptCount, 3);
    EXPECT_EQ(result.stdOut, "ok\n");
}

TEST_F(CommandExecutorTest, Execute_ZeroRetryCountStillRunsOnce) {
    EXPECT_CALL(*mock_, run(_, _)).WillOnce(Return(exitWith(2)));

    auto result = executor_->execute(makeCommand({"shell", "false"}, 0));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.attemptCount, 1);
}

TEST_F(CommandExecutorTest, Execute_TransportErrorBecomesFailedResult) {
    EXPECT_CALL(*mock_, run(_, _))
        .WillOnce(Return(bridgeError(DispatchErrorCode::TransportUnavailable,
                                     "Failed to execute bridge")));

    auto result = executor_->execute(makeCommand({"devices"}, 1));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.returnCode, -1);
    EXPECT_THAT(result.stdErr, HasSubstr("Failed to execute bridge"));
}

TEST_F(CommandExecutorTest, BackoffDelay_GrowsAndIsCapped) {
    config::RetryConfig retry;
    retry.initialDelayMs = 1000;
    retry.multiplier = 2.0;
    retry.maxDelayMs = 5000;
    CommandExecutor executor(mock_, retry);

    EXPECT_EQ(executor.backoffDelay(1), 1000ms);
    EXPECT_EQ(executor.backoffDelay(2), 2000ms);
    EXPECT_EQ(executor.backoffDelay(3), 4000ms);
    EXPECT_EQ(executor.backoffDelay(4), 5000ms);
}

// ========== Registry feedback ==========

TEST_F(CommandExecutorTest, Execute_RecordsOutcomeOnDevice) {
    auto pool = std::make_shared<device::ConnectionPool>(2);
    auto registry = std::make_shared<device::DeviceRegistry>(mock_, pool);
    registry->applyScan({device::DeviceListing{
                            "R58M123", device::DeviceState::Connected, {}}},
                        std::chrono::system_clock::now());

    CommandExecutor executor(mock_, retry_, registry, pool);
    EXPECT_CALL(*mock_, run(_, _)).WillOnce(Return(exitWith(1)));

    auto result = executor.execute(makeCommand({"shell", "false"}, 1, "R58M123"));
    EXPECT_FALSE(result.success);

    auto device = registry->find("R58M123");
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->failureCount, 1u);
    EXPECT_NEAR(device->connectionQuality, 0.9, 1e-9);
    EXPECT_EQ(pool->activeConnections("R58M123"), 0u);
}
