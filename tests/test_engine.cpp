/*
 * test_engine.cpp - Tests for engine wiring and lifecycle
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "common/fake_bridge.hpp"
#include "engine.hpp"

using namespace helium;
using namespace helium::test;
using namespace std::chrono_literals;

namespace {

const std::string LISTING =
    "List of devices attached\n"
    "emulator-5554          device product:sdk model:Pixel_7\n"
    "emulator-5556          device product:sdk model:Pixel_8\n";

auto deviceHandler(const std::vector<std::string>& args) -> BridgeOutcome {
    auto cmd = commandPart(args);
    if (cmd == std::vector<std::string>{"version"}) {
        return exitWith(0, "Android Debug Bridge version 1.0.41\nVersion 34\n");
    }
    if (cmd == std::vector<std::string>{"devices", "-l"}) {
        return exitWith(0, LISTING);
    }
    if (cmd.size() == 3 && cmd[1] == "getprop") {
        return exitWith(0, "Pixel 7\n");
    }
    return exitWith(0, "test\n");
}

}  // namespace

class EngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.workerPool.workerCount = 2;
        config_.workerPool.retry.initialDelayMs = 1;
        config_.scanner.intervalMs = 60000;
        config_.cache.sweepIntervalMs = 60000;
        config_.profiler.burstSize = 2;
        config_.profiler.latencySamples = 1;
        config_.profiler.concurrencyLevels = {1, 2};
        config_.profiler.commandsPerWorker = 1;
        config_.profiler.loadArgs = {"shell", "true"};
    }

    void TearDown() override {
        if (engine_) {
            engine_->stop();
        }
    }

    void makeEngine(ScriptedBridge::Handler handler) {
        bridge_ = std::make_shared<ScriptedBridge>(std::move(handler));
        engine_ = std::make_unique<Engine>(config_, bridge_);
    }

    config::EngineConfig config_;
    std::shared_ptr<ScriptedBridge> bridge_;
    std::unique_ptr<Engine> engine_;
};

// ========== Lifecycle ==========

TEST_F(EngineTest, Construct_DoesNotStart) {
    makeEngine(deviceHandler);
    EXPECT_FALSE(engine_->isRunning());
    EXPECT_FALSE(engine_->workerPool()->isRunning());
    EXPECT_EQ(bridge_->callCount(), 0u);
}

TEST_F(EngineTest, Start_ProbesBridgeAndStartsComponents) {
    makeEngine(deviceHandler);
    auto started = engine_->start();
    ASSERT_TRUE(started.has_value()) << started.error().toString();
    EXPECT_TRUE(engine_->isRunning());
    EXPECT_TRUE(engine_->workerPool()->isRunning());
    EXPECT_TRUE(engine_->registry()->isRunning());
    EXPECT_EQ(bridge_->countStartingWith({"version"}), 1u);

    engine_->stop();
    EXPECT_FALSE(engine_->isRunning());
    EXPECT_FALSE(engine_->workerPool()->isRunning());
    EXPECT_FALSE(engine_->registry()->isRunning());
}

TEST_F(EngineTest, Start_UnavailableBridgeStillRuns) {
    makeEngine([](const std::vector<std::string>&) {
        return bridgeError(dispatch::DispatchErrorCode::TransportUnavailable,
                           "not found");
    });
    auto started = engine_->start();
    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().code,
              dispatch::DispatchErrorCode::TransportUnavailable);
    EXPECT_TRUE(engine_->isRunning());

    // Commands complete as failed results rather than errors
    auto result = engine_->commandCoordinator()->execute(
        dispatch::Command({"shell", "echo", "x"}));
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->success);
}

TEST_F(EngineTest, Start_Twice_ProbesOnce) {
    makeEngine(deviceHandler);
    ASSERT_TRUE(engine_->start().has_value());
    ASSERT_TRUE(engine_->start().has_value());
    EXPECT_EQ(bridge_->countStartingWith({"version"}), 1u);
}

TEST_F(EngineTest, Start_AfterStopAcceptsCommands) {
    makeEngine(deviceHandler);
    ASSERT_TRUE(engine_->start().has_value());
    engine_->stop();
    ASSERT_TRUE(engine_->start().has_value());
    EXPECT_TRUE(engine_->workerPool()->isRunning());
    EXPECT_TRUE(engine_->registry()->isRunning());

    auto result = engine_->commandCoordinator()->execute(
        dispatch::Command({"shell", "echo", "x"}));
    ASSERT_TRUE(result.has_value()) << result.error().toString();
    EXPECT_TRUE(result->success);
    EXPECT_EQ(result->stdOut, "test\n");
}

TEST_F(EngineTest, Stop_WithoutStartIsHarmless) {
    makeEngine(deviceHandler);
    engine_->stop();
    EXPECT_FALSE(engine_->isRunning());
}

// ========== Wiring ==========

TEST_F(EngineTest, Accessors_ShareConfiguration) {
    config_.cache.maxEntries = 123;
    makeEngine(deviceHandler);
    EXPECT_EQ(engine_->engineConfig().cache.maxEntries, 123u);
    EXPECT_EQ(engine_->bridge(), bridge_);
    EXPECT_NE(engine_->connectionPool(), nullptr);
    EXPECT_NE(engine_->resultCache(), nullptr);
    EXPECT_NE(engine_->patternAnalyzer(), nullptr);
    EXPECT_NE(engine_->deviceProfiler(), nullptr);
}

TEST_F(EngineTest, Execute_RepeatedReadIsServedFromCache) {
    makeEngine(deviceHandler);
    ASSERT_TRUE(engine_->start().has_value());
    ASSERT_TRUE(engine_->registry()->scan().has_value());

    auto coordinator = engine_->commandCoordinator();
    for (int i = 0; i < 2; ++i) {
        auto result = coordinator->execute(dispatch::Command(
            {"shell", "getprop", "ro.product.model"}, "emulator-5554"));
        ASSERT_TRUE(result.has_value());
        EXPECT_TRUE(result->success);
        EXPECT_EQ(result->stdOut, "Pixel 7\n");
    }

    EXPECT_EQ(bridge_->countStartingWith({"shell", "getprop"}), 1u);
    EXPECT_EQ(coordinator->statistics().cacheHits, 1u);
    EXPECT_EQ(engine_->resultCache()->size(), 1u);
    EXPECT_EQ(engine_->patternAnalyzer()->recentExecutions().size(), 1u);
}

// ========== Profiling ==========

TEST_F(EngineTest, ProfileAllDevices_ProfilesEveryConnectedDevice) {
    makeEngine(deviceHandler);
    ASSERT_TRUE(engine_->start().has_value());
    ASSERT_TRUE(engine_->registry()->scan().has_value());

    auto profiles = engine_->profileAllDevices();
    ASSERT_EQ(profiles.size(), 2u);
    EXPECT_TRUE(engine_->deviceProfiler()->getProfile("emulator-5554"));
    EXPECT_TRUE(engine_->deviceProfiler()->getProfile("emulator-5556"));
}

TEST_F(EngineTest, ProfileAllDevices_NoDevices) {
    makeEngine(deviceHandler);
    EXPECT_TRUE(engine_->profileAllDevices().empty());
}
