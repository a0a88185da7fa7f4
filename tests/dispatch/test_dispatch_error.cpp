/*
 * test_dispatch_error.cpp - Tests for dispatch error and result types
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "dispatch/common/dispatch_result.hpp"

using namespace helium::dispatch;

TEST(DispatchErrorTest, ToString_IncludesCodeAndDevice) {
    DispatchError error(DispatchErrorCode::DeviceNotFound, "Unknown device",
                        "emulator-5554");
    EXPECT_EQ(error.toString(),
              "[DeviceNotFound] Unknown device (device: emulator-5554)");

    DispatchError plain(DispatchErrorCode::QueueFull, "Queue is full");
    EXPECT_EQ(plain.toString(), "[QueueFull] Queue is full");
}

TEST(DispatchErrorTest, ToJson_CarriesCodeName) {
    DispatchError error(DispatchErrorCode::IoError, "disk full");
    auto j = error.toJson();
    EXPECT_EQ(j["code"], 300);
    EXPECT_EQ(j["codeName"], "IoError");
    EXPECT_EQ(j["message"], "disk full");
    EXPECT_FALSE(j.contains("deviceSerial"));
}

TEST(DispatchErrorTest, Retryable_OnlyExecutionErrors) {
    EXPECT_TRUE(isRetryable(DispatchErrorCode::CommandTimeout));
    EXPECT_TRUE(isRetryable(DispatchErrorCode::CommandFailed));
    EXPECT_TRUE(isRetryable(DispatchErrorCode::TransportUnavailable));
    EXPECT_FALSE(isRetryable(DispatchErrorCode::QueueFull));
    EXPECT_FALSE(isRetryable(DispatchErrorCode::DeviceNotFound));
    EXPECT_FALSE(isRetryable(DispatchErrorCode::InvalidArgument));
}

TEST(DispatchResultTest, Helpers_BuildValueAndError) {
    auto ok = success(42);
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(*ok, 42);

    auto bad = failure<int>(DispatchErrorCode::NotRunning, "stopped");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, DispatchErrorCode::NotRunning);

    EXPECT_TRUE(success().has_value());
    EXPECT_FALSE(failure(DispatchErrorCode::IoError, "x").has_value());
}

TEST(DispatchResultTest, ThrowIfError_ReturnsValue) {
    EXPECT_EQ(throwIfError(success(std::string("ok"))), "ok");
    EXPECT_NO_THROW(throwIfError(success()));
}

TEST(DispatchResultTest, ThrowIfError_ThrowsDispatchException) {
    try {
        throwIfError(failure(DispatchErrorCode::IoError, "cannot write"));
        FAIL() << "expected DispatchException";
    } catch (const DispatchException& e) {
        EXPECT_EQ(e.code(), DispatchErrorCode::IoError);
        EXPECT_EQ(e.error().message, "cannot write");
        EXPECT_STREQ(e.what(), "[IoError] cannot write");
    }

    EXPECT_THROW(
        throwIfError(failure<int>(DispatchErrorCode::QueueFull, "full")),
        DispatchException);
}
