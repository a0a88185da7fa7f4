/*
 * fake_bridge.hpp - Bridge transport doubles shared by the test suites
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef HELIUM_TESTS_COMMON_FAKE_BRIDGE_HPP
#define HELIUM_TESTS_COMMON_FAKE_BRIDGE_HPP

#include <gmock/gmock.h>

#include <algorithm>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "transport/bridge_transport.hpp"

namespace helium::test {

using transport::ProcessOutput;
using BridgeOutcome = dispatch::DispatchResult<ProcessOutput>;

class MockBridgeTransport : public transport::BridgeTransport {
public:
    MOCK_METHOD(BridgeOutcome, run,
                (const std::vector<std::string>&, std::chrono::milliseconds),
                (override));
    MOCK_METHOD(std::string, executable, (), (const, override));
};

inline auto exitWith(int code, std::string out = {}, std::string err = {},
                     std::chrono::milliseconds duration =
                         std::chrono::milliseconds{5}) -> BridgeOutcome {
    ProcessOutput output;
    output.exitCode = code;
    output.stdOut = std::move(out);
    output.stdErr = std::move(err);
    output.duration = duration;
    return output;
}

inline auto bridgeError(dispatch::DispatchErrorCode code,
                        const std::string& message) -> BridgeOutcome {
    return std::unexpected(dispatch::DispatchError(code, message));
}

/// Arguments after the "-s SERIAL" selector
inline auto commandPart(const std::vector<std::string>& args)
    -> std::vector<std::string> {
    if (args.size() >= 2 && args[0] == "-s") {
        return std::vector<std::string>(args.begin() + 2, args.end());
    }
    return args;
}

/**
 * Thread-safe transport that answers through a handler and records every
 * invocation. Without a handler every call exits 0 with empty output.
 */
class ScriptedBridge : public transport::BridgeTransport {
public:
    using Handler = std::function<BridgeOutcome(const std::vector<std::string>&)>;

    explicit ScriptedBridge(Handler handler = {})
        : handler_(std::move(handler)) {}

    auto run(const std::vector<std::string>& args,
             std::chrono::milliseconds /*timeout*/) -> BridgeOutcome override {
        {
            std::lock_guard lock(mutex_);
            calls_.push_back(args);
        }
        if (handler_) {
            return handler_(args);
        }
        return exitWith(0);
    }

    auto executable() const -> std::string override { return "fake-bridge"; }

    auto calls() const -> std::vector<std::vector<std::string>> {
        std::lock_guard lock(mutex_);
        return calls_;
    }

    auto callCount() const -> size_t {
        std::lock_guard lock(mutex_);
        return calls_.size();
    }

    /// Calls whose command part starts with @p prefix
    auto countStartingWith(const std::vector<std::string>& prefix) const
        -> size_t {
        std::lock_guard lock(mutex_);
        size_t count = 0;
        for (const auto& call : calls_) {
            auto cmd = commandPart(call);
            if (cmd.size() >= prefix.size() &&
                std::equal(prefix.begin(), prefix.end(), cmd.begin())) {
                count++;
            }
        }
        return count;
    }

private:
    Handler handler_;
    mutable std::mutex mutex_;
    std::vector<std::vector<std::string>> calls_;
};

}  // namespace helium::test

#endif  // HELIUM_TESTS_COMMON_FAKE_BRIDGE_HPP
