//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: test_server_retry.cpp
// Purpose: Server message-loop retry budget against a scripted transport
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "mcpwire/Errors.h"
#include "mcpwire/Server.h"
#include "mcpwire/Transport.h"

using namespace mcpwire;

namespace {

// One scripted ReceiveText outcome: either a document or a thrown error.
struct Step {
    std::optional<std::string> text;
    std::optional<errors::Error> error;
};

Step Msg(std::string text) { return Step{std::move(text), std::nullopt}; }
Step Fail(errors::Error e) { return Step{std::nullopt, std::move(e)}; }

const char* kPing = R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})";
const char* kShutdown = R"({"jsonrpc":"2.0","id":99,"method":"shutdown"})";

struct Script {
    std::mutex mutex;
    std::deque<Step> steps;
    std::vector<std::string> sent;
    int receives{0};
    int closes{0};
};

class ScriptedTransport : public ITransport {
public:
    explicit ScriptedTransport(std::shared_ptr<Script> script) : script_(std::move(script)) {}

    void Start() override { connected_ = true; }
    void Close() override {
        std::lock_guard<std::mutex> lock(script_->mutex);
        if (connected_) {
            ++script_->closes;
        }
        connected_ = false;
    }
    bool IsConnected() const override { return connected_; }
    std::string GetSessionId() const override { return "scripted"; }

    void SendText(const std::string& text) override {
        std::lock_guard<std::mutex> lock(script_->mutex);
        script_->sent.push_back(text);
    }

    std::string ReceiveText() override {
        std::lock_guard<std::mutex> lock(script_->mutex);
        ++script_->receives;
        if (script_->steps.empty()) {
            throw errors::Error::transport("script exhausted");
        }
        Step step = script_->steps.front();
        script_->steps.pop_front();
        if (step.error.has_value()) {
            throw step.error.value();
        }
        return step.text.value();
    }

    void SetMessageHandler(MessageHandler) override {}
    void SetErrorHandler(ErrorHandler) override {}
    void SetCloseHandler(CloseHandler) override {}

private:
    std::shared_ptr<Script> script_;
    bool connected_{false};
};

} // namespace

TEST(ServerRetry, FiveConsecutiveFailuresAbortTheLoop) {
    auto script = std::make_shared<Script>();
    for (int i = 0; i < 5; ++i) {
        script->steps.push_back(Fail(errors::Error::transport("read failed #" + std::to_string(i + 1))));
    }
    script->steps.push_back(Msg(kShutdown));

    Server server(ServerConfig().WithName("retry-test"));
    server.SetMaxErrors(5);
    server.SetRetryDelay(std::chrono::milliseconds(1));
    try {
        server.Serve(std::make_unique<ScriptedTransport>(script));
        FAIL() << "Serve should rethrow the fifth error";
    } catch (const errors::Error& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::Transport);
        EXPECT_EQ(e.detail(), "read failed #5");
    }
    EXPECT_EQ(script->receives, 5);
    EXPECT_EQ(script->steps.size(), 1u);
    EXPECT_EQ(script->closes, 1);
    EXPECT_FALSE(server.IsRunning());
}

TEST(ServerRetry, FourFailuresThenSuccessKeepsServing) {
    auto script = std::make_shared<Script>();
    for (int i = 0; i < 4; ++i) {
        script->steps.push_back(Fail(errors::Error::transport("flaky")));
    }
    script->steps.push_back(Msg(kPing));
    for (int i = 0; i < 4; ++i) {
        script->steps.push_back(Fail(errors::Error::protocol("garbled")));
    }
    script->steps.push_back(Msg(kShutdown));

    Server server(ServerConfig().WithName("retry-test"));
    server.SetMaxErrors(5);
    server.SetRetryDelay(std::chrono::milliseconds(1));
    EXPECT_NO_THROW(server.Serve(std::make_unique<ScriptedTransport>(script)));

    EXPECT_TRUE(script->steps.empty());
    ASSERT_EQ(script->sent.size(), 2u);
    EXPECT_NE(script->sent[0].find("\"server_info\""), std::string::npos);
    EXPECT_NE(script->sent[1].find("\"id\":99"), std::string::npos);
    EXPECT_EQ(script->closes, 1);
}

TEST(ServerRetry, TransientErrorsDoNotConsumeTheBudget) {
    auto script = std::make_shared<Script>();
    for (int i = 0; i < 3; ++i) {
        script->steps.push_back(Fail(errors::Error::notConnected()));
        script->steps.push_back(Fail(errors::Error::transport("Connection reset by peer")));
    }
    script->steps.push_back(Msg(kShutdown));

    Server server(ServerConfig().WithName("retry-test"));
    server.SetMaxErrors(2);
    server.SetRetryDelay(std::chrono::milliseconds(1));
    EXPECT_NO_THROW(server.Serve(std::make_unique<ScriptedTransport>(script)));
    EXPECT_EQ(script->receives, 7);
    ASSERT_EQ(script->sent.size(), 1u);
}

TEST(ServerRetry, MaxErrorsOfOneFailsFast) {
    auto script = std::make_shared<Script>();
    script->steps.push_back(Fail(errors::Error::deserialization("bad frame")));
    script->steps.push_back(Msg(kShutdown));

    Server server(ServerConfig().WithName("retry-test"));
    server.SetMaxErrors(0);
    EXPECT_EQ(server.GetMaxErrors(), 1u);
    server.SetRetryDelay(std::chrono::milliseconds(1));
    EXPECT_THROW(server.Serve(std::make_unique<ScriptedTransport>(script)), errors::Error);
    EXPECT_EQ(script->receives, 1);
}

TEST(ServerRetry, InvalidDocumentsAreAnsweredNotCounted) {
    auto script = std::make_shared<Script>();
    for (int i = 0; i < 6; ++i) {
        script->steps.push_back(Msg("{not json"));
    }
    script->steps.push_back(Msg(kShutdown));

    Server server(ServerConfig().WithName("retry-test"));
    server.SetMaxErrors(2);
    server.SetRetryDelay(std::chrono::milliseconds(1));
    EXPECT_NO_THROW(server.Serve(std::make_unique<ScriptedTransport>(script)));
    ASSERT_EQ(script->sent.size(), 7u);
    EXPECT_EQ(script->sent[0], R"({"jsonrpc":"2.0","id":null,"error":{"code":-32700,"message":"Parse error"}})");
}

TEST(ServerRetry, RetryPolicyAccessors) {
    Server server;
    server.SetMaxErrors(7);
    server.SetRetryDelay(std::chrono::milliseconds(25));
    EXPECT_EQ(server.GetMaxErrors(), 7u);
    EXPECT_EQ(server.GetRetryDelay(), std::chrono::milliseconds(25));
}
