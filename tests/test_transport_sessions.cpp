//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: test_transport_sessions.cpp
// Purpose: Full client/server sessions over the TCP and SSE transports created from URIs
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include "mcpwire/Client.h"
#include "mcpwire/EventStreamTransport.hpp"
#include "mcpwire/Server.h"
#include "mcpwire/SocketTransport.hpp"
#include "mcpwire/Transport.h"

using namespace mcpwire;

namespace {

constexpr auto kWait = std::chrono::milliseconds(3000);

bool WaitFor(const std::function<bool()>& cond) {
    auto deadline = std::chrono::steady_clock::now() + kWait;
    while (!cond()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

// Serves an already started listener on a background thread.
class ServingThread {
public:
    explicit ServingThread(std::unique_ptr<ITransport> listener)
        : server(ServerConfig().WithName("relay").WithVersion("2.0.1").WithTool(Tool("echo"))) {
        server.RegisterToolHandler("echo", [](const JSONValue& p) { return p; });
        loop = std::thread([this, t = std::move(listener)]() mutable {
            try {
                server.Serve(std::move(t));
            } catch (const errors::Error& e) {
                ADD_FAILURE() << "Serve failed: " << e.what();
            }
        });
    }

    ~ServingThread() {
        server.Stop();
        if (loop.joinable()) {
            loop.join();
        }
    }

    void Join() { loop.join(); }

    Server server;

private:
    std::thread loop;
};

// initialize, one echo call, shutdown.
void RunSession(Client& client, ServingThread& serving) {
    client.SetResponseTimeout(kWait);
    InitializeResult init = client.Initialize();
    EXPECT_EQ(init.serverInfo.name, "relay");
    EXPECT_EQ(init.serverInfo.version, "2.0.1");
    ASSERT_EQ(init.tools.size(), 1u);

    JSONValue args = MakeObject({{"note", JSONValue("over the wire")}, {"n", JSONValue(int64_t{3})}});
    EXPECT_EQ(client.CallTool("echo", args), args);

    client.Shutdown();
    EXPECT_FALSE(client.IsConnected());
    serving.Join();
    EXPECT_FALSE(serving.server.IsRunning());
}

} // namespace

TEST(TransportSessions, ClientAndServerOverTcp) {
    auto listener = CreateTransport("tcp-listen://127.0.0.1:0");
    listener->Start();
    const uint16_t port = dynamic_cast<SocketTransport&>(*listener).LocalPort();
    ASSERT_GT(port, 0);
    ServingThread serving(std::move(listener));

    Client client(CreateTransport("tcp://127.0.0.1:" + std::to_string(port) + "?receive_timeout_ms=3000"));
    RunSession(client, serving);
}

TEST(TransportSessions, ClientAndServerOverEventStream) {
    // Default drain: the shutdown acknowledgement must still reach the subscriber.
    auto listener = CreateTransport("sse-listen://127.0.0.1:0");
    listener->Start();
    const uint16_t port = dynamic_cast<EventStreamTransport&>(*listener).LocalPort();
    ASSERT_GT(port, 0);
    ServingThread serving(std::move(listener));

    auto transport = CreateTransport("http://127.0.0.1:" + std::to_string(port) + "?receive_timeout_ms=3000");
    auto* sse = dynamic_cast<EventStreamTransport*>(transport.get());
    ASSERT_NE(sse, nullptr);
    transport->Start();
    // Replies need a subscribed peer; wait for the endpoint event before the first request.
    ASSERT_TRUE(WaitFor([sse]() { return sse->MessageTarget().find("client_id=") != std::string::npos; }));

    Client client(std::move(transport));
    RunSession(client, serving);
}
