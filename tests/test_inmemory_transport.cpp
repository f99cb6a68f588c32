//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: test_inmemory_transport.cpp
// Purpose: GoogleTests for the in-memory transport pair, the shared state machine and the inbound queue
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "mcpwire/InMemoryTransport.hpp"
#include "ConnectionState.h"

using namespace mcpwire;

TEST(InMemoryTransport, DeliversInBothDirections) {
    auto [a, b] = InMemoryTransport::CreatePair();
    a->Start();
    b->Start();
    EXPECT_TRUE(a->IsConnected());
    EXPECT_NE(a->GetSessionId(), b->GetSessionId());
    EXPECT_EQ(a->GetSessionId().rfind("memory-", 0), 0u);

    a->SendText(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    a->SendText("second");
    b->SendText("reply");
    EXPECT_EQ(b->ReceiveText(), R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    EXPECT_EQ(b->ReceiveText(), "second");
    EXPECT_EQ(a->ReceiveText(), "reply");
}

TEST(InMemoryTransport, MessageHandlerSeesInboundTraffic) {
    auto [a, b] = InMemoryTransport::CreatePair();
    std::vector<std::string> seen;
    b->SetMessageHandler([&seen](const std::string& text) { seen.push_back(text); });
    a->Start();
    b->Start();
    a->SendText("one");
    a->SendText("two");
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[1], "two");
}

TEST(InMemoryTransport, StateMachine) {
    auto [a, b] = InMemoryTransport::CreatePair();
    EXPECT_FALSE(a->IsConnected());
    try {
        a->SendText("early");
        FAIL() << "send before start should fail";
    } catch (const errors::Error& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::NotConnected);
    }

    a->Start();
    try {
        a->Start();
        FAIL() << "second start should fail";
    } catch (const errors::Error& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::AlreadyConnected);
    }

    a->Close();
    EXPECT_FALSE(a->IsConnected());
    try {
        a->Start();
        FAIL() << "restart after close should fail";
    } catch (const errors::Error& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::State);
    }
    EXPECT_THROW(a->ReceiveText(), errors::Error);
}

TEST(InMemoryTransport, SendToUnstartedOrClosedPeerFails) {
    auto [a, b] = InMemoryTransport::CreatePair();
    int errorsSeen = 0;
    a->SetErrorHandler([&errorsSeen](const errors::Error&) { ++errorsSeen; });
    a->Start();
    try {
        a->SendText("nobody home");
        FAIL() << "send to idle peer should fail";
    } catch (const errors::Error& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::Transport);
        EXPECT_EQ(e.detail(), "Peer not connected");
    }
    EXPECT_EQ(errorsSeen, 1);

    b->Start();
    b->Close();
    EXPECT_THROW(a->SendText("gone"), errors::Error);

    b.reset();
    EXPECT_THROW(a->SendText("destroyed"), errors::Error);
}

TEST(InMemoryTransport, CloseHandlerFiresOnce) {
    auto [a, b] = InMemoryTransport::CreatePair();
    int closes = 0;
    a->SetCloseHandler([&closes]() { ++closes; });
    a->Start();
    a->Close();
    a->Close();
    EXPECT_EQ(closes, 1);

    int idleCloses = 0;
    b->SetCloseHandler([&idleCloses]() { ++idleCloses; });
    b->Close();
    EXPECT_EQ(idleCloses, 0);
}

TEST(InMemoryTransport, CloseUnblocksReceiver) {
    auto pair = InMemoryTransport::CreatePair();
    InMemoryTransport* b = pair.second.get();
    pair.first->Start();
    b->Start();
    std::atomic<bool> unblocked{false};
    std::thread reader([b, &unblocked]() {
        try {
            b->ReceiveText();
        } catch (const errors::Error& e) {
            EXPECT_EQ(e.kind(), errors::ErrorKind::NotConnected);
        }
        unblocked = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    b->Close();
    reader.join();
    EXPECT_TRUE(unblocked.load());
}

TEST(InMemoryTransport, FactoryCreatesIndependentTransport) {
    InMemoryTransportFactory factory;
    auto t = factory.CreateTransport("memory://");
    ASSERT_TRUE(t);
    t->Start();
    EXPECT_TRUE(t->IsConnected());
    EXPECT_THROW(t->SendText("unpaired"), errors::Error);
}

TEST(InboundQueue, PopOrderTimeoutAndShutdown) {
    detail::InboundQueue q;
    q.push("a");
    q.push("b");
    EXPECT_EQ(q.size(), 2u);
    EXPECT_EQ(q.pop(), "a");
    EXPECT_EQ(q.pop(std::chrono::milliseconds(10)), "b");

    try {
        q.pop(std::chrono::milliseconds(10));
        FAIL() << "empty pop should time out";
    } catch (const errors::Error& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::Timeout);
    }

    q.push("dropped");
    q.shutdown();
    EXPECT_EQ(q.size(), 0u);
    try {
        q.pop();
        FAIL() << "pop after shutdown should fail";
    } catch (const errors::Error& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::NotConnected);
    }
}

TEST(ConnectionState, AbortedStartStaysIdle) {
    detail::ConnectionState state;
    state.beginStart();
    EXPECT_THROW(state.beginStart(), errors::Error);
    state.abortStart();
    EXPECT_EQ(state.phase(), detail::ConnectionState::Phase::Idle);
    state.beginStart();
    state.markConnected();
    EXPECT_TRUE(state.markClosed());
    EXPECT_FALSE(state.markClosed());
}
