//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: test_transport_factories.cpp
// Purpose: Transport URI parsing and scheme-based transport selection
//==========================================================================================================

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "mcpwire/EventStreamTransport.hpp"
#include "mcpwire/FramedTransport.hpp"
#include "mcpwire/InMemoryTransport.hpp"
#include "mcpwire/SocketTransport.hpp"
#include "mcpwire/StreamTransport.hpp"
#include "mcpwire/Transport.h"
#include "TransportUri.h"

using namespace mcpwire;

namespace {

template <typename T>
bool Creates(const std::string& uri) {
    std::unique_ptr<ITransport> t = CreateTransport(uri);
    return dynamic_cast<T*>(t.get()) != nullptr;
}

void ExpectInvalid(const std::string& uri) {
    try {
        CreateTransport(uri);
        ADD_FAILURE() << "accepted " << uri;
    } catch (const errors::Error& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::InvalidRequest) << uri;
    }
}

} // namespace

TEST(TransportUri, SplitsComponents) {
    auto uri = detail::ParseTransportUri("  WS-Listen://0.0.0.0:8080/mcp/v1?a=1&flag&b=two ", "");
    EXPECT_EQ(uri.scheme, "ws-listen");
    EXPECT_EQ(uri.host, "0.0.0.0");
    EXPECT_EQ(uri.port, "8080");
    EXPECT_EQ(uri.path, "/mcp/v1");
    EXPECT_EQ(uri.param("a", "x"), "1");
    EXPECT_EQ(uri.param("flag", "fallback"), "fallback");
    EXPECT_EQ(uri.param("b", ""), "two");
    EXPECT_EQ(uri.paramUint("a", 9), 1u);
    EXPECT_EQ(uri.paramUint("missing", 9), 9u);
    EXPECT_THROW(uri.paramUint("b", 0), errors::Error);
}

TEST(TransportUri, Ipv6AndDefaultPort) {
    auto v6 = detail::ParseTransportUri("tcp://[::1]:9000", "");
    EXPECT_EQ(v6.host, "::1");
    EXPECT_EQ(v6.port, "9000");

    auto defaulted = detail::ParseTransportUri("https://example.org/base", "443");
    EXPECT_EQ(defaulted.port, "443");
    EXPECT_EQ(defaulted.path, "/base");
}

TEST(TransportUri, RejectsMalformedInput) {
    EXPECT_THROW(detail::ParseTransportUri("no-scheme", ""), errors::Error);
    EXPECT_THROW(detail::ParseTransportUri("tcp://:9000", ""), errors::Error);
    EXPECT_THROW(detail::ParseTransportUri("tcp://host:99999", ""), errors::Error);
    EXPECT_THROW(detail::ParseTransportUri("tcp://host:80a", ""), errors::Error);
    EXPECT_THROW(detail::ParseTransportUri("tcp://[::1:9000", ""), errors::Error);
    EXPECT_THROW(detail::ParseTransportUri("tcp://host", ""), errors::Error);
}

TEST(TransportUri, QueryString) {
    auto q = detail::ParseQueryString("client_id=4&&empty=&bare");
    EXPECT_EQ(q.size(), 3u);
    EXPECT_EQ(q["client_id"], "4");
    EXPECT_EQ(q["empty"], "");
    EXPECT_EQ(q.count("bare"), 1u);
}

TEST(CreateTransport, SelectsBySchemeWithoutStarting) {
    EXPECT_TRUE(Creates<StreamTransport>("stdio"));
    EXPECT_TRUE(Creates<StreamTransport>(""));
    EXPECT_TRUE(Creates<StreamTransport>("command=cat;args=-u"));
    EXPECT_TRUE(Creates<SocketTransport>("tcp://127.0.0.1:9000"));
    EXPECT_TRUE(Creates<SocketTransport>("TCP-LISTEN://127.0.0.1:0?receive_timeout_ms=10"));
    EXPECT_TRUE(Creates<FramedTransport>("ws://127.0.0.1:9001/mcp"));
    EXPECT_TRUE(Creates<FramedTransport>("ws-listen://127.0.0.1:0"));
    EXPECT_TRUE(Creates<EventStreamTransport>("http://127.0.0.1:8080"));
    EXPECT_TRUE(Creates<EventStreamTransport>("https://127.0.0.1/api?ca=/tmp/ca.pem"));
    EXPECT_TRUE(Creates<EventStreamTransport>("sse-listen://127.0.0.1:0?drain_ms=0"));
    EXPECT_TRUE(Creates<InMemoryTransport>("memory://"));

    auto t = CreateTransport("tcp://127.0.0.1:9000");
    EXPECT_FALSE(t->IsConnected());
}

TEST(CreateTransport, RejectsUnknownOrMalformed) {
    ExpectInvalid("carrier-pigeon://coop:1");
    ExpectInvalid("not a uri");
    ExpectInvalid("tcp://127.0.0.1:notaport");
    ExpectInvalid("tcp-listen://127.0.0.1:0?receive_timeout_ms=soon");
    ExpectInvalid("command=;args=x");
}

TEST(CreateTransport, ListenerUriStartsOnEphemeralPort) {
    auto t = CreateTransport("tcp-listen://127.0.0.1:0");
    t->Start();
    auto* socket = dynamic_cast<SocketTransport*>(t.get());
    ASSERT_NE(socket, nullptr);
    EXPECT_GT(socket->LocalPort(), 0);
    t->Close();
}
