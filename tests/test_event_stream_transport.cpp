//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: test_event_stream_transport.cpp
// Purpose: text/event-stream decoding and the SSE + POST transport on loopback
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <string>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "mcpwire/EventStreamTransport.hpp"

using namespace mcpwire;

namespace {

bool WaitFor(const std::function<bool()>& cond, std::chrono::milliseconds limit = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (!cond()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

EventStreamTransport::Options ServerOptions() {
    EventStreamTransport::Options o;
    o.mode = EventStreamTransport::Mode::Server;
    o.host = "127.0.0.1";
    o.port = "0";
    o.drainMs = 0;
    o.receiveTimeoutMs = 3000;
    return o;
}

EventStreamTransport::Options ClientOptions(uint16_t port) {
    EventStreamTransport::Options o;
    o.mode = EventStreamTransport::Mode::Client;
    o.host = "127.0.0.1";
    o.port = std::to_string(port);
    o.receiveTimeoutMs = 3000;
    return o;
}

// Plain GET against the server, returning status and body.
std::pair<unsigned, std::string> HttpGet(uint16_t port, const std::string& target) {
    namespace beast = boost::beast;
    namespace http = boost::beast::http;
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    stream.connect(resolver.resolve("127.0.0.1", std::to_string(port)));
    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, "127.0.0.1");
    http::write(stream, req);
    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);
    boost::system::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return {res.result_int(), res.body()};
}

} // namespace

TEST(SseEventParser, JoinsDataLinesAndKeepsFields) {
    SseEventParser p;
    auto events = p.Feed("event: endpoint\nid: 7\ndata: first\ndata: second\n\n");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].event, "endpoint");
    EXPECT_EQ(events[0].id, "7");
    EXPECT_EQ(events[0].data, "first\nsecond");
}

TEST(SseEventParser, HandlesChunkBoundariesAndCrlf) {
    SseEventParser p;
    EXPECT_TRUE(p.Feed("da").empty());
    EXPECT_TRUE(p.Feed("ta: {\"a\"").empty());
    EXPECT_TRUE(p.Feed(":1}\r\n").empty());
    auto events = p.Feed("\r\ndata:tight\n\n");
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].data, "{\"a\":1}");
    EXPECT_TRUE(events[0].event.empty());
    EXPECT_EQ(events[1].data, "tight");
}

TEST(SseEventParser, IgnoresCommentsAndEmptyEvents) {
    SseEventParser p;
    EXPECT_TRUE(p.Feed(": keep-alive\n\n").empty());
    EXPECT_TRUE(p.Feed("\n\n").empty());
    EXPECT_TRUE(p.Feed("retry: 10\n\n").empty());
    auto events = p.Feed("data\n\n");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].data, "");
}

TEST(EventStreamTransport, ServerWithoutSubscriberCannotSend) {
    EventStreamTransport server(ServerOptions());
    server.Start();
    EXPECT_GT(server.LocalPort(), 0);
    EXPECT_TRUE(server.CurrentClientId().empty());
    try {
        server.SendText("nobody");
        FAIL() << "expected a send failure";
    } catch (const errors::Error& e) {
        EXPECT_EQ(e.detail(), "No client to send to");
    }
}

TEST(EventStreamTransport, SecondStartIsAlreadyConnected) {
    EventStreamTransport server(ServerOptions());
    server.Start();
    try {
        server.Start();
        FAIL() << "start while connected";
    } catch (const errors::Error& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::AlreadyConnected);
    }
    server.Close();
}

TEST(EventStreamTransport, RoundTripOverEventsAndPost) {
    EventStreamTransport server(ServerOptions());
    server.Start();
    EventStreamTransport client(ClientOptions(server.LocalPort()));
    client.Start();

    // The endpoint event rewrites the POST target to carry the assigned client id.
    ASSERT_TRUE(WaitFor([&]() { return client.MessageTarget() == "/message?client_id=1"; }));
    EXPECT_EQ(server.CurrentClientId(), "1");

    client.SendText(R"({"jsonrpc":"2.0","id":1,"method":"initialize"})");
    EXPECT_EQ(server.ReceiveText(), R"({"jsonrpc":"2.0","id":1,"method":"initialize"})");

    server.SendText(R"({"jsonrpc":"2.0","id":1,"result":{}})");
    EXPECT_EQ(client.ReceiveText(), R"({"jsonrpc":"2.0","id":1,"result":{}})");

    server.SendText("line one\nline two");
    EXPECT_EQ(client.ReceiveText(), "line one\nline two");

    client.Close();
    server.Close();
    EXPECT_FALSE(server.IsConnected());
}

TEST(EventStreamTransport, CloseDeliversQueuedMessagesToSubscribers) {
    auto opts = ServerOptions();
    opts.drainMs = 800;
    EventStreamTransport server(opts);
    server.Start();
    EventStreamTransport client(ClientOptions(server.LocalPort()));
    client.Start();
    ASSERT_TRUE(WaitFor([&]() { return client.MessageTarget() == "/message?client_id=1"; }));

    server.SendText(R"({"jsonrpc":"2.0","id":9,"result":{}})");
    const auto closing = std::chrono::steady_clock::now();
    server.Close();
    const auto took = std::chrono::steady_clock::now() - closing;

    EXPECT_EQ(client.ReceiveText(), R"({"jsonrpc":"2.0","id":9,"result":{}})");
    // The drain ends as soon as the queue is empty.
    EXPECT_LT(took, std::chrono::milliseconds(700));
    client.Close();
}

TEST(EventStreamTransport, NonSuccessPostIsTransportError) {
    EventStreamTransport server(ServerOptions());
    server.Start();

    auto opts = ClientOptions(server.LocalPort());
    opts.eventsPath = "/no-such-stream";
    opts.messagePath = "/no-such-endpoint";
    opts.reconnectMs = 60000;
    EventStreamTransport client(opts);
    client.Start();
    try {
        client.SendText("{}");
        FAIL() << "expected a rejected POST";
    } catch (const errors::Error& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::Transport);
        EXPECT_EQ(e.detail(), "Server returned error: 404");
    }
}

TEST(EventStreamTransport, EmptyPostIsRejected) {
    EventStreamTransport server(ServerOptions());
    server.Start();
    auto opts = ClientOptions(server.LocalPort());
    opts.eventsPath = "/no-such-stream";
    opts.reconnectMs = 60000;
    EventStreamTransport client(opts);
    client.Start();
    try {
        client.SendText("");
        FAIL() << "expected a rejected POST";
    } catch (const errors::Error& e) {
        EXPECT_EQ(e.detail(), "Server returned error: 400");
    }
}

TEST(EventStreamTransport, PollingPeerCollectsQueuedResponses) {
    EventStreamTransport server(ServerOptions());
    server.Start();
    const uint16_t port = server.LocalPort();

    auto opts = ClientOptions(port);
    opts.eventsPath = "/no-such-stream";
    opts.messagePath = "/message?client_id=poller";
    opts.reconnectMs = 60000;
    EventStreamTransport poster(opts);
    poster.Start();
    poster.SendText(R"({"jsonrpc":"2.0","id":5,"method":"tools/list"})");
    EXPECT_EQ(server.ReceiveText(), R"({"jsonrpc":"2.0","id":5,"method":"tools/list"})");
    EXPECT_EQ(server.CurrentClientId(), "poller");

    server.SendText(R"({"a":1})");
    server.SendText(R"({"b":2})");
    auto polled = HttpGet(port, "/poll?client_id=poller");
    EXPECT_EQ(polled.first, 200u);
    EXPECT_EQ(polled.second, R"([{"a":1},{"b":2}])");

    auto empty = HttpGet(port, "/poll?client_id=poller");
    EXPECT_EQ(empty.second, "[]");

    auto unknown = HttpGet(port, "/poll?client_id=stranger");
    EXPECT_EQ(unknown.first, 404u);
}

TEST(EventStreamTransport, CloseReleasesBlockedReceiver) {
    auto opts = ServerOptions();
    opts.receiveTimeoutMs = 0;
    EventStreamTransport server(opts);
    int closes = 0;
    server.SetCloseHandler([&closes]() { ++closes; });
    server.Start();
    std::thread reader([&server]() { EXPECT_THROW(server.ReceiveText(), errors::Error); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    server.Close();
    reader.join();
    server.Close();
    EXPECT_EQ(closes, 1);
}
