//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: test_stream_transport.cpp
// Purpose: Line-delimited stream transport over string streams and a spawned child process
//==========================================================================================================

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "mcpwire/StreamTransport.hpp"

using namespace mcpwire;

TEST(StreamTransport, WritesOneLinePerMessage) {
    std::istringstream in;
    std::ostringstream out;
    StreamTransport t(in, out);
    t.Start();
    t.SendText(R"({"jsonrpc":"2.0","id":1,"result":{}})");
    t.SendText("second");
    EXPECT_EQ(out.str(), "{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{}}\nsecond\n");
}

TEST(StreamTransport, ReadsLinesAndStripsCarriageReturns) {
    std::istringstream in("first\r\nsecond\n\nlast");
    std::ostringstream out;
    StreamTransport t(in, out);
    t.Start();
    EXPECT_EQ(t.ReceiveText(), "first");
    EXPECT_EQ(t.ReceiveText(), "second");
    EXPECT_EQ(t.ReceiveText(), "");
    EXPECT_EQ(t.ReceiveText(), "last");
}

TEST(StreamTransport, EndOfStreamIsTransportError) {
    std::istringstream in("only\n");
    std::ostringstream out;
    StreamTransport t(in, out);
    int errorsSeen = 0;
    t.SetErrorHandler([&errorsSeen](const errors::Error&) { ++errorsSeen; });
    t.Start();
    EXPECT_EQ(t.ReceiveText(), "only");
    try {
        t.ReceiveText();
        FAIL() << "expected end of stream";
    } catch (const errors::Error& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::Transport);
        EXPECT_EQ(e.detail(), "end of stream");
        EXPECT_FALSE(errors::isTransient(e));
    }
    EXPECT_EQ(errorsSeen, 1);
}

TEST(StreamTransport, MessageHandlerTracesBothDirections) {
    std::istringstream in("incoming\n");
    std::ostringstream out;
    StreamTransport t(in, out);
    std::vector<std::string> traced;
    t.SetMessageHandler([&traced](const std::string& text) { traced.push_back(text); });
    t.Start();
    t.SendText("outgoing");
    t.ReceiveText();
    ASSERT_EQ(traced.size(), 2u);
    EXPECT_EQ(traced[0], "outgoing");
    EXPECT_EQ(traced[1], "incoming");
}

TEST(StreamTransport, RequiresStartAndHonoursClose) {
    std::istringstream in("x\n");
    std::ostringstream out;
    StreamTransport t(in, out);
    EXPECT_THROW(t.SendText("early"), errors::Error);
    EXPECT_THROW(t.ReceiveText(), errors::Error);

    int closes = 0;
    t.SetCloseHandler([&closes]() { ++closes; });
    t.Start();
    EXPECT_TRUE(t.IsConnected());
    EXPECT_EQ(t.GetSessionId().rfind("stdio-", 0), 0u);
    t.Close();
    t.Close();
    EXPECT_EQ(closes, 1);
    EXPECT_FALSE(t.IsConnected());
    EXPECT_THROW(t.SendText("late"), errors::Error);
    EXPECT_TRUE(out.str().empty());
}

TEST(StreamTransport, SecondStartIsAlreadyConnected) {
    std::istringstream in;
    std::ostringstream out;
    StreamTransport t(in, out);
    t.Start();
    for (int attempt = 0; attempt < 2; ++attempt) {
        try {
            t.Start();
            FAIL() << "start while connected";
        } catch (const errors::Error& e) {
            EXPECT_EQ(e.kind(), errors::ErrorKind::AlreadyConnected);
        }
    }
    EXPECT_TRUE(t.IsConnected());
}

TEST(StreamTransport, WriteFailureSurfaces) {
    std::istringstream in;
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    StreamTransport t(in, out);
    t.Start();
    try {
        t.SendText("lost");
        FAIL() << "expected a write failure";
    } catch (const errors::Error& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::Transport);
        EXPECT_EQ(e.detail().rfind("Failed to write", 0), 0u);
    }
}

TEST(StreamTransportChild, EchoesThroughCat) {
    auto t = StreamTransport::ForChildProcess("cat", {});
    EXPECT_EQ(t->ChildPid(), -1);
    t->Start();
    EXPECT_GT(t->ChildPid(), 0);

    t->SendText(R"({"jsonrpc":"2.0","id":1,"method":"initialize"})");
    EXPECT_EQ(t->ReceiveText(), R"({"jsonrpc":"2.0","id":1,"method":"initialize"})");
    t->SendText("again");
    EXPECT_EQ(t->ReceiveText(), "again");

    t->Close();
    EXPECT_EQ(t->ChildPid(), -1);
    EXPECT_FALSE(t->IsConnected());
}

TEST(StreamTransportChild, MissingExecutableReadsEndOfStream) {
    auto t = StreamTransport::ForChildProcess("/nonexistent/mcpwire-no-such-binary", {"--flag"});
    t->Start();
    try {
        t->ReceiveText();
        FAIL() << "expected end of stream from a child that failed to exec";
    } catch (const errors::Error& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::Transport);
    }
    t->Close();
}

TEST(StreamTransportChild, ChildExitEndsTheStream) {
    auto t = StreamTransport::ForChildProcess("sh", {"-c", "echo ready; exit 0"});
    t->Start();
    EXPECT_EQ(t->ReceiveText(), "ready");
    EXPECT_THROW(t->ReceiveText(), errors::Error);
    t->Close();
}
