//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: test_jsonrpc_codec.cpp
// Purpose: Classification of inbound JSON-RPC documents and the error replies for invalid ones
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "mcpwire/JsonRpcCodec.h"

using namespace mcpwire;

namespace {

InvalidMessage ExpectInvalid(const std::string& text) {
    auto decoded = DecodeMessage(text);
    EXPECT_EQ(KindOf(decoded), MessageKind::Invalid) << text;
    if (auto* inv = std::get_if<InvalidMessage>(&decoded)) {
        return *inv;
    }
    return InvalidMessage{};
}

} // namespace

TEST(JsonRpcCodec, RequestWithParams) {
    auto decoded = DecodeMessage(R"({"jsonrpc":"2.0","id":3,"method":"tools/list","params":{"cursor":"c"}})");
    ASSERT_EQ(KindOf(decoded), MessageKind::Request);
    const auto& req = std::get<JSONRPCRequest>(decoded);
    EXPECT_EQ(std::get<int64_t>(req.id), 3);
    EXPECT_EQ(req.method, "tools/list");
    ASSERT_TRUE(req.params.has_value());
    EXPECT_EQ(FindString(req.params.value(), "cursor").value_or(""), "c");
}

TEST(JsonRpcCodec, RequestIdsMayBeStringsOrNull) {
    auto s = DecodeMessage(R"({"jsonrpc":"2.0","id":"abc","method":"m"})");
    ASSERT_EQ(KindOf(s), MessageKind::Request);
    EXPECT_EQ(std::get<std::string>(std::get<JSONRPCRequest>(s).id), "abc");
    EXPECT_FALSE(std::get<JSONRPCRequest>(s).params.has_value());

    auto n = DecodeMessage(R"({"jsonrpc":"2.0","id":null,"method":"m"})");
    ASSERT_EQ(KindOf(n), MessageKind::Request);
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(std::get<JSONRPCRequest>(n).id));
}

TEST(JsonRpcCodec, MethodWithoutIdIsNotification) {
    auto decoded = DecodeMessage(R"({"jsonrpc":"2.0","method":"notify","params":[1]})");
    ASSERT_EQ(KindOf(decoded), MessageKind::Notification);
    const auto& note = std::get<JSONRPCNotification>(decoded);
    EXPECT_EQ(note.method, "notify");
    ASSERT_TRUE(note.params.has_value());
    EXPECT_TRUE(note.params->IsArray());
}

TEST(JsonRpcCodec, SuccessAndErrorResponses) {
    auto ok = DecodeMessage(R"({"jsonrpc":"2.0","id":9,"result":null})");
    ASSERT_EQ(KindOf(ok), MessageKind::Response);
    const auto& okResp = std::get<JSONRPCResponse>(ok);
    EXPECT_FALSE(okResp.IsError());
    ASSERT_TRUE(okResp.result.has_value());
    EXPECT_TRUE(okResp.result->IsNull());

    auto err = DecodeMessage(R"({"jsonrpc":"2.0","id":"r","error":{"code":-32000,"message":"nope","data":{"k":1}}})");
    ASSERT_EQ(KindOf(err), MessageKind::Response);
    const auto& errResp = std::get<JSONRPCResponse>(err);
    EXPECT_TRUE(errResp.IsError());
    EXPECT_EQ(std::get<std::string>(errResp.id), "r");
}

TEST(JsonRpcCodec, MalformedJsonIsParseError) {
    InvalidMessage inv = ExpectInvalid(R"({"jsonrpc":"2.0","id":1,"method":)");
    EXPECT_EQ(inv.code, JSONRPCErrorCodes::ParseError);
    EXPECT_EQ(inv.message, "Parse error");
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(inv.id));
}

TEST(JsonRpcCodec, StructurallyInvalidEnvelopes) {
    struct Case {
        const char* text;
        const char* message;
    };
    const Case cases[] = {
        {R"([{"jsonrpc":"2.0","id":1,"method":"m"}])", "Invalid Request: expected a JSON object"},
        {R"("just a string")", "Invalid Request: expected a JSON object"},
        {R"({"jsonrpc":"2.0","id":1.5,"method":"m"})", "Invalid Request: id must be a string, integer or null"},
        {R"({"jsonrpc":"2.0","id":{},"method":"m"})", "Invalid Request: id must be a string, integer or null"},
        {R"({"id":1,"method":"m"})", "Invalid Request: jsonrpc must be \"2.0\""},
        {R"({"jsonrpc":"1.0","id":1,"method":"m"})", "Invalid Request: jsonrpc must be \"2.0\""},
        {R"({"jsonrpc":"2.0","id":1,"method":5})", "Invalid Request: method must be a string"},
        {R"({"jsonrpc":"2.0","id":1,"result":1,"error":{"code":1,"message":"x"}})",
         "Invalid Request: both result and error present"},
        {R"({"jsonrpc":"2.0","result":1})", "Invalid Request: response without id"},
        {R"({"jsonrpc":"2.0","id":1,"error":{"message":"no code"}})", "Invalid Request: malformed error object"},
        {R"({"jsonrpc":"2.0","id":1})", "Invalid Request: missing method"},
    };
    for (const auto& c : cases) {
        InvalidMessage inv = ExpectInvalid(c.text);
        EXPECT_EQ(inv.code, JSONRPCErrorCodes::InvalidRequest) << c.text;
        EXPECT_EQ(inv.message, c.message) << c.text;
    }
}

TEST(JsonRpcCodec, InvalidKeepsReadableId) {
    InvalidMessage inv = ExpectInvalid(R"({"jsonrpc":"2.0","id":"keep","method":false})");
    EXPECT_EQ(std::get<std::string>(inv.id), "keep");

    auto reply = ErrorResponseFor(inv);
    EXPECT_EQ(reply->Serialize(),
              R"({"jsonrpc":"2.0","id":"keep","error":{"code":-32600,"message":"Invalid Request: method must be a string"}})");
}

TEST(JsonRpcCodec, MessageDeserializeMatchesKind) {
    const std::string request = R"({"jsonrpc":"2.0","id":1,"method":"initialize"})";
    const std::string notification = R"({"jsonrpc":"2.0","method":"ping"})";
    const std::string response = R"({"jsonrpc":"2.0","id":1,"result":{}})";

    JSONRPCRequest req;
    EXPECT_TRUE(req.Deserialize(request));
    EXPECT_EQ(req.method, "initialize");
    EXPECT_FALSE(req.Deserialize(notification));
    EXPECT_FALSE(req.Deserialize("not json"));

    JSONRPCNotification note;
    EXPECT_TRUE(note.Deserialize(notification));
    EXPECT_EQ(note.method, "ping");
    EXPECT_FALSE(note.Deserialize(request));

    JSONRPCResponse resp;
    EXPECT_TRUE(resp.Deserialize(response));
    EXPECT_FALSE(resp.IsError());
    EXPECT_FALSE(resp.Deserialize(request));
}

TEST(JsonRpcCodec, SerializedRequestDecodesToSameFields) {
    JSONRPCRequest original(int64_t{42}, "tool_call", MakeObject({{"name", JSONValue("echo")}}));
    auto decoded = DecodeMessage(original.Serialize());
    ASSERT_EQ(KindOf(decoded), MessageKind::Request);
    const auto& req = std::get<JSONRPCRequest>(decoded);
    EXPECT_EQ(std::get<int64_t>(req.id), 42);
    EXPECT_EQ(req.method, "tool_call");
    EXPECT_EQ(req.params.value(), original.params.value());
}
