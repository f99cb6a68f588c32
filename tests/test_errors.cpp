//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: test_errors.cpp
// Purpose: GoogleTests for typed errors, transient classification and JSON-RPC error mapping helpers
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcpwire/JSONRPCTypes.h"
#include "mcpwire/Errors.h"

using namespace mcpwire;

TEST(Errors, CategoryMapping) {
    using mcpwire::errors::ErrorCategory;
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::JsonRpcParse);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidRequest), ErrorCategory::JsonRpcInvalidRequest);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::MethodNotFound), ErrorCategory::JsonRpcMethodNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidParams), ErrorCategory::JsonRpcInvalidParams);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InternalError), ErrorCategory::JsonRpcInternal);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ApplicationError), ErrorCategory::Application);
    EXPECT_EQ(errors::errorCategoryFromCode(12345), ErrorCategory::Unknown);
}

TEST(Errors, DisplayStrings) {
    EXPECT_STREQ(errors::Error::protocol("bad frame").what(), "Protocol error: bad frame");
    EXPECT_STREQ(errors::Error::transport("pipe closed").what(), "Transport error: pipe closed");
    EXPECT_STREQ(errors::Error::notFound("tool 'x'").what(), "Not found: tool 'x'");
    EXPECT_STREQ(errors::Error::notConnected().what(), "Transport error: Not connected");
    EXPECT_STREQ(errors::Error::alreadyConnected().what(), "Transport error: Already connected");
    EXPECT_STREQ(errors::Error::timeout().what(), "Transport error: Operation timed out");
    EXPECT_STREQ(errors::Error::transition("Idle -> Closed").what(), "State transition error: Idle -> Closed");
    EXPECT_STREQ(errors::kindName(errors::ErrorKind::Deserialization), "Deserialization");
}

TEST(Errors, CarriesKindDetailAndRpcCode) {
    errors::Error e(errors::ErrorKind::Protocol, "Method not found: x", JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(e.kind(), errors::ErrorKind::Protocol);
    EXPECT_EQ(e.detail(), "Method not found: x");
    ASSERT_TRUE(e.rpcCode().has_value());
    EXPECT_EQ(e.rpcCode().value(), -32601);
    EXPECT_FALSE(errors::Error::state("x").rpcCode().has_value());
}

TEST(Errors, FatalKinds) {
    EXPECT_TRUE(errors::Error::transport("x").isFatal());
    EXPECT_TRUE(errors::Error::protocol("x").isFatal());
    EXPECT_TRUE(errors::Error::notConnected().isFatal());
    EXPECT_TRUE(errors::Error::authentication("x").isFatal());
    EXPECT_TRUE(errors::Error::authorization("x").isFatal());
    EXPECT_FALSE(errors::Error::timeout().isFatal());
    EXPECT_FALSE(errors::Error::notFound("x").isFatal());
    EXPECT_FALSE(errors::Error::deserialization("x").isFatal());
}

TEST(Errors, TransientClassification) {
    EXPECT_TRUE(errors::isTransient(errors::Error::notConnected()));
    EXPECT_TRUE(errors::isTransient(errors::Error::alreadyConnected()));
    EXPECT_TRUE(errors::isTransient(errors::Error::transport("read: Connection reset by peer")));
    EXPECT_TRUE(errors::isTransient(errors::Error::transport("CONNECTION ABORTED")));
    EXPECT_FALSE(errors::isTransient(errors::Error::transport("end of stream")));
    EXPECT_FALSE(errors::isTransient(errors::Error::protocol("connection reset")));
    EXPECT_FALSE(errors::isTransient(errors::Error::timeout()));
}

TEST(Errors, RpcErrorFromWellFormedObject) {
    JSONValue obj = CreateErrorObject(JSONRPCErrorCodes::InvalidParams, "Invalid parameters", JSONValue("detail"));
    auto rpc = errors::rpcErrorFromErrorValue(obj);
    ASSERT_TRUE(rpc.has_value());
    EXPECT_EQ(rpc->code, JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(rpc->message, "Invalid parameters");
    EXPECT_EQ(rpc->category, errors::ErrorCategory::JsonRpcInvalidParams);
    ASSERT_TRUE(rpc->data.has_value());
    EXPECT_EQ(rpc->data.value(), JSONValue("detail"));
}

TEST(Errors, RpcErrorRejectsBadShapes) {
    EXPECT_FALSE(errors::rpcErrorFromErrorValue(JSONValue("oops")).has_value());
    EXPECT_FALSE(errors::rpcErrorFromErrorValue(ParseJSON(R"({"code":"1","message":"m"})")).has_value());
    EXPECT_FALSE(errors::rpcErrorFromErrorValue(ParseJSON(R"({"code":1})")).has_value());
    EXPECT_FALSE(errors::rpcErrorFromErrorValue(ParseJSON(R"({"code":1,"message":2})")).has_value());

    JSONRPCResponse success(int64_t{1}, JSONValue(true));
    EXPECT_FALSE(errors::rpcErrorFromResponse(success).has_value());
}

TEST(Errors, BuildErrorResponses) {
    auto rpc = errors::makeRpcError(JSONRPCErrorCodes::MethodNotFound, "Method not found: m");
    EXPECT_EQ(rpc.category, errors::ErrorCategory::JsonRpcMethodNotFound);

    auto resp = errors::makeErrorResponse(JSONRPCId{int64_t{4}}, rpc);
    EXPECT_EQ(resp->Serialize(), R"({"jsonrpc":"2.0","id":4,"error":{"code":-32601,"message":"Method not found: m"}})");

    auto back = errors::rpcErrorFromResponse(*resp);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->code, rpc.code);
    EXPECT_EQ(errors::makeErrorValue(rpc), resp->error.value());
}
