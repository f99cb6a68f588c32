//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: Errors.cpp
// Purpose: Error taxonomy display strings, fatality and transient classification, wire error mapping
//==========================================================================================================

#include <algorithm>
#include <cctype>

#include "mcpwire/Errors.h"

namespace mcpwire {
namespace errors {

const char* kindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Transport: return "Transport";
        case ErrorKind::Serialization: return "Serialization";
        case ErrorKind::Deserialization: return "Deserialization";
        case ErrorKind::Protocol: return "Protocol";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::InvalidRequest: return "InvalidRequest";
        case ErrorKind::Authentication: return "Authentication";
        case ErrorKind::Authorization: return "Authorization";
        case ErrorKind::State: return "State";
        case ErrorKind::Transition: return "Transition";
        case ErrorKind::AlreadyConnected: return "AlreadyConnected";
        case ErrorKind::NotConnected: return "NotConnected";
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::Internal: return "Internal";
    }
    return "Unknown";
}

std::string formatError(ErrorKind kind, const std::string& detail) {
    switch (kind) {
        case ErrorKind::Transport: return "Transport error: " + detail;
        case ErrorKind::Serialization: return "Serialization error: " + detail;
        case ErrorKind::Deserialization: return "Deserialization error: " + detail;
        case ErrorKind::Protocol: return "Protocol error: " + detail;
        case ErrorKind::NotFound: return "Not found: " + detail;
        case ErrorKind::InvalidRequest: return "Invalid request: " + detail;
        case ErrorKind::Authentication: return "Authentication error: " + detail;
        case ErrorKind::Authorization: return "Authorization error: " + detail;
        case ErrorKind::State: return "State error: " + detail;
        case ErrorKind::Transition: return "State transition error: " + detail;
        case ErrorKind::AlreadyConnected: return "Transport error: Already connected";
        case ErrorKind::NotConnected: return "Transport error: Not connected";
        case ErrorKind::Timeout: return "Transport error: Operation timed out";
        case ErrorKind::Internal: return "Internal error: " + detail;
    }
    return "Unknown error: " + detail;
}

Error::Error(ErrorKind kind, std::string detail, std::optional<int> rpcCode)
    : std::runtime_error(formatError(kind, detail)),
      kind_(kind), detail_(std::move(detail)), rpcCode_(rpcCode) {}

bool Error::isFatal() const noexcept {
    switch (kind_) {
        case ErrorKind::Transport:
        case ErrorKind::Protocol:
        case ErrorKind::NotConnected:
        case ErrorKind::Authentication:
        case ErrorKind::Authorization:
            return true;
        default:
            return false;
    }
}

bool isTransient(const Error& e) {
    if (e.kind() == ErrorKind::NotConnected || e.kind() == ErrorKind::AlreadyConnected) {
        return true;
    }
    if (e.kind() != ErrorKind::Transport) {
        return false;
    }
    std::string lower = e.detail();
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return lower.find("connection reset") != std::string::npos ||
           lower.find("reset by peer") != std::string::npos ||
           lower.find("connection aborted") != std::string::npos;
}

ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::ApplicationError: return ErrorCategory::Application;
        default: return ErrorCategory::Unknown;
    }
}

std::optional<RpcError> rpcErrorFromErrorValue(const JSONValue& errVal) {
    if (!errVal.IsObject()) {
        return std::nullopt;
    }
    const JSONValue* code = FindMember(errVal, "code");
    const JSONValue* msg = FindMember(errVal, "message");
    if (!code || !msg) {
        return std::nullopt;
    }
    if (!std::holds_alternative<int64_t>(code->value) || !msg->IsString()) {
        return std::nullopt;
    }

    RpcError e;
    e.code = static_cast<int>(std::get<int64_t>(code->value));
    e.message = std::get<std::string>(msg->value);
    if (const JSONValue* data = FindMember(errVal, "data")) {
        e.data = *data;
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

std::optional<RpcError> rpcErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return rpcErrorFromErrorValue(response.error.value());
}

JSONValue makeErrorValue(const RpcError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const RpcError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

RpcError makeRpcError(int code, std::string message) {
    RpcError e;
    e.code = code;
    e.message = std::move(message);
    e.category = errorCategoryFromCode(code);
    return e;
}

} // namespace errors
} // namespace mcpwire
