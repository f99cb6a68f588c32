//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: JsonRpcCodec.cpp
// Purpose: JSON-RPC envelope validation and message deserialization
//==========================================================================================================

#include <optional>
#include <string>

#include "logging/Logger.h"
#include "mcpwire/Errors.h"
#include "mcpwire/JsonRpcCodec.h"

namespace mcpwire {

namespace {
InvalidMessage invalid(int code, std::string message, JSONRPCId id = nullptr) {
    InvalidMessage m;
    m.code = code;
    m.message = std::move(message);
    m.id = std::move(id);
    return m;
}

// Returns false when the id member exists but is not string, integer or null.
bool extractId(const JSONValue& doc, JSONRPCId& id, bool& present) {
    const JSONValue* v = FindMember(doc, "id");
    present = v != nullptr;
    id = nullptr;
    if (!v) {
        return true;
    }
    if (std::holds_alternative<std::string>(v->value)) {
        id = std::get<std::string>(v->value);
        return true;
    }
    if (std::holds_alternative<int64_t>(v->value)) {
        id = std::get<int64_t>(v->value);
        return true;
    }
    return v->IsNull();
}
} // namespace

DecodedMessage DecodeMessage(const std::string& text) {
    FUNC_SCOPE();
    JSONValue doc;
    try {
        doc = ParseJSON(text);
    } catch (const errors::Error& e) {
        LOG_DEBUG("DecodeMessage: parse failure: {}", e.what());
        return invalid(JSONRPCErrorCodes::ParseError, "Parse error");
    }
    if (!doc.IsObject()) {
        return invalid(JSONRPCErrorCodes::InvalidRequest, "Invalid Request: expected a JSON object");
    }

    JSONRPCId id = nullptr;
    bool hasId = false;
    if (!extractId(doc, id, hasId)) {
        return invalid(JSONRPCErrorCodes::InvalidRequest, "Invalid Request: id must be a string, integer or null");
    }

    auto version = FindString(doc, "jsonrpc");
    if (!version.has_value() || version.value() != "2.0") {
        return invalid(JSONRPCErrorCodes::InvalidRequest, "Invalid Request: jsonrpc must be \"2.0\"", id);
    }

    const JSONValue* method = FindMember(doc, "method");
    const JSONValue* result = FindMember(doc, "result");
    const JSONValue* error = FindMember(doc, "error");
    const auto& obj = std::get<JSONValue::Object>(doc.value);
    const bool hasResult = obj.find("result") != obj.end();

    if (method) {
        if (!method->IsString()) {
            return invalid(JSONRPCErrorCodes::InvalidRequest, "Invalid Request: method must be a string", id);
        }
        std::optional<JSONValue> params;
        if (const JSONValue* p = FindMember(doc, "params")) {
            params = *p;
        }
        const std::string& name = std::get<std::string>(method->value);
        if (hasId) {
            return JSONRPCRequest(id, name, std::move(params));
        }
        return JSONRPCNotification(name, std::move(params));
    }

    if (hasResult || error) {
        if (hasResult && error) {
            return invalid(JSONRPCErrorCodes::InvalidRequest, "Invalid Request: both result and error present", id);
        }
        if (!hasId) {
            return invalid(JSONRPCErrorCodes::InvalidRequest, "Invalid Request: response without id");
        }
        JSONRPCResponse response;
        response.id = id;
        if (error) {
            if (!errors::rpcErrorFromErrorValue(*error).has_value()) {
                return invalid(JSONRPCErrorCodes::InvalidRequest, "Invalid Request: malformed error object", id);
            }
            response.error = *error;
        } else {
            response.result = result ? *result : JSONValue(nullptr);
        }
        return response;
    }

    return invalid(JSONRPCErrorCodes::InvalidRequest, "Invalid Request: missing method", id);
}

MessageKind KindOf(const DecodedMessage& msg) {
    switch (msg.index()) {
        case 0: return MessageKind::Request;
        case 1: return MessageKind::Notification;
        case 2: return MessageKind::Response;
        default: return MessageKind::Invalid;
    }
}

std::unique_ptr<JSONRPCResponse> ErrorResponseFor(const InvalidMessage& inv) {
    return CreateErrorResponse(inv.id, inv.code, inv.message);
}

/////////////////////////////////////////// Message Deserialize ///////////////////////////////////////////

bool JSONRPCRequest::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    auto decoded = DecodeMessage(json);
    if (auto* req = std::get_if<JSONRPCRequest>(&decoded)) {
        *this = std::move(*req);
        return true;
    }
    return false;
}

bool JSONRPCResponse::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    auto decoded = DecodeMessage(json);
    if (auto* resp = std::get_if<JSONRPCResponse>(&decoded)) {
        *this = std::move(*resp);
        return true;
    }
    return false;
}

bool JSONRPCNotification::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    auto decoded = DecodeMessage(json);
    if (auto* note = std::get_if<JSONRPCNotification>(&decoded)) {
        *this = std::move(*note);
        return true;
    }
    return false;
}

} // namespace mcpwire
