//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: JsonRpcCodec.h
// Purpose: Decoding of raw text into typed JSON-RPC messages, with protocol-level error classification
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <variant>

#include "mcpwire/JSONRPCTypes.h"

namespace mcpwire {

//==========================================================================================================
// InvalidMessage
// Purpose: Decoding failure ready to be answered on the wire.
// Fields:
//   code: -32700 for malformed JSON, -32600 for a structurally invalid envelope.
//   message: Human-readable reason.
//   id: The request id when it could be extracted, otherwise null.
//==========================================================================================================
struct InvalidMessage {
    int code{JSONRPCErrorCodes::InvalidRequest};
    std::string message;
    JSONRPCId id{nullptr};
};

using DecodedMessage = std::variant<JSONRPCRequest, JSONRPCNotification, JSONRPCResponse, InvalidMessage>;

enum class MessageKind {
    Request,
    Notification,
    Response,
    Invalid
};

//==========================================================================================================
// DecodeMessage
// Purpose: Parses one document and classifies it.
// Notes:
//   - Malformed JSON yields InvalidMessage{-32700, id null}.
//   - A non-object, a jsonrpc member other than "2.0", a non-string method, an id that is not a string,
//     integer or null, a document carrying both result and error, or one with neither method nor
//     result/error yields InvalidMessage{-32600} with the id if present.
//   - "method" with "id" is a Request; "method" without "id" is a Notification; "result" or "error"
//     is a Response.
//==========================================================================================================
DecodedMessage DecodeMessage(const std::string& text);

MessageKind KindOf(const DecodedMessage& msg);

// Builds the error response answering an InvalidMessage.
std::unique_ptr<JSONRPCResponse> ErrorResponseFor(const InvalidMessage& invalid);

} // namespace mcpwire
