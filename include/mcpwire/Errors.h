//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: Errors.h
// Purpose: Engine error taxonomy (kind + fatality) and JSON-RPC wire error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "mcpwire/JSONRPCTypes.h"

namespace mcpwire {
namespace errors {

/////////////////////////////////////////// Engine error taxonomy ///////////////////////////////////////////

// Closed set of failure kinds shared by transports, codec and engines.
enum class ErrorKind {
    Transport,
    Serialization,
    Deserialization,
    Protocol,
    NotFound,
    InvalidRequest,
    Authentication,
    Authorization,
    State,
    Transition,
    AlreadyConnected,
    NotConnected,
    Timeout,
    Internal
};

// Stable name of a kind, e.g. "Transport".
const char* kindName(ErrorKind kind);

//==========================================================================================================
// Error
// Purpose: Tagged error thrown by every engine operation. Callers switch on kind(); what() renders the
//          display string ("Transport error: <detail>", "Transport error: Not connected", ...).
// Fields:
//   kind: The ErrorKind tag.
//   detail: Kind-specific message; empty for AlreadyConnected, NotConnected and Timeout.
//   rpcCode: JSON-RPC code when the error was produced from a server error frame.
//==========================================================================================================
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, std::string detail = std::string(), std::optional<int> rpcCode = std::nullopt);

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& detail() const noexcept { return detail_; }
    std::optional<int> rpcCode() const noexcept { return rpcCode_; }

    //==========================================================================================================
    // isFatal
    // Purpose: True for kinds that require tearing the connection down: Transport, Protocol, NotConnected,
    //          Authentication and Authorization.
    //==========================================================================================================
    bool isFatal() const noexcept;

    static Error transport(std::string msg) { return Error(ErrorKind::Transport, std::move(msg)); }
    static Error serialization(std::string msg) { return Error(ErrorKind::Serialization, std::move(msg)); }
    static Error deserialization(std::string msg) { return Error(ErrorKind::Deserialization, std::move(msg)); }
    static Error protocol(std::string msg) { return Error(ErrorKind::Protocol, std::move(msg)); }
    static Error notFound(std::string msg) { return Error(ErrorKind::NotFound, std::move(msg)); }
    static Error invalidRequest(std::string msg) { return Error(ErrorKind::InvalidRequest, std::move(msg)); }
    static Error authentication(std::string msg) { return Error(ErrorKind::Authentication, std::move(msg)); }
    static Error authorization(std::string msg) { return Error(ErrorKind::Authorization, std::move(msg)); }
    static Error state(std::string msg) { return Error(ErrorKind::State, std::move(msg)); }
    static Error transition(std::string msg) { return Error(ErrorKind::Transition, std::move(msg)); }
    static Error alreadyConnected() { return Error(ErrorKind::AlreadyConnected); }
    static Error notConnected() { return Error(ErrorKind::NotConnected); }
    static Error timeout() { return Error(ErrorKind::Timeout); }
    static Error internal(std::string msg) { return Error(ErrorKind::Internal, std::move(msg)); }

private:
    ErrorKind kind_;
    std::string detail_;
    std::optional<int> rpcCode_;
};

// Renders the display string for a kind/detail pair.
std::string formatError(ErrorKind kind, const std::string& detail);

//==========================================================================================================
// isTransient
// Purpose: Server retry carve-out. NotConnected/AlreadyConnected, and Transport errors that describe a
//          peer-initiated connection reset, are expected during reconnects and never count toward the
//          fatal error budget.
//==========================================================================================================
bool isTransient(const Error& e);

/////////////////////////////////////////// JSON-RPC wire errors ///////////////////////////////////////////

// Categorization of the JSON-RPC error codes used on the wire.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    Application,
    Unknown
};

// Wire error representation ({ code, message, data? }).
struct RpcError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a JSON-RPC numeric error code to an ErrorCategory; Unknown when unmapped.
ErrorCategory errorCategoryFromCode(int code);

// Convert a JSON-RPC error object to RpcError. Returns std::nullopt when the shape is not
// { code: integer, message: string, data?: any }.
std::optional<RpcError> rpcErrorFromErrorValue(const JSONValue& errVal);

// Extract RpcError from a JSONRPCResponse if it carries a well-formed error.
std::optional<RpcError> rpcErrorFromResponse(const JSONRPCResponse& response);

// Create a JSONValue error object from a typed RpcError.
JSONValue makeErrorValue(const RpcError& err);

// Create a JSONRPCResponse error from RpcError and id.
std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const RpcError& err);

// Convenience: build an RpcError with category derived from code.
RpcError makeRpcError(int code, std::string message);

} // namespace errors
} // namespace mcpwire
