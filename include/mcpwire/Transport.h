//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: Transport.h
// Purpose: Uniform transport contract (lifecycle, text I/O, callbacks) and transport factories
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <string>

#include "mcpwire/Errors.h"

namespace mcpwire {

//==========================================================================================================
// ITransport
// Purpose: Capability contract shared by every concrete transport.
// Notes:
//   - State machine: Idle --Start()--> Connected --Close()--> Closed. Closed is terminal.
//   - Start() while Connected throws AlreadyConnected; SendText/ReceiveText outside Connected throw
//     NotConnected.
//   - Close() is idempotent and fires the close handler at most once.
//   - Handlers are stored values; registering again overwrites the previous handler.
//==========================================================================================================
class ITransport {
public:
    using MessageHandler = std::function<void(const std::string& text)>;
    using ErrorHandler = std::function<void(const errors::Error& error)>;
    using CloseHandler = std::function<void()>;

    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Opens the underlying medium and spawns the background reader where the transport has one.
    // Throws:
    //   errors::Error AlreadyConnected when already started; Transport when the medium cannot be opened.
    //==========================================================================================================
    virtual void Start() = 0;

    //==========================================================================================================
    // Flips the state to Closed, stops and joins any background reader, releases the medium and then
    // invokes the close handler. Safe to call in any state.
    //==========================================================================================================
    virtual void Close() = 0;

    virtual bool IsConnected() const = 0;

    // Diagnostic identifier, e.g. "tcp-4821".
    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Text I/O ///////////////////////////////////////////
    //==========================================================================================================
    // Sends one complete JSON-RPC document.
    // Args:
    //   text: Serialized message without delimiter; the transport adds newline or frame boundaries.
    // Throws:
    //   errors::Error NotConnected or Transport.
    //==========================================================================================================
    virtual void SendText(const std::string& text) = 0;

    //==========================================================================================================
    // Blocks for the next inbound document.
    // Throws:
    //   errors::Error NotConnected, Transport, or Timeout when the transport has a receive timeout.
    //==========================================================================================================
    virtual std::string ReceiveText() = 0;

    // False for push-only transports whose inbound traffic arrives exclusively through the message handler.
    virtual bool SupportsReceive() const { return true; }

    /////////////////////////////////////////// Callbacks ///////////////////////////////////////////
    virtual void SetMessageHandler(MessageHandler handler) = 0;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
    virtual void SetCloseHandler(CloseHandler handler) = 0;
};

// Concrete transports are declared in their respective headers:
//  - mcpwire/StreamTransport.hpp
//  - mcpwire/SocketTransport.hpp
//  - mcpwire/FramedTransport.hpp
//  - mcpwire/EventStreamTransport.hpp
//  - mcpwire/InMemoryTransport.hpp

//==========================================================================================================
// Transport factory interface
// Purpose: Factory for creating transports from configuration strings.
//==========================================================================================================
class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;

    //==========================================================================================================
    // Creates a transport instance using the provided configuration.
    // Args:
    //   config: Transport-specific configuration string (e.g., "tcp://127.0.0.1:9000").
    // Returns:
    //   A unique_ptr to a newly created, not yet started ITransport.
    // Throws:
    //   errors::Error InvalidRequest when the configuration cannot be parsed.
    //==========================================================================================================
    virtual std::unique_ptr<ITransport> CreateTransport(const std::string& config) = 0;
};

//==========================================================================================================
// CreateTransport
// Purpose: Selects a factory by URI scheme: stdio / command=, tcp, tcp-listen, ws, ws-listen, http, https,
//          sse-listen, memory.
//==========================================================================================================
std::unique_ptr<ITransport> CreateTransport(const std::string& uri);

} // namespace mcpwire
