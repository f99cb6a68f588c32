//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: FramedTransport.hpp
// Purpose: Persistent framed transport over WebSocket (Boost.Beast), push-only delivery
//==========================================================================================================
#pragma once

#include "mcpwire/Transport.h"
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <memory>
#include <string>

namespace mcpwire {

//==========================================================================================================
// FramedTransport
// Purpose: One text frame per JSON-RPC document. An io_context thread runs a coroutine reader which hands
//          text frames to the message handler, drops binary frames, and absorbs ping/pong.
// Notes:
//   - Client mode performs the handshake in Start(). Listener mode accepts one peer at a time and returns
//     to accepting when that peer goes away.
//   - Frame-level errors are classified by IsTransientFrameError: transient errors back off briefly and
//     continue; anything else reports through the error handler and tears the connection down.
//==========================================================================================================
class FramedTransport : public ITransport {
public:
    enum class Mode { Client, Listener };

    struct Options {
        Mode mode{Mode::Client};
        std::string host{"127.0.0.1"};
        std::string port{"0"};
        std::string path{"/"};
    };

    explicit FramedTransport(const Options& opts);
    ~FramedTransport() override;

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    void Start() override;
    void Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;

    //==========================================================================================================
    // Writes text as a single text frame.
    // Throws:
    //   NotConnected; Transport("No client to send to") in listener mode without a peer;
    //   Transport("Failed to write: ...") on frame errors.
    // Notes:
    //   Frames are written in call order by a single writer. Called from a handler on the io thread, the
    //   frame is queued and SendText returns at once; a later write failure reaches only the error handler.
    //==========================================================================================================
    void SendText(const std::string& text) override;

    //==========================================================================================================
    // Not supported: always throws Transport("WebSocket transport uses async message handling").
    //==========================================================================================================
    std::string ReceiveText() override;

    bool SupportsReceive() const override { return false; }

    void SetMessageHandler(MessageHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;
    void SetCloseHandler(CloseHandler handler) override;

    uint16_t LocalPort() const;
    bool HasPeer() const;

    // True for would-block style conditions that the reader retries after a short sleep.
    static bool IsTransientFrameError(const boost::system::error_code& ec);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// FramedTransportFactory
// Purpose: "ws://host:port/path" creates a client; "ws-listen://host:port/path" a listener.
//==========================================================================================================
class FramedTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;
};

} // namespace mcpwire
