//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: SocketTransport.hpp
// Purpose: Newline-delimited TCP transport (client or single-peer listener) built on Boost.Asio
//==========================================================================================================
#pragma once

#include "mcpwire/Transport.h"
#include <cstdint>
#include <memory>
#include <string>

namespace mcpwire {

//==========================================================================================================
// SocketTransport
// Purpose: TCP line transport with one background reader thread.
// Notes:
//   - Client mode dials host:port; the connected socket is split into a reader and a duplicated writer.
//   - Listener mode binds host:port and serves one peer at a time; when a peer disconnects the transport
//     returns to accepting.
//   - Each received (trimmed, non-empty) line is delivered to the message handler and queued for
//     ReceiveText.
//==========================================================================================================
class SocketTransport : public ITransport {
public:
    enum class Mode { Client, Listener };

    struct Options {
        Mode mode{Mode::Client};
        std::string host{"127.0.0.1"};
        std::string port{"0"};
        // 0 waits indefinitely in ReceiveText.
        uint64_t receiveTimeoutMs{0};
    };

    explicit SocketTransport(const Options& opts);
    ~SocketTransport() override;

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    void Start() override;
    void Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;

    //==========================================================================================================
    // Writes text plus '\n' to the connected peer.
    // Throws:
    //   NotConnected; Transport("No client to send to") in listener mode without a peer;
    //   Transport("Failed to write: ...") on socket errors.
    //==========================================================================================================
    void SendText(const std::string& text) override;

    //==========================================================================================================
    // Pops the next received line.
    // Throws:
    //   NotConnected when closed (also while blocked); Timeout when receiveTimeoutMs elapses.
    //==========================================================================================================
    std::string ReceiveText() override;

    void SetMessageHandler(MessageHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;
    void SetCloseHandler(CloseHandler handler) override;

    // Bound port in listener mode, local port in client mode; 0 before Start().
    uint16_t LocalPort() const;

    // True while a listener has an accepted peer, or while a client is connected.
    bool HasPeer() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// SocketTransportFactory
// Purpose: "tcp://host:port" creates a client; "tcp-listen://host:port" a listener. Query key
//          receive_timeout_ms sets Options::receiveTimeoutMs.
//==========================================================================================================
class SocketTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;
};

} // namespace mcpwire
