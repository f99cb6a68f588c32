//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: EventStreamTransport.hpp
// Purpose: Half-duplex HTTP transport: Server-Sent Events inbound, POST outbound (Boost.Beast, OpenSSL)
//==========================================================================================================
#pragma once

#include "mcpwire/Transport.h"
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace mcpwire {

//==========================================================================================================
// SseEvent / SseEventParser
// Purpose: Incremental text/event-stream decoder. Lines may arrive split across chunks; "data:" lines of one
//          event are joined with '\n', comment lines (leading ':') are ignored, and a blank line dispatches.
//==========================================================================================================
struct SseEvent {
    std::string event;   // empty for the default "message" type
    std::string data;
    std::string id;
};

class SseEventParser {
public:
    // Consumes a chunk and returns the events completed by it.
    std::vector<SseEvent> Feed(std::string_view chunk);

private:
    void processLine(std::string_view line, std::vector<SseEvent>& out);

    std::string buffer_;
    SseEvent current_;
    bool hasData_{false};
};

//==========================================================================================================
// EventStreamTransport
// Purpose: Client mode subscribes to GET <events> on a background io thread, queues each event payload and
//          delivers it to the message handler; SendText POSTs to <message>. Server mode binds an HTTP listener
//          that assigns each subscribing peer an id and an outbound queue; SendText enqueues onto the current
//          peer's queue for streaming or polling.
//==========================================================================================================
class EventStreamTransport : public ITransport {
public:
    enum class Mode { Client, Server };

    struct Options {
        Mode mode{Mode::Client};
        std::string scheme{"http"};          // http or https
        std::string host{"127.0.0.1"};
        std::string port{"0"};
        std::string basePath;                // client: prefix applied to relative endpoint paths
        std::string eventsPath{"/events"};
        std::string messagePath{"/message"};
        std::string pollPath{"/poll"};
        uint64_t reconnectMs{2000};          // client: delay before re-subscribing
        uint64_t receiveTimeoutMs{0};        // 0 waits indefinitely in ReceiveText
        uint64_t drainMs{1000};              // server: longest wait in Close() for queued messages to go out
        uint64_t keepAliveMs{15000};         // server: interval of ": keep-alive" comments
        std::string certFile;                // server https
        std::string keyFile;                 // server https
        std::string caFile;                  // client https; empty uses the system trust store
    };

    explicit EventStreamTransport(const Options& opts);
    ~EventStreamTransport() override;

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    void Start() override;

    //==========================================================================================================
    // Server mode keeps streaming and answering polls until every client queue is empty or drainMs has
    // passed. Each event stream then writes what is left before the sockets go away. POSTs during the
    // drain get 503.
    //==========================================================================================================
    void Close() override;

    bool IsConnected() const override;
    std::string GetSessionId() const override;

    //==========================================================================================================
    // Client: synchronous POST. Server: enqueue for the current peer.
    // Throws:
    //   NotConnected; Transport("Server returned error: <status>") for a non-2xx POST;
    //   Transport("No client to send to") in server mode without a current peer.
    //==========================================================================================================
    void SendText(const std::string& text) override;

    std::string ReceiveText() override;

    void SetMessageHandler(MessageHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;
    void SetCloseHandler(CloseHandler handler) override;

    // Server: bound port; 0 before Start() and in client mode.
    uint16_t LocalPort() const;

    // Client: POST target currently in use (updated by "endpoint" events).
    std::string MessageTarget() const;

    // Server: id of the peer SendText targets, or empty.
    std::string CurrentClientId() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// EventStreamTransportFactory
// Purpose: "http(s)://host:port[/base]" creates a client (query: events, message, reconnect_ms,
//          receive_timeout_ms, ca); "sse-listen://host:port" a server (query: events, message, poll,
//          drain_ms, cert, key). A server with cert and key serves https.
//==========================================================================================================
class EventStreamTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;
};

} // namespace mcpwire
