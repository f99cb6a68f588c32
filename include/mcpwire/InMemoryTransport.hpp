//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: InMemoryTransport.hpp
// Purpose: In-memory transport pair for tests and embedding
//==========================================================================================================
#pragma once

#include "mcpwire/Transport.h"
#include <memory>
#include <utility>

namespace mcpwire {

//==========================================================================================================
// InMemoryTransport
// Purpose: In-process transport. Sending on one endpoint queues the text for its peer and fires the peer's
//          message handler; ReceiveText pops the local queue.
//==========================================================================================================
class InMemoryTransport : public ITransport {
public:
    InMemoryTransport();
    ~InMemoryTransport() override;

    //==========================================================================================================
    // CreatePair
    // Purpose: Creates two endpoints wired to each other.
    // Returns:
    //   pair(left,right) where sending on one delivers to the other.
    //==========================================================================================================
    static std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> CreatePair();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    void Start() override;
    void Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;

    //==========================================================================================================
    // Delivers text to the peer endpoint.
    // Throws:
    //   NotConnected when this endpoint is not started; Transport when the peer is gone or not started.
    //==========================================================================================================
    void SendText(const std::string& text) override;
    std::string ReceiveText() override;

    void SetMessageHandler(MessageHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;
    void SetCloseHandler(CloseHandler handler) override;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

// Config string is ignored; the endpoint is unpaired until wired by CreatePair.
class InMemoryTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;
};

} // namespace mcpwire
