//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: InMemoryTransport.cpp
// Purpose: In-memory transport implementation
//==========================================================================================================

#include <memory>
#include <mutex>
#include <string>

#include "logging/Logger.h"
#include "mcpwire/InMemoryTransport.hpp"
#include "ConnectionState.h"

namespace mcpwire {

class InMemoryTransport::Impl {
public:
    detail::ConnectionState state;
    detail::InboundQueue inbox;
    std::string sessionId;
    std::weak_ptr<Impl> peer;
    std::mutex peerMutex;

    Impl() : sessionId(detail::makeSessionId("memory")) {}

    void deliver(const std::string& text) {
        inbox.push(text);
        state.emitMessage(text);
    }
};

InMemoryTransport::InMemoryTransport() : pImpl(std::make_shared<Impl>()) { FUNC_SCOPE(); }

InMemoryTransport::~InMemoryTransport() {
    FUNC_SCOPE();
    Close();
}

std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> InMemoryTransport::CreatePair() {
    FUNC_SCOPE();
    auto transport1 = std::make_unique<InMemoryTransport>();
    auto transport2 = std::make_unique<InMemoryTransport>();
    transport1->pImpl->peer = transport2->pImpl;
    transport2->pImpl->peer = transport1->pImpl;
    return std::make_pair(std::move(transport1), std::move(transport2));
}

void InMemoryTransport::Start() {
    FUNC_SCOPE();
    pImpl->state.beginStart();
    pImpl->state.markConnected();
    LOG_INFO("InMemoryTransport started (session={})", pImpl->sessionId);
}

void InMemoryTransport::Close() {
    FUNC_SCOPE();
    if (!pImpl->state.markClosed()) {
        pImpl->inbox.shutdown();
        return;
    }
    LOG_INFO("Closing InMemoryTransport (session={})", pImpl->sessionId);
    pImpl->inbox.shutdown();
    pImpl->state.emitClose();
}

bool InMemoryTransport::IsConnected() const { FUNC_SCOPE(); return pImpl->state.isConnected(); }
std::string InMemoryTransport::GetSessionId() const { FUNC_SCOPE(); return pImpl->sessionId; }

void InMemoryTransport::SendText(const std::string& text) {
    FUNC_SCOPE();
    pImpl->state.requireConnected();
    std::shared_ptr<Impl> peer;
    {
        std::lock_guard<std::mutex> lock(pImpl->peerMutex);
        peer = pImpl->peer.lock();
    }
    if (!peer || !peer->state.isConnected()) {
        auto err = errors::Error::transport("Peer not connected");
        LOG_WARN("InMemoryTransport: peer not connected; dropping message");
        pImpl->state.emitError(err);
        throw err;
    }
    LOG_DEBUG("InMemoryTransport send: {}", text);
    peer->deliver(text);
}

std::string InMemoryTransport::ReceiveText() {
    FUNC_SCOPE();
    pImpl->state.requireConnected();
    return pImpl->inbox.pop();
}

void InMemoryTransport::SetMessageHandler(MessageHandler handler) {
    FUNC_SCOPE();
    pImpl->state.setMessageHandler(std::move(handler));
}

void InMemoryTransport::SetErrorHandler(ErrorHandler handler) {
    FUNC_SCOPE();
    pImpl->state.setErrorHandler(std::move(handler));
}

void InMemoryTransport::SetCloseHandler(CloseHandler handler) {
    FUNC_SCOPE();
    pImpl->state.setCloseHandler(std::move(handler));
}

std::unique_ptr<ITransport> InMemoryTransportFactory::CreateTransport(const std::string& /*config*/) {
    return std::make_unique<InMemoryTransport>();
}

} // namespace mcpwire
