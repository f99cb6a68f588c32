//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: ConnectionState.h
// Purpose: Guarded connection state cell and inbound message queue shared by the concrete transports
//==========================================================================================================

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <random>
#include <string>

#include "mcpwire/Errors.h"
#include "mcpwire/Transport.h"

namespace mcpwire {
namespace detail {

//==========================================================================================================
// ConnectionState
// Purpose: One lock guarding the Idle/Connected/Closed phase and the handler triple. Handlers are copied
//          under the lock and invoked outside it, so a callback may call back into its transport.
//==========================================================================================================
class ConnectionState {
public:
    enum class Phase { Idle, Connected, Closed };

    void setMessageHandler(ITransport::MessageHandler h) {
        std::lock_guard<std::mutex> lock(mutex_);
        onMessage_ = std::move(h);
    }
    void setErrorHandler(ITransport::ErrorHandler h) {
        std::lock_guard<std::mutex> lock(mutex_);
        onError_ = std::move(h);
    }
    void setCloseHandler(ITransport::CloseHandler h) {
        std::lock_guard<std::mutex> lock(mutex_);
        onClose_ = std::move(h);
    }

    // Reserves the start; throws AlreadyConnected while Connected or while another Start() is running.
    void beginStart() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (phase_ == Phase::Connected || starting_) {
            throw errors::Error::alreadyConnected();
        }
        if (phase_ == Phase::Closed) {
            throw errors::Error::state("Transport has been closed");
        }
        starting_ = true;
    }

    // Completes a reserved start.
    void markConnected() {
        std::lock_guard<std::mutex> lock(mutex_);
        starting_ = false;
        phase_ = Phase::Connected;
    }

    // Releases a reserved start after the medium failed to open; the transport stays Idle.
    void abortStart() {
        std::lock_guard<std::mutex> lock(mutex_);
        starting_ = false;
    }

    // Moves to Closed. Returns true only for the caller that performed Connected -> Closed.
    bool markClosed() {
        std::lock_guard<std::mutex> lock(mutex_);
        const bool wasConnected = phase_ == Phase::Connected;
        phase_ = Phase::Closed;
        return wasConnected;
    }

    bool isConnected() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return phase_ == Phase::Connected;
    }

    Phase phase() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return phase_;
    }

    void requireConnected() const {
        if (!isConnected()) {
            throw errors::Error::notConnected();
        }
    }

    void emitMessage(const std::string& text) const {
        ITransport::MessageHandler h;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            h = onMessage_;
        }
        if (h) {
            h(text);
        }
    }

    void emitError(const errors::Error& e) const {
        ITransport::ErrorHandler h;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            h = onError_;
        }
        if (h) {
            h(e);
        }
    }

    void emitClose() const {
        ITransport::CloseHandler h;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            h = onClose_;
        }
        if (h) {
            h();
        }
    }

private:
    mutable std::mutex mutex_;
    Phase phase_{Phase::Idle};
    bool starting_{false};
    ITransport::MessageHandler onMessage_;
    ITransport::ErrorHandler onError_;
    ITransport::CloseHandler onClose_;
};

//==========================================================================================================
// InboundQueue
// Purpose: FIFO of received documents backing ReceiveText on transports with a background reader.
//          pop() blocks until a message arrives, the queue is shut down (NotConnected) or the optional
//          timeout elapses (Timeout).
//==========================================================================================================
class InboundQueue {
public:
    void push(std::string text) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            items_.push_back(std::move(text));
        }
        cv_.notify_one();
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shut_ = true;
            items_.clear();
        }
        cv_.notify_all();
    }

    std::string pop(std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto ready = [this]() { return shut_ || !items_.empty(); };
        if (timeout.has_value() && timeout->count() > 0) {
            if (!cv_.wait_for(lock, *timeout, ready)) {
                throw errors::Error::timeout();
            }
        } else {
            cv_.wait(lock, ready);
        }
        if (shut_) {
            throw errors::Error::notConnected();
        }
        std::string front = std::move(items_.front());
        items_.pop_front();
        return front;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> items_;
    bool shut_{false};
};

// Random diagnostic session id, e.g. "tcp-4821".
inline std::string makeSessionId(const std::string& prefix) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(1000, 9999);
    return prefix + "-" + std::to_string(dis(gen));
}

} // namespace detail
} // namespace mcpwire
