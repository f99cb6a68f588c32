//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: FramedTransport.cpp
// Purpose: WebSocket transport using Boost.Beast coroutines on a dedicated io_context thread
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "logging/Logger.h"
#include "mcpwire/FramedTransport.hpp"
#include "ConnectionState.h"
#include "TransportUri.h"

namespace mcpwire {
namespace net = boost::asio;
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp = net::ip::tcp;

namespace {
constexpr auto RetryBackoff = std::chrono::milliseconds(10);
constexpr auto CloseTimeout = std::chrono::milliseconds(1000);
constexpr auto SendWaitSlice = std::chrono::milliseconds(50);
using WsStream = websocket::stream<beast::tcp_stream>;
}

bool FramedTransport::IsTransientFrameError(const boost::system::error_code& ec) {
    return ec == net::error::would_block || ec == net::error::try_again;
}

class FramedTransport::Impl {
public:
    enum class ReadOutcome { Stopped, PeerClosed, Failed };

    FramedTransport::Options opts;
    detail::ConnectionState state;
    std::string sessionId;

    net::io_context ioc;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::thread ioThread;
    std::atomic<std::thread::id> ioThreadId{};
    std::atomic<uint16_t> localPort{0};

    mutable std::mutex peerMutex;
    std::shared_ptr<WsStream> peer;

    // One queued frame. Beast allows a single outstanding write per stream, so every text and close frame
    // goes through outbox and is written by one drainWrites coroutine. Both members are io-thread only.
    struct Outbound {
        std::shared_ptr<WsStream> ws;
        std::string text;
        bool close = false;
        std::function<void(boost::system::error_code)> done;
    };
    std::deque<Outbound> outbox;
    bool writing = false;

    explicit Impl(const FramedTransport::Options& o) : opts(o), sessionId(detail::makeSessionId("ws")) {}

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            if (ioThread.get_id() != std::this_thread::get_id()) {
                ioThread.join();
            } else {
                ioThread.detach();
            }
        }
    }

    std::shared_ptr<WsStream> currentPeer() const {
        std::lock_guard<std::mutex> lock(peerMutex);
        return peer;
    }

    void setPeer(std::shared_ptr<WsStream> ws) {
        std::lock_guard<std::mutex> lock(peerMutex);
        peer = std::move(ws);
    }

    bool onIoThread() const { return ioThreadId.load() == std::this_thread::get_id(); }

    void configure(WsStream& ws) {
        ws.text(true);
        ws.control_callback([](websocket::frame_type kind, beast::string_view payload) {
            const char* name = kind == websocket::frame_type::ping ? "ping"
                             : kind == websocket::frame_type::pong ? "pong" : "close";
            LOG_DEBUG("FramedTransport control frame: {} ({} bytes)", name, payload.size());
        });
    }

    //==========================================================================================================
    // readFrames
    // Purpose: Reads frames until the peer closes, a fatal error occurs, or the connection flag drops.
    //==========================================================================================================
    net::awaitable<ReadOutcome> readFrames(std::shared_ptr<WsStream> ws, boost::system::error_code& failure) {
        beast::flat_buffer buffer;
        while (state.isConnected()) {
            boost::system::error_code ec;
            buffer.clear();
            co_await ws->async_read(buffer, net::redirect_error(net::use_awaitable, ec));
            if (ec == websocket::error::closed) {
                co_return ReadOutcome::PeerClosed;
            }
            if (ec) {
                if (!state.isConnected()) {
                    co_return ReadOutcome::Stopped;
                }
                if (FramedTransport::IsTransientFrameError(ec)) {
                    LOG_DEBUG("FramedTransport: transient frame error ({}); retrying", ec.message());
                    net::steady_timer timer(co_await net::this_coro::executor);
                    timer.expires_after(RetryBackoff);
                    co_await timer.async_wait(net::redirect_error(net::use_awaitable, ec));
                    continue;
                }
                failure = ec;
                co_return ReadOutcome::Failed;
            }
            if (!ws->got_text()) {
                LOG_DEBUG("FramedTransport: dropping binary frame ({} bytes)", buffer.size());
                continue;
            }
            std::string text = beast::buffers_to_string(buffer.data());
            LOG_DEBUG("FramedTransport received: {}", text);
            state.emitMessage(text);
        }
        co_return ReadOutcome::Stopped;
    }

    void closeFromReader() {
        if (!state.markClosed()) {
            return;
        }
        setPeer(nullptr);
        LOG_INFO("FramedTransport closed by peer (session={})", sessionId);
        state.emitClose();
    }

    void reportFrameError(const boost::system::error_code& ec) {
        auto err = errors::Error::transport("WebSocket error: " + ec.message());
        LOG_ERROR("FramedTransport: {}", err.what());
        state.emitError(err);
    }

    net::awaitable<void> clientSession(std::shared_ptr<WsStream> ws) {
        boost::system::error_code failure;
        ReadOutcome outcome = co_await readFrames(ws, failure);
        if (outcome == ReadOutcome::PeerClosed) {
            LOG_INFO("FramedTransport: peer sent close frame");
            closeFromReader();
        } else if (outcome == ReadOutcome::Failed) {
            reportFrameError(failure);
            closeFromReader();
        }
        co_return;
    }

    net::awaitable<void> acceptLoop() {
        while (state.isConnected()) {
            boost::system::error_code ec;
            tcp::socket socket = co_await acceptor->async_accept(net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                if (!state.isConnected()) {
                    break;
                }
                auto err = errors::Error::transport("Accept error: " + ec.message());
                LOG_ERROR("FramedTransport: {}", err.what());
                state.emitError(err);
                closeFromReader();
                break;
            }
            auto ws = std::make_shared<WsStream>(std::move(socket));
            configure(*ws);
            co_await ws->async_accept(net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                LOG_WARN("FramedTransport: handshake with peer failed: {}", ec.message());
                continue;
            }
            LOG_INFO("FramedTransport: accepted peer");
            setPeer(ws);

            boost::system::error_code failure;
            ReadOutcome outcome = co_await readFrames(ws, failure);
            setPeer(nullptr);
            if (outcome == ReadOutcome::Stopped) {
                break;
            }
            if (outcome == ReadOutcome::Failed) {
                reportFrameError(failure);
                beast::get_lowest_layer(*ws).close();
            }
            LOG_INFO("FramedTransport: peer disconnected; waiting for next peer");
        }
        co_return;
    }

    std::shared_ptr<WsStream> connectClient() {
        tcp::resolver resolver(ioc);
        boost::system::error_code ec;
        auto results = resolver.resolve(opts.host, opts.port, ec);
        if (ec) {
            throw errors::Error::transport("Failed to resolve " + opts.host + ":" + opts.port + ": " + ec.message());
        }
        auto ws = std::make_shared<WsStream>(ioc);
        beast::get_lowest_layer(*ws).connect(results, ec);
        if (ec) {
            throw errors::Error::transport("Failed to connect to " + opts.host + ":" + opts.port + ": " + ec.message());
        }
        configure(*ws);
        ws->handshake(opts.host + ":" + opts.port, opts.path, ec);
        if (ec) {
            throw errors::Error::transport("WebSocket handshake failed: " + ec.message());
        }
        localPort = beast::get_lowest_layer(*ws).socket().local_endpoint(ec).port();
        LOG_INFO("FramedTransport: connected to ws://{}:{}{}", opts.host, opts.port, opts.path);
        return ws;
    }

    void bindListener() {
        tcp::resolver resolver(ioc);
        boost::system::error_code ec;
        auto results = resolver.resolve(opts.host, opts.port, ec);
        if (ec || results.empty()) {
            throw errors::Error::transport("Failed to resolve " + opts.host + ":" + opts.port + ": " + ec.message());
        }
        tcp::endpoint ep = *results.begin();
        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol(), ec);
        if (!ec) acceptor->set_option(tcp::acceptor::reuse_address(true), ec);
        if (!ec) acceptor->bind(ep, ec);
        if (!ec) acceptor->listen(net::socket_base::max_listen_connections, ec);
        if (ec) {
            acceptor.reset();
            throw errors::Error::transport("Failed to bind " + opts.host + ":" + opts.port + ": " + ec.message());
        }
        localPort = acceptor->local_endpoint(ec).port();
        LOG_INFO("FramedTransport: listening on ws://{}:{}{}", opts.host, localPort.load(), opts.path);
    }

    net::awaitable<void> drainWrites() {
        while (!outbox.empty()) {
            Outbound item = std::move(outbox.front());
            outbox.pop_front();
            boost::system::error_code ec;
            if (item.close) {
                co_await item.ws->async_close(websocket::close_code::normal,
                                              net::redirect_error(net::use_awaitable, ec));
            } else {
                co_await item.ws->async_write(net::buffer(item.text), net::redirect_error(net::use_awaitable, ec));
            }
            if (item.done) {
                item.done(ec);
            }
        }
        writing = false;
        co_return;
    }

    // Queues a frame from any thread; done runs on the io thread once the frame is written or failed.
    void enqueue(Outbound item) {
        net::post(ioc, [this, item = std::move(item)]() mutable {
            outbox.push_back(std::move(item));
            if (!writing) {
                writing = true;
                net::co_spawn(ioc, drainWrites(), net::detached);
            }
        });
    }

    // Queues text and waits for the write outcome. Throws NotConnected if the transport closes meanwhile.
    boost::system::error_code writeAndWait(std::shared_ptr<WsStream> ws, const std::string& text) {
        auto done = std::make_shared<std::promise<boost::system::error_code>>();
        auto fut = done->get_future();
        enqueue(Outbound{std::move(ws), text, false, [done](boost::system::error_code ec) { done->set_value(ec); }});
        while (fut.wait_for(SendWaitSlice) != std::future_status::ready) {
            if (!state.isConnected()) {
                throw errors::Error::notConnected();
            }
        }
        return fut.get();
    }

    // Sends a close frame to the current peer, bounded by CloseTimeout.
    void closePeerGracefully() {
        auto ws = currentPeer();
        if (!ws || onIoThread()) {
            return;
        }
        auto done = std::make_shared<std::promise<void>>();
        auto fut = done->get_future();
        enqueue(Outbound{ws, std::string(), true, [done](boost::system::error_code ec) {
            if (ec) {
                LOG_DEBUG("FramedTransport: close handshake ended with {}", ec.message());
            }
            done->set_value();
        }});
        if (fut.wait_for(CloseTimeout) != std::future_status::ready) {
            LOG_WARN("FramedTransport: close handshake timed out");
        }
    }

    void stopIo() {
        if (workGuard) {
            workGuard->reset();
            workGuard.reset();
        }
        ioc.stop();
        if (ioThread.joinable() && !onIoThread()) {
            ioThread.join();
        }
        setPeer(nullptr);
        boost::system::error_code ec;
        if (acceptor && !ioThread.joinable()) {
            acceptor->close(ec);
        }
    }
};

FramedTransport::FramedTransport(const Options& opts) : pImpl(std::make_unique<Impl>(opts)) { FUNC_SCOPE(); }

FramedTransport::~FramedTransport() {
    FUNC_SCOPE();
    Close();
}

void FramedTransport::Start() {
    FUNC_SCOPE();
    pImpl->state.beginStart();
    std::shared_ptr<WsStream> ws;
    try {
        if (pImpl->opts.mode == Mode::Client) {
            ws = pImpl->connectClient();
        } else {
            pImpl->bindListener();
        }
    } catch (const errors::Error& e) {
        pImpl->state.abortStart();
        LOG_ERROR("FramedTransport: start failed: {}", e.what());
        pImpl->state.emitError(e);
        throw;
    }
    pImpl->state.markConnected();
    if (ws) {
        pImpl->setPeer(ws);
        net::co_spawn(pImpl->ioc, pImpl->clientSession(ws), net::detached);
    } else {
        net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    }
    pImpl->workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(pImpl->ioc));
    pImpl->ioThread = std::thread([this]() {
        pImpl->ioThreadId = std::this_thread::get_id();
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            auto err = errors::Error::transport(std::string("WebSocket io loop failed: ") + e.what());
            LOG_ERROR("FramedTransport: {}", err.what());
            pImpl->state.emitError(err);
            pImpl->closeFromReader();
        }
        pImpl->ioThreadId = std::thread::id();
    });
    LOG_INFO("FramedTransport started (session={})", pImpl->sessionId);
}

void FramedTransport::Close() {
    FUNC_SCOPE();
    const bool transitioned = pImpl->state.markClosed();
    if (pImpl->ioThread.joinable()) {
        pImpl->closePeerGracefully();
        pImpl->stopIo();
    }
    if (!transitioned) {
        return;
    }
    LOG_INFO("FramedTransport closed (session={})", pImpl->sessionId);
    pImpl->state.emitClose();
}

bool FramedTransport::IsConnected() const { FUNC_SCOPE(); return pImpl->state.isConnected(); }
std::string FramedTransport::GetSessionId() const { FUNC_SCOPE(); return pImpl->sessionId; }
uint16_t FramedTransport::LocalPort() const { return pImpl->localPort.load(); }
bool FramedTransport::HasPeer() const { return pImpl->currentPeer() != nullptr; }

void FramedTransport::SendText(const std::string& text) {
    FUNC_SCOPE();
    pImpl->state.requireConnected();
    auto ws = pImpl->currentPeer();
    std::optional<errors::Error> failure;
    if (!ws) {
        failure = errors::Error::transport("No client to send to");
    } else if (pImpl->onIoThread()) {
        // Called from a handler on the io thread; waiting here would deadlock the reader.
        pImpl->enqueue(Impl::Outbound{ws, text, false, [this](boost::system::error_code ec) {
            if (ec) {
                auto err = errors::Error::transport("Failed to write: " + ec.message());
                LOG_ERROR("FramedTransport: {}", err.what());
                pImpl->state.emitError(err);
            }
        }});
    } else if (auto ec = pImpl->writeAndWait(ws, text)) {
        failure = errors::Error::transport("Failed to write: " + ec.message());
    }
    if (failure) {
        LOG_ERROR("FramedTransport: {}", failure->what());
        pImpl->state.emitError(*failure);
        throw *failure;
    }
    LOG_DEBUG("FramedTransport sent: {}", text);
}

std::string FramedTransport::ReceiveText() {
    FUNC_SCOPE();
    auto err = errors::Error::transport("WebSocket transport uses async message handling");
    pImpl->state.emitError(err);
    throw err;
}

void FramedTransport::SetMessageHandler(MessageHandler handler) {
    FUNC_SCOPE();
    pImpl->state.setMessageHandler(std::move(handler));
}

void FramedTransport::SetErrorHandler(ErrorHandler handler) {
    FUNC_SCOPE();
    pImpl->state.setErrorHandler(std::move(handler));
}

void FramedTransport::SetCloseHandler(CloseHandler handler) {
    FUNC_SCOPE();
    pImpl->state.setCloseHandler(std::move(handler));
}

std::unique_ptr<ITransport> FramedTransportFactory::CreateTransport(const std::string& config) {
    FUNC_SCOPE();
    auto uri = detail::ParseTransportUri(config, "");
    FramedTransport::Options opts;
    if (uri.scheme == "ws") {
        opts.mode = FramedTransport::Mode::Client;
    } else if (uri.scheme == "ws-listen") {
        opts.mode = FramedTransport::Mode::Listener;
    } else {
        throw errors::Error::invalidRequest("Unsupported framed scheme: " + uri.scheme);
    }
    opts.host = uri.host;
    opts.port = uri.port;
    opts.path = uri.path.empty() ? std::string("/") : uri.path;
    return std::make_unique<FramedTransport>(opts);
}

} // namespace mcpwire
