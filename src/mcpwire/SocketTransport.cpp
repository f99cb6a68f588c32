//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: SocketTransport.cpp
// Purpose: TCP line transport implementation (Boost.Asio, synchronous sockets plus one reader thread)
//==========================================================================================================

#include <unistd.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>

#include <boost/asio.hpp>

#include "logging/Logger.h"
#include "mcpwire/SocketTransport.hpp"
#include "ConnectionState.h"
#include "TransportUri.h"

namespace mcpwire {
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {
constexpr auto PollInterval = std::chrono::milliseconds(10);
constexpr std::size_t ReadChunk = 4096;

bool isWouldBlock(const boost::system::error_code& ec) {
    return ec == net::error::would_block || ec == net::error::try_again;
}

std::string trimLine(const std::string& s) {
    auto notSpace = [](unsigned char c){ return !std::isspace(c); };
    auto b = std::find_if(s.begin(), s.end(), notSpace);
    auto e = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    return (b < e) ? std::string(b, e) : std::string();
}
} // namespace

class SocketTransport::Impl {
public:
    enum class ReadOutcome { Stopped, PeerClosed, Failed };

    SocketTransport::Options opts;
    detail::ConnectionState state;
    detail::InboundQueue inbox;
    std::string sessionId;

    net::io_context ioc;
    std::unique_ptr<tcp::socket> reader;    // client mode only; listener peers live on the reader thread
    std::unique_ptr<tcp::socket> writer;    // guarded by writeMutex
    std::unique_ptr<tcp::acceptor> acceptor;
    mutable std::mutex writeMutex;
    std::thread readerThread;
    std::atomic<uint16_t> localPort{0};

    explicit Impl(const SocketTransport::Options& o) : opts(o), sessionId(detail::makeSessionId("tcp")) {}

    void installWriter(tcp::socket& source) {
        int fd = ::dup(source.native_handle());
        if (fd < 0) {
            throw errors::Error::transport("Failed to duplicate socket for writing");
        }
        auto w = std::make_unique<tcp::socket>(ioc);
        boost::system::error_code ec;
        w->assign(source.local_endpoint().protocol(), fd, ec);
        if (ec) {
            ::close(fd);
            throw errors::Error::transport("Failed to assign writer socket: " + ec.message());
        }
        std::lock_guard<std::mutex> lock(writeMutex);
        writer = std::move(w);
    }

    void dropWriter() {
        std::lock_guard<std::mutex> lock(writeMutex);
        if (writer) {
            boost::system::error_code ec;
            writer->shutdown(tcp::socket::shutdown_both, ec);
            writer->close(ec);
            writer.reset();
        }
    }

    //==========================================================================================================
    // readLines
    // Purpose: Polls a non-blocking socket, splitting the byte stream on '\n'. Re-checks the connection flag
    //          every iteration so Close() is observed within one poll interval.
    //==========================================================================================================
    ReadOutcome readLines(tcp::socket& sock, boost::system::error_code& failure) {
        std::string buffer;
        std::array<char, ReadChunk> chunk{};
        while (state.isConnected()) {
            boost::system::error_code ec;
            std::size_t n = sock.read_some(net::buffer(chunk), ec);
            if (isWouldBlock(ec)) {
                std::this_thread::sleep_for(PollInterval);
                continue;
            }
            if (ec == net::error::eof) {
                return ReadOutcome::PeerClosed;
            }
            if (ec) {
                failure = ec;
                return ReadOutcome::Failed;
            }
            buffer.append(chunk.data(), n);
            std::size_t pos = 0;
            while ((pos = buffer.find('\n')) != std::string::npos) {
                std::string line = trimLine(buffer.substr(0, pos));
                buffer.erase(0, pos + 1);
                if (line.empty()) {
                    continue;
                }
                LOG_DEBUG("SocketTransport received: {}", line);
                inbox.push(line);
                state.emitMessage(line);
            }
        }
        return ReadOutcome::Stopped;
    }

    // Reader-initiated close: flag flip, then onClose once, then the thread exits.
    void closeFromReader() {
        if (!state.markClosed()) {
            return;
        }
        inbox.shutdown();
        dropWriter();
        LOG_INFO("SocketTransport closed by peer (session={})", sessionId);
        state.emitClose();
    }

    void runClient() {
        boost::system::error_code failure;
        ReadOutcome outcome = readLines(*reader, failure);
        if (outcome == ReadOutcome::PeerClosed) {
            LOG_INFO("SocketTransport: peer closed connection");
            closeFromReader();
        } else if (outcome == ReadOutcome::Failed) {
            auto err = errors::Error::transport("Read error: " + failure.message());
            LOG_ERROR("SocketTransport: {}", err.what());
            state.emitError(err);
            closeFromReader();
        }
    }

    void runListener() {
        while (state.isConnected()) {
            tcp::socket peer(ioc);
            boost::system::error_code ec;
            acceptor->accept(peer, ec);
            if (isWouldBlock(ec)) {
                std::this_thread::sleep_for(PollInterval);
                continue;
            }
            if (ec) {
                if (!state.isConnected()) {
                    break;
                }
                auto err = errors::Error::transport("Accept error: " + ec.message());
                LOG_ERROR("SocketTransport: {}", err.what());
                state.emitError(err);
                closeFromReader();
                break;
            }

            boost::system::error_code epEc;
            auto remote = peer.remote_endpoint(epEc);
            LOG_INFO("SocketTransport: accepted peer {}:{}", remote.address().to_string(), remote.port());
            peer.non_blocking(true, ec);
            try {
                installWriter(peer);
            } catch (const errors::Error& e) {
                LOG_ERROR("SocketTransport: {}", e.what());
                state.emitError(e);
                peer.close(ec);
                continue;
            }

            boost::system::error_code failure;
            ReadOutcome outcome = readLines(peer, failure);
            dropWriter();
            peer.close(ec);
            if (outcome == ReadOutcome::Stopped) {
                break;
            }
            if (outcome == ReadOutcome::Failed) {
                auto err = errors::Error::transport("Read error: " + failure.message());
                LOG_ERROR("SocketTransport: {}", err.what());
                state.emitError(err);
            }
            LOG_INFO("SocketTransport: peer disconnected; waiting for next peer");
        }
    }

    void startClient() {
        tcp::resolver resolver(ioc);
        boost::system::error_code ec;
        auto results = resolver.resolve(opts.host, opts.port, ec);
        if (ec) {
            throw errors::Error::transport("Failed to resolve " + opts.host + ":" + opts.port + ": " + ec.message());
        }
        reader = std::make_unique<tcp::socket>(ioc);
        net::connect(*reader, results, ec);
        if (ec) {
            reader.reset();
            throw errors::Error::transport("Failed to connect to " + opts.host + ":" + opts.port + ": " + ec.message());
        }
        installWriter(*reader);
        reader->non_blocking(true, ec);
        localPort = reader->local_endpoint(ec).port();
        LOG_INFO("SocketTransport: connected to {}:{}", opts.host, opts.port);
    }

    void startListener() {
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
        if (!ec) acceptor->non_blocking(true, ec);
        if (ec) {
            acceptor.reset();
            throw errors::Error::transport("Failed to bind " + opts.host + ":" + opts.port + ": " + ec.message());
        }
        localPort = acceptor->local_endpoint(ec).port();
        LOG_INFO("SocketTransport: listening on {}:{}", opts.host, localPort.load());
    }

    void releaseSockets() {
        dropWriter();
        boost::system::error_code ec;
        if (reader) {
            reader->close(ec);
            reader.reset();
        }
        if (acceptor) {
            acceptor->close(ec);
            acceptor.reset();
        }
    }
};

SocketTransport::SocketTransport(const Options& opts) : pImpl(std::make_unique<Impl>(opts)) { FUNC_SCOPE(); }

SocketTransport::~SocketTransport() {
    FUNC_SCOPE();
    Close();
}

void SocketTransport::Start() {
    FUNC_SCOPE();
    pImpl->state.beginStart();
    try {
        if (pImpl->opts.mode == Mode::Client) {
            pImpl->startClient();
        } else {
            pImpl->startListener();
        }
    } catch (const errors::Error& e) {
        pImpl->releaseSockets();
        pImpl->state.abortStart();
        LOG_ERROR("SocketTransport: start failed: {}", e.what());
        pImpl->state.emitError(e);
        throw;
    }
    pImpl->state.markConnected();
    if (pImpl->opts.mode == Mode::Client) {
        pImpl->readerThread = std::thread([this]() { pImpl->runClient(); });
    } else {
        pImpl->readerThread = std::thread([this]() { pImpl->runListener(); });
    }
    LOG_INFO("SocketTransport started (session={})", pImpl->sessionId);
}

void SocketTransport::Close() {
    FUNC_SCOPE();
    const bool transitioned = pImpl->state.markClosed();
    if (pImpl->readerThread.joinable() && pImpl->readerThread.get_id() != std::this_thread::get_id()) {
        pImpl->readerThread.join();
    }
    pImpl->inbox.shutdown();
    pImpl->releaseSockets();
    if (!transitioned) {
        return;
    }
    LOG_INFO("SocketTransport closed (session={})", pImpl->sessionId);
    pImpl->state.emitClose();
}

bool SocketTransport::IsConnected() const { FUNC_SCOPE(); return pImpl->state.isConnected(); }
std::string SocketTransport::GetSessionId() const { FUNC_SCOPE(); return pImpl->sessionId; }
uint16_t SocketTransport::LocalPort() const { return pImpl->localPort.load(); }

bool SocketTransport::HasPeer() const {
    std::lock_guard<std::mutex> lock(pImpl->writeMutex);
    return pImpl->writer != nullptr;
}

void SocketTransport::SendText(const std::string& text) {
    FUNC_SCOPE();
    pImpl->state.requireConnected();
    std::optional<errors::Error> failure;
    {
        std::lock_guard<std::mutex> lock(pImpl->writeMutex);
        if (!pImpl->writer) {
            failure = errors::Error::transport("No client to send to");
        } else {
            std::string framed = text;
            framed.push_back('\n');
            boost::system::error_code ec;
            net::write(*pImpl->writer, net::buffer(framed), ec);
            if (ec) {
                failure = errors::Error::transport("Failed to write: " + ec.message());
            }
        }
    }
    if (failure) {
        LOG_ERROR("SocketTransport: {}", failure->what());
        pImpl->state.emitError(*failure);
        throw *failure;
    }
    LOG_DEBUG("SocketTransport sent: {}", text);
}

std::string SocketTransport::ReceiveText() {
    FUNC_SCOPE();
    pImpl->state.requireConnected();
    std::optional<std::chrono::milliseconds> timeout;
    if (pImpl->opts.receiveTimeoutMs > 0) {
        timeout = std::chrono::milliseconds(pImpl->opts.receiveTimeoutMs);
    }
    return pImpl->inbox.pop(timeout);
}

void SocketTransport::SetMessageHandler(MessageHandler handler) {
    FUNC_SCOPE();
    pImpl->state.setMessageHandler(std::move(handler));
}

void SocketTransport::SetErrorHandler(ErrorHandler handler) {
    FUNC_SCOPE();
    pImpl->state.setErrorHandler(std::move(handler));
}

void SocketTransport::SetCloseHandler(CloseHandler handler) {
    FUNC_SCOPE();
    pImpl->state.setCloseHandler(std::move(handler));
}

std::unique_ptr<ITransport> SocketTransportFactory::CreateTransport(const std::string& config) {
    FUNC_SCOPE();
    auto uri = detail::ParseTransportUri(config, "");
    SocketTransport::Options opts;
    if (uri.scheme == "tcp") {
        opts.mode = SocketTransport::Mode::Client;
    } else if (uri.scheme == "tcp-listen") {
        opts.mode = SocketTransport::Mode::Listener;
    } else {
        throw errors::Error::invalidRequest("Unsupported socket scheme: " + uri.scheme);
    }
    opts.host = uri.host;
    opts.port = uri.port;
    opts.receiveTimeoutMs = uri.paramUint("receive_timeout_ms", 0);
    return std::make_unique<SocketTransport>(opts);
}

} // namespace mcpwire
