//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: EventStreamTransport.cpp
// Purpose: SSE + POST transport (client and server) using Boost.Beast coroutines; TLS 1.3 via OpenSSL
//==========================================================================================================

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <deque>
#include <future>
#include <limits>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "mcpwire/EventStreamTransport.hpp"
#include "ConnectionState.h"
#include "TransportUri.h"

namespace mcpwire {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {
constexpr auto StreamPollInterval = std::chrono::milliseconds(20);
constexpr auto SendWaitSlice = std::chrono::milliseconds(50);
constexpr auto DrainPollInterval = std::chrono::milliseconds(10);
constexpr auto RequestTimeout = std::chrono::seconds(30);
constexpr std::size_t ReadChunk = 4096;

std::string formatSseData(const std::string& payload) {
    std::string out;
    std::size_t start = 0;
    while (true) {
        auto nl = payload.find('\n', start);
        out += "data: ";
        out += payload.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
        out += "\n";
        if (nl == std::string::npos) {
            break;
        }
        start = nl + 1;
    }
    out += "\n";
    return out;
}

std::string joinPath(const std::string& base, const std::string& path) {
    std::string b = base;
    while (!b.empty() && b.back() == '/') {
        b.pop_back();
    }
    if (path.empty()) {
        return b.empty() ? std::string("/") : b;
    }
    return b + (path.front() == '/' ? path : "/" + path);
}
} // namespace

/////////////////////////////////////////// SseEventParser ///////////////////////////////////////////

std::vector<SseEvent> SseEventParser::Feed(std::string_view chunk) {
    std::vector<SseEvent> out;
    buffer_.append(chunk.data(), chunk.size());
    std::size_t pos = 0;
    while ((pos = buffer_.find('\n')) != std::string::npos) {
        std::string line = buffer_.substr(0, pos);
        buffer_.erase(0, pos + 1);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        processLine(line, out);
    }
    return out;
}

void SseEventParser::processLine(std::string_view line, std::vector<SseEvent>& out) {
    if (line.empty()) {
        if (hasData_ || !current_.event.empty()) {
            out.push_back(std::move(current_));
        }
        current_ = SseEvent{};
        hasData_ = false;
        return;
    }
    if (line.front() == ':') {
        return; // comment / keep-alive
    }
    std::string_view field = line;
    std::string_view value;
    auto colon = line.find(':');
    if (colon != std::string_view::npos) {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (!value.empty() && value.front() == ' ') {
            value.remove_prefix(1);
        }
    }
    if (field == "data") {
        if (hasData_) {
            current_.data.push_back('\n');
        }
        current_.data.append(value.data(), value.size());
        hasData_ = true;
    } else if (field == "event") {
        current_.event.assign(value.data(), value.size());
    } else if (field == "id") {
        current_.id.assign(value.data(), value.size());
    }
}

/////////////////////////////////////////// EventStreamTransport ///////////////////////////////////////////

class EventStreamTransport::Impl {
public:
    EventStreamTransport::Options opts;
    detail::ConnectionState state;
    detail::InboundQueue inbox;
    std::string sessionId;

    // Client
    mutable std::mutex targetMutex;
    std::string messageTarget;

    // Server
    mutable std::mutex clientsMutex;
    std::map<std::string, std::deque<std::string>> clients;
    std::string currentClient;
    std::atomic<uint64_t> clientCounter{0};
    // Server sockets outlive the connection flag by the close drain; this ends them.
    std::atomic<bool> stopServing{false};
    std::atomic<int> activeStreams{0};

    // Declared after the state above: suspended sessions are destroyed with ioc and still reference it.
    std::unique_ptr<ssl::context> sslCtx;
    net::io_context ioc;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::thread ioThread;
    std::atomic<std::thread::id> ioThreadId{};
    std::atomic<uint16_t> localPort{0};

    explicit Impl(const EventStreamTransport::Options& o) : opts(o), sessionId(detail::makeSessionId("sse")) {
        messageTarget = joinPath(opts.basePath, opts.messagePath);
    }

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

    bool isServer() const { return opts.mode == EventStreamTransport::Mode::Server; }
    bool onIoThread() const { return ioThreadId.load() == std::this_thread::get_id(); }

    void reportError(const errors::Error& err) {
        LOG_ERROR("EventStreamTransport: {}", err.what());
        state.emitError(err);
    }

    //==========================================================================================================
    // TLS contexts (TLS 1.3 only)
    //==========================================================================================================
    void initClientTls() {
        sslCtx = std::make_unique<ssl::context>(ssl::context::tls_client);
        ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
        ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
        boost::system::error_code ec;
        if (!opts.caFile.empty()) {
            sslCtx->load_verify_file(opts.caFile, ec);
        } else {
            sslCtx->set_default_verify_paths(ec);
        }
        if (ec) {
            throw errors::Error::transport("Failed to load CA certificates: " + ec.message());
        }
        sslCtx->set_verify_mode(ssl::verify_peer);
    }

    void initServerTls() {
        sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
        ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
        ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
        boost::system::error_code ec;
        sslCtx->use_certificate_chain_file(opts.certFile, ec);
        if (!ec) {
            sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem, ec);
        }
        if (ec) {
            throw errors::Error::transport("Failed to load certificate/key: " + ec.message());
        }
        sslCtx->set_options(
            ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
            ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
    }

    /////////////////////////////////////////// Client mode ///////////////////////////////////////////

    std::string currentTarget() const {
        std::lock_guard<std::mutex> lock(targetMutex);
        return messageTarget;
    }

    // Accepts an absolute URL, an absolute path, or a path relative to basePath.
    std::string resolveTarget(const std::string& data) const {
        auto scheme = data.find("://");
        if (scheme != std::string::npos) {
            auto slash = data.find('/', scheme + 3);
            return slash == std::string::npos ? std::string("/") : data.substr(slash);
        }
        if (!data.empty() && data.front() == '/') {
            return data;
        }
        return joinPath(opts.basePath, data);
    }

    void handleEvent(const SseEvent& ev) {
        if (ev.event == "endpoint") {
            std::string target = resolveTarget(ev.data);
            {
                std::lock_guard<std::mutex> lock(targetMutex);
                messageTarget = target;
            }
            LOG_INFO("EventStreamTransport: message endpoint is {}", target);
            return;
        }
        if (ev.data.empty()) {
            return;
        }
        LOG_DEBUG("EventStreamTransport received: {}", ev.data);
        inbox.push(ev.data);
        state.emitMessage(ev.data);
    }

    template <class Stream>
    net::awaitable<void> readEvents(Stream& stream) {
        http::request<http::empty_body> req{http::verb::get, joinPath(opts.basePath, opts.eventsPath), 11};
        req.set(http::field::host, opts.host);
        req.set(http::field::accept, "text/event-stream");
        req.set(http::field::cache_control, "no-cache");
        co_await http::async_write(stream, req, net::use_awaitable);

        beast::flat_buffer buffer;
        http::response_parser<http::buffer_body> parser;
        parser.body_limit(std::numeric_limits<std::uint64_t>::max());
        co_await http::async_read_header(stream, buffer, parser, net::use_awaitable);
        const unsigned status = parser.get().result_int();
        if (status / 100 != 2) {
            throw errors::Error::transport("Event stream subscription rejected: " + std::to_string(status));
        }
        LOG_INFO("EventStreamTransport: subscribed to {}://{}:{}{}", opts.scheme, opts.host, opts.port,
                 joinPath(opts.basePath, opts.eventsPath));

        SseEventParser sse;
        std::array<char, ReadChunk> chunk{};
        while (state.isConnected() && !parser.is_done()) {
            parser.get().body().data = chunk.data();
            parser.get().body().size = chunk.size();
            boost::system::error_code ec;
            co_await http::async_read_some(stream, buffer, parser, net::redirect_error(net::use_awaitable, ec));
            if (ec == http::error::need_buffer) {
                ec = {};
            }
            if (ec == http::error::end_of_stream || ec == net::error::eof) {
                break;
            }
            if (ec) {
                throw boost::system::system_error(ec);
            }
            const std::size_t n = chunk.size() - parser.get().body().size;
            for (const auto& ev : sse.Feed(std::string_view(chunk.data(), n))) {
                handleEvent(ev);
            }
        }
        co_return;
    }

    net::awaitable<void> subscribeOnce() {
        auto executor = co_await net::this_coro::executor;
        tcp::resolver resolver(executor);
        auto results = co_await resolver.async_resolve(opts.host, opts.port, net::use_awaitable);
        if (opts.scheme == "https") {
            beast::ssl_stream<beast::tcp_stream> stream(executor, *sslCtx);
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), opts.host.c_str())) {
                LOG_WARN("EventStreamTransport: failed to set SNI hostname");
            }
            co_await beast::get_lowest_layer(stream).async_connect(results, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
            co_await readEvents(stream);
        } else {
            beast::tcp_stream stream(executor);
            co_await stream.async_connect(results, net::use_awaitable);
            co_await readEvents(stream);
        }
        co_return;
    }

    net::awaitable<void> subscribeLoop() {
        while (state.isConnected()) {
            std::optional<errors::Error> failure;
            try {
                co_await subscribeOnce();
                LOG_INFO("EventStreamTransport: event stream ended");
            } catch (const errors::Error& e) {
                failure = e;
            } catch (const std::exception& e) {
                failure = errors::Error::transport(std::string("Event stream failed: ") + e.what());
            }
            if (!state.isConnected()) {
                break;
            }
            if (failure) {
                reportError(*failure);
            }
            LOG_DEBUG("EventStreamTransport: reconnecting in {} ms", opts.reconnectMs);
            net::steady_timer timer(co_await net::this_coro::executor);
            timer.expires_after(std::chrono::milliseconds(opts.reconnectMs));
            boost::system::error_code ec;
            co_await timer.async_wait(net::redirect_error(net::use_awaitable, ec));
        }
        co_return;
    }

    template <class Stream>
    static net::awaitable<unsigned> exchange(Stream& stream, http::request<http::string_body>& req) {
        co_await http::async_write(stream, req, net::use_awaitable);
        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        co_await http::async_read(stream, buffer, res, net::use_awaitable);
        co_return res.result_int();
    }

    net::awaitable<unsigned> postMessage(std::string target, std::string body) {
        auto executor = co_await net::this_coro::executor;
        http::request<http::string_body> req{http::verb::post, target, 11};
        req.set(http::field::host, opts.host);
        req.set(http::field::content_type, "application/json");
        req.set(http::field::accept, "application/json");
        req.set(http::field::connection, "close");
        req.body() = std::move(body);
        req.prepare_payload();

        tcp::resolver resolver(executor);
        auto results = co_await resolver.async_resolve(opts.host, opts.port, net::use_awaitable);
        if (opts.scheme == "https") {
            beast::ssl_stream<beast::tcp_stream> stream(executor, *sslCtx);
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), opts.host.c_str())) {
                LOG_WARN("EventStreamTransport: failed to set SNI hostname");
            }
            beast::get_lowest_layer(stream).expires_after(RequestTimeout);
            co_await beast::get_lowest_layer(stream).async_connect(results, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
            co_return co_await exchange(stream, req);
        }
        beast::tcp_stream stream(executor);
        stream.expires_after(RequestTimeout);
        co_await stream.async_connect(results, net::use_awaitable);
        unsigned status = co_await exchange(stream, req);
        boost::system::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        co_return status;
    }

    void clientSend(const std::string& text) {
        const std::string target = currentTarget();
        if (onIoThread()) {
            net::co_spawn(ioc, postMessage(target, text), [this](std::exception_ptr eptr, unsigned status) {
                if (eptr) {
                    try {
                        std::rethrow_exception(eptr);
                    } catch (const std::exception& e) {
                        reportError(errors::Error::transport(std::string("Failed to POST: ") + e.what()));
                    }
                } else if (status / 100 != 2) {
                    reportError(errors::Error::transport("Server returned error: " + std::to_string(status)));
                }
            });
            return;
        }

        auto done = std::make_shared<std::promise<unsigned>>();
        auto fut = done->get_future();
        net::co_spawn(ioc, postMessage(target, text), [done](std::exception_ptr eptr, unsigned status) {
            if (eptr) {
                done->set_exception(eptr);
            } else {
                done->set_value(status);
            }
        });
        while (fut.wait_for(SendWaitSlice) != std::future_status::ready) {
            if (!state.isConnected()) {
                throw errors::Error::notConnected();
            }
        }
        unsigned status = 0;
        try {
            status = fut.get();
        } catch (const std::exception& e) {
            auto err = errors::Error::transport(std::string("Failed to POST: ") + e.what());
            reportError(err);
            throw err;
        }
        if (status / 100 != 2) {
            auto err = errors::Error::transport("Server returned error: " + std::to_string(status));
            reportError(err);
            throw err;
        }
    }

    /////////////////////////////////////////// Server mode ///////////////////////////////////////////

    std::string registerClient() {
        std::string id = std::to_string(++clientCounter);
        std::lock_guard<std::mutex> lock(clientsMutex);
        clients[id];
        currentClient = id;
        return id;
    }

    void unregisterClient(const std::string& id) {
        std::lock_guard<std::mutex> lock(clientsMutex);
        clients.erase(id);
        if (currentClient == id) {
            currentClient.clear();
        }
    }

    bool hasPendingFor(const std::string& id) const {
        std::lock_guard<std::mutex> lock(clientsMutex);
        auto it = clients.find(id);
        return it != clients.end() && !it->second.empty();
    }

    std::deque<std::string> takePending(const std::string& id) {
        std::lock_guard<std::mutex> lock(clientsMutex);
        std::deque<std::string> out;
        auto it = clients.find(id);
        if (it != clients.end()) {
            out.swap(it->second);
        }
        return out;
    }

    bool hasPending() const {
        std::lock_guard<std::mutex> lock(clientsMutex);
        for (const auto& entry : clients) {
            if (!entry.second.empty()) {
                return true;
            }
        }
        return false;
    }

    struct ClientRegistration {
        Impl* impl;
        std::string id;
        ClientRegistration(Impl* i, std::string clientId) : impl(i), id(std::move(clientId)) { ++impl->activeStreams; }
        ~ClientRegistration() {
            impl->unregisterClient(id);
            --impl->activeStreams;
        }
    };

    template <class Stream>
    net::awaitable<void> flushPending(Stream& stream, const std::string& id) {
        auto pending = takePending(id);
        if (pending.empty()) {
            co_return;
        }
        std::string out;
        for (const auto& msg : pending) {
            out += formatSseData(msg);
        }
        co_await net::async_write(stream, net::buffer(out), net::use_awaitable);
        co_return;
    }

    template <class Stream>
    net::awaitable<void> streamEvents(Stream& stream, unsigned version) {
        ClientRegistration reg(this, registerClient());
        LOG_INFO("EventStreamTransport: client {} subscribed", reg.id);

        http::response<http::empty_body> res{http::status::ok, version};
        res.set(http::field::content_type, "text/event-stream");
        res.set(http::field::cache_control, "no-cache");
        res.keep_alive(false);
        http::response_serializer<http::empty_body> sr{res};
        co_await http::async_write_header(stream, sr, net::use_awaitable);

        std::string hello = "event: endpoint\ndata: " + opts.messagePath + "?client_id=" + reg.id + "\n\n";
        co_await net::async_write(stream, net::buffer(hello), net::use_awaitable);

        auto lastWrite = std::chrono::steady_clock::now();
        net::steady_timer timer(co_await net::this_coro::executor);
        while (!stopServing) {
            if (hasPendingFor(reg.id)) {
                co_await flushPending(stream, reg.id);
                lastWrite = std::chrono::steady_clock::now();
            } else if (std::chrono::steady_clock::now() - lastWrite >= std::chrono::milliseconds(opts.keepAliveMs)) {
                static const std::string keepAlive = ": keep-alive\n\n";
                co_await net::async_write(stream, net::buffer(keepAlive), net::use_awaitable);
                lastWrite = std::chrono::steady_clock::now();
            }
            timer.expires_after(StreamPollInterval);
            co_await timer.async_wait(net::use_awaitable);
        }
        co_await flushPending(stream, reg.id);
        co_return;
    }

    http::response<http::string_body> route(const http::request<http::string_body>& req, const std::string& path,
                                            const std::map<std::string, std::string>& params) {
        http::response<http::string_body> res{http::status::ok, req.version()};
        res.set(http::field::content_type, "application/json");
        res.keep_alive(false);

        auto clientIt = params.find("client_id");
        const std::string clientId = clientIt == params.end() ? std::string() : clientIt->second;

        if (req.method() == http::verb::post && path == opts.messagePath) {
            if (!state.isConnected()) {
                res.result(http::status::service_unavailable);
                res.body() = "{\"error\":\"Shutting down\"}";
                res.prepare_payload();
                return res;
            }
            if (req.body().empty()) {
                res.result(http::status::bad_request);
                res.body() = "{\"error\":\"Empty body\"}";
                res.prepare_payload();
                return res;
            }
            if (!clientId.empty()) {
                std::lock_guard<std::mutex> lock(clientsMutex);
                clients[clientId];
                currentClient = clientId;
            }
            LOG_DEBUG("EventStreamTransport received: {}", req.body());
            inbox.push(req.body());
            state.emitMessage(req.body());
            res.result(http::status::accepted);
            res.prepare_payload();
            return res;
        }

        if (req.method() == http::verb::get && path == opts.pollPath) {
            std::lock_guard<std::mutex> lock(clientsMutex);
            auto it = clients.find(clientId);
            if (clientId.empty() || it == clients.end()) {
                res.result(http::status::not_found);
                res.body() = "{\"error\":\"Unknown client\"}";
                res.prepare_payload();
                return res;
            }
            std::string body = "[";
            bool first = true;
            for (const auto& msg : it->second) {
                if (!first) body += ",";
                first = false;
                body += msg;
            }
            body += "]";
            it->second.clear();
            res.body() = std::move(body);
            res.prepare_payload();
            return res;
        }

        res.result(http::status::not_found);
        res.body() = "{\"error\":\"Not found\"}";
        res.prepare_payload();
        return res;
    }

    template <class Stream>
    net::awaitable<void> serveHttp(Stream& stream) {
        beast::flat_buffer buffer;
        http::request<http::string_body> req;
        co_await http::async_read(stream, buffer, req, net::use_awaitable);

        std::string target(req.target());
        std::string path = target;
        std::string query;
        auto q = target.find('?');
        if (q != std::string::npos) {
            path = target.substr(0, q);
            query = target.substr(q + 1);
        }
        if (req.method() == http::verb::get && path == opts.eventsPath) {
            co_await streamEvents(stream, req.version());
            co_return;
        }
        auto res = route(req, path, detail::ParseQueryString(query));
        co_await http::async_write(stream, res, net::use_awaitable);
        co_return;
    }

    net::awaitable<void> sessionPlain(tcp::socket socket) {
        try {
            beast::tcp_stream stream(std::move(socket));
            co_await serveHttp(stream);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const std::exception& e) {
            LOG_DEBUG("EventStreamTransport: session ended: {}", e.what());
        }
        co_return;
    }

    net::awaitable<void> sessionTls(tcp::socket socket) {
        try {
            ssl::stream<tcp::socket> tls(std::move(socket), *sslCtx);
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            co_await serveHttp(tls);
            boost::system::error_code ec;
            tls.lowest_layer().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const std::exception& e) {
            LOG_DEBUG("EventStreamTransport: TLS session ended: {}", e.what());
        }
        co_return;
    }

    net::awaitable<void> acceptLoop() {
        while (!stopServing) {
            boost::system::error_code ec;
            tcp::socket socket = co_await acceptor->async_accept(net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                if (!stopServing) {
                    reportError(errors::Error::transport("Accept error: " + ec.message()));
                }
                break;
            }
            if (sslCtx) {
                net::co_spawn(ioc, sessionTls(std::move(socket)), net::detached);
            } else {
                net::co_spawn(ioc, sessionPlain(std::move(socket)), net::detached);
            }
        }
        co_return;
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
        LOG_INFO("EventStreamTransport: listening on {}://{}:{} (events={} message={} poll={})",
                 sslCtx ? "https" : "http", opts.host, localPort.load(), opts.eventsPath, opts.messagePath,
                 opts.pollPath);
    }

    void serverSend(const std::string& text) {
        std::lock_guard<std::mutex> lock(clientsMutex);
        auto it = currentClient.empty() ? clients.end() : clients.find(currentClient);
        if (it == clients.end()) {
            auto err = errors::Error::transport("No client to send to");
            LOG_ERROR("EventStreamTransport: {}", err.what());
            state.emitError(err);
            throw err;
        }
        it->second.push_back(text);
    }

    // Keeps serving streams and polls after the connection flag drops until every queue is empty or
    // drainMs elapses, then lets each stream write what is left and end.
    void drainAndStopServing() {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(opts.drainMs);
        while (hasPending() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(DrainPollInterval);
        }
        stopServing = true;
        const auto streamsDeadline = std::chrono::steady_clock::now() + 4 * StreamPollInterval;
        while (activeStreams.load() > 0 && std::chrono::steady_clock::now() < streamsDeadline) {
            std::this_thread::sleep_for(DrainPollInterval);
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
        boost::system::error_code ec;
        if (acceptor && !ioThread.joinable()) {
            acceptor->close(ec);
        }
    }
};

EventStreamTransport::EventStreamTransport(const Options& opts) : pImpl(std::make_unique<Impl>(opts)) { FUNC_SCOPE(); }

EventStreamTransport::~EventStreamTransport() {
    FUNC_SCOPE();
    Close();
}

void EventStreamTransport::Start() {
    FUNC_SCOPE();
    pImpl->state.beginStart();
    try {
        if (pImpl->isServer()) {
            if (!pImpl->opts.certFile.empty() && !pImpl->opts.keyFile.empty()) {
                pImpl->initServerTls();
            }
            pImpl->bindListener();
        } else if (pImpl->opts.scheme == "https") {
            pImpl->initClientTls();
        }
    } catch (const errors::Error& e) {
        pImpl->acceptor.reset();
        pImpl->state.abortStart();
        LOG_ERROR("EventStreamTransport: start failed: {}", e.what());
        pImpl->state.emitError(e);
        throw;
    }
    pImpl->state.markConnected();
    if (pImpl->isServer()) {
        net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    } else {
        net::co_spawn(pImpl->ioc, pImpl->subscribeLoop(), net::detached);
    }
    pImpl->workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(pImpl->ioc));
    pImpl->ioThread = std::thread([this]() {
        pImpl->ioThreadId = std::this_thread::get_id();
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            pImpl->reportError(errors::Error::transport(std::string("Event stream io loop failed: ") + e.what()));
        }
        pImpl->ioThreadId = std::thread::id();
    });
    LOG_INFO("EventStreamTransport started in {} mode (session={})",
             pImpl->isServer() ? "server" : "client", pImpl->sessionId);
}

void EventStreamTransport::Close() {
    FUNC_SCOPE();
    const bool transitioned = pImpl->state.markClosed();
    if (transitioned && pImpl->isServer() && pImpl->ioThread.joinable() && !pImpl->onIoThread()) {
        // Best-effort: subscribers and pollers still collect responses queued just before Close().
        pImpl->drainAndStopServing();
    }
    pImpl->stopServing = true;
    if (pImpl->ioThread.joinable()) {
        pImpl->stopIo();
    }
    pImpl->inbox.shutdown();
    if (!transitioned) {
        return;
    }
    LOG_INFO("EventStreamTransport closed (session={})", pImpl->sessionId);
    pImpl->state.emitClose();
}

bool EventStreamTransport::IsConnected() const { FUNC_SCOPE(); return pImpl->state.isConnected(); }
std::string EventStreamTransport::GetSessionId() const { FUNC_SCOPE(); return pImpl->sessionId; }
uint16_t EventStreamTransport::LocalPort() const { return pImpl->localPort.load(); }
std::string EventStreamTransport::MessageTarget() const { return pImpl->currentTarget(); }

std::string EventStreamTransport::CurrentClientId() const {
    std::lock_guard<std::mutex> lock(pImpl->clientsMutex);
    return pImpl->currentClient;
}

void EventStreamTransport::SendText(const std::string& text) {
    FUNC_SCOPE();
    pImpl->state.requireConnected();
    if (pImpl->isServer()) {
        pImpl->serverSend(text);
    } else {
        pImpl->clientSend(text);
    }
    LOG_DEBUG("EventStreamTransport sent: {}", text);
}

std::string EventStreamTransport::ReceiveText() {
    FUNC_SCOPE();
    pImpl->state.requireConnected();
    std::optional<std::chrono::milliseconds> timeout;
    if (pImpl->opts.receiveTimeoutMs > 0) {
        timeout = std::chrono::milliseconds(pImpl->opts.receiveTimeoutMs);
    }
    return pImpl->inbox.pop(timeout);
}

void EventStreamTransport::SetMessageHandler(MessageHandler handler) {
    FUNC_SCOPE();
    pImpl->state.setMessageHandler(std::move(handler));
}

void EventStreamTransport::SetErrorHandler(ErrorHandler handler) {
    FUNC_SCOPE();
    pImpl->state.setErrorHandler(std::move(handler));
}

void EventStreamTransport::SetCloseHandler(CloseHandler handler) {
    FUNC_SCOPE();
    pImpl->state.setCloseHandler(std::move(handler));
}

std::unique_ptr<ITransport> EventStreamTransportFactory::CreateTransport(const std::string& config) {
    FUNC_SCOPE();
    EventStreamTransport::Options opts;
    std::string defaultPort;
    {
        auto sep = config.find("://");
        std::string scheme = sep == std::string::npos ? std::string() : config.substr(0, sep);
        defaultPort = scheme == "https" ? "443" : (scheme == "http" ? "80" : "");
    }
    auto uri = detail::ParseTransportUri(config, defaultPort);
    if (uri.scheme == "http" || uri.scheme == "https") {
        opts.mode = EventStreamTransport::Mode::Client;
        opts.scheme = uri.scheme;
        opts.basePath = uri.path;
        opts.reconnectMs = uri.paramUint("reconnect_ms", opts.reconnectMs);
        opts.caFile = uri.param("ca", "");
    } else if (uri.scheme == "sse-listen") {
        opts.mode = EventStreamTransport::Mode::Server;
        opts.pollPath = uri.param("poll", opts.pollPath);
        opts.drainMs = uri.paramUint("drain_ms", opts.drainMs);
        opts.certFile = uri.param("cert", "");
        opts.keyFile = uri.param("key", "");
        opts.scheme = (!opts.certFile.empty() && !opts.keyFile.empty()) ? "https" : "http";
    } else {
        throw errors::Error::invalidRequest("Unsupported event-stream scheme: " + uri.scheme);
    }
    opts.host = uri.host;
    opts.port = uri.port;
    opts.eventsPath = uri.param("events", opts.eventsPath);
    opts.messagePath = uri.param("message", opts.messagePath);
    opts.receiveTimeoutMs = uri.paramUint("receive_timeout_ms", 0);
    return std::make_unique<EventStreamTransport>(opts);
}

} // namespace mcpwire
