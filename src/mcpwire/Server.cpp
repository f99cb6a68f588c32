//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: Server.cpp
// Purpose: MCP server engine implementation
//==========================================================================================================
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <unordered_map>
#include <unordered_set>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpwire/Errors.h"
#include "mcpwire/JsonRpcCodec.h"
#include "mcpwire/Server.h"
#include "ConnectionState.h"

namespace mcpwire {

class Server::Impl {
public:
    explicit Impl(ServerConfig cfg)
        : config(std::move(cfg)),
          maxErrors(static_cast<uint32_t>(std::max<uint64_t>(1, GetEnvUintOrDefault("MCPWIRE_SERVER_MAX_ERRORS", 5)))),
          retryDelayMs(static_cast<int64_t>(GetEnvUintOrDefault("MCPWIRE_SERVER_RETRY_DELAY_MS", 1000))) {}

    ServerConfig config;

    // Dispatch table and providers
    mutable std::mutex tableMutex;
    std::unordered_map<std::string, ToolHandler> toolHandlers;
    std::shared_ptr<IToolsProvider> toolsProvider;
    std::shared_ptr<IPromptsProvider> promptsProvider;
    std::shared_ptr<IResourcesProvider> resourcesProvider;

    // Retry policy
    std::atomic<uint32_t> maxErrors;
    std::atomic<int64_t> retryDelayMs;

    // Loop state; 'active' is only dereferenced under loopMutex.
    std::mutex loopMutex;
    std::condition_variable loopCv;
    bool stopRequested{false};
    std::atomic<bool> running{false};
    std::atomic<bool> shutdownRequested{false};
    ITransport* active{nullptr};
    std::shared_ptr<detail::InboundQueue> pushInbox;

    bool isStopRequested() {
        std::lock_guard<std::mutex> lock(loopMutex);
        return stopRequested;
    }

    // Sleeps for the retry delay; returns early when Stop() is called.
    void waitRetry() {
        std::unique_lock<std::mutex> lock(loopMutex);
        loopCv.wait_for(lock, std::chrono::milliseconds(retryDelayMs.load()), [this]() { return stopRequested; });
    }

    std::vector<Tool> collectTools();
    JSONValue buildCapabilities(bool hasTools);

    std::unique_ptr<JSONRPCResponse> dispatch(const JSONRPCRequest& req);
    std::unique_ptr<JSONRPCResponse> handleInitialize(const JSONRPCRequest& req);
    std::unique_ptr<JSONRPCResponse> handleToolsList(const JSONRPCRequest& req);
    std::unique_ptr<JSONRPCResponse> handleToolCall(const JSONRPCRequest& req);
    std::unique_ptr<JSONRPCResponse> handlePromptsList(const JSONRPCRequest& req);
    std::unique_ptr<JSONRPCResponse> handlePromptMessages(const JSONRPCRequest& req);
    std::unique_ptr<JSONRPCResponse> handleResourcesList(const JSONRPCRequest& req);
    std::unique_ptr<JSONRPCResponse> handleResourceGet(const JSONRPCRequest& req);
    std::unique_ptr<JSONRPCResponse> handleResourceTemplatesList(const JSONRPCRequest& req);
};

namespace {

std::unique_ptr<JSONRPCResponse> success(const JSONRPCId& id, JSONValue result) {
    return std::make_unique<JSONRPCResponse>(id, std::move(result));
}

const JSONValue& paramsOf(const JSONRPCRequest& req) {
    static const JSONValue kNull;
    return req.params.has_value() ? req.params.value() : kNull;
}

} // namespace

//================================ Helper method definitions =================================
std::vector<Tool> Server::Impl::collectTools() {
    std::vector<Tool> tools = config.tools;
    std::shared_ptr<IToolsProvider> provider;
    {
        std::lock_guard<std::mutex> lock(tableMutex);
        provider = toolsProvider;
    }
    if (provider) {
        for (auto& t : provider->GetTools()) {
            auto dup = std::find_if(tools.begin(), tools.end(), [&](const Tool& c) { return c.name == t.name; });
            if (dup == tools.end()) {
                tools.push_back(std::move(t));
            }
        }
    }
    return tools;
}

JSONValue Server::Impl::buildCapabilities(bool hasTools) {
    JSONValue::Object caps;
    auto listChanged = [] { return std::make_shared<JSONValue>(MakeObject({{"list_changed", JSONValue(false)}})); };
    if (hasTools) {
        caps["tools"] = listChanged();
    }
    std::lock_guard<std::mutex> lock(tableMutex);
    if (promptsProvider) {
        caps["prompts"] = listChanged();
    }
    if (resourcesProvider) {
        caps["resources"] = listChanged();
    }
    return JSONValue(std::move(caps));
}

std::unique_ptr<JSONRPCResponse> Server::Impl::dispatch(const JSONRPCRequest& req) {
    try {
        const std::string& m = req.method;
        if (m == Methods::Initialize) {
            return handleInitialize(req);
        } else if (m == Methods::Shutdown) {
            LOG_INFO("Received shutdown request");
            shutdownRequested.store(true);
            return success(req.id, JSONValue(JSONValue::Object{}));
        } else if (m == Methods::ToolCall || m == Methods::CallTool) {
            return handleToolCall(req);
        } else if (m == Methods::ListTools || m == Methods::GetTools) {
            return handleToolsList(req);
        } else if (m == Methods::ListPrompts || m == Methods::GetPrompts) {
            return handlePromptsList(req);
        } else if (m == Methods::GetPromptMessages) {
            return handlePromptMessages(req);
        } else if (m == Methods::ListResources || m == Methods::GetResources) {
            return handleResourcesList(req);
        } else if (m == Methods::ReadResource || m == Methods::GetResource) {
            return handleResourceGet(req);
        } else if (m == Methods::ListResourceTemplates || m == Methods::GetResourceTemplates) {
            return handleResourceTemplatesList(req);
        }
        LOG_WARN("Unknown method: {}", m);
        return CreateErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + m);
    } catch (const std::exception& e) {
        LOG_ERROR("Dispatch of '{}' failed: {}", req.method, e.what());
        return CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, e.what());
    }
}

std::unique_ptr<JSONRPCResponse> Server::Impl::handleInitialize(const JSONRPCRequest& req) {
    if (const JSONValue* ci = FindMember(paramsOf(req), "client_info")) {
        LOG_INFO("Initialize from client '{}' {}", FindString(*ci, "name").value_or("?"),
                 FindString(*ci, "version").value_or("?"));
    } else {
        LOG_INFO("Received initialization request");
    }
    auto tools = collectTools();
    JSONValue result = MakeObject({
        {"protocol_version", JSONValue(PROTOCOL_VERSION)},
        {"server_info", ToJSON(Implementation(config.name, config.version))},
        {"capabilities", buildCapabilities(!tools.empty())},
        {"tools", JsonConvert<std::vector<Tool>>::ToJSON(tools)}
    });
    return success(req.id, std::move(result));
}

std::unique_ptr<JSONRPCResponse> Server::Impl::handleToolsList(const JSONRPCRequest& req) {
    LOG_DEBUG("Handling tools/list request");
    bool haveProvider = false;
    {
        std::lock_guard<std::mutex> lock(tableMutex);
        haveProvider = toolsProvider != nullptr;
    }
    if (config.tools.empty() && !haveProvider) {
        return CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, "No tools provider registered");
    }
    return success(req.id, MakeObject({{"tools", JsonConvert<std::vector<Tool>>::ToJSON(collectTools())}}));
}

std::unique_ptr<JSONRPCResponse> Server::Impl::handleToolCall(const JSONRPCRequest& req) {
    const JSONValue& params = paramsOf(req);
    auto name = FindString(params, "name");
    if (!name.has_value()) {
        return CreateErrorResponse(req.id, JSONRPCErrorCodes::InvalidParams, "Invalid parameters: missing tool name");
    }
    JSONValue args;
    if (const JSONValue* p = FindMember(params, "parameters")) {
        args = *p;
    } else if (const JSONValue* a = FindMember(params, "arguments")) {
        args = *a;
    }

    ToolHandler handler;
    std::shared_ptr<IToolsProvider> provider;
    {
        std::lock_guard<std::mutex> lock(tableMutex);
        auto it = toolHandlers.find(name.value());
        if (it != toolHandlers.end()) {
            handler = it->second;
        }
        provider = toolsProvider;
    }
    LOG_DEBUG("Calling tool '{}'", name.value());
    try {
        JSONValue value;
        if (handler) {
            value = handler(args);
        } else if (provider) {
            value = provider->ExecuteTool(name.value(), args);
        } else {
            throw errors::Error::notFound("No handler registered for tool '" + name.value() + "'");
        }
        return success(req.id, MakeObject({{"result", value}}));
    } catch (const std::exception& e) {
        LOG_WARN("Tool '{}' failed: {}", name.value(), e.what());
        return CreateErrorResponse(req.id, JSONRPCErrorCodes::ApplicationError,
                                   std::string("Tool execution failed: ") + e.what());
    }
}

std::unique_ptr<JSONRPCResponse> Server::Impl::handlePromptsList(const JSONRPCRequest& req) {
    std::shared_ptr<IPromptsProvider> provider;
    {
        std::lock_guard<std::mutex> lock(tableMutex);
        provider = promptsProvider;
    }
    if (!provider) {
        return CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, "No prompt provider registered");
    }
    try {
        return success(req.id, MakeObject({{"prompts", JsonConvert<std::vector<Prompt>>::ToJSON(provider->GetPrompts())}}));
    } catch (const std::exception& e) {
        return CreateErrorResponse(req.id, JSONRPCErrorCodes::ApplicationError, e.what());
    }
}

std::unique_ptr<JSONRPCResponse> Server::Impl::handlePromptMessages(const JSONRPCRequest& req) {
    std::shared_ptr<IPromptsProvider> provider;
    {
        std::lock_guard<std::mutex> lock(tableMutex);
        provider = promptsProvider;
    }
    if (!provider) {
        return CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, "No prompt provider registered");
    }
    const JSONValue& params = paramsOf(req);
    auto name = FindString(params, "name");
    if (!name.has_value()) {
        return CreateErrorResponse(req.id, JSONRPCErrorCodes::InvalidParams, "Invalid parameters: missing prompt name");
    }
    const JSONValue* args = FindMember(params, "arguments");
    try {
        auto messages = provider->GetPromptMessages(name.value(), args ? *args : JSONValue(nullptr));
        return success(req.id, MakeObject({{"messages", JsonConvert<std::vector<PromptMessage>>::ToJSON(messages)}}));
    } catch (const std::exception& e) {
        LOG_WARN("Prompt '{}' failed: {}", name.value(), e.what());
        return CreateErrorResponse(req.id, JSONRPCErrorCodes::ApplicationError, e.what());
    }
}

std::unique_ptr<JSONRPCResponse> Server::Impl::handleResourcesList(const JSONRPCRequest& req) {
    std::shared_ptr<IResourcesProvider> provider;
    {
        std::lock_guard<std::mutex> lock(tableMutex);
        provider = resourcesProvider;
    }
    if (!provider) {
        return CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, "No resource provider registered");
    }
    try {
        return success(req.id, MakeObject({{"resources", JsonConvert<std::vector<Resource>>::ToJSON(provider->GetResources())}}));
    } catch (const std::exception& e) {
        return CreateErrorResponse(req.id, JSONRPCErrorCodes::ApplicationError, e.what());
    }
}

std::unique_ptr<JSONRPCResponse> Server::Impl::handleResourceGet(const JSONRPCRequest& req) {
    std::shared_ptr<IResourcesProvider> provider;
    {
        std::lock_guard<std::mutex> lock(tableMutex);
        provider = resourcesProvider;
    }
    if (!provider) {
        return CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, "No resource provider registered");
    }
    auto uri = FindString(paramsOf(req), "uri");
    if (!uri.has_value()) {
        return CreateErrorResponse(req.id, JSONRPCErrorCodes::InvalidParams, "Invalid parameters: missing resource uri");
    }
    try {
        return success(req.id, MakeObject({{"resource", ToJSON(provider->GetResource(uri.value()))}}));
    } catch (const std::exception& e) {
        LOG_WARN("Resource '{}' failed: {}", uri.value(), e.what());
        return CreateErrorResponse(req.id, JSONRPCErrorCodes::ApplicationError, e.what());
    }
}

std::unique_ptr<JSONRPCResponse> Server::Impl::handleResourceTemplatesList(const JSONRPCRequest& req) {
    std::shared_ptr<IResourcesProvider> provider;
    {
        std::lock_guard<std::mutex> lock(tableMutex);
        provider = resourcesProvider;
    }
    if (!provider) {
        return CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, "No resource provider registered");
    }
    try {
        return success(req.id, MakeObject({{"resourceTemplates",
            JsonConvert<std::vector<ResourceTemplate>>::ToJSON(provider->GetResourceTemplates())}}));
    } catch (const std::exception& e) {
        return CreateErrorResponse(req.id, JSONRPCErrorCodes::ApplicationError, e.what());
    }
}

////////////////////////////////////////////// Server ///////////////////////////////////////////////

Server::Server(ServerConfig config) : pImpl(std::make_unique<Impl>(std::move(config))) {
    FUNC_SCOPE();
}

Server::~Server() {
    FUNC_SCOPE();
    Stop();
}

void Server::RegisterToolHandler(const std::string& name, ToolHandler handler) {
    FUNC_SCOPE();
    const auto& tools = pImpl->config.tools;
    if (std::none_of(tools.begin(), tools.end(), [&](const Tool& t) { return t.name == name; })) {
        throw errors::Error::protocol("Tool '" + name + "' not found in server configuration");
    }
    std::lock_guard<std::mutex> lock(pImpl->tableMutex);
    pImpl->toolHandlers[name] = std::move(handler);
    LOG_DEBUG("Registered tool handler: {}", name);
}

void Server::SetToolsProvider(std::shared_ptr<IToolsProvider> provider) {
    std::lock_guard<std::mutex> lock(pImpl->tableMutex);
    pImpl->toolsProvider = std::move(provider);
}

void Server::SetPromptsProvider(std::shared_ptr<IPromptsProvider> provider) {
    std::lock_guard<std::mutex> lock(pImpl->tableMutex);
    pImpl->promptsProvider = std::move(provider);
}

void Server::SetResourcesProvider(std::shared_ptr<IResourcesProvider> provider) {
    std::lock_guard<std::mutex> lock(pImpl->tableMutex);
    pImpl->resourcesProvider = std::move(provider);
}

const ServerConfig& Server::GetConfig() const {
    return pImpl->config;
}

void Server::SetMaxErrors(uint32_t maxErrors) {
    pImpl->maxErrors.store(std::max<uint32_t>(1, maxErrors));
}

void Server::SetRetryDelay(std::chrono::milliseconds delay) {
    pImpl->retryDelayMs.store(std::max<int64_t>(0, static_cast<int64_t>(delay.count())));
}

uint32_t Server::GetMaxErrors() const {
    return pImpl->maxErrors.load();
}

std::chrono::milliseconds Server::GetRetryDelay() const {
    return std::chrono::milliseconds(pImpl->retryDelayMs.load());
}

std::unique_ptr<JSONRPCResponse> Server::HandleJSONRPC(const JSONRPCRequest& request) {
    FUNC_SCOPE();
    LOG_DEBUG("HandleJSONRPC: method={} id={}", request.method, IdToString(request.id));
    return pImpl->dispatch(request);
}

std::optional<std::string> Server::HandleMessage(const std::string& text) {
    FUNC_SCOPE();
    auto decoded = DecodeMessage(text);
    switch (KindOf(decoded)) {
        case MessageKind::Request:
            return HandleJSONRPC(std::get<JSONRPCRequest>(decoded))->Serialize();
        case MessageKind::Notification:
            LOG_DEBUG("Ignoring notification: {}", std::get<JSONRPCNotification>(decoded).method);
            return std::nullopt;
        case MessageKind::Response:
            LOG_DEBUG("Ignoring unsolicited response id={}", IdToString(std::get<JSONRPCResponse>(decoded).id));
            return std::nullopt;
        case MessageKind::Invalid: {
            const auto& inv = std::get<InvalidMessage>(decoded);
            LOG_WARN("Rejecting message: {} (code {})", inv.message, inv.code);
            return ErrorResponseFor(inv)->Serialize();
        }
    }
    return std::nullopt;
}

void Server::Serve(std::unique_ptr<ITransport> transport) {
    FUNC_SCOPE();
    if (!transport) {
        throw errors::Error::invalidRequest("Serve requires a transport");
    }
    Impl* impl = pImpl.get();
    {
        std::lock_guard<std::mutex> lock(impl->loopMutex);
        if (impl->running.load()) {
            throw errors::Error::state("Server is already serving a transport");
        }
        impl->running.store(true);
        impl->stopRequested = false;
        impl->shutdownRequested.store(false);
        impl->active = transport.get();
    }

    // Detaches the transport from Stop(), then closes it on every exit path.
    struct ServeScope {
        Impl* impl;
        std::unique_ptr<ITransport>& transport;
        ~ServeScope() {
            {
                std::lock_guard<std::mutex> lock(impl->loopMutex);
                impl->active = nullptr;
                impl->pushInbox.reset();
            }
            transport->Close();
            impl->running.store(false);
        }
    } scope{impl, transport};

    const bool pushOnly = !transport->SupportsReceive();
    auto inbox = std::make_shared<detail::InboundQueue>();
    if (pushOnly) {
        transport->SetMessageHandler([inbox](const std::string& text) { inbox->push(text); });
        transport->SetCloseHandler([inbox]() { inbox->shutdown(); });
        std::lock_guard<std::mutex> lock(impl->loopMutex);
        impl->pushInbox = inbox;
    }
    transport->SetErrorHandler([](const errors::Error& e) {
        LOG_ERROR("Transport reported: {}", e.what());
    });

    if (!transport->IsConnected()) {
        try {
            transport->Start();
        } catch (const errors::Error& e) {
            if (impl->isStopRequested()) {
                LOG_INFO("Server stopped before transport start completed ({})", e.what());
                return;
            }
            throw;
        }
    }
    LOG_INFO("Server '{}' serving on {} (max errors {}, retry delay {}ms)", impl->config.name,
             transport->GetSessionId(), impl->maxErrors.load(), impl->retryDelayMs.load());

    uint32_t consecutiveErrors = 0;
    while (!impl->isStopRequested()) {
        try {
            std::string text = pushOnly ? inbox->pop() : transport->ReceiveText();
            LOG_DEBUG("Server received: {}", text);
            auto reply = HandleMessage(text);
            if (reply.has_value()) {
                transport->SendText(reply.value());
            }
            consecutiveErrors = 0;
            if (impl->shutdownRequested.load()) {
                LOG_INFO("Shutdown acknowledged; leaving message loop");
                break;
            }
        } catch (const errors::Error& e) {
            if (impl->isStopRequested()) {
                break;
            }
            if (errors::isTransient(e)) {
                consecutiveErrors = 0;
                LOG_WARN("Transient transport condition: {}; retrying in {}ms", e.what(), impl->retryDelayMs.load());
                impl->waitRetry();
                continue;
            }
            ++consecutiveErrors;
            const uint32_t limit = impl->maxErrors.load();
            if (consecutiveErrors >= limit) {
                LOG_ERROR("Giving up after {} consecutive errors: {}", consecutiveErrors, e.what());
                throw;
            }
            LOG_WARN("Message loop error {}/{}: {}; retrying in {}ms", consecutiveErrors, limit, e.what(),
                     impl->retryDelayMs.load());
            impl->waitRetry();
        }
    }
    LOG_INFO("Server '{}' message loop ended", impl->config.name);
}

void Server::Stop() {
    FUNC_SCOPE();
    std::shared_ptr<detail::InboundQueue> inbox;
    {
        std::lock_guard<std::mutex> lock(pImpl->loopMutex);
        pImpl->stopRequested = true;
        inbox = pImpl->pushInbox;
        if (pImpl->active) {
            // Unblocks a pending ReceiveText; Serve() closes again on exit, which is a no-op.
            pImpl->active->Close();
        }
    }
    pImpl->loopCv.notify_all();
    if (inbox) {
        inbox->shutdown();
    }
}

bool Server::IsRunning() const {
    return pImpl->running.load();
}

} // namespace mcpwire
