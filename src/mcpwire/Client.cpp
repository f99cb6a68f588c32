//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: Client.cpp
// Purpose: MCP client engine implementation
//==========================================================================================================
#include <atomic>
#include <mutex>
#include <optional>

#include "logging/Logger.h"
#include "mcpwire/Client.h"
#include "mcpwire/Errors.h"
#include "mcpwire/JsonRpcCodec.h"
#include "mcpwire/version.h"
#include "ConnectionState.h"

namespace mcpwire {

class Client::Impl {
public:
    std::unique_ptr<ITransport> transport;
    std::atomic<int64_t> nextId{1};

    Implementation clientInfo{"mcpwire", getVersionString()};
    JSONValue capabilities{JSONValue::Object{}};
    bool useToolsCall{false};
    std::chrono::milliseconds responseTimeout{30000};

    Implementation serverInfo;
    mutable std::mutex toolsMutex;
    std::vector<Tool> initTools;

    // Set for push-only transports
    std::shared_ptr<detail::InboundQueue> inbox;

    std::string receiveOne() {
        if (inbox) {
            return inbox->pop(responseTimeout);
        }
        return transport->ReceiveText();
    }

    //==========================================================================================================
    // Sends one request and blocks for the response carrying its id.
    // Returns:
    //   The result member (null when absent).
    // Throws:
    //   Protocol for an error frame, Deserialization for a malformed reply, transport errors as raised.
    //==========================================================================================================
    JSONValue roundTrip(const std::string& method, std::optional<JSONValue> params) {
        const int64_t id = nextId.fetch_add(1);
        JSONRPCRequest request(id, method, std::move(params));
        const std::string wire = request.Serialize();
        LOG_DEBUG("Client sending: {}", wire);
        transport->SendText(wire);

        while (true) {
            const std::string text = receiveOne();
            LOG_DEBUG("Client received: {}", text);
            auto decoded = DecodeMessage(text);
            if (auto* invalid = std::get_if<InvalidMessage>(&decoded)) {
                throw errors::Error::deserialization("Malformed response to '" + method + "': " + invalid->message);
            }
            auto* resp = std::get_if<JSONRPCResponse>(&decoded);
            if (!resp) {
                LOG_DEBUG("Skipping non-response message while waiting for id {}", id);
                continue;
            }
            const bool matches = std::holds_alternative<int64_t>(resp->id) && std::get<int64_t>(resp->id) == id;
            // A null id is the server's answer to a request it could not read.
            const bool unreadable = std::holds_alternative<std::nullptr_t>(resp->id) && resp->IsError();
            if (!matches && !unreadable) {
                LOG_DEBUG("Skipping response id={} while waiting for id {}", IdToString(resp->id), id);
                continue;
            }
            if (resp->IsError()) {
                auto rpc = errors::rpcErrorFromResponse(*resp);
                if (!rpc.has_value()) {
                    throw errors::Error::protocol(method + " failed with an unrecognized error shape");
                }
                LOG_WARN("{} failed: code={} message={}", method, rpc->code, rpc->message);
                throw errors::Error(errors::ErrorKind::Protocol, rpc->message, rpc->code);
            }
            return resp->result.has_value() ? resp->result.value() : JSONValue(nullptr);
        }
    }
};

namespace {

const JSONValue& requireField(const JSONValue& result, const char* key) {
    const JSONValue* v = FindMember(result, key);
    if (!v) {
        throw errors::Error::protocol(std::string("Missing '") + key + "' field in response");
    }
    return *v;
}

} // namespace

Client::Client(std::unique_ptr<ITransport> transport) : pImpl(std::make_unique<Impl>()) {
    FUNC_SCOPE();
    if (!transport) {
        throw errors::Error::invalidRequest("Client requires a transport");
    }
    pImpl->transport = std::move(transport);
    if (!pImpl->transport->SupportsReceive()) {
        auto inbox = std::make_shared<detail::InboundQueue>();
        pImpl->transport->SetMessageHandler([inbox](const std::string& text) { inbox->push(text); });
        pImpl->transport->SetCloseHandler([inbox]() { inbox->shutdown(); });
        pImpl->inbox = inbox;
    }
}

Client::~Client() {
    FUNC_SCOPE();
    if (pImpl && pImpl->transport) {
        pImpl->transport->Close();
    }
}

void Client::SetClientInfo(const Implementation& info) { pImpl->clientInfo = info; }
void Client::SetCapabilities(const JSONValue& capabilities) { pImpl->capabilities = capabilities; }
void Client::SetUseToolsCallMethod(bool useToolsCall) { pImpl->useToolsCall = useToolsCall; }
void Client::SetResponseTimeout(std::chrono::milliseconds timeout) { pImpl->responseTimeout = timeout; }

InitializeResult Client::Initialize() {
    FUNC_SCOPE();
    if (!pImpl->transport->IsConnected()) {
        pImpl->transport->Start();
    }
    JSONValue params = MakeObject({
        {"protocol_version", JSONValue(PROTOCOL_VERSION)},
        {"capabilities", pImpl->capabilities},
        {"client_info", ToJSON(pImpl->clientInfo)}
    });
    JSONValue result = pImpl->roundTrip(Methods::Initialize, std::move(params));

    const JSONValue* si = FindMember(result, "server_info");
    if (!si) {
        LOG_ERROR("Initialize response lacks server_info");
        throw errors::Error::protocol("Missing server_info in response");
    }
    InitializeResult out;
    try {
        out.serverInfo = ParseImplementation(*si);
    } catch (const errors::Error& e) {
        throw errors::Error::protocol(std::string("Invalid server_info in response: ") + e.what());
    }
    out.protocolVersion = FindString(result, "protocol_version").value_or("");
    if (out.protocolVersion != PROTOCOL_VERSION) {
        LOG_WARN("Server protocol version '{}' differs from client '{}'", out.protocolVersion, PROTOCOL_VERSION);
    }
    if (const JSONValue* caps = FindMember(result, "capabilities")) {
        out.capabilities = *caps;
    } else {
        out.capabilities = JSONValue(JSONValue::Object{});
    }
    if (const JSONValue* tools = FindMember(result, "tools")) {
        try {
            out.tools = JsonConvert<std::vector<Tool>>::FromJSON(*tools);
        } catch (const errors::Error& e) {
            LOG_WARN("Ignoring malformed tool listing in initialize response: {}", e.what());
        }
    }

    pImpl->serverInfo = out.serverInfo;
    {
        std::lock_guard<std::mutex> lock(pImpl->toolsMutex);
        pImpl->initTools = out.tools;
    }
    LOG_INFO("Initialized with server '{}' {} ({} tools)", out.serverInfo.name, out.serverInfo.version, out.tools.size());
    return out;
}

const Implementation& Client::ServerInfo() const {
    return pImpl->serverInfo;
}

std::vector<Tool> Client::InitializationTools() const {
    std::lock_guard<std::mutex> lock(pImpl->toolsMutex);
    return pImpl->initTools;
}

JSONValue Client::CallTool(const std::string& name, const JSONValue& params) {
    FUNC_SCOPE();
    const bool toolsCall = pImpl->useToolsCall;
    JSONValue request = MakeObject({
        {"name", JSONValue(name)},
        {toolsCall ? "arguments" : "parameters", params}
    });
    JSONValue result = pImpl->roundTrip(toolsCall ? Methods::CallTool : Methods::ToolCall, std::move(request));
    return requireField(result, "result");
}

std::vector<Tool> Client::GetTools() {
    FUNC_SCOPE();
    JSONValue result = pImpl->roundTrip(Methods::ListTools, std::nullopt);
    return JsonConvert<std::vector<Tool>>::FromJSON(requireField(result, "tools"));
}

std::vector<Prompt> Client::GetPrompts() {
    FUNC_SCOPE();
    JSONValue result = pImpl->roundTrip(Methods::ListPrompts, std::nullopt);
    return JsonConvert<std::vector<Prompt>>::FromJSON(requireField(result, "prompts"));
}

std::vector<PromptMessage> Client::GetPromptMessages(const std::string& name, const JSONValue& arguments) {
    FUNC_SCOPE();
    JSONValue::Object params;
    params["name"] = std::make_shared<JSONValue>(name);
    if (!arguments.IsNull()) {
        params["arguments"] = std::make_shared<JSONValue>(arguments);
    }
    JSONValue result = pImpl->roundTrip(Methods::GetPromptMessages, JSONValue(std::move(params)));
    return JsonConvert<std::vector<PromptMessage>>::FromJSON(requireField(result, "messages"));
}

std::vector<Resource> Client::GetResources() {
    FUNC_SCOPE();
    JSONValue result = pImpl->roundTrip(Methods::ListResources, std::nullopt);
    return JsonConvert<std::vector<Resource>>::FromJSON(requireField(result, "resources"));
}

ResourceContents Client::GetResource(const std::string& uri) {
    FUNC_SCOPE();
    JSONValue result = pImpl->roundTrip(Methods::ReadResource, MakeObject({{"uri", JSONValue(uri)}}));
    return ParseResourceContents(requireField(result, "resource"));
}

std::vector<ResourceTemplate> Client::GetResourceTemplates() {
    FUNC_SCOPE();
    JSONValue result = pImpl->roundTrip(Methods::ListResourceTemplates, std::nullopt);
    return JsonConvert<std::vector<ResourceTemplate>>::FromJSON(requireField(result, "resourceTemplates"));
}

void Client::Shutdown() {
    FUNC_SCOPE();
    std::optional<errors::Error> failure;
    try {
        pImpl->roundTrip(Methods::Shutdown, std::nullopt);
    } catch (const errors::Error& e) {
        if (e.kind() == errors::ErrorKind::Protocol || e.kind() == errors::ErrorKind::Deserialization) {
            LOG_WARN("Shutdown acknowledgement was not well formed ({}); closing anyway", e.what());
        } else {
            failure = e;
        }
    }
    pImpl->transport->Close();
    LOG_INFO("Client shut down");
    if (failure.has_value()) {
        throw failure.value();
    }
}

bool Client::IsConnected() const {
    return pImpl->transport->IsConnected();
}

ITransport& Client::GetTransport() {
    return *pImpl->transport;
}

} // namespace mcpwire
