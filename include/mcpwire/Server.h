//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: Server.h
// Purpose: MCP server engine: method dispatch, tool handler table and the transport message loop
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcpwire/JSONRPCTypes.h"
#include "mcpwire/Protocol.h"
#include "mcpwire/Providers.h"
#include "mcpwire/Transport.h"

namespace mcpwire {

// Tool handlers return the result value or throw to report a failure.
using ToolHandler = std::function<JSONValue(const JSONValue& params)>;

//==========================================================================================================
// ServerConfig
// Purpose: Server identity and the tools it advertises. Only configured tools accept handlers.
//==========================================================================================================
struct ServerConfig {
    std::string name{"MCP Server"};
    std::string version{"1.0.0"};
    std::vector<Tool> tools;

    ServerConfig& WithName(std::string n) { name = std::move(n); return *this; }
    ServerConfig& WithVersion(std::string v) { version = std::move(v); return *this; }
    ServerConfig& WithTool(Tool t) { tools.push_back(std::move(t)); return *this; }
};

//==========================================================================================================
// Server
// Purpose: Receives requests from one transport, dispatches them and answers each with exactly one response
//          or error carrying the request id.
// Notes:
//   - Recognized methods: initialize, shutdown, tool_call | tools/call, tools/list | get_tools,
//     prompts/list | get_prompts, get_prompt_messages, resources/list | get_resources,
//     resources/get | get_resource, resources/templates/list | get_resource_templates.
//   - Retry policy: transient transport errors (errors::isTransient) reset the consecutive error count and
//     retry after the retry delay; any other error increments it and, once it reaches the maximum, Serve()
//     rethrows that error. A successful exchange resets the count.
//==========================================================================================================
class Server {
public:
    explicit Server(ServerConfig config = ServerConfig());
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    ////////////////////////////////////////////// Registration /////////////////////////////////////////////
    //==========================================================================================================
    // Binds a handler to a configured tool. Registering again replaces the handler.
    // Throws:
    //   errors::Error Protocol("Tool '<name>' not found in server configuration").
    //==========================================================================================================
    void RegisterToolHandler(const std::string& name, ToolHandler handler);

    void SetToolsProvider(std::shared_ptr<IToolsProvider> provider);
    void SetPromptsProvider(std::shared_ptr<IPromptsProvider> provider);
    void SetResourcesProvider(std::shared_ptr<IResourcesProvider> provider);

    const ServerConfig& GetConfig() const;

    ////////////////////////////////////////////// Retry policy /////////////////////////////////////////////
    // Defaults come from MCPWIRE_SERVER_MAX_ERRORS (5) and MCPWIRE_SERVER_RETRY_DELAY_MS (1000).
    void SetMaxErrors(uint32_t maxErrors);
    void SetRetryDelay(std::chrono::milliseconds delay);
    uint32_t GetMaxErrors() const;
    std::chrono::milliseconds GetRetryDelay() const;

    ////////////////////////////////////////////// Dispatch /////////////////////////////////////////////////
    //==========================================================================================================
    // Dispatches one decoded request. Never throws for handler or provider failures; those become error
    // responses.
    //==========================================================================================================
    std::unique_ptr<JSONRPCResponse> HandleJSONRPC(const JSONRPCRequest& request);

    //==========================================================================================================
    // Decodes and dispatches one raw document.
    // Returns:
    //   The serialized reply for requests and invalid documents; std::nullopt for notifications and responses.
    //==========================================================================================================
    std::optional<std::string> HandleMessage(const std::string& text);

    ////////////////////////////////////////////// Message loop /////////////////////////////////////////////
    //==========================================================================================================
    // Starts the transport (unless already connected) and runs receive, dispatch, respond until a shutdown
    // request is answered or Stop() is called. The transport is closed before returning.
    // Throws:
    //   The errors::Error that exhausted the retry budget, or the error raised by Start().
    //==========================================================================================================
    void Serve(std::unique_ptr<ITransport> transport);

    // Ends a running Serve() from another thread.
    void Stop();

    bool IsRunning() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpwire
