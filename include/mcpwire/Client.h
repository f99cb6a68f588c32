//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: Client.h
// Purpose: MCP client engine: initialize handshake, tool calls, listings and shutdown over any transport
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "mcpwire/JSONRPCTypes.h"
#include "mcpwire/Protocol.h"
#include "mcpwire/Transport.h"

namespace mcpwire {

//==========================================================================================================
// Client
// Purpose: Issues one request at a time and blocks for the response with the matching id. Messages with
//          other ids and notifications are skipped.
// Notes:
//   - Request ids start at 1 and are never reused by an instance.
//   - Server error frames raise errors::Error(Protocol) carrying the server code in rpcCode().
//   - Push-only transports (SupportsReceive() == false) are read through an internal queue fed by the message
//     handler; the response timeout applies to them only.
//==========================================================================================================
class Client {
public:
    explicit Client(std::unique_ptr<ITransport> transport);
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // Defaults: this library's name and version, empty capabilities, protocol PROTOCOL_VERSION.
    void SetClientInfo(const Implementation& info);
    void SetCapabilities(const JSONValue& capabilities);

    // Selects "tools/call" instead of "tool_call" for CallTool.
    void SetUseToolsCallMethod(bool useToolsCall);

    void SetResponseTimeout(std::chrono::milliseconds timeout);

    //==========================================================================================================
    // Starts the transport and performs the initialize handshake.
    // Returns:
    //   Server protocol version, server info, capabilities and the advertised tools.
    // Throws:
    //   errors::Error Protocol when the response lacks server_info; the transport is left started.
    //==========================================================================================================
    InitializeResult Initialize();

    // Server info from the last successful Initialize().
    const Implementation& ServerInfo() const;

    // Tools advertised in the initialize response, without a round trip.
    std::vector<Tool> InitializationTools() const;

    ////////////////////////////////////////// Tools /////////////////////////////////////////////////
    //==========================================================================================================
    // Invokes a tool and unwraps the "result" member of the response.
    // Throws:
    //   errors::Error Protocol for an error frame or a response without "result".
    //==========================================================================================================
    JSONValue CallTool(const std::string& name, const JSONValue& params);

    template <typename T>
    T CallToolAs(const std::string& name, const JSONValue& params) {
        return JsonConvert<T>::FromJSON(CallTool(name, params));
    }

    std::vector<Tool> GetTools();

    ////////////////////////////////////////// Prompts /////////////////////////////////////////////////
    std::vector<Prompt> GetPrompts();
    std::vector<PromptMessage> GetPromptMessages(const std::string& name, const JSONValue& arguments = JSONValue());

    ////////////////////////////////////////// Resources ///////////////////////////////////////////////
    std::vector<Resource> GetResources();
    ResourceContents GetResource(const std::string& uri);
    std::vector<ResourceTemplate> GetResourceTemplates();

    //==========================================================================================================
    // Sends shutdown, waits for the acknowledgement and closes the transport. The transport is closed even
    // when the acknowledgement is malformed; transport failures while sending still propagate after closing.
    //==========================================================================================================
    void Shutdown();

    bool IsConnected() const;
    ITransport& GetTransport();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpwire
