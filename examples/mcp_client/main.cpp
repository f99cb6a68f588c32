//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: main.cpp
// Purpose: MCP client example: initialize, list, call a tool and shut down
//==========================================================================================================

#include "logging/Logger.h"
#include "mcpwire/Client.h"
#include "mcpwire/Errors.h"
#include "mcpwire/Protocol.h"
#include "mcpwire/Transport.h"
#include "mcpwire/version.h"

#include <cstddef>
#include <iostream>
#include <optional>
#include <string>

using namespace mcpwire;

//==========================================================================================================
// getArgValue
// Purpose: Parses "--key=value" or "--key value" CLI options.
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
        if (a == key && i + 1 < static_cast<std::size_t>(argc)) {
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    // Default: spawn the example server as a child process speaking over its stdio.
    const std::string uri = getArgValue(argc, argv, "--transport")
                                .value_or("command=./mcpwire_server;args=--transport stdio");
    const std::string toolName = getArgValue(argc, argv, "--tool").value_or("echo");
    const std::string paramsText = getArgValue(argc, argv, "--params").value_or("{\"message\":\"hello\"}");
    LOG_INFO("Client starting with transport={}", uri);

    try {
        Client client(CreateTransport(uri));
        client.SetClientInfo(Implementation("mcpwire example client", getVersionString()));
        if (getArgValue(argc, argv, "--tools-call").value_or("0") == "1") {
            client.SetUseToolsCallMethod(true);
        }

        InitializeResult init = client.Initialize();
        std::cout << "Connected to " << init.serverInfo.name << " " << init.serverInfo.version
                  << " (protocol " << init.protocolVersion << ")" << std::endl;
        for (const auto& t : client.InitializationTools()) {
            std::cout << "  tool: " << t.name << " - " << t.description.value_or("") << std::endl;
        }

        try {
            for (const auto& p : client.GetPrompts()) {
                std::cout << "  prompt: " << p.name << std::endl;
            }
            for (const auto& r : client.GetResources()) {
                std::cout << "  resource: " << r.uri << " (" << r.name << ")" << std::endl;
            }
        } catch (const errors::Error& e) {
            // Servers without providers answer listings with an error frame.
            LOG_WARN("Listing failed: {}", e.what());
        }

        JSONValue result = client.CallTool(toolName, ParseJSON(paramsText));
        std::cout << toolName << " -> " << SerializeJSONPretty(result) << std::endl;

        client.Shutdown();
    } catch (const errors::Error& e) {
        LOG_ERROR("Client failed: {}", e.what());
        return 1;
    }
    return 0;
}
