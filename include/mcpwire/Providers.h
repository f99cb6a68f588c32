//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: Providers.h
// Purpose: Provider interfaces supplying tool, prompt and resource listings to the server
//==========================================================================================================

#pragma once

#include <string>
#include <vector>

#include "mcpwire/Protocol.h"

namespace mcpwire {

//==========================================================================================================
// Provider interfaces
// Purpose: External collaborators the Server calls synchronously from its dispatch handlers.
// Notes:
//   - Failures are reported by throwing; errors::Error keeps its kind, any other std::exception is
//     surfaced with its what() text.
//==========================================================================================================
class IToolsProvider {
public:
    virtual ~IToolsProvider() = default;

    virtual std::vector<Tool> GetTools() = 0;

    //==========================================================================================================
    // Executes a tool.
    // Args:
    //   name: Tool name as sent by the client.
    //   params: Tool parameters (null when the request carried none).
    // Returns:
    //   The tool result value, sent back as {"result": value}.
    //==========================================================================================================
    virtual JSONValue ExecuteTool(const std::string& name, const JSONValue& params) = 0;
};

class IPromptsProvider {
public:
    virtual ~IPromptsProvider() = default;

    virtual std::vector<Prompt> GetPrompts() = 0;

    // Renders the messages of a prompt; arguments is an object or null.
    virtual std::vector<PromptMessage> GetPromptMessages(const std::string& name, const JSONValue& arguments) = 0;
};

class IResourcesProvider {
public:
    virtual ~IResourcesProvider() = default;

    virtual std::vector<Resource> GetResources() = 0;
    virtual ResourceContents GetResource(const std::string& uri) = 0;

    virtual std::vector<ResourceTemplate> GetResourceTemplates() { return {}; }
};

} // namespace mcpwire
