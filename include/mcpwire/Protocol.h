//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: Protocol.h
// Purpose: MCP descriptor types, method names and typed JSON conversion
//==========================================================================================================

#pragma once

#include "mcpwire/JSONRPCTypes.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mcpwire {

///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
constexpr const char* PROTOCOL_VERSION = "0.1.0";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
struct Tool {
    std::string name;
    std::optional<std::string> description;
    JSONValue inputSchema;  // JSON Schema for tool parameters

    Tool() = default;
    Tool(std::string name, std::optional<std::string> description = std::nullopt,
         JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)), inputSchema(std::move(inputSchema)) {}
};

///////////////////////////////////////// Prompts ///////////////////////////////////////////
struct PromptArgument {
    std::string name;
    std::optional<std::string> description;
    std::optional<bool> required;
};

struct Prompt {
    std::string name;
    std::optional<std::string> description;
    std::optional<std::vector<PromptArgument>> arguments;

    Prompt() = default;
    Prompt(std::string name, std::optional<std::string> description = std::nullopt,
           std::optional<std::vector<PromptArgument>> arguments = std::nullopt)
        : name(std::move(name)), description(std::move(description)), arguments(std::move(arguments)) {}
};

// Serialized as { role, content: { type: "text", text } }.
struct PromptMessage {
    std::string role;
    std::string text;

    PromptMessage() = default;
    PromptMessage(std::string role, std::string text) : role(std::move(role)), text(std::move(text)) {}
};

///////////////////////////////////////// Resources ///////////////////////////////////////////
struct Resource {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;

    Resource() = default;
    Resource(std::string uri, std::string name,
             std::optional<std::string> description = std::nullopt,
             std::optional<std::string> mimeType = std::nullopt)
        : uri(std::move(uri)), name(std::move(name)),
          description(std::move(description)), mimeType(std::move(mimeType)) {}
};

struct ResourceTemplate {
    std::string uriTemplate;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;

    ResourceTemplate() = default;
    ResourceTemplate(std::string uriTemplate, std::string name,
                     std::optional<std::string> description = std::nullopt,
                     std::optional<std::string> mimeType = std::nullopt)
        : uriTemplate(std::move(uriTemplate)), name(std::move(name)),
          description(std::move(description)), mimeType(std::move(mimeType)) {}
};

// Text or base64 blob contents of one resource.
struct ResourceContents {
    std::string uri;
    std::optional<std::string> mimeType;
    std::optional<std::string> text;
    std::optional<std::string> blob;
};

///////////////////////////////////////// Initialization ///////////////////////////////////////////
struct InitializeResult {
    std::string protocolVersion;
    Implementation serverInfo;
    JSONValue capabilities;
    std::vector<Tool> tools;
};

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Shutdown = "shutdown";

    constexpr const char* ToolCall = "tool_call";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* GetTools = "get_tools";

    constexpr const char* ListPrompts = "prompts/list";
    constexpr const char* GetPrompts = "get_prompts";
    constexpr const char* GetPromptMessages = "get_prompt_messages";

    constexpr const char* ListResources = "resources/list";
    constexpr const char* GetResources = "get_resources";
    constexpr const char* ReadResource = "resources/get";
    constexpr const char* GetResource = "get_resource";
    constexpr const char* ListResourceTemplates = "resources/templates/list";
    constexpr const char* GetResourceTemplates = "get_resource_templates";
}

/////////////////////////////////////// Descriptor <-> JSON ///////////////////////////////////////////
//==========================================================================================================
// ToJSON / Parse*
// Purpose: Wire conversion of the descriptor types. Optional fields are omitted when unset.
// Throws:
//   Parse* throw errors::Error(Deserialization) when a required member is missing or mistyped.
//==========================================================================================================
JSONValue ToJSON(const Implementation& v);
JSONValue ToJSON(const Tool& v);
JSONValue ToJSON(const PromptArgument& v);
JSONValue ToJSON(const Prompt& v);
JSONValue ToJSON(const PromptMessage& v);
JSONValue ToJSON(const Resource& v);
JSONValue ToJSON(const ResourceTemplate& v);
JSONValue ToJSON(const ResourceContents& v);

Implementation ParseImplementation(const JSONValue& v);
Tool ParseTool(const JSONValue& v);
PromptArgument ParsePromptArgument(const JSONValue& v);
Prompt ParsePrompt(const JSONValue& v);
PromptMessage ParsePromptMessage(const JSONValue& v);
Resource ParseResource(const JSONValue& v);
ResourceTemplate ParseResourceTemplate(const JSONValue& v);
ResourceContents ParseResourceContents(const JSONValue& v);

//==========================================================================================================
// JsonConvert<T>
// Purpose: Typed conversion used by Client::CallToolAs<T>. Specializations exist for JSONValue, string,
//          bool, int64_t, double, the descriptor types and std::vector of any convertible type.
//==========================================================================================================
template <typename T>
struct JsonConvert;

template <>
struct JsonConvert<JSONValue> {
    static JSONValue FromJSON(const JSONValue& v) { return v; }
    static JSONValue ToJSON(const JSONValue& v) { return v; }
};

template <>
struct JsonConvert<std::string> {
    static std::string FromJSON(const JSONValue& v);
    static JSONValue ToJSON(const std::string& v) { return JSONValue(v); }
};

template <>
struct JsonConvert<bool> {
    static bool FromJSON(const JSONValue& v);
    static JSONValue ToJSON(bool v) { return JSONValue(v); }
};

template <>
struct JsonConvert<int64_t> {
    static int64_t FromJSON(const JSONValue& v);
    static JSONValue ToJSON(int64_t v) { return JSONValue(v); }
};

// Accepts integers as well as doubles.
template <>
struct JsonConvert<double> {
    static double FromJSON(const JSONValue& v);
    static JSONValue ToJSON(double v) { return JSONValue(v); }
};

#define MCPWIRE_DESCRIPTOR_CONVERT(Type)                                                 \
    template <>                                                                          \
    struct JsonConvert<Type> {                                                           \
        static Type FromJSON(const JSONValue& v) { return Parse##Type(v); }             \
        static JSONValue ToJSON(const Type& v) { return ::mcpwire::ToJSON(v); }         \
    };

MCPWIRE_DESCRIPTOR_CONVERT(Implementation)
MCPWIRE_DESCRIPTOR_CONVERT(Tool)
MCPWIRE_DESCRIPTOR_CONVERT(Prompt)
MCPWIRE_DESCRIPTOR_CONVERT(PromptMessage)
MCPWIRE_DESCRIPTOR_CONVERT(Resource)
MCPWIRE_DESCRIPTOR_CONVERT(ResourceTemplate)
MCPWIRE_DESCRIPTOR_CONVERT(ResourceContents)

#undef MCPWIRE_DESCRIPTOR_CONVERT

// Throws errors::Error(Deserialization) when v is not an array.
const JSONValue::Array& RequireArray(const JSONValue& v, const char* what);

template <typename T>
struct JsonConvert<std::vector<T>> {
    static std::vector<T> FromJSON(const JSONValue& v) {
        std::vector<T> out;
        for (const auto& item : RequireArray(v, "array")) {
            out.push_back(JsonConvert<T>::FromJSON(item ? *item : JSONValue(nullptr)));
        }
        return out;
    }
    static JSONValue ToJSON(const std::vector<T>& v) {
        JSONValue::Array arr;
        for (const auto& item : v) {
            arr.push_back(std::make_shared<JSONValue>(JsonConvert<T>::ToJSON(item)));
        }
        return JSONValue(std::move(arr));
    }
};

} // namespace mcpwire
