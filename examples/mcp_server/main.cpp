//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: main.cpp
// Purpose: MCP server example serving echo/calculate tools, a greeting prompt and a README resource
//==========================================================================================================

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpwire/Errors.h"
#include "mcpwire/Protocol.h"
#include "mcpwire/Providers.h"
#include "mcpwire/Server.h"
#include "mcpwire/Transport.h"
#include "mcpwire/version.h"

#include <cstddef>
#include <cstdlib>
#include <optional>
#include <string>

using namespace mcpwire;

//==========================================================================================================
// Parses "--key=value" or "--key value" command-line options.
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
        if (a == key && i + 1 < static_cast<std::size_t>(argc) && argv[i + 1] != nullptr) {
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

static double numberArg(const JSONValue& params, const char* key) {
    const JSONValue* v = FindMember(params, key);
    if (!v) {
        throw errors::Error::invalidRequest(std::string("missing numeric parameter '") + key + "'");
    }
    return JsonConvert<double>::FromJSON(*v);
}

static JSONValue schemaWithProperties(JSONValue properties, std::vector<JSONValue> required) {
    return MakeObject({
        {"type", JSONValue("object")},
        {"properties", std::move(properties)},
        {"required", MakeArray(required)}
    });
}

class GreetingPrompts : public IPromptsProvider {
public:
    std::vector<Prompt> GetPrompts() override {
        PromptArgument name{"name", std::string("Who to greet"), true};
        return {Prompt("greeting", std::string("Friendly greeting"), std::vector<PromptArgument>{name})};
    }

    std::vector<PromptMessage> GetPromptMessages(const std::string& name, const JSONValue& arguments) override {
        if (name != "greeting") {
            throw errors::Error::notFound("prompt '" + name + "'");
        }
        std::string who = FindString(arguments, "name").value_or("there");
        return {PromptMessage("user", "Please greet " + who + " warmly."),
                PromptMessage("assistant", "Hello, " + who + "! Great to see you.")};
    }
};

class ReadmeResources : public IResourcesProvider {
public:
    std::vector<Resource> GetResources() override {
        return {Resource(kUri, "README", std::string("About this server"), std::string("text/markdown"))};
    }

    ResourceContents GetResource(const std::string& uri) override {
        if (uri != kUri) {
            throw errors::Error::notFound("resource '" + uri + "'");
        }
        ResourceContents c;
        c.uri = uri;
        c.mimeType = "text/markdown";
        c.text = "# mcpwire example server\n\nTools: echo, calculate.\n";
        return c;
    }

    std::vector<ResourceTemplate> GetResourceTemplates() override {
        return {ResourceTemplate("file:///docs/{name}", "Documentation page", std::nullopt, std::string("text/markdown"))};
    }

private:
    static constexpr const char* kUri = "file:///README.md";
};

int main(int argc, char** argv) {
    const std::string uri = getArgValue(argc, argv, "--transport").value_or("stdio");
    if (uri == "stdio") {
        // stdout carries the JSON-RPC stream.
        Logger::setConsole(LogConsole::Stderr);
    }
    if (auto logFile = getArgValue(argc, argv, "--log-file")) {
        Logger::setLogFile(*logFile);
    }
    FUNC_SCOPE();

    JSONValue echoSchema = schemaWithProperties(
        MakeObject({{"message", MakeObject({{"type", JSONValue("string")}})}}), {JSONValue("message")});
    JSONValue numberType = MakeObject({{"type", JSONValue("number")}});
    JSONValue calcSchema = schemaWithProperties(
        MakeObject({{"operation", MakeObject({{"type", JSONValue("string")}})}, {"a", numberType}, {"b", numberType}}),
        {JSONValue("operation"), JSONValue("a"), JSONValue("b")});

    ServerConfig config;
    config.WithName("mcpwire example server")
          .WithVersion(getVersionString())
          .WithTool(Tool("echo", std::string("Echoes its parameters back"), echoSchema))
          .WithTool(Tool("calculate", std::string("Applies add, subtract, multiply or divide to a and b"), calcSchema));

    Server server(config);
    server.RegisterToolHandler("echo", [](const JSONValue& params) { return params; });
    server.RegisterToolHandler("calculate", [](const JSONValue& params) {
        const std::string op = FindString(params, "operation").value_or("");
        const double a = numberArg(params, "a");
        const double b = numberArg(params, "b");
        double r = 0.0;
        if (op == "add") {
            r = a + b;
        } else if (op == "subtract") {
            r = a - b;
        } else if (op == "multiply") {
            r = a * b;
        } else if (op == "divide") {
            if (b == 0.0) {
                throw errors::Error::invalidRequest("division by zero");
            }
            r = a / b;
        } else {
            throw errors::Error::invalidRequest("unknown operation '" + op + "'");
        }
        return MakeObject({{"value", JSONValue(r)}});
    });
    server.SetPromptsProvider(std::make_shared<GreetingPrompts>());
    server.SetResourcesProvider(std::make_shared<ReadmeResources>());
    if (auto v = getArgValue(argc, argv, "--max-errors"); v.has_value()) {
        server.SetMaxErrors(static_cast<uint32_t>(std::strtoul(v->c_str(), nullptr, 10)));
    }

    LOG_INFO("Server starting with transport={}", uri);
    try {
        server.Serve(CreateTransport(uri));
    } catch (const errors::Error& e) {
        LOG_ERROR("Server terminated: {}", e.what());
        return 1;
    }
    LOG_INFO("Server exited cleanly");
    return 0;
}
