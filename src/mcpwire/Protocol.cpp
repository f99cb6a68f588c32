//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: Protocol.cpp
// Purpose: Descriptor serialization and typed JSON conversion
//==========================================================================================================

#include "mcpwire/Protocol.h"
#include "mcpwire/Errors.h"

namespace mcpwire {

namespace {

void putString(JSONValue::Object& o, const char* key, const std::string& v) {
    o[key] = std::make_shared<JSONValue>(v);
}

void putOptional(JSONValue::Object& o, const char* key, const std::optional<std::string>& v) {
    if (v.has_value()) {
        putString(o, key, v.value());
    }
}

const JSONValue::Object& requireObject(const JSONValue& v, const char* what) {
    if (!v.IsObject()) {
        throw errors::Error::deserialization(std::string(what) + ": expected object");
    }
    return std::get<JSONValue::Object>(v.value);
}

std::string requireString(const JSONValue& v, const char* key, const char* what) {
    auto s = FindString(v, key);
    if (!s.has_value()) {
        throw errors::Error::deserialization(std::string(what) + ": missing string member '" + key + "'");
    }
    return s.value();
}

std::optional<std::string> optionalString(const JSONValue& v, const char* key) {
    return FindString(v, key);
}

} // namespace

const JSONValue::Array& RequireArray(const JSONValue& v, const char* what) {
    if (!v.IsArray()) {
        throw errors::Error::deserialization(std::string(what) + ": expected array");
    }
    return std::get<JSONValue::Array>(v.value);
}

///////////////////////////////////////// ToJSON ///////////////////////////////////////////

JSONValue ToJSON(const Implementation& v) {
    JSONValue::Object o;
    putString(o, "name", v.name);
    putString(o, "version", v.version);
    return JSONValue(std::move(o));
}

JSONValue ToJSON(const Tool& v) {
    JSONValue::Object o;
    putString(o, "name", v.name);
    putOptional(o, "description", v.description);
    // An unset schema is advertised as an empty object schema.
    if (v.inputSchema.IsNull()) {
        o["inputSchema"] = std::make_shared<JSONValue>(MakeObject({{"type", JSONValue("object")}}));
    } else {
        o["inputSchema"] = std::make_shared<JSONValue>(v.inputSchema);
    }
    return JSONValue(std::move(o));
}

JSONValue ToJSON(const PromptArgument& v) {
    JSONValue::Object o;
    putString(o, "name", v.name);
    putOptional(o, "description", v.description);
    if (v.required.has_value()) {
        o["required"] = std::make_shared<JSONValue>(v.required.value());
    }
    return JSONValue(std::move(o));
}

JSONValue ToJSON(const Prompt& v) {
    JSONValue::Object o;
    putString(o, "name", v.name);
    putOptional(o, "description", v.description);
    if (v.arguments.has_value()) {
        JSONValue::Array args;
        for (const auto& a : v.arguments.value()) {
            args.push_back(std::make_shared<JSONValue>(ToJSON(a)));
        }
        o["arguments"] = std::make_shared<JSONValue>(std::move(args));
    }
    return JSONValue(std::move(o));
}

JSONValue ToJSON(const PromptMessage& v) {
    return MakeObject({
        {"role", JSONValue(v.role)},
        {"content", MakeObject({{"type", JSONValue("text")}, {"text", JSONValue(v.text)}})}
    });
}

JSONValue ToJSON(const Resource& v) {
    JSONValue::Object o;
    putString(o, "uri", v.uri);
    putString(o, "name", v.name);
    putOptional(o, "description", v.description);
    putOptional(o, "mimeType", v.mimeType);
    return JSONValue(std::move(o));
}

JSONValue ToJSON(const ResourceTemplate& v) {
    JSONValue::Object o;
    putString(o, "uriTemplate", v.uriTemplate);
    putString(o, "name", v.name);
    putOptional(o, "description", v.description);
    putOptional(o, "mimeType", v.mimeType);
    return JSONValue(std::move(o));
}

JSONValue ToJSON(const ResourceContents& v) {
    JSONValue::Object o;
    putString(o, "uri", v.uri);
    putOptional(o, "mimeType", v.mimeType);
    putOptional(o, "text", v.text);
    putOptional(o, "blob", v.blob);
    return JSONValue(std::move(o));
}

///////////////////////////////////////// Parse ///////////////////////////////////////////

Implementation ParseImplementation(const JSONValue& v) {
    requireObject(v, "Implementation");
    return Implementation(requireString(v, "name", "Implementation"), requireString(v, "version", "Implementation"));
}

Tool ParseTool(const JSONValue& v) {
    requireObject(v, "Tool");
    Tool t;
    t.name = requireString(v, "name", "Tool");
    t.description = optionalString(v, "description");
    if (const JSONValue* schema = FindMember(v, "inputSchema")) {
        t.inputSchema = *schema;
    } else if (const JSONValue* legacy = FindMember(v, "input_schema")) {
        t.inputSchema = *legacy;
    }
    return t;
}

PromptArgument ParsePromptArgument(const JSONValue& v) {
    requireObject(v, "PromptArgument");
    PromptArgument a;
    a.name = requireString(v, "name", "PromptArgument");
    a.description = optionalString(v, "description");
    if (const JSONValue* req = FindMember(v, "required")) {
        if (!std::holds_alternative<bool>(req->value)) {
            throw errors::Error::deserialization("PromptArgument: 'required' must be a boolean");
        }
        a.required = std::get<bool>(req->value);
    }
    return a;
}

Prompt ParsePrompt(const JSONValue& v) {
    requireObject(v, "Prompt");
    Prompt p;
    p.name = requireString(v, "name", "Prompt");
    p.description = optionalString(v, "description");
    if (const JSONValue* args = FindMember(v, "arguments")) {
        if (!args->IsNull()) {
            std::vector<PromptArgument> list;
            for (const auto& item : RequireArray(*args, "Prompt.arguments")) {
                list.push_back(ParsePromptArgument(item ? *item : JSONValue(nullptr)));
            }
            p.arguments = std::move(list);
        }
    }
    return p;
}

PromptMessage ParsePromptMessage(const JSONValue& v) {
    requireObject(v, "PromptMessage");
    PromptMessage m;
    m.role = requireString(v, "role", "PromptMessage");
    const JSONValue* content = FindMember(v, "content");
    if (!content) {
        throw errors::Error::deserialization("PromptMessage: missing member 'content'");
    }
    if (content->IsString()) {
        m.text = std::get<std::string>(content->value);
    } else {
        m.text = requireString(*content, "text", "PromptMessage.content");
    }
    return m;
}

Resource ParseResource(const JSONValue& v) {
    requireObject(v, "Resource");
    Resource r;
    r.uri = requireString(v, "uri", "Resource");
    r.name = requireString(v, "name", "Resource");
    r.description = optionalString(v, "description");
    r.mimeType = optionalString(v, "mimeType");
    return r;
}

ResourceTemplate ParseResourceTemplate(const JSONValue& v) {
    requireObject(v, "ResourceTemplate");
    ResourceTemplate t;
    t.uriTemplate = requireString(v, "uriTemplate", "ResourceTemplate");
    t.name = requireString(v, "name", "ResourceTemplate");
    t.description = optionalString(v, "description");
    t.mimeType = optionalString(v, "mimeType");
    return t;
}

ResourceContents ParseResourceContents(const JSONValue& v) {
    requireObject(v, "ResourceContents");
    ResourceContents c;
    c.uri = requireString(v, "uri", "ResourceContents");
    c.mimeType = optionalString(v, "mimeType");
    c.text = optionalString(v, "text");
    c.blob = optionalString(v, "blob");
    return c;
}

///////////////////////////////////////// Scalar conversions ///////////////////////////////////////////

std::string JsonConvert<std::string>::FromJSON(const JSONValue& v) {
    if (!v.IsString()) {
        throw errors::Error::deserialization("expected string");
    }
    return std::get<std::string>(v.value);
}

bool JsonConvert<bool>::FromJSON(const JSONValue& v) {
    if (!std::holds_alternative<bool>(v.value)) {
        throw errors::Error::deserialization("expected boolean");
    }
    return std::get<bool>(v.value);
}

int64_t JsonConvert<int64_t>::FromJSON(const JSONValue& v) {
    if (!std::holds_alternative<int64_t>(v.value)) {
        throw errors::Error::deserialization("expected integer");
    }
    return std::get<int64_t>(v.value);
}

double JsonConvert<double>::FromJSON(const JSONValue& v) {
    if (std::holds_alternative<double>(v.value)) {
        return std::get<double>(v.value);
    }
    if (std::holds_alternative<int64_t>(v.value)) {
        return static_cast<double>(std::get<int64_t>(v.value));
    }
    throw errors::Error::deserialization("expected number");
}

} // namespace mcpwire
