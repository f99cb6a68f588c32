//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: Transport.cpp
// Purpose: Scheme-based transport selection
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <string>

#include "logging/Logger.h"
#include "mcpwire/Transport.h"
#include "mcpwire/StreamTransport.hpp"
#include "mcpwire/SocketTransport.hpp"
#include "mcpwire/FramedTransport.hpp"
#include "mcpwire/EventStreamTransport.hpp"
#include "mcpwire/InMemoryTransport.hpp"

namespace mcpwire {

std::unique_ptr<ITransport> CreateTransport(const std::string& uri) {
    FUNC_SCOPE();
    if (uri.empty() || uri == "stdio" || uri.rfind("command=", 0) == 0) {
        StreamTransportFactory f;
        return f.CreateTransport(uri);
    }
    if (uri == "memory" || uri.rfind("memory://", 0) == 0) {
        InMemoryTransportFactory f;
        return f.CreateTransport(uri);
    }
    auto sep = uri.find("://");
    if (sep == std::string::npos) {
        throw errors::Error::invalidRequest("Unrecognized transport: " + uri);
    }
    std::string scheme = uri.substr(0, sep);
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    LOG_DEBUG("CreateTransport: scheme={}", scheme);

    if (scheme == "tcp" || scheme == "tcp-listen") {
        SocketTransportFactory f;
        return f.CreateTransport(uri);
    }
    if (scheme == "ws" || scheme == "ws-listen") {
        FramedTransportFactory f;
        return f.CreateTransport(uri);
    }
    if (scheme == "http" || scheme == "https" || scheme == "sse-listen") {
        EventStreamTransportFactory f;
        return f.CreateTransport(uri);
    }
    throw errors::Error::invalidRequest("Unsupported transport scheme: " + scheme);
}

} // namespace mcpwire
