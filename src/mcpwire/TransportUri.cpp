//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: TransportUri.cpp
// Purpose: Transport URI parsing
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

#include "mcpwire/Errors.h"
#include "TransportUri.h"

namespace mcpwire {
namespace detail {

namespace {
void trim(std::string& s) {
    auto notSpace = [](unsigned char c){ return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
}
}

std::string TransportUri::param(const std::string& key, const std::string& fallback) const {
    auto it = query.find(key);
    return (it == query.end() || it->second.empty()) ? fallback : it->second;
}

uint64_t TransportUri::paramUint(const std::string& key, uint64_t fallback) const {
    auto it = query.find(key);
    if (it == query.end() || it->second.empty()) {
        return fallback;
    }
    const std::string& v = it->second;
    if (!std::all_of(v.begin(), v.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; })) {
        throw errors::Error::invalidRequest("Query parameter '" + key + "' must be numeric: " + v);
    }
    try {
        return static_cast<uint64_t>(std::stoull(v));
    } catch (const std::out_of_range&) {
        throw errors::Error::invalidRequest("Query parameter '" + key + "' out of range: " + v);
    }
}

std::map<std::string, std::string> ParseQueryString(const std::string& query) {
    std::map<std::string, std::string> out;
    std::stringstream ss(query);
    std::string kv;
    while (std::getline(ss, kv, '&')) {
        if (kv.empty()) {
            continue;
        }
        auto eq = kv.find('=');
        std::string key = (eq == std::string::npos) ? kv : kv.substr(0, eq);
        std::string val = (eq == std::string::npos) ? std::string() : kv.substr(eq + 1);
        out[key] = val;
    }
    return out;
}

TransportUri ParseTransportUri(const std::string& uri, const std::string& defaultPort) {
    TransportUri out;
    std::string cfg = uri;
    trim(cfg);

    auto sep = cfg.find("://");
    if (sep == std::string::npos || sep == 0) {
        throw errors::Error::invalidRequest("Transport URI lacks a scheme: " + uri);
    }
    out.scheme = cfg.substr(0, sep);
    std::transform(out.scheme.begin(), out.scheme.end(), out.scheme.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    cfg = cfg.substr(sep + 3);

    auto qpos = cfg.find('?');
    if (qpos != std::string::npos) {
        out.query = ParseQueryString(cfg.substr(qpos + 1));
        cfg = cfg.substr(0, qpos);
    }

    std::string hostPort = cfg;
    auto slash = cfg.find('/');
    if (slash != std::string::npos) {
        hostPort = cfg.substr(0, slash);
        out.path = cfg.substr(slash);
    }

    if (!hostPort.empty() && hostPort.front() == '[') {
        auto rb = hostPort.find(']');
        if (rb == std::string::npos) {
            throw errors::Error::invalidRequest("Unterminated IPv6 literal: " + uri);
        }
        out.host = hostPort.substr(1, rb - 1);
        if (rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') {
            out.port = hostPort.substr(rb + 2);
        }
    } else {
        auto colon = hostPort.rfind(':');
        if (colon != std::string::npos) {
            out.host = hostPort.substr(0, colon);
            out.port = hostPort.substr(colon + 1);
        } else {
            out.host = hostPort;
        }
    }
    trim(out.host);
    trim(out.port);
    if (out.host.empty()) {
        throw errors::Error::invalidRequest("Transport URI lacks a host: " + uri);
    }
    if (out.port.empty()) {
        out.port = defaultPort;
    }
    if (!std::all_of(out.port.begin(), out.port.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; })) {
        throw errors::Error::invalidRequest("Invalid port (non-numeric): " + out.port);
    }
    unsigned long portNum = 0;
    try {
        portNum = std::stoul(out.port);
    } catch (const std::out_of_range&) {
        throw errors::Error::invalidRequest("Invalid port (out of range): " + out.port);
    } catch (const std::invalid_argument&) {
        throw errors::Error::invalidRequest("Invalid port: " + out.port);
    }
    if (portNum > 65535ul) {
        throw errors::Error::invalidRequest("Invalid port (out of range): " + out.port);
    }
    return out;
}

} // namespace detail
} // namespace mcpwire
