//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: TransportUri.h
// Purpose: scheme://host:port/path?k=v parsing shared by the transport factories
//==========================================================================================================

#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace mcpwire {
namespace detail {

struct TransportUri {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;                          // includes leading '/', or empty
    std::map<std::string, std::string> query;

    // Query value or fallback.
    std::string param(const std::string& key, const std::string& fallback) const;
    uint64_t paramUint(const std::string& key, uint64_t fallback) const;
};

//==========================================================================================================
// ParseTransportUri
// Purpose: Splits a transport URI. Accepts IPv6 literals in [addr]:port form. The port is validated to be
//          numeric and within [0, 65535] when present; defaultPort is used when absent.
// Throws:
//   errors::Error InvalidRequest on a missing scheme, empty host or invalid port.
//==========================================================================================================
TransportUri ParseTransportUri(const std::string& uri, const std::string& defaultPort);

// Splits "a=b&c=d" into a map. Keys without '=' map to an empty value.
std::map<std::string, std::string> ParseQueryString(const std::string& query);

} // namespace detail
} // namespace mcpwire
