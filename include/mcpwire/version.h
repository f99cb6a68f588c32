//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: version.h
// Purpose: Library version (semantic version helpers)
//==========================================================================================================
#pragma once

#include <string>

namespace mcpwire {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

VersionInfo getVersion();

// "MAJOR.MINOR.PATCH"; also the default client_info version sent by Client.
std::string getVersionString();

} // namespace mcpwire
