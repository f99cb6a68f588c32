//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: Logger.cpp
// Purpose: Logger static state, seeded from MCPWIRE_LOG_LEVEL, MCPWIRE_LOG_COLOR and MCPWIRE_STDIO_MODE.
//==========================================================================================================

#include "logging/Logger.h"

namespace {

bool envFlag(const char* name, const char* def) {
    const std::string v = GetEnvOrDefault(name, def);
    return v == "1" || v == "true" || v == "TRUE";
}

} // namespace

std::atomic<LogLevel> Logger::sLogLevel{Logger::levelFromString(GetEnvOrDefault("MCPWIRE_LOG_LEVEL", "INFO"))};
std::atomic<LogConsole> Logger::sConsole{envFlag("MCPWIRE_STDIO_MODE", "0") ? LogConsole::Stderr : LogConsole::Stdout};
const bool Logger::sColor = envFlag("MCPWIRE_LOG_COLOR", "1");
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
