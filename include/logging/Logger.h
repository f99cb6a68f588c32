//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: Logger.h
// Purpose: Process-wide leveled logger with std::format messages, console routing and an optional file sink.
//==========================================================================================================
#pragma once

#include <atomic>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <format>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include "env/EnvVars.h"

enum class LogLevel {
    LOG_DEBUG_LEVEL,
    LOG_INFO_LEVEL,
    LOG_WARN_LEVEL,
    LOG_ERROR_LEVEL,
    LOG_FATAL_LEVEL
};

// Where console lines go. Stderr keeps stdout free for a line-delimited JSON-RPC stream.
enum class LogConsole {
    Stdout,
    Stderr
};

class Logger {
public:
    // Case-insensitive; WARNING is accepted for WARN. Anything unrecognised is INFO.
    static LogLevel levelFromString(std::string_view lvl) {
        auto is = [lvl](std::string_view name) {
            if (lvl.size() != name.size()) return false;
            for (size_t i = 0; i < name.size(); ++i) {
                if (::toupper(static_cast<unsigned char>(lvl[i])) != name[i]) return false;
            }
            return true;
        };
        if (is("DEBUG")) return LogLevel::LOG_DEBUG_LEVEL;
        if (is("WARN") || is("WARNING")) return LogLevel::LOG_WARN_LEVEL;
        if (is("ERROR")) return LogLevel::LOG_ERROR_LEVEL;
        if (is("FATAL")) return LogLevel::LOG_FATAL_LEVEL;
        return LogLevel::LOG_INFO_LEVEL;
    }

    static bool enabled(LogLevel level) { return sLogLevel.load(std::memory_order_relaxed) <= level; }

    static void setLogLevel(LogLevel level) { sLogLevel.store(level, std::memory_order_relaxed); }

    static void setConsole(LogConsole console) { sConsole.store(console, std::memory_order_relaxed); }

    // Appends to filePath in addition to the console. An empty path closes the current file.
    static void setLogFile(const std::string& filePath) {
        std::lock_guard<std::mutex> lock(sLogMutex);
        if (sLogFile.is_open()) {
            sLogFile.close();
        }
        if (filePath.empty()) {
            return;
        }
        sLogFile.open(filePath, std::ios::out | std::ios::app);
        if (!sLogFile.is_open()) {
            std::cerr << "[ERROR] Failed to open log file: " << filePath << " (errno=" << errno << ")" << std::endl;
            return;
        }
        sLogFile << "\n=== mcpwire log opened " << timestamp() << " ===\n";
        sLogFile.flush();
    }

    template <typename... Args>
    static void logf(LogLevel level, const char* fmt, const char* file, unsigned int line, Args&&... args) {
        std::string msg;
        try {
            msg = std::vformat(fmt, std::make_format_args(args...));
        } catch (const std::format_error& e) {
            msg = std::format("<bad log format '{}': {}>", fmt, e.what());
        }
        write(level, msg, file, line);
    }

private:
    static const char* label(LogLevel level) {
        switch (level) {
            case LogLevel::LOG_DEBUG_LEVEL: return "DEBUG";
            case LogLevel::LOG_INFO_LEVEL:  return "INFO";
            case LogLevel::LOG_WARN_LEVEL:  return "WARN";
            case LogLevel::LOG_ERROR_LEVEL: return "ERROR";
            case LogLevel::LOG_FATAL_LEVEL: return "FATAL";
        }
        return "?";
    }

    // HH:MM:SS.mmm local time.
    static std::string timestamp() {
        const auto now = std::chrono::system_clock::now();
        const std::time_t secs = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm tm{};
        ::localtime_r(&secs, &tm);
        return std::format("{:02}:{:02}:{:02}.{:03}", tm.tm_hour, tm.tm_min, tm.tm_sec, ms);
    }

    static void write(LogLevel level, const std::string& msg, const char* file, unsigned int line) {
        const char* slash = ::strrchr(file, '/');
        const char* shortFile = slash ? slash + 1 : file;
        const std::string prefix = timestamp();
        const char* name = label(level);

        std::lock_guard<std::mutex> lock(sLogMutex);
        std::ostream& console = sConsole.load(std::memory_order_relaxed) == LogConsole::Stderr ? std::cerr : std::cout;
        if (sColor) {
            const char* tint = level >= LogLevel::LOG_ERROR_LEVEL ? "\033[38;5;88m" : "\033[35m";
            console << prefix << " [" << tint << name << "\033[0m] ";
        } else {
            console << prefix << " [" << name << "] ";
        }
        console << shortFile << ":" << line << ": " << msg << '\n' << std::flush;

        if (sLogFile.is_open()) {
            sLogFile << prefix << " [" << name << "] " << shortFile << ":" << line << ": " << msg << '\n';
            sLogFile.flush();
        }
    }

    static std::atomic<LogLevel> sLogLevel;
    static std::atomic<LogConsole> sConsole;
    static const bool sColor;
    static std::ofstream sLogFile;
    static std::mutex sLogMutex;
};

// Arguments are evaluated only when the level is enabled.
#define MCPWIRE_LOG_AT(lvl, fmt, ...) \
    do { if (Logger::enabled(lvl)) Logger::logf(lvl, fmt, __FILE__, __LINE__, ##__VA_ARGS__); } while (0)
#define LOG_DEBUG(fmt, ...) MCPWIRE_LOG_AT(LogLevel::LOG_DEBUG_LEVEL, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  MCPWIRE_LOG_AT(LogLevel::LOG_INFO_LEVEL, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  MCPWIRE_LOG_AT(LogLevel::LOG_WARN_LEVEL, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) MCPWIRE_LOG_AT(LogLevel::LOG_ERROR_LEVEL, fmt, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) \
    do { Logger::logf(LogLevel::LOG_FATAL_LEVEL, fmt, __FILE__, __LINE__, ##__VA_ARGS__); ::_Exit(EXIT_FAILURE); } while (0)

#ifdef _DEBUG
namespace {
struct FuncScopeGuard {
    const char* func;
    explicit FuncScopeGuard(const char* f) : func(f) { LOG_DEBUG("ENTER: {}", func); }
    ~FuncScopeGuard() { LOG_DEBUG("EXIT:  {}", func); }
};
}
#define FUNC_SCOPE() [[maybe_unused]] FuncScopeGuard funcScope(__FUNCTION__)
#else
#define FUNC_SCOPE() ((void)0)
#endif
