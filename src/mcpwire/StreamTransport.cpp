//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: StreamTransport.cpp
// Purpose: Stream (stdio / child process) transport implementation
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <cstring>

#include <chrono>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <boost/iostreams/device/file_descriptor.hpp>
#include <boost/iostreams/stream.hpp>

#include "logging/Logger.h"
#include "mcpwire/StreamTransport.hpp"
#include "ConnectionState.h"

namespace mcpwire {

namespace io = boost::iostreams;

namespace {
constexpr auto ChildTerminateGrace = std::chrono::milliseconds(500);
constexpr auto ChildPollInterval = std::chrono::milliseconds(10);
}

class StreamTransport::Impl {
public:
    detail::ConnectionState state;
    std::string sessionId;
    std::istream* in{nullptr};
    std::ostream* out{nullptr};
    std::mutex readMutex;
    std::mutex writeMutex;

    // Child process mode
    bool childMode{false};
    std::string command;
    std::vector<std::string> args;
    pid_t childPid{-1};
    io::stream<io::file_descriptor_source> childStdout;
    io::stream<io::file_descriptor_sink> childStdin;

    Impl(std::istream* i, std::ostream* o) : sessionId(detail::makeSessionId("stdio")), in(i), out(o) {}

    //==========================================================================================================
    // spawnChild
    // Purpose: fork/exec the configured command with stdin/stdout redirected into two pipes and bind the
    //          parent ends to iostreams.
    //==========================================================================================================
    void spawnChild() {
        // argv is materialized before fork(); the child must not allocate.
        std::vector<std::string> argvStorage;
        argvStorage.reserve(args.size() + 1);
        argvStorage.push_back(command);
        for (const auto& a : args) {
            argvStorage.push_back(a);
        }
        std::vector<char*> argv;
        argv.reserve(argvStorage.size() + 1);
        for (auto& s : argvStorage) {
            argv.push_back(s.data());
        }
        argv.push_back(nullptr);

        int stdinPipe[2];
        int stdoutPipe[2];
        if (::pipe(stdinPipe) == -1) {
            throw errors::Error::transport(std::string("Failed to create pipes: ") + ::strerror(errno));
        }
        if (::pipe(stdoutPipe) == -1) {
            const int err = errno;
            ::close(stdinPipe[0]);
            ::close(stdinPipe[1]);
            throw errors::Error::transport(std::string("Failed to create pipes: ") + ::strerror(err));
        }

        pid_t pid = ::fork();
        if (pid == -1) {
            const int err = errno;
            ::close(stdinPipe[0]);
            ::close(stdinPipe[1]);
            ::close(stdoutPipe[0]);
            ::close(stdoutPipe[1]);
            throw errors::Error::transport(std::string("Failed to fork: ") + ::strerror(err));
        }
        if (pid == 0) {
            ::dup2(stdinPipe[0], STDIN_FILENO);
            ::close(stdinPipe[0]);
            ::close(stdinPipe[1]);
            ::dup2(stdoutPipe[1], STDOUT_FILENO);
            ::close(stdoutPipe[0]);
            ::close(stdoutPipe[1]);
            ::execvp(command.c_str(), argv.data());
            ::_exit(127);
        }

        ::close(stdinPipe[0]);
        ::close(stdoutPipe[1]);
        ::fcntl(stdinPipe[1], F_SETFD, FD_CLOEXEC);
        ::fcntl(stdoutPipe[0], F_SETFD, FD_CLOEXEC);

        // A dead child must surface as a write error, not a process-wide SIGPIPE.
        ::signal(SIGPIPE, SIG_IGN);

        childPid = pid;
        childStdout.open(io::file_descriptor_source(stdoutPipe[0], io::close_handle));
        childStdin.open(io::file_descriptor_sink(stdinPipe[1], io::close_handle));
        in = &childStdout;
        out = &childStdin;
        LOG_INFO("StreamTransport: spawned '{}' (pid={})", command, static_cast<int>(pid));
    }

    void terminateChild() {
        {
            std::lock_guard<std::mutex> lock(writeMutex);
            if (childStdin.is_open()) {
                childStdin.close();
            }
        }
        if (childPid > 0) {
            ::kill(childPid, SIGTERM);
            int status = 0;
            auto deadline = std::chrono::steady_clock::now() + ChildTerminateGrace;
            pid_t waited = ::waitpid(childPid, &status, WNOHANG);
            while (waited == 0 && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(ChildPollInterval);
                waited = ::waitpid(childPid, &status, WNOHANG);
            }
            if (waited == 0) {
                LOG_WARN("StreamTransport: child pid={} ignored SIGTERM; killing", static_cast<int>(childPid));
                ::kill(childPid, SIGKILL);
                ::waitpid(childPid, &status, 0);
            }
            LOG_INFO("StreamTransport: child pid={} exited", static_cast<int>(childPid));
            childPid = -1;
        }
        // The child is gone, so any blocked reader has already seen EOF.
        std::lock_guard<std::mutex> lock(readMutex);
        if (childStdout.is_open()) {
            childStdout.close();
        }
    }

    [[noreturn]] void fail(const std::string& msg) {
        auto err = errors::Error::transport(msg);
        LOG_ERROR("StreamTransport: {}", msg);
        state.emitError(err);
        throw err;
    }
};

StreamTransport::StreamTransport() : pImpl(std::make_unique<Impl>(&std::cin, &std::cout)) { FUNC_SCOPE(); }

StreamTransport::StreamTransport(std::istream& in, std::ostream& out)
    : pImpl(std::make_unique<Impl>(&in, &out)) { FUNC_SCOPE(); }

StreamTransport::~StreamTransport() {
    FUNC_SCOPE();
    Close();
}

std::unique_ptr<StreamTransport> StreamTransport::ForChildProcess(const std::string& command,
                                                                  const std::vector<std::string>& args) {
    FUNC_SCOPE();
    auto t = std::make_unique<StreamTransport>();
    t->pImpl->childMode = true;
    t->pImpl->command = command;
    t->pImpl->args = args;
    t->pImpl->in = nullptr;
    t->pImpl->out = nullptr;
    return t;
}

void StreamTransport::Start() {
    FUNC_SCOPE();
    pImpl->state.beginStart();
    if (pImpl->childMode) {
        try {
            pImpl->spawnChild();
        } catch (const errors::Error& e) {
            pImpl->state.abortStart();
            LOG_ERROR("StreamTransport: start failed: {}", e.what());
            pImpl->state.emitError(e);
            throw;
        }
    }
    pImpl->state.markConnected();
    LOG_INFO("StreamTransport started (session={})", pImpl->sessionId);
}

void StreamTransport::Close() {
    FUNC_SCOPE();
    const bool transitioned = pImpl->state.markClosed();
    if (pImpl->childMode && pImpl->childPid > 0) {
        pImpl->terminateChild();
    }
    if (!transitioned) {
        return;
    }
    LOG_INFO("StreamTransport closed (session={})", pImpl->sessionId);
    pImpl->state.emitClose();
}

bool StreamTransport::IsConnected() const { FUNC_SCOPE(); return pImpl->state.isConnected(); }
std::string StreamTransport::GetSessionId() const { FUNC_SCOPE(); return pImpl->sessionId; }
int StreamTransport::ChildPid() const { return static_cast<int>(pImpl->childPid); }

void StreamTransport::SendText(const std::string& text) {
    FUNC_SCOPE();
    pImpl->state.requireConnected();
    {
        std::lock_guard<std::mutex> lock(pImpl->writeMutex);
        std::ostream& out = *pImpl->out;
        try {
            out << text << '\n';
        } catch (const std::exception& e) {
            pImpl->fail(std::string("Failed to write: ") + e.what());
        }
        if (!out) {
            pImpl->fail("Failed to write: output stream in error state");
        }
        try {
            out.flush();
        } catch (const std::exception& e) {
            pImpl->fail(std::string("Failed to flush: ") + e.what());
        }
        if (!out) {
            pImpl->fail("Failed to flush: output stream in error state");
        }
    }
    LOG_DEBUG("StreamTransport sent: {}", text);
    pImpl->state.emitMessage(text);
}

std::string StreamTransport::ReceiveText() {
    FUNC_SCOPE();
    pImpl->state.requireConnected();
    std::string line;
    {
        std::lock_guard<std::mutex> lock(pImpl->readMutex);
        std::istream& in = *pImpl->in;
        bool ok = false;
        try {
            ok = static_cast<bool>(std::getline(in, line));
        } catch (const std::exception& e) {
            pImpl->fail(std::string("Failed to read: ") + e.what());
        }
        if (!ok) {
            if (in.eof() && !in.bad()) {
                pImpl->fail("end of stream");
            }
            pImpl->fail("Failed to read: input stream in error state");
        }
    }
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }
    LOG_DEBUG("StreamTransport received: {}", line);
    pImpl->state.emitMessage(line);
    return line;
}

void StreamTransport::SetMessageHandler(MessageHandler handler) {
    FUNC_SCOPE();
    pImpl->state.setMessageHandler(std::move(handler));
}

void StreamTransport::SetErrorHandler(ErrorHandler handler) {
    FUNC_SCOPE();
    pImpl->state.setErrorHandler(std::move(handler));
}

void StreamTransport::SetCloseHandler(CloseHandler handler) {
    FUNC_SCOPE();
    pImpl->state.setCloseHandler(std::move(handler));
}

std::unique_ptr<ITransport> StreamTransportFactory::CreateTransport(const std::string& config) {
    FUNC_SCOPE();
    if (config.empty() || config == "stdio") {
        return std::make_unique<StreamTransport>();
    }
    // command=<exe>;args=<a b c>
    std::string command;
    std::vector<std::string> args;
    std::stringstream ss(config);
    std::string part;
    while (std::getline(ss, part, ';')) {
        auto eq = part.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string key = part.substr(0, eq);
        std::string value = part.substr(eq + 1);
        if (key == "command") {
            command = value;
        } else if (key == "args") {
            std::istringstream as(value);
            std::string a;
            while (as >> a) {
                args.push_back(a);
            }
        }
    }
    if (command.empty()) {
        throw errors::Error::invalidRequest("Stream transport config requires 'stdio' or 'command=<exe>': " + config);
    }
    return StreamTransport::ForChildProcess(command, args);
}

} // namespace mcpwire
