//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 mcpwire contributors
// File: StreamTransport.hpp
// Purpose: Newline-delimited transport over a duplex byte stream (process stdio or a piped child process)
//==========================================================================================================
#pragma once

#include "mcpwire/Transport.h"
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace mcpwire {

//==========================================================================================================
// StreamTransport
// Purpose: Synchronous line transport. No background thread: ReceiveText blocks on a single line read and
//          the message handler fires as a trace hook on every successful send and receive.
//==========================================================================================================
class StreamTransport : public ITransport {
public:
    // Uses the process std::cin / std::cout.
    StreamTransport();

    // Wraps caller-owned streams; they must outlive the transport.
    StreamTransport(std::istream& in, std::ostream& out);

    ~StreamTransport() override;

    //==========================================================================================================
    // ForChildProcess
    // Purpose: Creates a transport that spawns `command args...` on Start() with piped stdin/stdout.
    //          Close() terminates the child with SIGTERM and reaps it.
    // Args:
    //   command: Executable, resolved through PATH.
    //   args: Arguments, not including argv[0].
    //==========================================================================================================
    static std::unique_ptr<StreamTransport> ForChildProcess(const std::string& command,
                                                            const std::vector<std::string>& args);

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    void Start() override;
    void Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;

    //==========================================================================================================
    // Writes text plus '\n' and flushes.
    // Throws:
    //   NotConnected; Transport("Failed to write: ...") or Transport("Failed to flush: ...").
    //==========================================================================================================
    void SendText(const std::string& text) override;

    //==========================================================================================================
    // Reads one line with trailing CR/LF removed.
    // Throws:
    //   NotConnected; Transport("end of stream") on clean EOF; Transport("Failed to read: ...") otherwise.
    //==========================================================================================================
    std::string ReceiveText() override;

    void SetMessageHandler(MessageHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;
    void SetCloseHandler(CloseHandler handler) override;

    // Pid of the spawned child, or -1.
    int ChildPid() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// StreamTransportFactory
// Purpose: "stdio" creates a stdio transport; "command=<exe>;args=<a b c>" a child-process transport.
//==========================================================================================================
class StreamTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;
};

} // namespace mcpwire
