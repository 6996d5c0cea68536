//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CallbackListener.hpp
// Purpose: Single-port loopback HTTP listener that captures OAuth redirects one poll at a time
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

#include "monzo/auth/CallbackSink.hpp"

namespace monzo::auth {

//==========================================================================================================
// CallbackListener
// Purpose: Binds a TCP listener at construction and, on each ServeOneRequestOrTimeout() call, runs
//          accepts and open sessions for at most the poll timeout. Every request (any method, any path) is handed
//          to the sink and answered with 200 OK and a fixed text body.
// Notes:
//   Not thread-safe; ServeOneRequestOrTimeout() runs on the caller's thread.
//==========================================================================================================
class CallbackListener {
public:
    //==========================================================================================================
    // Options
    // Purpose: Bind and timing configuration.
    // Fields:
    //   address: Bind address (default: 127.0.0.1)
    //   port: Listen port (default: 36453; "0" picks an ephemeral port)
    //   pollTimeoutMs: Upper bound for waiting on a new connection per poll
    //   readTimeoutMs: Lifetime of an accepted connection; may span several polls
    //   responseBody: text/plain body sent back to the browser
    //==========================================================================================================
    struct Options {
        std::string address{"127.0.0.1"};
        std::string port{"36453"};
        unsigned int pollTimeoutMs{200};
        unsigned int readTimeoutMs{2000};
        std::string responseBody{"Done. Please go back to the app."};
    };

    // Binds and listens. Throws errors::MonzoError(Transport) when the address/port cannot be bound
    // and errors::MonzoError(InvalidArgument) for a malformed port.
    CallbackListener(const Options& opts, CallbackSink& sink);
    ~CallbackListener();

    CallbackListener(const CallbackListener&) = delete;
    CallbackListener& operator=(const CallbackListener&) = delete;

    //==========================================================================================================
    // Runs the listener for at most pollTimeoutMs, returning early once a request has been answered.
    // Returns:
    //   true when a request reached the sink during this poll, false otherwise.
    //==========================================================================================================
    bool ServeOneRequestOrTimeout();

    // Port actually bound (useful when Options::port is "0").
    unsigned short Port() const;

    const Options& GetOptions() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace monzo::auth
