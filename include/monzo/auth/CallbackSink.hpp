//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/monzo/auth/CallbackSink.hpp
// Purpose: Receiver for request targets captured by the loopback callback listener
//==========================================================================================================
#pragma once

#include <string>

namespace monzo::auth {

class CallbackSink {
public:
    virtual ~CallbackSink() = default;

    // Called once per accepted request with its raw path+query (e.g. "/monzo_callback?code=..").
    virtual void Capture(const std::string& target) = 0;
};

} // namespace monzo::auth
