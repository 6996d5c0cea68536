//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CallbackCoordinator.hpp
// Purpose: Single-use state machine that drives the callback listener until a redirect arrives or the
//          wait is cancelled
//==========================================================================================================

#pragma once

#include <mutex>
#include <optional>
#include <string>

#include "monzo/auth/CallbackListener.hpp"
#include "monzo/auth/CallbackSink.hpp"
#include "monzo/util/Url.hpp"

namespace monzo::auth {

//==========================================================================================================
// CallbackCoordinator
// Purpose: Owns a CallbackListener and exposes a blocking WaitForCallback() plus a thread-safe Cancel().
// State machine:
//   Pending -> Completed (first captured request wins)
//   Pending -> Cancelled
//   Terminal states never change.
// Notes:
//   All state is read and written under one mutex; the mutex is never held while the listener polls.
//==========================================================================================================
class CallbackCoordinator : public CallbackSink {
public:
    enum class State { Pending, Completed, Cancelled };

    // Binds the listener immediately. Throws errors::MonzoError(Transport) when binding fails.
    explicit CallbackCoordinator(const CallbackListener::Options& opts);
    ~CallbackCoordinator() override;

    //==========================================================================================================
    // Polls the listener until the state leaves Pending.
    // Returns:
    //   Parsed query parameters of the captured request, or nullopt when cancelled.
    // Throws:
    //   errors::MonzoError(InternalProtocolViolation) if the loop ends in neither terminal state.
    //==========================================================================================================
    std::optional<util::QueryParameters> WaitForCallback();

    // Records the first captured target; later captures are discarded.
    void Capture(const std::string& target) override;

    // Pending -> Cancelled; no-op in a terminal state. Safe from any thread.
    void Cancel();

    State GetState() const;
    std::optional<std::string> CapturedPath() const;
    unsigned short Port() const;

private:
    mutable std::mutex mutex;
    State state{State::Pending};
    std::string capturedPath;
    CallbackListener listener;
};

const char* stateName(CallbackCoordinator::State state);

} // namespace monzo::auth
