//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/monzo/auth/CallbackCoordinator.cpp
// Purpose: Callback wait loop and its pending/completed/cancelled state machine
//==========================================================================================================

#include "monzo/auth/CallbackCoordinator.hpp"
#include "monzo/errors/Errors.h"
#include "logging/Logger.h"

namespace monzo::auth {

const char* stateName(CallbackCoordinator::State state) {
    switch (state) {
        case CallbackCoordinator::State::Pending: return "pending";
        case CallbackCoordinator::State::Completed: return "completed";
        case CallbackCoordinator::State::Cancelled: return "cancelled";
    }
    return "unknown";
}

CallbackCoordinator::CallbackCoordinator(const CallbackListener::Options& opts)
    : listener(opts, *this) {}

CallbackCoordinator::~CallbackCoordinator() = default;

std::optional<util::QueryParameters> CallbackCoordinator::WaitForCallback() {
    FUNC_SCOPE();
    for (;;) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (state != State::Pending) {
                break;
            }
        }
        listener.ServeOneRequestOrTimeout();
    }

    std::lock_guard<std::mutex> lock(mutex);
    if (state == State::Cancelled) {
        LOG_INFO("Callback wait cancelled");
        return std::nullopt;
    }
    if (state == State::Completed) {
        return util::parseQueryFromTarget(capturedPath);
    }
    LOG_ERROR("Callback wait loop exited in state {}", stateName(state));
    throw errors::MonzoError(errors::ErrorKind::InternalProtocolViolation,
                             "Callback wait loop exited without completion or cancellation");
}

void CallbackCoordinator::Capture(const std::string& target) {
    std::lock_guard<std::mutex> lock(mutex);
    if (state != State::Pending) {
        LOG_DEBUG("Discarding callback capture in state {}", stateName(state));
        return;
    }
    capturedPath = target;
    state = State::Completed;
}

void CallbackCoordinator::Cancel() {
    std::lock_guard<std::mutex> lock(mutex);
    if (state == State::Pending) {
        state = State::Cancelled;
    }
}

CallbackCoordinator::State CallbackCoordinator::GetState() const {
    std::lock_guard<std::mutex> lock(mutex);
    return state;
}

std::optional<std::string> CallbackCoordinator::CapturedPath() const {
    std::lock_guard<std::mutex> lock(mutex);
    if (state != State::Completed) {
        return std::nullopt;
    }
    return capturedPath;
}

unsigned short CallbackCoordinator::Port() const {
    return listener.Port();
}

} // namespace monzo::auth
