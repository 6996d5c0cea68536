//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/support/FakeHttpClient.hpp
// Purpose: Scripted IHttpClient that records requests and replays canned responses
//==========================================================================================================

#pragma once

#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "monzo/errors/Errors.h"
#include "monzo/http/IHttpClient.hpp"

namespace monzo::test {

class FakeHttpClient : public http::IHttpClient {
public:
    // Queues a response; an empty queue answers 200 "{}".
    void Respond(int status, const std::string& body) {
        std::lock_guard<std::mutex> lock(mutex);
        replies.push_back(Reply{status, body, false});
    }

    // Queues a transport failure.
    void FailTransport() {
        std::lock_guard<std::mutex> lock(mutex);
        replies.push_back(Reply{0, std::string(), true});
    }

    http::HttpResponse Send(const http::HttpRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex);
        requests.push_back(request);
        Reply reply{200, "{}", false};
        if (!replies.empty()) {
            reply = replies.front();
            replies.pop_front();
        }
        if (reply.transportFailure) {
            throw errors::MonzoError(errors::ErrorKind::Transport, "connection refused");
        }
        http::HttpResponse res;
        res.status = reply.status;
        res.body = reply.body;
        return res;
    }

    std::vector<http::HttpRequest> Requests() const {
        std::lock_guard<std::mutex> lock(mutex);
        return requests;
    }

    static std::optional<std::string> Header(const http::HttpRequest& req, const std::string& name) {
        for (const auto& h : req.headers) {
            if (h.name == name) return h.value;
        }
        return std::nullopt;
    }

private:
    struct Reply {
        int status;
        std::string body;
        bool transportFailure;
    };

    mutable std::mutex mutex;
    std::deque<Reply> replies;
    std::vector<http::HttpRequest> requests;
};

} // namespace monzo::test
