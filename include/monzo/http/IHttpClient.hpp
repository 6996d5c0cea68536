//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/monzo/http/IHttpClient.hpp
// Purpose: Blocking HTTP client interface used for token exchange and REST calls
//==========================================================================================================
#pragma once

#include <optional>
#include <string>
#include <vector>

namespace monzo::http {

enum class HttpMethod { Get, Post, Put, Patch, Delete };

struct HeaderKV {
    std::string name;
    std::string value;
};

struct HttpRequest {
    HttpMethod method{HttpMethod::Get};
    std::string url;
    std::vector<HeaderKV> headers;
    std::string body;
};

struct HttpResponse {
    int status{0};
    std::vector<HeaderKV> headers;
    std::string body;

    // Case-insensitive header lookup.
    std::optional<std::string> header(const std::string& name) const;
};

const char* methodName(HttpMethod method);

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // Perform one request. Non-2xx statuses are returned, not thrown.
    // Throws errors::MonzoError(Transport) when no response could be obtained.
    virtual HttpResponse Send(const HttpRequest& request) = 0;
};

} // namespace monzo::http
