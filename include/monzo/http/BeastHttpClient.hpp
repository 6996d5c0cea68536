//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BeastHttpClient.hpp
// Purpose: IHttpClient implementation over Boost.Beast (plain TCP or TLS 1.2+ via OpenSSL)
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

#include "monzo/http/IHttpClient.hpp"

namespace monzo::http {

//==========================================================================================================
// BeastHttpClient
// Purpose: One connection per request, driven by a coroutine on a private io_context.
//==========================================================================================================
class BeastHttpClient : public IHttpClient {
public:
    //==========================================================================================================
    // Options
    // Purpose: Connection and TLS settings.
    // Fields:
    //   caFile/caPath: Optional CA bundle/path for the trust store (system defaults otherwise)
    //   connectTimeoutMs: Resolve + connect + handshake timeout in milliseconds
    //   readTimeoutMs: Write + read timeout in milliseconds
    //   userAgent: Value for the User-Agent header
    //==========================================================================================================
    struct Options {
        std::string caFile;
        std::string caPath;
        unsigned int connectTimeoutMs{10000};
        unsigned int readTimeoutMs{30000};
        std::string userAgent;
    };

    BeastHttpClient();
    explicit BeastHttpClient(const Options& opts);
    ~BeastHttpClient() override;

    HttpResponse Send(const HttpRequest& request) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace monzo::http
