//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BeastHttpClient.cpp
// Purpose: Coroutine-based HTTP/HTTPS request execution using Boost.Beast
//==========================================================================================================

#include <chrono>
#include <exception>
#include <optional>
#include <strings.h>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include "monzo/http/BeastHttpClient.hpp"
#include "monzo/errors/Errors.h"
#include "monzo/util/Url.hpp"
#include "monzo/version.h"
#include "logging/Logger.h"

namespace monzo::http {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace bhttp = boost::beast::http;
using tcp = net::ip::tcp;

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    for (const auto& h : headers) {
        if (::strcasecmp(h.name.c_str(), name.c_str()) == 0) {
            return h.value;
        }
    }
    return std::nullopt;
}

const char* methodName(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get: return "GET";
        case HttpMethod::Post: return "POST";
        case HttpMethod::Put: return "PUT";
        case HttpMethod::Patch: return "PATCH";
        case HttpMethod::Delete: return "DELETE";
    }
    return "GET";
}

namespace {

bhttp::verb toVerb(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get: return bhttp::verb::get;
        case HttpMethod::Post: return bhttp::verb::post;
        case HttpMethod::Put: return bhttp::verb::put;
        case HttpMethod::Patch: return bhttp::verb::patch;
        case HttpMethod::Delete: return bhttp::verb::delete_;
    }
    return bhttp::verb::get;
}

} // namespace

class BeastHttpClient::Impl {
public:
    BeastHttpClient::Options opts;
    // Built once and only read afterwards, so concurrent Send() calls can share it
    std::unique_ptr<ssl::context> sslCtx;
    bool caInitOk{true};

    explicit Impl(const BeastHttpClient::Options& o) : opts(o) {
        if (opts.userAgent.empty()) {
            opts.userAgent = getUserAgent();
        }
        initTls();
    }

    void initTls() {
        try {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_client);
        } catch (const std::exception& e) {
            LOG_ERROR("HTTPS: cannot create TLS context: {}", e.what());
            caInitOk = false;
            return;
        }
        ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_2_VERSION);
        ::ERR_clear_error();
        const bool userProvidedCA = !opts.caFile.empty() || !opts.caPath.empty();
        if (userProvidedCA) {
            try {
                if (!opts.caFile.empty()) { sslCtx->load_verify_file(opts.caFile); }
                if (!opts.caPath.empty()) { sslCtx->add_verify_path(opts.caPath); }
            } catch (const std::exception& e) {
                LOG_ERROR("HTTPS: failed to load user-provided CA file/path: {}", e.what());
                caInitOk = false;
            }
        } else {
            try {
                sslCtx->set_default_verify_paths();
            } catch (const std::exception& e) {
                LOG_DEBUG("HTTPS: set_default_verify_paths failed: {}", e.what());
            }
        }
        sslCtx->set_verify_mode(ssl::verify_peer);
    }

    bhttp::request<bhttp::string_body> buildRequest(const HttpRequest& in, const util::UrlParts& u) const {
        bhttp::request<bhttp::string_body> req{toVerb(in.method), u.target, 11};
        const bool defaultPort = (u.scheme == "https" && u.port == "443") || (u.scheme == "http" && u.port == "80");
        req.set(bhttp::field::host, defaultPort ? u.host : u.host + ":" + u.port);
        req.set(bhttp::field::user_agent, opts.userAgent);
        req.set(bhttp::field::accept, "application/json");
        req.set(bhttp::field::connection, "close");
        for (const auto& h : in.headers) {
            req.set(h.name, h.value);
        }
        req.body() = in.body;
        req.prepare_payload();
        return req;
    }

    static HttpResponse toResponse(bhttp::response<bhttp::string_body>& res) {
        HttpResponse out;
        out.status = static_cast<int>(res.result_int());
        for (const auto& field : res) {
            out.headers.push_back(HeaderKV{std::string(field.name_string()), std::string(field.value())});
        }
        out.body = std::move(res.body());
        return out;
    }

    net::awaitable<HttpResponse> coSend(HttpRequest request) {
        util::UrlParts u = util::parseUrl(request.url);
        auto req = buildRequest(request, u);
        tcp::resolver resolver(co_await net::this_coro::executor);
        auto results = co_await resolver.async_resolve(u.host, u.port, net::use_awaitable);
        LOG_DEBUG("HTTP: {} {}:{}{}", methodName(request.method), u.host, u.port, u.target);

        boost::beast::flat_buffer buffer;
        bhttp::response_parser<bhttp::string_body> parser;
        parser.body_limit(64u * 1024u * 1024u);

        if (u.scheme == "https") {
            if (!caInitOk || !sslCtx) {
                throw errors::MonzoError(errors::ErrorKind::Transport, "HTTPS: CA initialization failed (bad caFile/caPath)");
            }
            boost::beast::ssl_stream<boost::beast::tcp_stream> stream(co_await net::this_coro::executor, *sslCtx);
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), u.host.c_str())) {
                LOG_WARN("HTTPS: SNI set failed for {}", u.host);
            }
            (void)::SSL_set1_host(stream.native_handle(), u.host.c_str());
            stream.next_layer().expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
            co_await stream.next_layer().async_connect(results, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

            stream.next_layer().expires_after(std::chrono::milliseconds(opts.readTimeoutMs));
            co_await bhttp::async_write(stream, req, net::use_awaitable);
            co_await bhttp::async_read(stream, buffer, parser, net::use_awaitable);
            boost::system::error_code ec;
            stream.shutdown(ec);
        } else {
            boost::beast::tcp_stream stream(co_await net::this_coro::executor);
            stream.expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
            co_await stream.async_connect(results, net::use_awaitable);

            stream.expires_after(std::chrono::milliseconds(opts.readTimeoutMs));
            co_await bhttp::async_write(stream, req, net::use_awaitable);
            co_await bhttp::async_read(stream, buffer, parser, net::use_awaitable);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        }
        auto res = parser.release();
        LOG_DEBUG("HTTP: {} {} -> {} ({} bytes)", methodName(request.method), u.target, res.result_int(), res.body().size());
        co_return toResponse(res);
    }
};

BeastHttpClient::BeastHttpClient() : BeastHttpClient(Options{}) {}

BeastHttpClient::BeastHttpClient(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

BeastHttpClient::~BeastHttpClient() = default;

//==========================================================================================================
// BeastHttpClient::Send
// Purpose: Runs one request to completion on a private io_context.
// Throws:
//   errors::MonzoError(InvalidArgument) for an unusable URL, errors::MonzoError(Transport) for any
//   resolve/connect/TLS/IO failure or timeout.
//==========================================================================================================
HttpResponse BeastHttpClient::Send(const HttpRequest& request) {
    FUNC_SCOPE();
    net::io_context ioc;
    std::optional<HttpResponse> result;
    std::exception_ptr failure;
    net::co_spawn(ioc, pImpl->coSend(request),
        [&](std::exception_ptr e, HttpResponse r) {
            if (e) {
                failure = e;
            } else {
                result = std::move(r);
            }
        });
    ioc.run();

    if (failure) {
        try {
            std::rethrow_exception(failure);
        } catch (const errors::MonzoError&) {
            throw;
        } catch (const std::exception& e) {
            LOG_WARN("HTTP: {} {} failed: {}", methodName(request.method), request.url, e.what());
            throw errors::MonzoError(errors::ErrorKind::Transport,
                                     std::string("HTTP request failed: ") + e.what());
        }
    }
    if (!result) {
        throw errors::MonzoError(errors::ErrorKind::Transport, "HTTP request produced no response");
    }
    return std::move(*result);
}

} // namespace monzo::http
