//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/monzo/auth/CallbackListener.cpp
// Purpose: Loopback OAuth redirect listener using Boost.Beast with poll-bounded accepts
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <chrono>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "monzo/auth/CallbackListener.hpp"
#include "monzo/errors/Errors.h"

namespace monzo::auth {
namespace net = boost::asio;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

class CallbackListener::Impl {
public:
    CallbackListener::Options opts;
    CallbackSink& sink;

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;

    // Only touched from the thread running ioc
    bool acceptPending{false};
    bool captured{false};

    Impl(const CallbackListener::Options& o, CallbackSink& s) : opts(o), sink(s) {
        // Validate port strictly: numeric and within [0, 65535]
        if (opts.port.empty() ||
            !std::all_of(opts.port.begin(), opts.port.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; }) ||
            opts.port.size() > 5 || std::stoul(opts.port) > 65535ul) {
            throw errors::MonzoError(errors::ErrorKind::InvalidArgument,
                                     std::string("CallbackListener invalid port: ") + opts.port);
        }
        try {
            tcp::resolver resolver(ioc);
            auto r = resolver.resolve(opts.address, opts.port);
            tcp::endpoint ep = *r.begin();

            acceptor = std::make_unique<tcp::acceptor>(ioc);
            acceptor->open(ep.protocol());
            acceptor->set_option(tcp::acceptor::reuse_address(true));
            acceptor->bind(ep);
            acceptor->listen();
        } catch (const boost::system::system_error& e) {
            LOG_ERROR("CallbackListener bind {}:{} failed: {}", opts.address, opts.port, e.what());
            throw errors::MonzoError(errors::ErrorKind::Transport,
                                     std::string("Cannot listen on ") + opts.address + ":" + opts.port + ": " + e.what());
        }
        LOG_DEBUG("CallbackListener listening on {}:{}", opts.address, acceptor->local_endpoint().port());
    }

    http::response<http::string_body> makeResponse(const http::request<http::string_body>& req) {
        http::response<http::string_body> res{http::status::ok, req.version()};
        res.set(http::field::content_type, "text/plain; charset=utf-8");
        res.keep_alive(false);
        res.body() = opts.responseBody;
        res.prepare_payload();
        return res;
    }

    net::awaitable<void> session(tcp::socket socket) {
        bool reachedSink = false;
        try {
            boost::beast::tcp_stream stream(std::move(socket));
            boost::beast::flat_buffer buffer;
            http::request<http::string_body> req;
            stream.expires_after(std::chrono::milliseconds(opts.readTimeoutMs));
            co_await http::async_read(stream, buffer, req, net::use_awaitable);

            const std::string target = std::string(req.target());
            LOG_DEBUG("CallbackListener received {} request", std::string(req.method_string()));
            sink.Capture(target);
            reachedSink = true;

            auto res = makeResponse(req);
            co_await http::async_write(stream, res, net::use_awaitable);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const boost::system::system_error& e) {
            LOG_WARN("CallbackListener dropped connection: {}", e.what());
        } catch (const std::exception& e) {
            LOG_ERROR("CallbackListener session error: {}", e.what());
        }
        if (reachedSink) {
            // Ends the current poll once the reply is flushed
            captured = true;
            ioc.stop();
        }
        co_return;
    }

    // Sessions run detached so an idle connection never holds up the next accept.
    // Both outlive a single poll and resume on the next run_for.
    net::awaitable<void> acceptLoop() {
        for (;;) {
            tcp::socket socket(ioc);
            try {
                socket = co_await acceptor->async_accept(net::use_awaitable);
            } catch (const boost::system::system_error& e) {
                if (e.code() != net::error::operation_aborted) {
                    LOG_WARN("CallbackListener accept error: {}", e.what());
                }
                break;
            }
            net::co_spawn(ioc, session(std::move(socket)), net::detached);
        }
        acceptPending = false;
    }

    bool serveOne() {
        captured = false;
        ioc.restart();
        if (!acceptPending && acceptor->is_open()) {
            acceptPending = true;
            net::co_spawn(ioc, acceptLoop(), net::detached);
        }
        ioc.run_for(std::chrono::milliseconds(opts.pollTimeoutMs));
        return captured;
    }
};

CallbackListener::CallbackListener(const Options& opts, CallbackSink& sink)
    : pImpl(std::make_unique<Impl>(opts, sink)) {}

CallbackListener::~CallbackListener() {
    if (pImpl && pImpl->acceptor) {
        boost::system::error_code ec;
        pImpl->acceptor->close(ec);
    }
}

bool CallbackListener::ServeOneRequestOrTimeout() {
    FUNC_SCOPE();
    return pImpl->serveOne();
}

unsigned short CallbackListener::Port() const {
    boost::system::error_code ec;
    auto ep = pImpl->acceptor->local_endpoint(ec);
    return ec ? 0 : ep.port();
}

const CallbackListener::Options& CallbackListener::GetOptions() const {
    return pImpl->opts;
}

} // namespace monzo::auth
