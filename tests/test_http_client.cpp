//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_http_client.cpp
// Purpose: BeastHttpClient tests against an in-process plain-HTTP server
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "monzo/errors/Errors.h"
#include "monzo/http/BeastHttpClient.hpp"
#include "monzo/version.h"
#include "support/LoopbackHttp.hpp"

namespace bhttp = boost::beast::http;
using monzo::http::BeastHttpClient;
using monzo::http::HttpMethod;
using monzo::http::HttpRequest;

namespace {

//==========================================================================================================
// MiniServer
// Purpose: Accepts one request per connection, records it, and answers by target:
//   /missing -> 404 with a JSON error body; /slow -> no reply until the client gives up; else 200 echo.
//==========================================================================================================
struct MiniServer {
    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor acceptor{io};
    std::thread thr;
    std::atomic<bool> running{false};
    unsigned short port{0};

    std::mutex mutex;
    std::string lastMethod;
    std::string lastTarget;
    std::string lastBody;
    std::string lastAuthorization;
    std::string lastContentType;
    std::string lastUserAgent;

    void runOnce() {
        using boost::asio::ip::tcp;
        try {
            tcp::socket socket{io};
            acceptor.accept(socket);
            if (!running.load()) return;
            boost::beast::tcp_stream stream{std::move(socket)};
            boost::beast::flat_buffer buffer;
            bhttp::request<bhttp::string_body> req;
            bhttp::read(stream, buffer, req);
            {
                std::lock_guard<std::mutex> lock(mutex);
                lastMethod = std::string(req.method_string());
                lastTarget = std::string(req.target());
                lastBody = req.body();
                lastAuthorization = std::string(req[bhttp::field::authorization]);
                lastContentType = std::string(req[bhttp::field::content_type]);
                lastUserAgent = std::string(req[bhttp::field::user_agent]);
            }
            if (lastTarget == "/slow") {
                std::this_thread::sleep_for(std::chrono::milliseconds(800));
                return;
            }
            bhttp::response<bhttp::string_body> res{bhttp::status::ok, req.version()};
            res.set(bhttp::field::content_type, "application/json");
            res.set("X-Request-Echo", lastMethod);
            if (lastTarget == "/missing") {
                res.result(bhttp::status::not_found);
                res.body() = "{\"code\":\"not_found\"}";
            } else {
                res.body() = "{\"ok\":true}";
            }
            res.keep_alive(false);
            res.prepare_payload();
            bhttp::write(stream, res);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        } catch (const std::exception& e) {
            // Test server: a failed connection only ends this iteration
            (void)e;
        }
    }

    void start() {
        using boost::asio::ip::tcp;
        tcp::endpoint ep{boost::asio::ip::make_address("127.0.0.1"), 0};
        acceptor.open(ep.protocol());
        acceptor.set_option(tcp::acceptor::reuse_address(true));
        acceptor.bind(ep);
        acceptor.listen();
        port = acceptor.local_endpoint().port();
        running.store(true);
        thr = std::thread([this]() {
            while (running.load()) {
                runOnce();
            }
        });
    }

    void stop() {
        running.store(false);
        boost::system::error_code ec;
        // Poke accept by connecting to ourselves before closing acceptor
        boost::asio::ip::tcp::socket pokeSock{io};
        pokeSock.connect({boost::asio::ip::make_address("127.0.0.1"), port}, ec);
        pokeSock.close(ec);
        if (thr.joinable()) {
            thr.join();
        }
        acceptor.close(ec);
    }

    std::string url(const std::string& target) const {
        return "http://127.0.0.1:" + std::to_string(port) + target;
    }
};

} // namespace

TEST(BeastHttpClient, SendsMethodHeadersAndBody) {
    MiniServer server;
    server.start();

    BeastHttpClient::Options opts;
    opts.userAgent = "monzo-cpp-test";
    BeastHttpClient client(opts);

    HttpRequest req;
    req.method = HttpMethod::Put;
    req.url = server.url("/pots/pot_1/deposit?x=1");
    req.headers.push_back({"Authorization", "Bearer tok"});
    req.headers.push_back({"Content-Type", "application/x-www-form-urlencoded"});
    req.body = "amount=100";
    auto res = client.Send(req);
    server.stop();

    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.body, "{\"ok\":true}");
    EXPECT_EQ(res.header("x-request-echo").value_or(""), "PUT");
    EXPECT_FALSE(res.header("X-Absent").has_value());
    EXPECT_EQ(server.lastMethod, "PUT");
    EXPECT_EQ(server.lastTarget, "/pots/pot_1/deposit?x=1");
    EXPECT_EQ(server.lastBody, "amount=100");
    EXPECT_EQ(server.lastAuthorization, "Bearer tok");
    EXPECT_EQ(server.lastContentType, "application/x-www-form-urlencoded");
    EXPECT_EQ(server.lastUserAgent, "monzo-cpp-test");
}

TEST(BeastHttpClient, ErrorStatusIsReturned) {
    MiniServer server;
    server.start();
    BeastHttpClient client;
    HttpRequest req;
    req.url = server.url("/missing");
    auto res = client.Send(req);
    server.stop();
    EXPECT_EQ(res.status, 404);
    EXPECT_EQ(res.body, "{\"code\":\"not_found\"}");
    EXPECT_EQ(server.lastMethod, "GET");
    EXPECT_EQ(server.lastUserAgent, monzo::getUserAgent());
    EXPECT_EQ(monzo::getUserAgent(), "monzo-cpp/" + monzo::getVersionString());
    EXPECT_EQ(monzo::getVersion().major, 0);
    EXPECT_EQ(monzo::getVersion().minor, 1);
}

TEST(BeastHttpClient, ConnectionRefusedIsTransport) {
    const unsigned short port = monzo::test::findFreePort();
    BeastHttpClient client;
    HttpRequest req;
    req.url = "http://127.0.0.1:" + std::to_string(port) + "/";
    try {
        client.Send(req);
        FAIL() << "expected MonzoError";
    } catch (const monzo::errors::MonzoError& e) {
        EXPECT_EQ(e.kind(), monzo::errors::ErrorKind::Transport);
    }
}

TEST(BeastHttpClient, ReadTimeoutIsTransport) {
    MiniServer server;
    server.start();
    BeastHttpClient::Options opts;
    opts.readTimeoutMs = 200;
    BeastHttpClient client(opts);
    HttpRequest req;
    req.url = server.url("/slow");
    try {
        client.Send(req);
        ADD_FAILURE() << "expected MonzoError";
    } catch (const monzo::errors::MonzoError& e) {
        EXPECT_EQ(e.kind(), monzo::errors::ErrorKind::Transport);
    }
    server.stop();
}

TEST(BeastHttpClient, UnsupportedSchemeIsInvalidArgument) {
    BeastHttpClient client;
    HttpRequest req;
    req.url = "ftp://127.0.0.1/file";
    try {
        client.Send(req);
        FAIL() << "expected MonzoError";
    } catch (const monzo::errors::MonzoError& e) {
        EXPECT_EQ(e.kind(), monzo::errors::ErrorKind::InvalidArgument);
    }
}

//==========================================================================================================
// Concurrent first-time HTTPS sends on one client share its TLS context; the plain-HTTP peer makes
// every handshake fail, and each caller gets its own Transport error.
//==========================================================================================================
TEST(BeastHttpClient, ConcurrentHttpsSendsFailCleanly) {
    MiniServer server;
    server.start();
    BeastHttpClient::Options opts;
    opts.connectTimeoutMs = 2000;
    opts.readTimeoutMs = 2000;
    BeastHttpClient client(opts);

    const std::string url = "https://127.0.0.1:" + std::to_string(server.port) + "/whoami";
    std::vector<std::future<monzo::errors::ErrorKind>> senders;
    for (int i = 0; i < 4; ++i) {
        senders.push_back(std::async(std::launch::async, [&client, url]() {
            HttpRequest req;
            req.url = url;
            try {
                client.Send(req);
            } catch (const monzo::errors::MonzoError& e) {
                return e.kind();
            }
            return monzo::errors::ErrorKind::InternalProtocolViolation;
        }));
    }
    for (auto& f : senders) {
        EXPECT_EQ(f.get(), monzo::errors::ErrorKind::Transport);
    }
    server.stop();
}

TEST(BeastHttpClient, BadCaFileFailsHttpsOnly) {
    MiniServer server;
    server.start();
    BeastHttpClient::Options opts;
    opts.caFile = "/nonexistent/monzo-ca.pem";
    BeastHttpClient client(opts);

    HttpRequest req;
    req.url = "https://127.0.0.1:" + std::to_string(server.port) + "/";
    try {
        client.Send(req);
        ADD_FAILURE() << "expected MonzoError";
    } catch (const monzo::errors::MonzoError& e) {
        EXPECT_EQ(e.kind(), monzo::errors::ErrorKind::Transport);
        EXPECT_NE(std::string(e.what()).find("CA initialization failed"), std::string::npos);
    }

    req.url = server.url("/plain");
    EXPECT_EQ(client.Send(req).status, 200);
    server.stop();
}
