//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/support/LoopbackHttp.hpp
// Purpose: Synchronous Beast helpers shared by the loopback listener tests
//==========================================================================================================

#pragma once

#include <chrono>
#include <string>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace monzo::test {

struct SimpleResponse {
    int status{0};
    std::string body;
};

//==========================================================================================================
// httpRequest
// Purpose: Send a single HTTP request with any verb and optional body, and capture the response
//          (synchronously).
// Notes:
//   Throws boost::system::system_error on connection failure; callers on helper threads catch it.
//==========================================================================================================
inline SimpleResponse httpRequest(boost::beast::http::verb method, const std::string& host, unsigned short port,
                                  const std::string& target, const std::string& body = std::string()) {
    namespace http = boost::beast::http;
    using boost::asio::ip::tcp;
    boost::asio::io_context ioc;
    tcp::resolver resolver{ioc};
    auto r = resolver.resolve(host, std::to_string(port));
    boost::beast::tcp_stream stream{ioc};
    stream.expires_after(std::chrono::seconds(10));
    stream.connect(r);

    http::request<http::string_body> req{method, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::user_agent, "monzo-test");
    if (!body.empty()) {
        req.set(http::field::content_type, "application/x-www-form-urlencoded");
        req.body() = body;
    }
    req.prepare_payload();
    http::write(stream, req);

    boost::beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);
    boost::system::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    return SimpleResponse{static_cast<int>(res.result_int()), res.body()};
}

inline SimpleResponse httpGet(const std::string& host, unsigned short port, const std::string& target) {
    return httpRequest(boost::beast::http::verb::get, host, port, target);
}

//==========================================================================================================
// findFreePort
// Purpose: Binds an ephemeral port on loopback and releases it.
//==========================================================================================================
inline unsigned short findFreePort() {
    using boost::asio::ip::tcp;
    boost::asio::io_context ioc;
    tcp::acceptor acceptor{ioc, tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), 0}};
    unsigned short port = acceptor.local_endpoint().port();
    acceptor.close();
    return port;
}

} // namespace monzo::test
