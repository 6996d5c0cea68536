//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_token_exchange.cpp
// Purpose: GoogleTests for the authorization-code exchange
//==========================================================================================================

#include <gtest/gtest.h>

#include "monzo/auth/TokenExchange.hpp"
#include "monzo/errors/Errors.h"
#include "monzo/util/Url.hpp"
#include "support/FakeHttpClient.hpp"

using monzo::auth::TokenExchangeRequest;
using monzo::errors::ErrorKind;
using monzo::errors::MonzoError;
using monzo::test::FakeHttpClient;

namespace {

TokenExchangeRequest sampleRequest() {
    TokenExchangeRequest req;
    req.clientId = "oauth2client_1";
    req.clientSecret = "s3cr3t";
    req.redirectUri = "http://localhost:36453/monzo_callback";
    req.code = "AUTHCODE1";
    return req;
}

MonzoError exchangeError(FakeHttpClient& http) {
    try {
        monzo::auth::exchangeAuthorizationCode(http, sampleRequest());
    } catch (const MonzoError& e) {
        return e;
    }
    ADD_FAILURE() << "expected MonzoError";
    return MonzoError(ErrorKind::Api, "none");
}

} // namespace

//==========================================================================================================
// Request shape and successful decode
//==========================================================================================================
TEST(TokenExchange, PostsFormAndDecodesToken) {
    FakeHttpClient http;
    http.Respond(200, "{\"access_token\":\"tok_live_1\",\"token_type\":\"Bearer\",\"user_id\":\"user_1\","
                      "\"client_id\":\"oauth2client_1\",\"expires_in\":21600}");
    auto token = monzo::auth::exchangeAuthorizationCode(http, sampleRequest());
    EXPECT_EQ(token.accessToken, "tok_live_1");
    EXPECT_EQ(token.tokenType, "Bearer");
    EXPECT_EQ(token.userId, "user_1");
    ASSERT_TRUE(token.expiresIn.has_value());
    EXPECT_EQ(*token.expiresIn, 21600);

    auto requests = http.Requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method, monzo::http::HttpMethod::Post);
    EXPECT_EQ(requests[0].url, "https://api.monzo.com/oauth2/token");
    EXPECT_EQ(FakeHttpClient::Header(requests[0], "Content-Type").value_or(""), "application/x-www-form-urlencoded");
    auto form = monzo::util::parseQueryString(requests[0].body);
    EXPECT_EQ(form["grant_type"], std::vector<std::string>{"authorization_code"});
    EXPECT_EQ(form["client_id"], std::vector<std::string>{"oauth2client_1"});
    EXPECT_EQ(form["client_secret"], std::vector<std::string>{"s3cr3t"});
    EXPECT_EQ(form["redirect_uri"], std::vector<std::string>{"http://localhost:36453/monzo_callback"});
    EXPECT_EQ(form["code"], std::vector<std::string>{"AUTHCODE1"});
}

//==========================================================================================================
// Failure causes
//==========================================================================================================
TEST(TokenExchange, HttpStatusBecomesCause) {
    FakeHttpClient http;
    http.Respond(401, "{\"code\":\"unauthorized.bad_client\"}");
    MonzoError e = exchangeError(http);
    EXPECT_EQ(e.kind(), ErrorKind::TokenExchangeFailed);
    ASSERT_TRUE(e.cause().has_value());
    EXPECT_EQ(*e.cause(), ErrorKind::Unauthorized);
    EXPECT_EQ(e.httpStatus(), 401);
}

TEST(TokenExchange, MalformedBodyIsDecodeCause) {
    FakeHttpClient http;
    http.Respond(200, "<html>nope</html>");
    MonzoError e = exchangeError(http);
    EXPECT_EQ(e.kind(), ErrorKind::TokenExchangeFailed);
    ASSERT_TRUE(e.cause().has_value());
    EXPECT_EQ(*e.cause(), ErrorKind::Decode);
}

TEST(TokenExchange, MissingTokenIsDecodeCause) {
    FakeHttpClient http;
    http.Respond(200, "{\"token_type\":\"Bearer\"}");
    MonzoError e = exchangeError(http);
    ASSERT_TRUE(e.cause().has_value());
    EXPECT_EQ(*e.cause(), ErrorKind::Decode);
}

TEST(TokenExchange, TransportFailureIsCause) {
    FakeHttpClient http;
    http.FailTransport();
    MonzoError e = exchangeError(http);
    EXPECT_EQ(e.kind(), ErrorKind::TokenExchangeFailed);
    ASSERT_TRUE(e.cause().has_value());
    EXPECT_EQ(*e.cause(), ErrorKind::Transport);
}
