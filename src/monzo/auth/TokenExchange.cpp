//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/monzo/auth/TokenExchange.cpp
// Purpose: OAuth2 authorization-code to access-token exchange
//==========================================================================================================

#include "monzo/auth/TokenExchange.hpp"
#include "monzo/JSONValue.h"
#include "monzo/errors/Errors.h"
#include "monzo/util/Url.hpp"
#include "logging/Logger.h"

namespace monzo::auth {

using errors::ErrorKind;
using errors::MonzoError;

AccessToken exchangeAuthorizationCode(http::IHttpClient& client, const TokenExchangeRequest& request) {
    FUNC_SCOPE();
    http::HttpRequest req;
    req.method = http::HttpMethod::Post;
    req.url = request.tokenUrl;
    req.headers.push_back(http::HeaderKV{"Content-Type", "application/x-www-form-urlencoded"});
    req.body = util::encodeForm({
        {"grant_type", "authorization_code"},
        {"client_id", request.clientId},
        {"client_secret", request.clientSecret},
        {"redirect_uri", request.redirectUri},
        {"code", request.code},
    });

    http::HttpResponse res;
    try {
        res = client.Send(req);
    } catch (const MonzoError& e) {
        LOG_ERROR("Token exchange request failed: {}", e.what());
        throw MonzoError(ErrorKind::TokenExchangeFailed, std::string("Token exchange failed: ") + e.what(),
                         e.httpStatus(), e.kind());
    }

    if (!errors::isSuccessStatus(res.status)) {
        const ErrorKind cause = errors::errorKindFromStatus(res.status);
        LOG_ERROR("Token exchange rejected with HTTP {} ({})", res.status, errors::errorKindName(cause));
        throw MonzoError(ErrorKind::TokenExchangeFailed,
                         std::string("Token exchange failed: (") + std::to_string(res.status) + "): " + res.body,
                         res.status, cause);
    }

    AccessToken token;
    try {
        JSONValue doc = parseJSON(res.body);
        token.accessToken = requireString(doc, "access_token");
        token.tokenType = optionalString(doc, "token_type").value_or("");
        token.userId = optionalString(doc, "user_id").value_or("");
        token.clientId = optionalString(doc, "client_id").value_or("");
        token.scope = optionalString(doc, "scope").value_or("");
        token.expiresIn = optionalInt(doc, "expires_in");
    } catch (const MonzoError& e) {
        LOG_ERROR("Token exchange response could not be decoded: {}", e.what());
        throw MonzoError(ErrorKind::TokenExchangeFailed, std::string("Token exchange failed: ") + e.what(),
                         res.status, ErrorKind::Decode);
    }
    if (token.accessToken.empty()) {
        throw MonzoError(ErrorKind::TokenExchangeFailed, "Token exchange failed: empty access_token",
                         res.status, ErrorKind::Decode);
    }
    LOG_INFO("Token exchange succeeded");
    return token;
}

} // namespace monzo::auth
