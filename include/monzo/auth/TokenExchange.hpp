//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/monzo/auth/TokenExchange.hpp
// Purpose: OAuth2 authorization-code to access-token exchange
//==========================================================================================================
#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "monzo/http/IHttpClient.hpp"

namespace monzo::auth {

struct TokenExchangeRequest {
    std::string tokenUrl{"https://api.monzo.com/oauth2/token"};
    std::string clientId;
    std::string clientSecret;
    std::string redirectUri;
    std::string code;
};

// Token endpoint response. Only accessToken is required; the rest is informational.
struct AccessToken {
    std::string accessToken;
    std::string tokenType;
    std::string userId;
    std::string clientId;
    std::string scope;
    std::optional<int64_t> expiresIn;
};

//==========================================================================================================
// exchangeAuthorizationCode
// Purpose: POSTs grant_type=authorization_code with client credentials, redirect URI and code.
// Throws:
//   errors::MonzoError(TokenExchangeFailed) with cause set to the mapped HTTP kind (and the HTTP
//   status), Transport, or Decode. No retries.
//==========================================================================================================
AccessToken exchangeAuthorizationCode(http::IHttpClient& client, const TokenExchangeRequest& request);

} // namespace monzo::auth
