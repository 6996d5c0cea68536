//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AuthenticationFlow.hpp
// Purpose: Browser-driven OAuth2 authorization-code login against a loopback redirect listener
//==========================================================================================================

#pragma once

#include <mutex>
#include <string>

#include "monzo/auth/BrowserLauncher.hpp"
#include "monzo/auth/TokenExchange.hpp"
#include "monzo/http/IHttpClient.hpp"

namespace monzo::auth {

class CallbackCoordinator;

//==========================================================================================================
// AuthenticationFlow
// Purpose: One login attempt. The CSRF state token is fixed at construction; Authenticate() may be
//          called once per instance.
// Sequence:
//   bind listener -> open browser -> wait for redirect -> check state -> exchange code
//==========================================================================================================
class AuthenticationFlow {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   clientId/clientSecret: OAuth client credentials
    //   authorizationUrl: Browser login endpoint
    //   tokenUrl: Token exchange endpoint
    //   redirectHost/redirectPort/redirectPath: Build http://{host}:{port}/{path}; must match the value
    //                                           registered with the provider. Port 0 binds an ephemeral
    //                                           port and uses it in the redirect URI.
    //   bindAddress: Local address the listener binds
    //   pollTimeoutMs/readTimeoutMs: Listener timing (see CallbackListener::Options)
    //==========================================================================================================
    struct Options {
        std::string clientId;
        std::string clientSecret;
        std::string authorizationUrl{"https://auth.monzo.com/"};
        std::string tokenUrl{"https://api.monzo.com/oauth2/token"};
        std::string redirectHost{"localhost"};
        unsigned short redirectPort{36453};
        std::string redirectPath{"monzo_callback"};
        std::string bindAddress{"127.0.0.1"};
        unsigned int pollTimeoutMs{200};
        unsigned int readTimeoutMs{2000};
    };

    static constexpr std::size_t kStateTokenLength = 20;

    // Generates a fresh state token.
    AuthenticationFlow(const Options& opts, http::IHttpClient& httpClient, IBrowserLauncher& browser);
    // Uses the given state token.
    AuthenticationFlow(const Options& opts, std::string stateToken, http::IHttpClient& httpClient,
                       IBrowserLauncher& browser);
    ~AuthenticationFlow();

    AuthenticationFlow(const AuthenticationFlow&) = delete;
    AuthenticationFlow& operator=(const AuthenticationFlow&) = delete;

    //==========================================================================================================
    // Runs the login to completion on the calling thread.
    // Returns:
    //   The exchanged access token.
    // Throws (errors::MonzoError):
    //   AuthAborted: cancelled, or the provider redirected with an error
    //   StateMismatch: state absent, repeated or different from StateToken()
    //   InvalidCallback: code absent or repeated
    //   TokenExchangeFailed: exchange failed (cause carries the mapped kind)
    //   Transport: the listener could not bind
    //==========================================================================================================
    AccessToken Authenticate();

    // Cancels a running Authenticate(), or the next one if it has not started yet. Safe from any thread.
    void Cancel();

    std::string RedirectUri() const;
    std::string RedirectUriForPort(unsigned short port) const;
    std::string BuildAuthorizationUrl(const std::string& redirectUri) const;
    const std::string& StateToken() const { return stateToken; }
    const Options& GetOptions() const { return opts; }

private:
    Options opts;
    std::string stateToken;
    http::IHttpClient& httpClient;
    IBrowserLauncher& browser;

    std::mutex cancelMutex;
    CallbackCoordinator* activeCoordinator{nullptr};
    bool cancelRequested{false};
};

} // namespace monzo::auth
