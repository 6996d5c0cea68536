//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/monzo/auth/AuthenticationFlow.cpp
// Purpose: Browser-driven OAuth2 authorization-code login against a loopback redirect listener
//==========================================================================================================

#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "monzo/auth/AuthenticationFlow.hpp"
#include "monzo/auth/CallbackCoordinator.hpp"
#include "monzo/errors/Errors.h"
#include "monzo/util/RandomString.hpp"
#include "monzo/util/Url.hpp"
#include "logging/Logger.h"

namespace monzo::auth {

using errors::ErrorKind;
using errors::MonzoError;

AuthenticationFlow::AuthenticationFlow(const Options& o, http::IHttpClient& client, IBrowserLauncher& launcher)
    : AuthenticationFlow(o, util::randomString(kStateTokenLength), client, launcher) {}

AuthenticationFlow::AuthenticationFlow(const Options& o, std::string token, http::IHttpClient& client,
                                       IBrowserLauncher& launcher)
    : opts(o), stateToken(std::move(token)), httpClient(client), browser(launcher) {}

AuthenticationFlow::~AuthenticationFlow() = default;

std::string AuthenticationFlow::RedirectUriForPort(unsigned short port) const {
    std::string path = opts.redirectPath;
    if (!path.empty() && path.front() == '/') path.erase(0, 1);
    return std::string("http://") + opts.redirectHost + ":" + std::to_string(port) + "/" + path;
}

std::string AuthenticationFlow::RedirectUri() const {
    return RedirectUriForPort(opts.redirectPort);
}

std::string AuthenticationFlow::BuildAuthorizationUrl(const std::string& redirectUri) const {
    return util::appendQuery(opts.authorizationUrl, util::encodeForm({
        {"client_id", opts.clientId},
        {"redirect_uri", redirectUri},
        {"response_type", "code"},
        {"state", stateToken},
    }));
}

void AuthenticationFlow::Cancel() {
    std::lock_guard<std::mutex> lock(cancelMutex);
    cancelRequested = true;
    if (activeCoordinator) {
        activeCoordinator->Cancel();
    }
}

namespace {

// Publishes the coordinator to Cancel() for the duration of the wait.
class ActiveCoordinatorScope {
public:
    ActiveCoordinatorScope(std::mutex& m, CallbackCoordinator*& slot, const bool& cancelRequested,
                           CallbackCoordinator& coordinator)
        : mutex(m), active(slot) {
        std::lock_guard<std::mutex> lock(mutex);
        if (cancelRequested) {
            coordinator.Cancel();
        }
        active = &coordinator;
    }
    ~ActiveCoordinatorScope() {
        std::lock_guard<std::mutex> lock(mutex);
        active = nullptr;
    }

private:
    std::mutex& mutex;
    CallbackCoordinator*& active;
};

const std::vector<std::string>* findParam(const util::QueryParameters& params, const std::string& name) {
    auto it = params.find(name);
    return it == params.end() ? nullptr : &it->second;
}

} // namespace

AccessToken AuthenticationFlow::Authenticate() {
    FUNC_SCOPE();
    CallbackListener::Options listenerOpts;
    listenerOpts.address = opts.bindAddress;
    listenerOpts.port = std::to_string(opts.redirectPort);
    listenerOpts.pollTimeoutMs = opts.pollTimeoutMs;
    listenerOpts.readTimeoutMs = opts.readTimeoutMs;

    // Listener is bound before the browser can be redirected to it
    auto coordinator = std::make_unique<CallbackCoordinator>(listenerOpts);
    const std::string redirectUri = RedirectUriForPort(coordinator->Port());
    const std::string authUrl = BuildAuthorizationUrl(redirectUri);

    std::optional<util::QueryParameters> params;
    {
        ActiveCoordinatorScope scope(cancelMutex, activeCoordinator, cancelRequested, *coordinator);

        LOG_INFO("Waiting for login redirect on {}", redirectUri);
        if (!browser.Open(authUrl)) {
            LOG_WARN("Could not open a browser. Visit this URL to log in: {}", authUrl);
        }
        params = coordinator->WaitForCallback();
    }

    if (!params) {
        throw MonzoError(ErrorKind::AuthAborted, "Authentication cancelled before the redirect arrived");
    }

    const auto* states = findParam(*params, "state");
    if (!states || states->size() != 1 || states->front() != stateToken) {
        LOG_ERROR("Login redirect carried an invalid state parameter");
        throw MonzoError(ErrorKind::StateMismatch, "Login redirect state does not match the expected value");
    }

    if (const auto* error = findParam(*params, "error")) {
        LOG_WARN("Login redirect reported error '{}'", error->front());
        throw MonzoError(ErrorKind::AuthAborted, std::string("Authorization denied: ") + error->front());
    }

    const auto* codes = findParam(*params, "code");
    if (!codes || codes->size() != 1) {
        LOG_ERROR("Login redirect carried {} code values", codes ? codes->size() : std::size_t{0});
        throw MonzoError(ErrorKind::InvalidCallback, "Login redirect must carry exactly one code");
    }

    TokenExchangeRequest request;
    request.tokenUrl = opts.tokenUrl;
    request.clientId = opts.clientId;
    request.clientSecret = opts.clientSecret;
    request.redirectUri = redirectUri;
    request.code = codes->front();
    return exchangeAuthorizationCode(httpClient, request);
}

} // namespace monzo::auth
