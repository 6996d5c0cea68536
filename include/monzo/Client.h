//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.h
// Purpose: Monzo API client: browser login plus typed REST operations
//==========================================================================================================

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "monzo/JSONValue.h"
#include "monzo/Types.h"
#include "monzo/auth/BrowserLauncher.hpp"
#include "monzo/http/IHttpClient.hpp"
#include "monzo/util/Url.hpp"

namespace monzo {

//==========================================================================================================
// ClientOptions
// Purpose: Credentials, endpoints and timing for a Client.
// Fields:
//   clientId/clientSecret/ownerId: OAuth client registration
//   accessToken: Pre-issued bearer token; skips Authenticate() when set
//   apiBaseUrl: REST base URL (trailing '/')
//   authorizationUrl/tokenUrl: OAuth endpoints
//   redirectHost/redirectPort/redirectPath: Loopback redirect URI components
//   bindAddress: Loopback listener bind address
//   pollTimeoutMs/callbackReadTimeoutMs: Loopback listener timing
//   connectTimeoutMs/readTimeoutMs: Outbound HTTP timeouts
//   caFile/caPath: Optional CA bundle/path for HTTPS
//==========================================================================================================
struct ClientOptions {
    std::string clientId;
    std::string clientSecret;
    std::string ownerId;
    std::string accessToken;
    std::string apiBaseUrl{"https://api.monzo.com/"};
    std::string authorizationUrl{"https://auth.monzo.com/"};
    std::string tokenUrl{"https://api.monzo.com/oauth2/token"};
    std::string redirectHost{"localhost"};
    unsigned short redirectPort{36453};
    std::string redirectPath{"monzo_callback"};
    std::string bindAddress{"127.0.0.1"};
    unsigned int pollTimeoutMs{200};
    unsigned int callbackReadTimeoutMs{2000};
    unsigned int connectTimeoutMs{10000};
    unsigned int readTimeoutMs{30000};
    std::string caFile;
    std::string caPath;
};

//==========================================================================================================
// parseClientOptions
// Purpose: Parses "key=value; key=value" configuration on top of the defaults.
// Notes:
//   Keys match the ClientOptions field names. Unknown keys are ignored; numbers that do not parse keep
//   their default.
//==========================================================================================================
ClientOptions parseClientOptions(const std::string& config);

// Overlays MONZO_CLIENT_ID, MONZO_CLIENT_SECRET, MONZO_OWNER_ID, MONZO_ACCESS_TOKEN and MONZO_REDIRECT_PORT.
ClientOptions clientOptionsFromEnv(ClientOptions base = ClientOptions{});

// Reads {"client_id", "client_secret", "owner_id", "access_token"} from a JSON file on top of base.
// Throws errors::MonzoError(InvalidArgument) when unreadable, (Decode) when malformed.
ClientOptions clientOptionsFromFile(const std::string& path, ClientOptions base = ClientOptions{});

//==========================================================================================================
// Client
// Purpose: Entry point for Monzo API access.
// Notes:
//   Every REST call maps a non-2xx response to errors::MonzoError with the status-derived kind.
//   The access token is guarded by a mutex; Authenticate() and CancelAuthentication() may run on
//   different threads.
//==========================================================================================================
class Client {
public:
    explicit Client(const ClientOptions& opts);
    Client(const ClientOptions& opts,
           std::shared_ptr<http::IHttpClient> httpClient,
           std::shared_ptr<auth::IBrowserLauncher> browser);
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    //==========================================================================================================
    // Runs the browser login with a fresh state token and stores the resulting access token.
    // Returns:
    //   true on success; every failure throws errors::MonzoError (see auth::AuthenticationFlow).
    //==========================================================================================================
    bool Authenticate();

    // Cancels an in-progress Authenticate(); no-op when none is running.
    void CancelAuthentication();

    std::string GetAccessToken() const;
    void SetAccessToken(const std::string& token);
    std::string RedirectUri() const;
    const ClientOptions& GetOptions() const;

    //----------------------------------------------------------------------------------------------------------
    // Raw REST helpers. `path` is relative to apiBaseUrl and may carry a query. Returns the decoded JSON
    // body (null for an empty body).
    //----------------------------------------------------------------------------------------------------------
    JSONValue Get(const std::string& path);
    JSONValue Post(const std::string& path, const util::FormFields& form);
    JSONValue Put(const std::string& path, const util::FormFields& form);
    JSONValue Patch(const std::string& path, const std::string& body);
    JSONValue Delete(const std::string& path);

    WhoAmI GetWhoAmI();
    std::vector<Account> GetAccounts();
    Balance GetBalance(const std::string& accountId);
    std::vector<Pot> GetPots();

    // A fresh 20-character dedupe id is generated per call unless one is supplied.
    Pot DepositIntoPot(const std::string& potId, const std::string& sourceAccountId, int64_t amount,
                       std::optional<std::string> dedupeId = std::nullopt);
    Pot WithdrawFromPot(const std::string& potId, const std::string& destinationAccountId, int64_t amount,
                        std::optional<std::string> dedupeId = std::nullopt);

    std::vector<Transaction> GetTransactions(const std::string& accountId);
    Transaction GetTransaction(const std::string& transactionId);
    Transaction AnnotateTransaction(const std::string& transactionId, const std::string& key, const std::string& value);
    Transaction RemoveTransactionAnnotation(const std::string& transactionId, const std::string& key);

    void CreateFeedItem(const std::string& accountId, const FeedItem& item);

    Attachment RegisterAttachment(const std::string& transactionId, const std::string& url, const std::string& mimeType);
    void UnregisterAttachment(const std::string& attachmentId);
    // Uploads a local file and returns the URL to pass to RegisterAttachment().
    std::string UploadAttachment(const std::string& filePath, const std::string& mimeType);

    std::vector<Webhook> GetWebhooks(const std::string& accountId);
    Webhook RegisterWebhook(const std::string& accountId, const std::string& url);
    void DeleteWebhook(const std::string& webhookId);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace monzo
