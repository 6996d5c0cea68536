//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.cpp
// Purpose: Monzo API client implementation
//==========================================================================================================

#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <sstream>
#include <type_traits>
#include <utility>

#include "monzo/Client.h"
#include "monzo/auth/AuthenticationFlow.hpp"
#include "monzo/errors/Errors.h"
#include "monzo/http/BeastHttpClient.hpp"
#include "monzo/util/RandomString.hpp"
#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace monzo {

using errors::ErrorKind;
using errors::MonzoError;
using util::urlEncodeForm;

namespace {

constexpr std::size_t kDedupeIdLength = 20;

bool isBlank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

template <typename T>
T firstOrThrow(std::vector<T>&& items, const char* what) {
    if (items.empty()) {
        throw MonzoError(ErrorKind::Decode, std::string("Response contained no ") + what);
    }
    return std::move(items.front());
}

} // namespace

//==========================================================================================================
// parseClientOptions
// Purpose: Parse semicolon-delimited key=value config into ClientOptions.
//==========================================================================================================
ClientOptions parseClientOptions(const std::string& config) {
    ClientOptions opts;
    auto trim = [](std::string s) -> std::string {
        std::size_t b = 0, e = s.size();
        while (b < e && (s[b] == ' ' || s[b] == '\t')) {
            ++b;
        }
        while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) {
            --e;
        }
        return s.substr(b, e - b);
    };
    auto parseUInt = [](const std::string& key, const std::string& val, unsigned long maxValue, auto& out) {
        try {
            std::size_t used = 0;
            unsigned long v = std::stoul(val, &used);
            if (used == val.size() && v <= maxValue) {
                out = static_cast<std::remove_reference_t<decltype(out)>>(v);
                return;
            }
        } catch (const std::logic_error&) {
        }
        LOG_WARN("Ignoring invalid value for '{}': {}", key, val);
    };

    std::size_t start = 0;
    while (start < config.size()) {
        std::size_t sep = config.find(';', start);
        if (sep == std::string::npos) { sep = config.size(); }
        std::string kv = trim(config.substr(start, sep - start));
        start = sep + 1;
        if (kv.empty()) {
            continue;
        }
        std::size_t eq = kv.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string key = trim(kv.substr(0, eq));
        std::string val = trim(kv.substr(eq + 1));
        if (key == "clientId") {
            opts.clientId = val;
        }
        else if (key == "clientSecret") {
            opts.clientSecret = val;
        }
        else if (key == "ownerId") {
            opts.ownerId = val;
        }
        else if (key == "accessToken" || key == "token") {
            opts.accessToken = val;
        }
        else if (key == "apiBaseUrl") {
            opts.apiBaseUrl = val;
        }
        else if (key == "authorizationUrl") {
            opts.authorizationUrl = val;
        }
        else if (key == "tokenUrl") {
            opts.tokenUrl = val;
        }
        else if (key == "redirectHost") {
            opts.redirectHost = val;
        }
        else if (key == "redirectPort") {
            parseUInt(key, val, 65535ul, opts.redirectPort);
        }
        else if (key == "redirectPath") {
            opts.redirectPath = val;
        }
        else if (key == "bindAddress") {
            opts.bindAddress = val;
        }
        else if (key == "pollTimeoutMs") {
            parseUInt(key, val, 0xFFFFFFFFul, opts.pollTimeoutMs);
        }
        else if (key == "callbackReadTimeoutMs") {
            parseUInt(key, val, 0xFFFFFFFFul, opts.callbackReadTimeoutMs);
        }
        else if (key == "connectTimeoutMs") {
            parseUInt(key, val, 0xFFFFFFFFul, opts.connectTimeoutMs);
        }
        else if (key == "readTimeoutMs") {
            parseUInt(key, val, 0xFFFFFFFFul, opts.readTimeoutMs);
        }
        else if (key == "caFile") {
            opts.caFile = val;
        }
        else if (key == "caPath") {
            opts.caPath = val;
        }
    }
    return opts;
}

ClientOptions clientOptionsFromEnv(ClientOptions base) {
    base.clientId = GetEnvOrDefault("MONZO_CLIENT_ID", base.clientId);
    base.clientSecret = GetEnvOrDefault("MONZO_CLIENT_SECRET", base.clientSecret);
    base.ownerId = GetEnvOrDefault("MONZO_OWNER_ID", base.ownerId);
    base.accessToken = GetEnvOrDefault("MONZO_ACCESS_TOKEN", base.accessToken);
    const std::string port = GetEnvOrDefault("MONZO_REDIRECT_PORT", "");
    if (!port.empty()) {
        try {
            unsigned long v = std::stoul(port);
            if (v <= 65535ul) {
                base.redirectPort = static_cast<unsigned short>(v);
            } else {
                LOG_WARN("MONZO_REDIRECT_PORT out of range: {}", port);
            }
        } catch (const std::logic_error&) {
            LOG_WARN("MONZO_REDIRECT_PORT is not a number: {}", port);
        }
    }
    return base;
}

ClientOptions clientOptionsFromFile(const std::string& path, ClientOptions base) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
        throw MonzoError(ErrorKind::InvalidArgument, "Cannot read configuration file: " + path);
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    JSONValue doc = parseJSON(text);
    requireObject(doc, path);
    if (auto v = optionalString(doc, "client_id")) base.clientId = *v;
    if (auto v = optionalString(doc, "client_secret")) base.clientSecret = *v;
    if (auto v = optionalString(doc, "owner_id")) base.ownerId = *v;
    if (auto v = optionalString(doc, "access_token")) base.accessToken = *v;
    return base;
}

class Client::Impl {
public:
    ClientOptions opts;
    std::shared_ptr<http::IHttpClient> httpClient;
    std::shared_ptr<auth::IBrowserLauncher> browser;

    mutable std::mutex tokenMutex;
    std::string accessToken;

    std::mutex flowMutex;
    auth::AuthenticationFlow* activeFlow{nullptr};

    Impl(const ClientOptions& o,
         std::shared_ptr<http::IHttpClient> client,
         std::shared_ptr<auth::IBrowserLauncher> launcher)
        : opts(o), httpClient(std::move(client)), browser(std::move(launcher)), accessToken(o.accessToken) {
        if (!httpClient) {
            http::BeastHttpClient::Options hopts;
            hopts.caFile = opts.caFile;
            hopts.caPath = opts.caPath;
            hopts.connectTimeoutMs = opts.connectTimeoutMs;
            hopts.readTimeoutMs = opts.readTimeoutMs;
            httpClient = std::make_shared<http::BeastHttpClient>(hopts);
        }
        if (!browser) {
            browser = std::make_shared<auth::SystemBrowserLauncher>();
        }
    }

    auth::AuthenticationFlow::Options flowOptions() const {
        auth::AuthenticationFlow::Options f;
        f.clientId = opts.clientId;
        f.clientSecret = opts.clientSecret;
        f.authorizationUrl = opts.authorizationUrl;
        f.tokenUrl = opts.tokenUrl;
        f.redirectHost = opts.redirectHost;
        f.redirectPort = opts.redirectPort;
        f.redirectPath = opts.redirectPath;
        f.bindAddress = opts.bindAddress;
        f.pollTimeoutMs = opts.pollTimeoutMs;
        f.readTimeoutMs = opts.callbackReadTimeoutMs;
        return f;
    }

    std::string urlFor(const std::string& path) const {
        std::string base = opts.apiBaseUrl;
        if (base.empty() || base.back() != '/') base.push_back('/');
        std::size_t skip = 0;
        while (skip < path.size() && path[skip] == '/') ++skip;
        return base + path.substr(skip);
    }

    std::string token() const {
        std::lock_guard<std::mutex> lock(tokenMutex);
        return accessToken;
    }

    JSONValue call(http::HttpMethod method, const std::string& path, std::string body, const std::string& contentType) {
        http::HttpRequest req;
        req.method = method;
        req.url = urlFor(path);
        const std::string bearer = token();
        if (!bearer.empty()) {
            req.headers.push_back(http::HeaderKV{"Authorization", "Bearer " + bearer});
        } else {
            LOG_WARN("Calling {} without an access token", path);
        }
        if (!contentType.empty()) {
            req.headers.push_back(http::HeaderKV{"Content-Type", contentType});
        }
        req.body = std::move(body);
        LOG_DEBUG("Performing {}: {}", http::methodName(method), req.url);

        http::HttpResponse res = httpClient->Send(req);
        return handleResponse(res);
    }

    static JSONValue handleResponse(const http::HttpResponse& res) {
        LOG_DEBUG("Handling response: {}", res.status);
        if (!errors::isSuccessStatus(res.status)) {
            throw errors::makeHttpError(res.status, res.body);
        }
        if (isBlank(res.body)) {
            return JSONValue(nullptr);
        }
        return parseJSON(res.body);
    }
};

Client::Client(const ClientOptions& opts)
    : pImpl(std::make_unique<Impl>(opts, nullptr, nullptr)) {}

Client::Client(const ClientOptions& opts,
               std::shared_ptr<http::IHttpClient> httpClient,
               std::shared_ptr<auth::IBrowserLauncher> browser)
    : pImpl(std::make_unique<Impl>(opts, std::move(httpClient), std::move(browser))) {}

Client::~Client() = default;

bool Client::Authenticate() {
    FUNC_SCOPE();
    LOG_INFO("Authenticating");
    auth::AuthenticationFlow flow(pImpl->flowOptions(), *pImpl->httpClient, *pImpl->browser);
    {
        std::lock_guard<std::mutex> lock(pImpl->flowMutex);
        pImpl->activeFlow = &flow;
    }
    struct ActiveFlowReset {
        Impl& impl;
        ~ActiveFlowReset() {
            std::lock_guard<std::mutex> lock(impl.flowMutex);
            impl.activeFlow = nullptr;
        }
    } reset{*pImpl};

    auth::AccessToken token = flow.Authenticate();
    SetAccessToken(token.accessToken);
    LOG_INFO("Authentication complete");
    return true;
}

void Client::CancelAuthentication() {
    std::lock_guard<std::mutex> lock(pImpl->flowMutex);
    if (pImpl->activeFlow) {
        pImpl->activeFlow->Cancel();
    }
}

std::string Client::GetAccessToken() const {
    return pImpl->token();
}

void Client::SetAccessToken(const std::string& token) {
    std::lock_guard<std::mutex> lock(pImpl->tokenMutex);
    pImpl->accessToken = token;
}

std::string Client::RedirectUri() const {
    const auto& o = pImpl->opts;
    std::string path = o.redirectPath;
    if (!path.empty() && path.front() == '/') path.erase(0, 1);
    return std::string("http://") + o.redirectHost + ":" + std::to_string(o.redirectPort) + "/" + path;
}

const ClientOptions& Client::GetOptions() const {
    return pImpl->opts;
}

JSONValue Client::Get(const std::string& path) {
    return pImpl->call(http::HttpMethod::Get, path, std::string(), std::string());
}

JSONValue Client::Post(const std::string& path, const util::FormFields& form) {
    return pImpl->call(http::HttpMethod::Post, path, util::encodeForm(form), "application/x-www-form-urlencoded");
}

JSONValue Client::Put(const std::string& path, const util::FormFields& form) {
    return pImpl->call(http::HttpMethod::Put, path, util::encodeForm(form), "application/x-www-form-urlencoded");
}

JSONValue Client::Patch(const std::string& path, const std::string& body) {
    return pImpl->call(http::HttpMethod::Patch, path, body, "application/x-www-form-urlencoded");
}

JSONValue Client::Delete(const std::string& path) {
    return pImpl->call(http::HttpMethod::Delete, path, std::string(), std::string());
}

WhoAmI Client::GetWhoAmI() {
    LOG_DEBUG("Requesting whoami");
    return whoAmIFromJson(Get("ping/whoami"));
}

std::vector<Account> Client::GetAccounts() {
    LOG_DEBUG("Requesting account list");
    return accountsFromJson(Get("accounts"));
}

Balance Client::GetBalance(const std::string& accountId) {
    LOG_DEBUG("Requesting balance for account: {}", accountId);
    return balanceFromJson(Get("balance?account_id=" + urlEncodeForm(accountId)));
}

std::vector<Pot> Client::GetPots() {
    LOG_DEBUG("Requesting pots");
    return potsFromJson(Get("pots"));
}

Pot Client::DepositIntoPot(const std::string& potId, const std::string& sourceAccountId, int64_t amount,
                           std::optional<std::string> dedupeId) {
    LOG_DEBUG("Depositing into pot ({}) from account ({}): {}", potId, sourceAccountId, amount);
    JSONValue res = Put("pots/" + urlEncodeForm(potId) + "/deposit", {
        {"source_account_id", sourceAccountId},
        {"amount", std::to_string(amount)},
        {"dedupe_id", dedupeId ? *dedupeId : util::randomString(kDedupeIdLength)},
    });
    return firstOrThrow(potsFromJson(res), "pot");
}

Pot Client::WithdrawFromPot(const std::string& potId, const std::string& destinationAccountId, int64_t amount,
                            std::optional<std::string> dedupeId) {
    LOG_DEBUG("Withdrawing from pot ({}) into account ({}): {}", potId, destinationAccountId, amount);
    JSONValue res = Put("pots/" + urlEncodeForm(potId) + "/withdraw", {
        {"destination_account_id", destinationAccountId},
        {"amount", std::to_string(amount)},
        {"dedupe_id", dedupeId ? *dedupeId : util::randomString(kDedupeIdLength)},
    });
    return firstOrThrow(potsFromJson(res), "pot");
}

std::vector<Transaction> Client::GetTransactions(const std::string& accountId) {
    LOG_DEBUG("Requesting transaction list for account: {}", accountId);
    return transactionsFromJson(Get("transactions?account_id=" + urlEncodeForm(accountId)));
}

Transaction Client::GetTransaction(const std::string& transactionId) {
    LOG_DEBUG("Requesting transaction: {}", transactionId);
    return firstOrThrow(transactionsFromJson(Get("transactions/" + urlEncodeForm(transactionId) + "?expand[]=merchant")),
                        "transaction");
}

Transaction Client::AnnotateTransaction(const std::string& transactionId, const std::string& key, const std::string& value) {
    LOG_DEBUG("Annotating transaction ({}) with key {}", transactionId, key);
    const std::string body = util::encodeForm({{"metadata[" + key + "]", value}});
    return firstOrThrow(transactionsFromJson(Patch("transactions/" + urlEncodeForm(transactionId), body)), "transaction");
}

Transaction Client::RemoveTransactionAnnotation(const std::string& transactionId, const std::string& key) {
    LOG_DEBUG("Removing transaction ({}) annotation: {}", transactionId, key);
    return AnnotateTransaction(transactionId, key, "");
}

void Client::CreateFeedItem(const std::string& accountId, const FeedItem& item) {
    LOG_DEBUG("Creating feed item on {}: {}", accountId, item.title);
    util::FormFields form{
        {"type", "basic"},
        {"account_id", accountId},
        {"params[title]", item.title},
        {"params[image_url]", item.imageUrl},
    };
    if (item.body) form.push_back({"params[body]", *item.body});
    if (item.backgroundColor) form.push_back({"params[background_color]", item.backgroundColor->HexCode()});
    if (item.bodyColor) form.push_back({"params[body_color]", item.bodyColor->HexCode()});
    if (item.titleColor) form.push_back({"params[title_color]", item.titleColor->HexCode()});
    if (item.url) form.push_back({"url", *item.url});
    Post("feed", form);
}

Attachment Client::RegisterAttachment(const std::string& transactionId, const std::string& url, const std::string& mimeType) {
    LOG_DEBUG("Registering attachment on {}: {}", transactionId, url);
    JSONValue res = Post("attachment/register", {
        {"external_id", transactionId},
        {"file_type", mimeType},
        {"file_url", url},
    });
    const JSONValue* attachment = findMember(res, "attachment");
    if (!attachment) {
        throw MonzoError(ErrorKind::Decode, "Missing field 'attachment'");
    }
    return attachmentFromJson(*attachment);
}

void Client::UnregisterAttachment(const std::string& attachmentId) {
    LOG_DEBUG("Unregistering attachment: {}", attachmentId);
    Post("attachment/deregister", {{"id", attachmentId}});
}

std::string Client::UploadAttachment(const std::string& filePath, const std::string& mimeType) {
    LOG_DEBUG("Uploading attachment: {}", filePath);
    std::ifstream in(filePath, std::ios::in | std::ios::binary);
    if (!in) {
        throw MonzoError(ErrorKind::InvalidArgument, "Cannot read attachment file: " + filePath);
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    JSONValue link = Post("attachment/upload", {
        {"file_name", std::filesystem::path(filePath).filename().string()},
        {"file_type", mimeType},
    });
    const std::string fileUrl = requireString(link, "file_url");
    const std::string uploadUrl = requireString(link, "upload_url");
    LOG_DEBUG("Retrieved upload location: {}", uploadUrl);

    // Upload target is pre-signed; no bearer token
    http::HttpRequest put;
    put.method = http::HttpMethod::Put;
    put.url = util::appendQuery(uploadUrl, "file=" + urlEncodeForm(filePath));
    put.headers.push_back(http::HeaderKV{"Content-Type", mimeType});
    put.body = std::move(content);
    http::HttpResponse res = pImpl->httpClient->Send(put);
    if (!errors::isSuccessStatus(res.status)) {
        throw errors::makeHttpError(res.status, res.body);
    }
    LOG_DEBUG("Upload complete. File can be accessed: {}", fileUrl);
    return fileUrl;
}

std::vector<Webhook> Client::GetWebhooks(const std::string& accountId) {
    LOG_DEBUG("Retrieving webhooks for: {}", accountId);
    return webhooksFromJson(Get("webhooks?account_id=" + urlEncodeForm(accountId)));
}

Webhook Client::RegisterWebhook(const std::string& accountId, const std::string& url) {
    LOG_DEBUG("Registering webhook on {}: {}", accountId, url);
    return firstOrThrow(webhooksFromJson(Post("webhooks", {{"account_id", accountId}, {"url", url}})), "webhook");
}

void Client::DeleteWebhook(const std::string& webhookId) {
    LOG_DEBUG("Deleting webhook: {}", webhookId);
    Delete("webhooks/" + urlEncodeForm(webhookId));
}

} // namespace monzo
