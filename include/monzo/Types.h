//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Types.h
// Purpose: Monzo API entities and their JSON decoders
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "monzo/JSONValue.h"

namespace monzo {

using Timestamp = std::chrono::system_clock::time_point;

//==========================================================================================================
// parseTimestamp
// Purpose: Parses "YYYY-MM-DDTHH:MM:SS[.fraction]Z" (UTC).
// Returns:
//   nullopt for an empty string.
// Throws:
//   errors::MonzoError(Decode) for any other malformed input.
//==========================================================================================================
std::optional<Timestamp> parseTimestamp(const std::string& text);

// Renders "YYYY-MM-DDTHH:MM:SSZ" (UTC, whole seconds).
std::string formatTimestamp(const Timestamp& ts);

//==========================================================================================================
// Color
// Purpose: RGB color for feed items. Accepts "RRGGBB" or "#RRGGBB"; anything else throws
//          errors::MonzoError(InvalidArgument).
//==========================================================================================================
class Color {
public:
    explicit Color(const std::string& hex);
    const std::string& HexCode() const { return hexCode; } // always "#RRGGBB"

private:
    std::string hexCode;
};

enum class AccountType { Retail, RetailJoint, Prepaid, Unknown };

AccountType accountTypeFromString(const std::string& s);
const char* accountTypeName(AccountType type);

struct WhoAmI {
    bool authenticated{false};
    std::string clientId;
    std::string userId;
};

struct Owner {
    std::string userId;
    std::string preferredName;
    std::string preferredFirstName;
};

struct Account {
    std::string id;
    std::string description;
    std::optional<Timestamp> created;
    bool closed{false};
    AccountType type{AccountType::Unknown};
    std::string typeName; // raw API value, kept for Unknown types
    std::vector<Owner> owners;
    std::optional<std::string> accountNumber;
    std::optional<std::string> sortCode;
};

// Amounts are in minor units of the currency.
struct Balance {
    int64_t balance{0};
    int64_t totalBalance{0}; // includes pots
    int64_t spendToday{0};
    std::string currency;
};

struct Pot {
    std::string id;
    std::string name;
    std::string style;
    int64_t balance{0};
    std::string currency;
    bool roundUp{false};
    std::optional<Timestamp> created;
    std::optional<Timestamp> updated;
    bool deleted{false};
};

struct Attachment {
    std::optional<std::string> id;
    std::string externalId;
    std::string fileType;
    std::string fileUrl;
    std::string userId;
};

// Only the stable fields are decoded; `raw` keeps the full object for everything else (merchant, metadata, ...).
struct Transaction {
    std::string id;
    std::string accountId;
    std::string userId;
    std::string description;
    int64_t amount{0};
    std::string currency;
    int64_t localAmount{0};
    std::string localCurrency;
    int64_t accountBalance{0};
    std::optional<Timestamp> created;
    std::optional<Timestamp> updated;
    std::optional<Timestamp> settled;
    std::vector<Attachment> attachments;
    JSONValue raw;
};

struct Webhook {
    std::string id;
    std::string accountId;
    std::string url;
};

struct FeedItem {
    std::string title;
    std::string imageUrl;
    std::optional<std::string> body;
    std::optional<Color> backgroundColor;
    std::optional<Color> bodyColor;
    std::optional<Color> titleColor;
    std::optional<std::string> url;
};

//----------------------------------------------------------------------------------------------------------
// Decoders. All throw errors::MonzoError(Decode) on a missing or mistyped required field.
// The list decoders accept either the plural envelope ({"accounts":[...]}), the singular envelope where
// the API has one ({"transaction":{...}}), or a bare object.
//----------------------------------------------------------------------------------------------------------
WhoAmI whoAmIFromJson(const JSONValue& json);
std::vector<Owner> ownersFromJson(const JSONValue& json);
std::vector<Account> accountsFromJson(const JSONValue& json);
Balance balanceFromJson(const JSONValue& json);
std::vector<Pot> potsFromJson(const JSONValue& json);
Attachment attachmentFromJson(const JSONValue& json);
std::vector<Transaction> transactionsFromJson(const JSONValue& json);
std::vector<Webhook> webhooksFromJson(const JSONValue& json);

} // namespace monzo
