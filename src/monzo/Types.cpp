//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Types.cpp
// Purpose: Monzo API entity decoders
//==========================================================================================================

#include <cctype>
#include <ctime>
#include <fmt/format.h>
#include "monzo/Types.h"
#include "monzo/errors/Errors.h"

namespace monzo {

using errors::ErrorKind;
using errors::MonzoError;

namespace {

bool readDigits(const std::string& s, std::size_t pos, std::size_t count, int& out) {
    if (pos + count > s.size()) return false;
    int v = 0;
    for (std::size_t k = 0; k < count; ++k) {
        char c = s[pos + k];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    return true;
}

// Required key whose value may be an empty string or null.
std::optional<Timestamp> timestampField(const JSONValue& object, const std::string& key) {
    const JSONValue* m = findMember(object, key);
    if (!m) {
        throw MonzoError(ErrorKind::Decode, fmt::format("Missing field '{}'", key));
    }
    if (m->isNull()) return std::nullopt;
    return parseTimestamp(requireString(object, key));
}

// Missing key, null and empty string are all "absent".
std::optional<Timestamp> optionalTimestampField(const JSONValue& object, const std::string& key) {
    const JSONValue* m = findMember(object, key);
    if (!m || m->isNull()) return std::nullopt;
    return parseTimestamp(requireString(object, key));
}

// Unwraps {"<plural>":[...]} or {"<singular>":{...}}; otherwise the value itself is the single item.
std::vector<const JSONValue*> envelopeItems(const JSONValue& json, const std::string& plural, const std::string& singular) {
    requireObject(json, plural);
    std::vector<const JSONValue*> items;
    const JSONValue* list = findMember(json, plural);
    if (list && !list->isNull()) {
        for (const auto& item : requireArray(json, plural)) {
            if (!item) throw MonzoError(ErrorKind::Decode, fmt::format("Null entry in '{}'", plural));
            items.push_back(item.get());
        }
        return items;
    }
    if (!singular.empty()) {
        const JSONValue* one = findMember(json, singular);
        if (one && !one->isNull()) {
            items.push_back(one);
            return items;
        }
    }
    items.push_back(&json);
    return items;
}

} // namespace

std::optional<Timestamp> parseTimestamp(const std::string& text) {
    if (text.empty()) return std::nullopt;
    std::tm tm{};
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    const bool shapeOk =
        readDigits(text, 0, 4, year) && text.size() > 4 && text[4] == '-' &&
        readDigits(text, 5, 2, month) && text.size() > 7 && text[7] == '-' &&
        readDigits(text, 8, 2, day) && text.size() > 10 && text[10] == 'T' &&
        readDigits(text, 11, 2, hour) && text.size() > 13 && text[13] == ':' &&
        readDigits(text, 14, 2, minute) && text.size() > 16 && text[16] == ':' &&
        readDigits(text, 17, 2, second);
    if (!shapeOk || month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        throw MonzoError(ErrorKind::Decode, fmt::format("Invalid timestamp '{}'", text));
    }
    std::size_t pos = 19;
    long long micros = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        std::size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 6) micros = micros * 10 + (text[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            throw MonzoError(ErrorKind::Decode, fmt::format("Invalid timestamp '{}'", text));
        }
        for (std::size_t k = digits; k < 6; ++k) micros *= 10;
    }
    if (pos + 1 != text.size() || text[pos] != 'Z') {
        throw MonzoError(ErrorKind::Decode, fmt::format("Invalid timestamp '{}'", text));
    }
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    std::time_t secs = ::timegm(&tm);
    return std::chrono::system_clock::from_time_t(secs) + std::chrono::microseconds(micros);
}

std::string formatTimestamp(const Timestamp& ts) {
    std::time_t secs = std::chrono::system_clock::to_time_t(ts);
    std::tm tm{};
    ::gmtime_r(&secs, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf);
}

Color::Color(const std::string& hex) : hexCode(hex) {
    if (hexCode.empty() || hexCode.front() != '#') {
        hexCode.insert(hexCode.begin(), '#');
    }
    bool valid = hexCode.size() == 7;
    for (std::size_t i = 1; valid && i < hexCode.size(); ++i) {
        valid = std::isxdigit(static_cast<unsigned char>(hexCode[i])) != 0;
    }
    if (!valid) {
        throw MonzoError(ErrorKind::InvalidArgument, fmt::format("Invalid hex color '{}'", hex));
    }
}

AccountType accountTypeFromString(const std::string& s) {
    if (s == "uk_retail") return AccountType::Retail;
    if (s == "uk_retail_joint") return AccountType::RetailJoint;
    if (s == "uk_prepaid") return AccountType::Prepaid;
    return AccountType::Unknown;
}

const char* accountTypeName(AccountType type) {
    switch (type) {
        case AccountType::Retail: return "uk_retail";
        case AccountType::RetailJoint: return "uk_retail_joint";
        case AccountType::Prepaid: return "uk_prepaid";
        case AccountType::Unknown: return "unknown";
    }
    return "unknown";
}

WhoAmI whoAmIFromJson(const JSONValue& json) {
    WhoAmI w;
    w.authenticated = requireBool(json, "authenticated");
    w.clientId = requireString(json, "client_id");
    w.userId = requireString(json, "user_id");
    return w;
}

std::vector<Owner> ownersFromJson(const JSONValue& json) {
    std::vector<const JSONValue*> items;
    if (const auto* arr = std::get_if<JSONValue::Array>(&json.value)) {
        for (const auto& item : *arr) {
            if (!item) throw MonzoError(ErrorKind::Decode, "Null owner entry");
            items.push_back(item.get());
        }
    } else {
        items.push_back(&json);
    }
    std::vector<Owner> owners;
    for (const JSONValue* item : items) {
        Owner o;
        o.userId = requireString(*item, "user_id");
        o.preferredName = requireString(*item, "preferred_name");
        o.preferredFirstName = requireString(*item, "preferred_first_name");
        owners.push_back(std::move(o));
    }
    return owners;
}

std::vector<Account> accountsFromJson(const JSONValue& json) {
    std::vector<Account> accounts;
    for (const JSONValue* item : envelopeItems(json, "accounts", "")) {
        Account a;
        a.id = requireString(*item, "id");
        a.description = requireString(*item, "description");
        a.created = timestampField(*item, "created");
        a.closed = requireBool(*item, "closed");
        a.typeName = requireString(*item, "type");
        a.type = accountTypeFromString(a.typeName);
        const JSONValue* owners = findMember(*item, "owners");
        if (!owners) throw MonzoError(ErrorKind::Decode, "Missing field 'owners'");
        a.owners = ownersFromJson(*owners);
        a.accountNumber = optionalString(*item, "account_number");
        a.sortCode = optionalString(*item, "sort_code");
        accounts.push_back(std::move(a));
    }
    return accounts;
}

Balance balanceFromJson(const JSONValue& json) {
    Balance b;
    b.balance = requireInt(json, "balance");
    b.totalBalance = requireInt(json, "total_balance");
    b.spendToday = requireInt(json, "spend_today");
    b.currency = requireString(json, "currency");
    return b;
}

std::vector<Pot> potsFromJson(const JSONValue& json) {
    std::vector<Pot> pots;
    for (const JSONValue* item : envelopeItems(json, "pots", "")) {
        Pot p;
        p.id = requireString(*item, "id");
        p.name = requireString(*item, "name");
        p.style = requireString(*item, "style");
        p.balance = requireInt(*item, "balance");
        p.currency = requireString(*item, "currency");
        p.roundUp = requireBool(*item, "round_up");
        p.created = timestampField(*item, "created");
        p.updated = timestampField(*item, "updated");
        p.deleted = requireBool(*item, "deleted");
        pots.push_back(std::move(p));
    }
    return pots;
}

Attachment attachmentFromJson(const JSONValue& json) {
    requireObject(json, "attachment");
    Attachment a;
    a.id = optionalString(json, "id");
    a.externalId = requireString(json, "external_id");
    a.fileType = requireString(json, "file_type");
    a.fileUrl = requireString(json, "file_url");
    a.userId = requireString(json, "user_id");
    return a;
}

std::vector<Transaction> transactionsFromJson(const JSONValue& json) {
    std::vector<Transaction> transactions;
    for (const JSONValue* item : envelopeItems(json, "transactions", "transaction")) {
        Transaction t;
        t.id = requireString(*item, "id");
        t.accountId = requireString(*item, "account_id");
        t.userId = requireString(*item, "user_id");
        t.description = requireString(*item, "description");
        t.amount = requireInt(*item, "amount");
        t.currency = requireString(*item, "currency");
        t.localAmount = requireInt(*item, "local_amount");
        t.localCurrency = requireString(*item, "local_currency");
        t.accountBalance = requireInt(*item, "account_balance");
        t.created = timestampField(*item, "created");
        t.updated = optionalTimestampField(*item, "updated");
        t.settled = optionalTimestampField(*item, "settled");
        const JSONValue* attachments = findMember(*item, "attachments");
        if (attachments && !attachments->isNull()) {
            for (const auto& att : requireArray(*item, "attachments")) {
                if (att) t.attachments.push_back(attachmentFromJson(*att));
            }
        }
        t.raw = *item;
        transactions.push_back(std::move(t));
    }
    return transactions;
}

std::vector<Webhook> webhooksFromJson(const JSONValue& json) {
    std::vector<Webhook> webhooks;
    for (const JSONValue* item : envelopeItems(json, "webhooks", "webhook")) {
        Webhook w;
        w.id = requireString(*item, "id");
        w.accountId = requireString(*item, "account_id");
        w.url = requireString(*item, "url");
        webhooks.push_back(std::move(w));
    }
    return webhooks;
}

} // namespace monzo
