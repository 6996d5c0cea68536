//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Lists accounts, balances, pots and recent transactions for a pre-issued access token
//==========================================================================================================

#include <cstdint>
#include <iostream>
#include <string>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "monzo/Client.h"
#include "monzo/errors/Errors.h"

using namespace monzo;

static std::string formatMinor(int64_t amount, const std::string& currency) {
    const char* sign = amount < 0 ? "-" : "";
    const int64_t abs = amount < 0 ? -amount : amount;
    return fmt::format("{}{}.{:02} {}", sign, abs / 100, abs % 100, currency);
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    ClientOptions opts;
    try {
        if (argc > 1) {
            opts = clientOptionsFromFile(argv[1]);
        }
    } catch (const errors::MonzoError& e) {
        LOG_ERROR("Cannot load credentials: {}", e.what());
        return 2;
    }
    opts = clientOptionsFromEnv(opts);
    if (opts.accessToken.empty()) {
        std::cerr << "usage: monzo_accounts [credentials.json]  (or set MONZO_ACCESS_TOKEN; see monzo_login)\n";
        return 2;
    }

    Client client(opts);
    try {
        for (const Account& account : client.GetAccounts()) {
            if (account.closed) {
                continue;
            }
            Balance balance = client.GetBalance(account.id);
            std::cout << account.id << " [" << account.typeName << "] " << account.description << ": "
                      << formatMinor(balance.balance, balance.currency)
                      << " (total " << formatMinor(balance.totalBalance, balance.currency) << ")\n";

            auto transactions = client.GetTransactions(account.id);
            std::size_t shown = 0;
            for (auto it = transactions.rbegin(); it != transactions.rend() && shown < 5; ++it, ++shown) {
                std::cout << "    " << (it->created ? formatTimestamp(*it->created) : std::string("-")) << "  "
                          << formatMinor(it->amount, it->currency) << "  " << it->description << "\n";
            }
        }
        for (const Pot& pot : client.GetPots()) {
            if (pot.deleted) {
                continue;
            }
            std::cout << "pot " << pot.id << " " << pot.name << ": " << formatMinor(pot.balance, pot.currency) << "\n";
        }
    } catch (const errors::MonzoError& e) {
        LOG_ERROR("Request failed ({}, HTTP {}): {}", errors::errorKindName(e.kind()), e.httpStatus(), e.what());
        return 1;
    }
    return 0;
}
