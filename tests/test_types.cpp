//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_types.cpp
// Purpose: GoogleTests for entity decoding, timestamps and colors
//==========================================================================================================

#include <gtest/gtest.h>

#include "monzo/Types.h"
#include "monzo/errors/Errors.h"

using namespace monzo;
using errors::ErrorKind;
using errors::MonzoError;

namespace {

const char* kAccountsJson = R"({"accounts":[
  {"id":"acc_1","description":"Peter Pan's Account","created":"2015-11-13T12:17:42.102Z","closed":false,
   "type":"uk_retail","owners":[{"user_id":"user_1","preferred_name":"Peter Pan","preferred_first_name":"Peter"}],
   "account_number":"12345678","sort_code":"040004"},
  {"id":"acc_2","description":"Joint","created":"2019-01-01T00:00:00Z","closed":true,
   "type":"uk_business","owners":{"user_id":"user_2","preferred_name":"W","preferred_first_name":"W"}}
]})";

const char* kTransactionJson = R"({"transaction":{
  "id":"tx_1","account_id":"acc_1","user_id":"user_1","description":"THE DE BEAUVOIR DELI C LONDON GBR",
  "amount":-510,"currency":"GBP","local_amount":-510,"local_currency":"GBP","account_balance":13013,
  "created":"2015-08-22T12:20:18Z","updated":"","settled":null,"attachments":null,
  "merchant":{"id":"merch_1","name":"The De Beauvoir Deli Co."},"metadata":{"note":"lunch"}
}})";

} // namespace

//==========================================================================================================
// Timestamps
//==========================================================================================================
TEST(Types, ParsesTimestamps) {
    auto ts = parseTimestamp("2015-11-13T12:17:42.102Z");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(formatTimestamp(*ts), "2015-11-13T12:17:42Z");
    auto whole = parseTimestamp("2015-11-13T12:17:42Z");
    ASSERT_TRUE(whole.has_value());
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::milliseconds>(*ts - *whole).count(), 102);
    EXPECT_EQ(std::chrono::system_clock::to_time_t(*parseTimestamp("1970-01-02T00:00:00Z")), 86400);
    EXPECT_FALSE(parseTimestamp("").has_value());
}

TEST(Types, RejectsBadTimestamps) {
    EXPECT_THROW(parseTimestamp("2015-11-13"), MonzoError);
    EXPECT_THROW(parseTimestamp("2015-13-13T12:17:42Z"), MonzoError);
    EXPECT_THROW(parseTimestamp("2015-11-13T12:17:42"), MonzoError);
    EXPECT_THROW(parseTimestamp("2015-11-13T12:17:42.Z"), MonzoError);
}

//==========================================================================================================
// Colors
//==========================================================================================================
TEST(Types, ColorNormalizesHash) {
    EXPECT_EQ(Color("FF00aa").HexCode(), "#FF00aa");
    EXPECT_EQ(Color("#123456").HexCode(), "#123456");
}

TEST(Types, ColorRejectsInvalid) {
    for (const char* bad : {"", "#12345", "1234567", "#GGGGGG", "##12345"}) {
        try {
            Color c(bad);
            ADD_FAILURE() << "accepted " << bad;
        } catch (const MonzoError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::InvalidArgument);
        }
    }
}

//==========================================================================================================
// Entities
//==========================================================================================================
TEST(Types, DecodesAccounts) {
    auto accounts = accountsFromJson(parseJSON(kAccountsJson));
    ASSERT_EQ(accounts.size(), 2u);
    EXPECT_EQ(accounts[0].id, "acc_1");
    EXPECT_EQ(accounts[0].type, AccountType::Retail);
    EXPECT_FALSE(accounts[0].closed);
    ASSERT_EQ(accounts[0].owners.size(), 1u);
    EXPECT_EQ(accounts[0].owners[0].preferredFirstName, "Peter");
    EXPECT_EQ(accounts[0].accountNumber.value_or(""), "12345678");
    EXPECT_EQ(accounts[0].sortCode.value_or(""), "040004");
    ASSERT_TRUE(accounts[0].created.has_value());

    EXPECT_EQ(accounts[1].type, AccountType::Unknown);
    EXPECT_EQ(accounts[1].typeName, "uk_business");
    EXPECT_TRUE(accounts[1].closed);
    ASSERT_EQ(accounts[1].owners.size(), 1u);
    EXPECT_FALSE(accounts[1].accountNumber.has_value());
}

TEST(Types, AccountTypeNames) {
    EXPECT_EQ(accountTypeFromString("uk_retail_joint"), AccountType::RetailJoint);
    EXPECT_EQ(accountTypeFromString("uk_prepaid"), AccountType::Prepaid);
    EXPECT_STREQ(accountTypeName(AccountType::RetailJoint), "uk_retail_joint");
}

TEST(Types, DecodesSingleTransactionEnvelope) {
    auto txs = transactionsFromJson(parseJSON(kTransactionJson));
    ASSERT_EQ(txs.size(), 1u);
    const Transaction& tx = txs[0];
    EXPECT_EQ(tx.id, "tx_1");
    EXPECT_EQ(tx.amount, -510);
    EXPECT_EQ(tx.accountBalance, 13013);
    ASSERT_TRUE(tx.created.has_value());
    EXPECT_FALSE(tx.updated.has_value());
    EXPECT_FALSE(tx.settled.has_value());
    EXPECT_TRUE(tx.attachments.empty());
    const JSONValue* merchant = findMember(tx.raw, "merchant");
    ASSERT_NE(merchant, nullptr);
    EXPECT_EQ(requireString(*merchant, "name"), "The De Beauvoir Deli Co.");
}

TEST(Types, DecodesTransactionList) {
    auto txs = transactionsFromJson(parseJSON(R"({"transactions":[
      {"id":"tx_1","account_id":"a","user_id":"u","description":"d","amount":1,"currency":"GBP",
       "local_amount":1,"local_currency":"GBP","account_balance":2,"created":"2020-01-01T00:00:00Z",
       "settled":"2020-01-02T00:00:00Z",
       "attachments":[{"id":"attach_1","external_id":"tx_1","file_type":"image/png",
                       "file_url":"https://x/y.png","user_id":"u"}]},
      {"id":"tx_2","account_id":"a","user_id":"u","description":"d","amount":-1,"currency":"GBP",
       "local_amount":-1,"local_currency":"GBP","account_balance":1,"created":"2020-01-03T00:00:00Z"}
    ]})"));
    ASSERT_EQ(txs.size(), 2u);
    ASSERT_TRUE(txs[0].settled.has_value());
    ASSERT_EQ(txs[0].attachments.size(), 1u);
    EXPECT_EQ(txs[0].attachments[0].id.value_or(""), "attach_1");
    EXPECT_EQ(txs[0].attachments[0].fileType, "image/png");
    EXPECT_FALSE(txs[1].updated.has_value());
}

TEST(Types, DecodesBalancePotsWebhooks) {
    Balance b = balanceFromJson(parseJSON(R"({"balance":5000,"total_balance":6000,"currency":"GBP","spend_today":-100})"));
    EXPECT_EQ(b.balance, 5000);
    EXPECT_EQ(b.totalBalance, 6000);
    EXPECT_EQ(b.spendToday, -100);

    auto pots = potsFromJson(parseJSON(R"({"pots":[{"id":"pot_1","name":"Savings","style":"beach_ball",
      "balance":133700,"currency":"GBP","round_up":true,"created":"2017-11-09T12:30:53.695Z",
      "updated":"2017-11-09T12:30:53.695Z","deleted":false}]})"));
    ASSERT_EQ(pots.size(), 1u);
    EXPECT_EQ(pots[0].name, "Savings");
    EXPECT_TRUE(pots[0].roundUp);

    auto hooks = webhooksFromJson(parseJSON(R"({"webhook":{"id":"webhook_1","account_id":"acc_1","url":"https://e/x"}})"));
    ASSERT_EQ(hooks.size(), 1u);
    EXPECT_EQ(hooks[0].url, "https://e/x");
    EXPECT_TRUE(webhooksFromJson(parseJSON(R"({"webhooks":[]})")).empty());

    WhoAmI who = whoAmIFromJson(parseJSON(R"({"authenticated":true,"client_id":"c","user_id":"u"})"));
    EXPECT_TRUE(who.authenticated);
    EXPECT_EQ(who.userId, "u");
}

TEST(Types, MissingRequiredFieldIsDecodeError) {
    try {
        balanceFromJson(parseJSON(R"({"balance":1,"currency":"GBP","spend_today":0})"));
        FAIL() << "expected MonzoError";
    } catch (const MonzoError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Decode);
        EXPECT_NE(std::string(e.what()).find("total_balance"), std::string::npos);
    }
    EXPECT_THROW(accountsFromJson(parseJSON(R"({"accounts":[{"id":"acc_1"}]})")), MonzoError);
    EXPECT_THROW(potsFromJson(parseJSON("[]")), MonzoError);
}
