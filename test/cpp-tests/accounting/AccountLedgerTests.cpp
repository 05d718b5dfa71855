/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "margincore/accounting/AccountLedger.hpp"
#include "formatting.hpp"
#include "matchers.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace margincore;
using namespace margincore::accounting;
using namespace margincore::literals;
using namespace margincore::test;

using namespace testing;

//-------------------------------------------------------------------------

struct AccountLedgerTest : Test
{
    virtual void SetUp() override
    {
        ledger.credit("alice", 150_dec);
        ledger.credit("bob", 500_dec);
    }

    AccountLedger ledger;
};

//-------------------------------------------------------------------------

TEST_F(AccountLedgerTest, UnknownAccountHasEmptyBalance)
{
    EXPECT_EQ(ledger.balance("nobody"), Balance{});
    EXPECT_FALSE(ledger.contains("nobody"));
}

TEST_F(AccountLedgerTest, CreditAndDebitTrackTotal)
{
    EXPECT_EQ(ledger.totalMargin(), 650_dec);
    ledger.debit("alice", 50_dec);
    EXPECT_EQ(ledger.balance("alice"), Balance{100_dec});
    EXPECT_EQ(ledger.totalMargin(), 600_dec);
    EXPECT_NO_THROW(ledger.checkConsistency());
}

TEST_F(AccountLedgerTest, PrepareDoesNotMutate)
{
    const auto txn = ledger.prepareDebit("alice", 50_dec);
    EXPECT_EQ(txn.at("alice").before, Balance{150_dec});
    EXPECT_EQ(txn.at("alice").after, Balance{100_dec});
    EXPECT_EQ(txn.totalMarginAfter, 600_dec);
    EXPECT_EQ(ledger.balance("alice"), Balance{150_dec});
    EXPECT_EQ(ledger.totalMargin(), 650_dec);
    EXPECT_THROW(static_cast<void>(txn.at("bob")), std::out_of_range);
}

TEST_F(AccountLedgerTest, DebitBeyondMarginIsRejected)
{
    EXPECT_THAT(
        [&] { ledger.debit("alice", DEC(150.000001)); },
        ThrowsLedgerError(LedgerError::INSUFFICIENT_BALANCE));
    EXPECT_THAT(
        [&] { ledger.debit("nobody", 1_dec); },
        ThrowsLedgerError(LedgerError::INSUFFICIENT_BALANCE));
    EXPECT_EQ(ledger.balance("alice"), Balance{150_dec});
}

TEST_F(AccountLedgerTest, NegativeAmountsAreRejected)
{
    EXPECT_THAT(
        [&] { ledger.credit("alice", DEC(-1.0)); }, ThrowsLedgerError(LedgerError::INVALID_AMOUNT));
    EXPECT_THAT(
        [&] { ledger.debit("alice", DEC(-1.0)); }, ThrowsLedgerError(LedgerError::INVALID_AMOUNT));
}

TEST_F(AccountLedgerTest, DebitOfWholeMarginLeavesZero)
{
    ledger.debit("alice", 150_dec);
    EXPECT_EQ(ledger.balance("alice"), Balance{0_dec});
    EXPECT_NO_THROW(ledger.debit("alice", 0_dec));
}

TEST_F(AccountLedgerTest, TradeMovesCostAndPosition)
{
    ledger.commit(ledger.prepareTrade("bob", "alice", 10_dec, 1000_dec));
    EXPECT_EQ(ledger.balance("bob"), Balance(DEC(-500.0), 10_dec));
    EXPECT_EQ(ledger.balance("alice"), Balance(1150_dec, DEC(-10.0)));
    EXPECT_EQ(ledger.totalMargin(), 650_dec);
    EXPECT_EQ(ledger.sumPosition(), wide_decimal_t{0});
    EXPECT_NO_THROW(ledger.checkConsistency());
}

TEST_F(AccountLedgerTest, IllFormedTradesAreRejected)
{
    EXPECT_THAT(
        [&] { static_cast<void>(ledger.prepareTrade("alice", "alice", 1_dec, 1_dec)); },
        ThrowsLedgerError(LedgerError::INVALID_TRADE));
    EXPECT_THAT(
        [&] { static_cast<void>(ledger.prepareTrade("bob", "alice", 0_dec, 1_dec)); },
        ThrowsLedgerError(LedgerError::INVALID_AMOUNT));
    EXPECT_THAT(
        [&] { static_cast<void>(ledger.prepareTrade("bob", "alice", 1_dec, DEC(-1.0))); },
        ThrowsLedgerError(LedgerError::INVALID_AMOUNT));
}

TEST_F(AccountLedgerTest, StaleTransactionIsRejected)
{
    const auto txn = ledger.prepareDebit("alice", 50_dec);
    ledger.credit("alice", 1_dec);
    EXPECT_THAT(
        [&] { ledger.commit(txn); },
        ThrowsLedgerError(LedgerError::INTERNAL_INVARIANT_VIOLATION));
    EXPECT_EQ(ledger.balance("alice"), Balance{151_dec});
}

TEST(AccountLedgerExactnessTest, InexactSumIsRejected)
{
    AccountLedger ledger;
    ledger.credit("carol", 9999999999999999_dec);
    EXPECT_THAT(
        [&] { ledger.credit("carol", DEC(0.1)); },
        ThrowsLedgerError(LedgerError::INVALID_AMOUNT));
}

//-------------------------------------------------------------------------

TEST_F(AccountLedgerTest, CheckpointRoundTrip)
{
    ledger.commit(ledger.prepareTrade("bob", "alice", DEC(2.5), 250_dec));

    rapidjson::Document json;
    ledger.checkpointSerialize(json);
    const auto restored = AccountLedger::fromJson(json);

    EXPECT_EQ(restored.totalMargin(), ledger.totalMargin());
    EXPECT_EQ(restored.accounts(), ledger.accounts());
}

TEST_F(AccountLedgerTest, JsonRoundTrip)
{
    rapidjson::Document json;
    ledger.jsonSerialize(json);
    ASSERT_TRUE(json["totalMargin"].IsString());
    const auto restored = AccountLedger::fromJson(json);
    EXPECT_EQ(restored.accounts(), ledger.accounts());
}

TEST(AccountLedgerRestoreTest, InconsistentTotalIsRejected)
{
    const auto doc = json::str2json(
        R"({"totalMargin": "100", "accounts": {"alice": {"margin": "90", "position": "0"}}})");
    EXPECT_THAT(
        [&] { static_cast<void>(AccountLedger::fromJson(doc)); },
        ThrowsLedgerError(LedgerError::INTERNAL_INVARIANT_VIOLATION));
}

TEST(AccountLedgerRestoreTest, UnbalancedPositionsAreRejected)
{
    const auto doc = json::str2json(
        R"({"totalMargin": "100", "accounts": {"alice": {"margin": "100", "position": "1"}}})");
    EXPECT_THAT(
        [&] { static_cast<void>(AccountLedger::fromJson(doc)); },
        ThrowsLedgerError(LedgerError::INTERNAL_INVARIANT_VIOLATION));
}

TEST(AccountLedgerRestoreTest, NegativeMarginWithoutPositionIsRejected)
{
    const auto doc = json::str2json(
        R"({"totalMargin": "0", "accounts": {)"
        R"("alice": {"margin": "-10", "position": "0"},)"
        R"("bob": {"margin": "10", "position": "0"}}})");
    EXPECT_THAT(
        [&] { static_cast<void>(AccountLedger::fromJson(doc)); },
        ThrowsLedgerError(LedgerError::INTERNAL_INVARIANT_VIOLATION));
}

//-------------------------------------------------------------------------
