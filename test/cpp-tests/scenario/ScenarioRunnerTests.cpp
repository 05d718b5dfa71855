/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "margincore/scenario/ScenarioRunner.hpp"
#include "margincore/serialization/json_util.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace margincore;
using namespace margincore::accounting;
using namespace margincore::scenario;
using namespace margincore::literals;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

constexpr const char* s_scenario = R"(
<Scenario>
    <Margin marginDecimals="6" minCollateral="1"/>
    <Custody>
        <Wallet id="alice" balance="1000"/>
        <Wallet id="bob" balance="1000"/>
    </Custody>
    <Oracle price="100"/>
    <Operations>
        <Deposit account="alice" amount="850"/>
        <Deposit account="bob" amount="850"/>
        <Withdraw account="alice" amount="10" caller="bob"/>
        <SetLocalOperator owner="alice" identity="bob"/>
        <Withdraw account="alice" amount="10" caller="bob"/>
        <Trade buyer="bob" seller="alice" size="10" price="100"/>
        <SetPrice price="184"/>
        <Withdraw account="alice" amount="1"/>
        <SetPrice unavailable="true"/>
        <Withdraw account="alice" amount="1"/>
    </Operations>
</Scenario>
)";

std::unique_ptr<ScenarioRunner> load(const char* xml)
{
    pugi::xml_document doc;
    if (!doc.load_string(xml)) {
        throw std::runtime_error{"Unable to parse test scenario"};
    }
    return ScenarioRunner::fromXml(doc.child("Scenario"));
}

}  // namespace

//-------------------------------------------------------------------------

TEST(ScenarioRunnerTest, RunsOperationsInOrder)
{
    auto runner = load(s_scenario);
    const auto outcomes = runner->run();

    ASSERT_THAT(outcomes, SizeIs(10));
    EXPECT_TRUE(outcomes[0].ok());
    EXPECT_TRUE(outcomes[1].ok());
    EXPECT_EQ(outcomes[2].error, LedgerError::UNAUTHORIZED);
    EXPECT_TRUE(outcomes[3].ok());
    EXPECT_TRUE(outcomes[4].ok());
    EXPECT_TRUE(outcomes[5].ok());
    EXPECT_TRUE(outcomes[6].ok());
    // Equity 1840 - 10 * 184 = 0, so any positive withdrawal fails.
    EXPECT_EQ(outcomes[7].error, LedgerError::UNDERCOLLATERALIZED);
    EXPECT_EQ(outcomes[9].error, LedgerError::PRICE_UNAVAILABLE);

    EXPECT_EQ(outcomes[2].operation, "Withdraw");
    EXPECT_EQ(outcomes[2].step, 3u);

    EXPECT_EQ(runner->engine().getAccountBalance("alice"), Balance(1840_dec, DEC(-10.0)));
    EXPECT_EQ(runner->custody().balanceOf("bob"), 160_dec);
    EXPECT_EQ(runner->engine().getTotalMargin(), runner->custody().custodyBalance());
}

TEST(ScenarioRunnerTest, OutcomeFormatting)
{
    const OperationOutcome ok{.step = 1, .operation = "Deposit"};
    EXPECT_EQ(fmt::format("{}", ok), "#1 Deposit: OK");

    const OperationOutcome failed{
        .step = 2,
        .operation = "Withdraw",
        .error = LedgerError::UNAUTHORIZED,
        .message = "denied"
    };
    EXPECT_EQ(fmt::format("{}", failed), "#2 Withdraw: UNAUTHORIZED (denied)");
}

TEST(ScenarioRunnerTest, UnknownOperationThrows)
{
    auto runner = load(R"(<Scenario><Operations><Mint account="alice"/></Operations></Scenario>)");
    EXPECT_THROW(static_cast<void>(runner->run()), std::invalid_argument);
}

TEST(ScenarioRunnerTest, MissingAttributeThrows)
{
    auto runner = load(R"(<Scenario><Operations><Deposit amount="1"/></Operations></Scenario>)");
    EXPECT_THROW(static_cast<void>(runner->run()), std::invalid_argument);
}

TEST(ScenarioRunnerTest, CheckpointRestoresEngineAndCustody)
{
    const fs::path path = fs::temp_directory_path() / "margincore-scenario-checkpoint.json";

    auto runner = load(s_scenario);
    static_cast<void>(runner->run());
    runner->writeCheckpoint(path);

    auto restored = load(R"(<Scenario><Oracle price="184"/></Scenario>)");
    restored->restoreCheckpoint(path);

    EXPECT_EQ(
        restored->engine().getAccountBalance("alice"),
        runner->engine().getAccountBalance("alice"));
    EXPECT_EQ(restored->engine().settlementIndex(), runner->engine().settlementIndex());
    EXPECT_EQ(restored->custody().balanceOf("bob"), 160_dec);
    EXPECT_TRUE(restored->engine().canWithdraw("alice", "bob"));
    EXPECT_NO_THROW(restored->engine().verifySolvency());

    fs::remove(path);
}

TEST(ScenarioRunnerTest, InconsistentCheckpointKeepsCurrentState)
{
    const fs::path path = fs::temp_directory_path() / "margincore-inconsistent-checkpoint.json";

    auto runner = load(s_scenario);
    static_cast<void>(runner->run());
    runner->writeCheckpoint(path);
    {
        auto json = json::loadJson(path);
        json["engine"]["ledger"]["totalMargin"].SetUint64(util::packDecimal(1_dec));
        std::ofstream ofs{path};
        json::dumpJson(json, ofs);
    }

    const auto& custodyBefore = runner->custody();
    EXPECT_THROW(runner->restoreCheckpoint(path), LedgerException);

    EXPECT_EQ(&runner->custody(), &custodyBefore);
    EXPECT_EQ(runner->engine().getAccountBalance("alice"), Balance(1840_dec, DEC(-10.0)));
    EXPECT_EQ(runner->custody().balanceOf("bob"), 160_dec);
    EXPECT_NO_THROW(runner->engine().verifySolvency());
    EXPECT_FALSE(runner->engine().halted());

    fs::remove(path);
}

TEST(ScenarioRunnerTest, CheckpointWithoutCustodyIsRejected)
{
    const fs::path path = fs::temp_directory_path() / "margincore-partial-checkpoint.json";

    auto runner = load(s_scenario);
    static_cast<void>(runner->run());
    runner->writeCheckpoint(path);
    {
        auto json = json::loadJson(path);
        json.RemoveMember("custody");
        std::ofstream ofs{path};
        json::dumpJson(json, ofs);
    }

    EXPECT_THAT(
        [&] { runner->restoreCheckpoint(path); },
        Throws<std::invalid_argument>(
            Property(&std::invalid_argument::what, HasSubstr("custody"))));
    EXPECT_EQ(runner->engine().getTotalMargin(), runner->custody().custodyBalance());
    EXPECT_EQ(runner->engine().getAccountBalance("bob").getPosition(), 10_dec);

    fs::remove(path);
}

//-------------------------------------------------------------------------
