/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "margincore/accounting/Collateral.hpp"
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

struct CollateralTestParams
{
    decimal_t minCollateral;
    decimal_t margin;
    decimal_t position;
    decimal_t price;
    bool refValue;
};

void PrintTo(const CollateralTestParams& params, std::ostream* os)
{
    *os << fmt::format(
        "{{.minCollateral = {}, .margin = {}, .position = {}, .price = {}, .refValue = {}}}",
        params.minCollateral,
        params.margin,
        params.position,
        params.price,
        params.refValue);
}

//-------------------------------------------------------------------------

struct IsCollateralizedTest : TestWithParam<CollateralTestParams>
{
    virtual void SetUp() override
    {
        const auto [minCollateral, margin, position, price, refValue] = GetParam();
        this->coll = Collateral{minCollateral};
        this->bal = Balance{margin, position};
        this->price = price;
        this->refValue = refValue;
    }

    Collateral coll;
    Balance bal;
    decimal_t price;
    bool refValue;
};

TEST_P(IsCollateralizedTest, WorksCorrectly)
{
    EXPECT_EQ(coll.isCollateralized(bal, price), refValue);
}

INSTANTIATE_TEST_SUITE_P(
    CollateralTests,
    IsCollateralizedTest,
    Values(
        // Flat accounts.
        CollateralTestParams{
            .minCollateral = 1_dec, .margin = 0_dec, .position = 0_dec,
            .price = 100_dec, .refValue = true
        },
        CollateralTestParams{
            .minCollateral = 1_dec, .margin = 150_dec, .position = 0_dec,
            .price = 100_dec, .refValue = true
        },
        // Short, equity exactly zero.
        CollateralTestParams{
            .minCollateral = 1_dec, .margin = 1150_dec, .position = DEC(-10.0),
            .price = 115_dec, .refValue = true
        },
        CollateralTestParams{
            .minCollateral = 1_dec, .margin = 1149_dec, .position = DEC(-10.0),
            .price = 115_dec, .refValue = false
        },
        CollateralTestParams{
            .minCollateral = 1_dec, .margin = 1150_dec, .position = DEC(-10.0),
            .price = DEC(115.00000001), .refValue = false
        },
        // Long with debt.
        CollateralTestParams{
            .minCollateral = 1_dec, .margin = DEC(-500.0), .position = 10_dec,
            .price = 50_dec, .refValue = true
        },
        CollateralTestParams{
            .minCollateral = 1_dec, .margin = DEC(-500.0), .position = 10_dec,
            .price = DEC(49.99999999), .refValue = false
        },
        CollateralTestParams{
            .minCollateral = 1_dec, .margin = 0_dec, .position = 10_dec,
            .price = 0_dec, .refValue = true
        },
        // Ratio above one.
        CollateralTestParams{
            .minCollateral = DEC(1.1), .margin = 1100_dec, .position = DEC(-10.0),
            .price = 100_dec, .refValue = true
        },
        CollateralTestParams{
            .minCollateral = DEC(1.1), .margin = 1099_dec, .position = DEC(-10.0),
            .price = 100_dec, .refValue = false
        },
        CollateralTestParams{
            .minCollateral = DEC(1.1), .margin = DEC(-1000.0), .position = 11_dec,
            .price = 100_dec, .refValue = true
        }
    ));

//-------------------------------------------------------------------------

TEST(CollateralTest, StatusReportsEquity)
{
    const Collateral coll;
    const auto status = coll.status(1150_dec, DEC(-10.0), 100_dec);
    EXPECT_EQ(status.equity, util::widen(150_dec));
    EXPECT_EQ(status.positiveValue, util::widen(1150_dec));
    EXPECT_EQ(status.negativeValue, util::widen(1000_dec));
    EXPECT_EQ(status.requiredValue, util::widen(1000_dec));
    EXPECT_TRUE(status.collateralized);
}

TEST(CollateralTest, NegativeMarginWithoutPositionIsAnInvariantViolation)
{
    const Collateral coll;
    EXPECT_THAT(
        [&] { static_cast<void>(coll.status(DEC(-1.0), 0_dec, 100_dec)); },
        ThrowsLedgerError(LedgerError::INTERNAL_INVARIANT_VIOLATION));
}

TEST(CollateralTest, InvalidInputsThrow)
{
    EXPECT_THROW(Collateral{DEC(0.99)}, std::invalid_argument);
    const Collateral coll;
    EXPECT_THROW(
        static_cast<void>(coll.status(100_dec, 1_dec, DEC(-1.0))), std::invalid_argument);
}

//-------------------------------------------------------------------------
