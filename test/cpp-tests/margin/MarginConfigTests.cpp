/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "margincore/margin/MarginConfig.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace margincore;
using namespace margincore::margin;
using namespace margincore::literals;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

MarginConfig parse(const char* xml)
{
    pugi::xml_document doc;
    const pugi::xml_parse_result result = doc.load_string(xml);
    if (!result) {
        throw std::runtime_error{result.description()};
    }
    return makeMarginConfig(doc.child("Margin"));
}

}  // namespace

//-------------------------------------------------------------------------

TEST(MarginConfigTest, Defaults)
{
    const auto config = parse("<Margin/>");
    EXPECT_EQ(config.marginDecimals, 6u);
    EXPECT_EQ(config.positionDecimals, 8u);
    EXPECT_EQ(config.priceDecimals, 8u);
    EXPECT_EQ(config.minCollateral, 1_dec);
    EXPECT_EQ(config.transferRetries, 0u);
    EXPECT_EQ(config.oracleRetries, 0u);
    EXPECT_TRUE(config.reconcileCustody);
}

TEST(MarginConfigTest, AttributesOverrideDefaults)
{
    const auto config = parse(
        R"(<Margin marginDecimals="2" positionDecimals="4" priceDecimals="3" )"
        R"(minCollateral="1.25" transferRetries="3" oracleRetries="1" )"
        R"(reconcileCustody="false"/>)");
    EXPECT_EQ(config.marginDecimals, 2u);
    EXPECT_EQ(config.positionDecimals, 4u);
    EXPECT_EQ(config.priceDecimals, 3u);
    EXPECT_EQ(config.minCollateral, DEC(1.25));
    EXPECT_EQ(config.transferRetries, 3u);
    EXPECT_EQ(config.oracleRetries, 1u);
    EXPECT_FALSE(config.reconcileCustody);
}

//-------------------------------------------------------------------------

struct InvalidMarginConfigTest : TestWithParam<std::string> {};

TEST_P(InvalidMarginConfigTest, Throws)
{
    EXPECT_THROW(static_cast<void>(parse(GetParam().c_str())), std::invalid_argument);
}

INSTANTIATE_TEST_SUITE_P(
    MarginConfigTests,
    InvalidMarginConfigTest,
    Values(
        R"(<Margin marginDecimals="0"/>)",
        R"(<Margin positionDecimals="17"/>)",
        R"(<Margin priceDecimals="0"/>)",
        R"(<Margin minCollateral="0.5"/>)",
        R"(<Margin minCollateral="lots"/>)",
        R"(<Margin transferRetries="101"/>)",
        R"(<Margin oracleRetries="4294967295"/>)"
    ));

//-------------------------------------------------------------------------

TEST(MarginConfigTest, ErrorNamesAttribute)
{
    EXPECT_THAT(
        [] { static_cast<void>(parse(R"(<Margin priceDecimals="20"/>)")); },
        Throws<std::invalid_argument>(
            Property(&std::invalid_argument::what, HasSubstr("priceDecimals"))));
    EXPECT_THAT(
        [] { static_cast<void>(parse(R"(<Margin transferRetries="4294967295"/>)")); },
        Throws<std::invalid_argument>(
            Property(&std::invalid_argument::what, HasSubstr("transferRetries"))));
}

TEST(MarginConfigTest, RetryBoundIsInclusive)
{
    const auto config = parse(R"(<Margin transferRetries="100" oracleRetries="100"/>)");
    EXPECT_EQ(config.transferRetries, kMaxRetries);
    EXPECT_EQ(config.oracleRetries, kMaxRetries);
}

//-------------------------------------------------------------------------
