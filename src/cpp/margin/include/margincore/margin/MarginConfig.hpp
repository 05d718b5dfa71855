/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "margincore/common.hpp"

#include <pugixml.hpp>

//-------------------------------------------------------------------------

namespace margincore::margin
{

inline constexpr uint32_t kMaxRetries = 100;

struct MarginConfig
{
    uint32_t marginDecimals = 6;
    uint32_t positionDecimals = 8;
    uint32_t priceDecimals = 8;
    decimal_t minCollateral = 1_dec;
    uint32_t transferRetries = 0;
    uint32_t oracleRetries = 0;
    bool reconcileCustody = true;
};

[[nodiscard]] MarginConfig makeMarginConfig(pugi::xml_node node);

uint32_t validateDecimalPlaces(
    uint32_t decimalPlaces,
    std::string_view attribute,
    std::source_location sl = std::source_location::current());

uint32_t validateRetries(
    uint32_t retries,
    std::string_view attribute,
    std::source_location sl = std::source_location::current());

}  // namespace margincore::margin

//-------------------------------------------------------------------------
