/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "margincore/margin/MarginConfig.hpp"

#include <fmt/format.h>

//-------------------------------------------------------------------------

namespace margincore::margin
{

//-------------------------------------------------------------------------

MarginConfig makeMarginConfig(pugi::xml_node node)
{
    static constexpr auto sl = std::source_location::current();

    const MarginConfig defaults;

    const auto minCollateral = [&] {
        const std::string str = node.attribute("minCollateral").as_string("1");
        const auto parsed = util::parseDecimal(str);
        if (!parsed.has_value()) {
            throw std::invalid_argument{fmt::format(
                "{}: 'minCollateral' must be a decimal literal, was '{}'",
                sl.function_name(), str)};
        }
        if (parsed.value() < 1_dec) {
            throw std::invalid_argument{fmt::format(
                "{}: 'minCollateral' must be at least 1, was {}",
                sl.function_name(), parsed.value())};
        }
        return parsed.value();
    }();

    return {
        .marginDecimals = validateDecimalPlaces(
            node.attribute("marginDecimals").as_uint(defaults.marginDecimals),
            "marginDecimals", sl),
        .positionDecimals = validateDecimalPlaces(
            node.attribute("positionDecimals").as_uint(defaults.positionDecimals),
            "positionDecimals", sl),
        .priceDecimals = validateDecimalPlaces(
            node.attribute("priceDecimals").as_uint(defaults.priceDecimals),
            "priceDecimals", sl),
        .minCollateral = minCollateral,
        .transferRetries = validateRetries(
            node.attribute("transferRetries").as_uint(defaults.transferRetries),
            "transferRetries", sl),
        .oracleRetries = validateRetries(
            node.attribute("oracleRetries").as_uint(defaults.oracleRetries),
            "oracleRetries", sl),
        .reconcileCustody = node.attribute("reconcileCustody").as_bool(defaults.reconcileCustody)
    };
}

//-------------------------------------------------------------------------

uint32_t validateDecimalPlaces(
    uint32_t decimalPlaces, std::string_view attribute, std::source_location sl)
{
    if (!(decimalPlaces > 0 && decimalPlaces <= util::kMaxDecimalPlaces)) {
        throw std::invalid_argument{fmt::format(
            "{}: '{}' should be in (0, {}], was {}",
            sl.function_name(), attribute, util::kMaxDecimalPlaces, decimalPlaces)};
    }
    return decimalPlaces;
}

//-------------------------------------------------------------------------

uint32_t validateRetries(uint32_t retries, std::string_view attribute, std::source_location sl)
{
    if (retries > kMaxRetries) {
        throw std::invalid_argument{fmt::format(
            "{}: '{}' should be at most {}, was {}",
            sl.function_name(), attribute, kMaxRetries, retries)};
    }
    return retries;
}

//-------------------------------------------------------------------------

}  // namespace margincore::margin

//-------------------------------------------------------------------------
