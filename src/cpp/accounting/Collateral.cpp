/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "margincore/accounting/Collateral.hpp"

#include "margincore/accounting/LedgerError.hpp"

//-------------------------------------------------------------------------

namespace margincore::accounting
{

//-------------------------------------------------------------------------

Collateral::Collateral(decimal_t minCollateral)
    : m_minCollateral{minCollateral}
{
    if (!util::isFinite(minCollateral) || minCollateral < 1_dec) {
        throw std::invalid_argument{fmt::format(
            "{}: minCollateral must be at least 1, was {}",
            std::source_location::current().function_name(),
            minCollateral)};
    }
}

//-------------------------------------------------------------------------

CollateralStatus Collateral::status(decimal_t margin, decimal_t position, decimal_t price) const
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (!util::isFinite(price) || price < 0_dec) {
        throw std::invalid_argument{fmt::format(
            "{}: Price must be non-negative, was {}", ctx, price)};
    }

    const wide_decimal_t zero{0};
    const wide_decimal_t wideMargin = util::widen(margin);

    if (position == 0_dec) {
        if (margin < 0_dec) {
            throw LedgerException{
                LedgerError::INTERNAL_INVARIANT_VIOLATION,
                fmt::format("{}: Negative margin {} without a position", ctx, margin)};
        }
        return {
            .equity = wideMargin,
            .positiveValue = wideMargin,
            .negativeValue = zero,
            .requiredValue = zero,
            .collateralized = true
        };
    }

    const wide_decimal_t positionValue = util::widen(position) * util::widen(price);

    wide_decimal_t positiveValue = zero;
    wide_decimal_t negativeValue = zero;
    for (const wide_decimal_t part : {wideMargin, positionValue}) {
        if (part > zero) {
            positiveValue += part;
        } else {
            negativeValue -= part;
        }
    }
    const wide_decimal_t requiredValue = negativeValue * util::widen(m_minCollateral);

    return {
        .equity = util::fma(util::widen(position), util::widen(price), wideMargin),
        .positiveValue = positiveValue,
        .negativeValue = negativeValue,
        .requiredValue = requiredValue,
        .collateralized = positiveValue >= requiredValue
    };
}

//-------------------------------------------------------------------------

CollateralStatus Collateral::status(const Balance& balance, decimal_t price) const
{
    return status(balance.getMargin(), balance.getPosition(), price);
}

//-------------------------------------------------------------------------

bool Collateral::isCollateralized(decimal_t margin, decimal_t position, decimal_t price) const
{
    return status(margin, position, price).collateralized;
}

//-------------------------------------------------------------------------

bool Collateral::isCollateralized(const Balance& balance, decimal_t price) const
{
    return status(balance, price).collateralized;
}

//-------------------------------------------------------------------------

}  // namespace margincore::accounting

//-------------------------------------------------------------------------
