/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "margincore/accounting/Balance.hpp"
#include "margincore/common.hpp"

//-------------------------------------------------------------------------

namespace margincore::accounting
{

//-------------------------------------------------------------------------

struct CollateralStatus
{
    wide_decimal_t equity{0};
    wide_decimal_t positiveValue{0};
    wide_decimal_t negativeValue{0};
    wide_decimal_t requiredValue{0};
    bool collateralized{true};
};

//-------------------------------------------------------------------------

/**
 * Mark-to-market solvency check of a (margin, position) pair.
 *
 * The positive and negative parts of margin and position * price are summed
 * separately; the account is collateralized iff
 *
 *     positiveValue >= negativeValue * minCollateral
 *
 * With minCollateral = 1 this reduces to margin + position * price >= 0.
 * The boundary is inclusive. All products are taken in 128-bit decimal.
 */
class Collateral
{
public:
    explicit Collateral(decimal_t minCollateral = 1_dec);

    [[nodiscard]] decimal_t minCollateral() const noexcept { return m_minCollateral; }

    [[nodiscard]] CollateralStatus status(
        decimal_t margin, decimal_t position, decimal_t price) const;
    [[nodiscard]] CollateralStatus status(const Balance& balance, decimal_t price) const;

    [[nodiscard]] bool isCollateralized(
        decimal_t margin, decimal_t position, decimal_t price) const;
    [[nodiscard]] bool isCollateralized(const Balance& balance, decimal_t price) const;

private:
    decimal_t m_minCollateral;
};

//-------------------------------------------------------------------------

}  // namespace margincore::accounting

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<margincore::accounting::CollateralStatus>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const margincore::accounting::CollateralStatus& status, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "CollateralStatus{{.equity = {}, .positiveValue = {}, .negativeValue = {}, "
            ".requiredValue = {}, .collateralized = {}}}",
            status.equity,
            status.positiveValue,
            status.negativeValue,
            status.requiredValue,
            status.collateralized);
    }
};

//-------------------------------------------------------------------------
