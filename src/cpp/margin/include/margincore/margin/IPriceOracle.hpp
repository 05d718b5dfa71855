/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "margincore/common.hpp"

//-------------------------------------------------------------------------

namespace margincore::margin
{

//-------------------------------------------------------------------------

class IPriceOracle
{
public:
    virtual ~IPriceOracle() = default;

    // Empty while the oracle is unavailable.
    [[nodiscard]] virtual std::optional<decimal_t> currentPrice() = 0;

protected:
    IPriceOracle() = default;
};

//-------------------------------------------------------------------------

}  // namespace margincore::margin

//-------------------------------------------------------------------------
