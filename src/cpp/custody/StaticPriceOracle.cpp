/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "margincore/custody/StaticPriceOracle.hpp"

//-------------------------------------------------------------------------

namespace margincore::custody
{

//-------------------------------------------------------------------------

StaticPriceOracle::StaticPriceOracle(decimal_t price)
{
    setPrice(price);
}

//-------------------------------------------------------------------------

void StaticPriceOracle::setPrice(decimal_t price)
{
    if (!util::isFinite(price) || price < 0_dec) {
        throw std::invalid_argument{fmt::format(
            "{}: Price should be finite and non-negative, was {}",
            std::source_location::current().function_name(), price)};
    }
    std::lock_guard lock{m_mtx};
    m_price = price;
}

//-------------------------------------------------------------------------

void StaticPriceOracle::setUnavailable()
{
    std::lock_guard lock{m_mtx};
    m_price.reset();
}

//-------------------------------------------------------------------------

std::optional<decimal_t> StaticPriceOracle::currentPrice()
{
    std::lock_guard lock{m_mtx};
    return m_price;
}

//-------------------------------------------------------------------------

}  // namespace margincore::custody

//-------------------------------------------------------------------------
