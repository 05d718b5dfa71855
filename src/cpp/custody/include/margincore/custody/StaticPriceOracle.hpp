/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "margincore/margin/IPriceOracle.hpp"

#include <mutex>

//-------------------------------------------------------------------------

namespace margincore::custody
{

//-------------------------------------------------------------------------

class StaticPriceOracle : public margin::IPriceOracle
{
public:
    StaticPriceOracle() noexcept = default;
    explicit StaticPriceOracle(decimal_t price);

    void setPrice(decimal_t price);
    void setUnavailable();

    [[nodiscard]] virtual std::optional<decimal_t> currentPrice() override;

private:
    std::optional<decimal_t> m_price;
    std::mutex m_mtx;
};

//-------------------------------------------------------------------------

}  // namespace margincore::custody

//-------------------------------------------------------------------------
