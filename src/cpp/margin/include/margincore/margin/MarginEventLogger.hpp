/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "margincore/margin/MarginSignals.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace margincore::margin
{

//-------------------------------------------------------------------------

/**
 * Writes every engine event as one CSV row:
 *
 *     Index,Event,Account,Counterparty,Amount,Price
 *
 * Deposit, Withdrawal and Trade rows carry the index of the IndexUpdated row
 * emitted just before them.
 */
class MarginEventLogger
{
public:
    MarginEventLogger(const fs::path& filepath, MarginSignals& signals);

    [[nodiscard]] const fs::path& filepath() const noexcept { return m_filepath; }

private:
    void log(const IndexUpdatedEvent& event);
    void log(const DepositEvent& event);
    void log(const WithdrawalEvent& event);
    void log(const TradeEvent& event);

    void write(
        std::string_view name,
        const AccountId& account,
        const AccountId& counterparty,
        decimal_t amount,
        std::optional<decimal_t> price = {});

    fs::path m_filepath;
    std::unique_ptr<spdlog::logger> m_logger;
    SettlementIndex m_lastIndex{};
    std::vector<bs2::scoped_connection> m_connections;
};

//-------------------------------------------------------------------------

}  // namespace margincore::margin

//-------------------------------------------------------------------------
