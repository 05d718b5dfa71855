/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "margincore/margin/MarginEventLogger.hpp"

#include <spdlog/sinks/basic_file_sink.h>

//-------------------------------------------------------------------------

namespace margincore::margin
{

//-------------------------------------------------------------------------

MarginEventLogger::MarginEventLogger(const fs::path& filepath, MarginSignals& signals)
    : m_filepath{filepath}
{
    fs::remove(filepath);
    m_logger = std::make_unique<spdlog::logger>(
        fmt::format("MarginEventLogger-{}", filepath.stem().c_str()),
        std::make_unique<spdlog::sinks::basic_file_sink_st>(filepath));
    m_logger->set_level(spdlog::level::trace);
    m_logger->set_pattern("%v");
    m_logger->trace("Index,Event,Account,Counterparty,Amount,Price");
    m_logger->flush();

    m_connections.emplace_back(signals.indexUpdated.connect(
        [this](const IndexUpdatedEvent& event) { log(event); }));
    m_connections.emplace_back(signals.deposit.connect(
        [this](const DepositEvent& event) { log(event); }));
    m_connections.emplace_back(signals.withdrawal.connect(
        [this](const WithdrawalEvent& event) { log(event); }));
    m_connections.emplace_back(signals.trade.connect(
        [this](const TradeEvent& event) { log(event); }));
}

//-------------------------------------------------------------------------

void MarginEventLogger::log(const IndexUpdatedEvent& event)
{
    m_lastIndex = event.index;
    write("IndexUpdated", event.account, {}, event.amount);
}

//-------------------------------------------------------------------------

void MarginEventLogger::log(const DepositEvent& event)
{
    write("Deposit", event.account, event.payer, event.amount);
}

//-------------------------------------------------------------------------

void MarginEventLogger::log(const WithdrawalEvent& event)
{
    write("Withdrawal", event.account, event.destination, event.amount);
}

//-------------------------------------------------------------------------

void MarginEventLogger::log(const TradeEvent& event)
{
    write("Trade", event.buyer, event.seller, event.size, event.price);
}

//-------------------------------------------------------------------------

void MarginEventLogger::write(
    std::string_view name,
    const AccountId& account,
    const AccountId& counterparty,
    decimal_t amount,
    std::optional<decimal_t> price)
{
    m_logger->trace(fmt::format(
        "{},{},{},{},{},{}",
        m_lastIndex,
        name,
        account,
        counterparty,
        amount,
        price.has_value() ? util::decimal2str(*price) : std::string{}));
    m_logger->flush();
}

//-------------------------------------------------------------------------

}  // namespace margincore::margin

//-------------------------------------------------------------------------
