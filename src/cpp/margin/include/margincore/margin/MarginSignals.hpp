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

struct IndexUpdatedEvent
{
    SettlementIndex index;
    AccountId account;
    decimal_t amount;
};

struct DepositEvent
{
    AccountId account;
    AccountId payer;
    decimal_t amount;
};

struct WithdrawalEvent
{
    AccountId account;
    AccountId destination;
    decimal_t amount;
};

struct TradeEvent
{
    AccountId buyer;
    AccountId seller;
    decimal_t size;
    decimal_t price;
    decimal_t cost;
};

//-------------------------------------------------------------------------

// Emitted after commit while the engine still holds its lock; slots must not
// call back into the engine. An exception thrown by a slot is logged and
// skips the remaining slots of that signal only.
struct MarginSignals
{
    Signal<void(const IndexUpdatedEvent&)> indexUpdated;
    Signal<void(const DepositEvent&)> deposit;
    Signal<void(const WithdrawalEvent&)> withdrawal;
    Signal<void(const TradeEvent&)> trade;
};

//-------------------------------------------------------------------------

}  // namespace margincore::margin

//-------------------------------------------------------------------------
