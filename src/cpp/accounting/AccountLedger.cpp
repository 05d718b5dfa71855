/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "margincore/accounting/AccountLedger.hpp"

//-------------------------------------------------------------------------

namespace margincore::accounting
{

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] decimal_t exactSum(
    decimal_t lhs, decimal_t rhs, std::string_view what, std::string_view ctx)
{
    auto sum = util::narrowExact(util::widen(lhs) + util::widen(rhs));
    if (!sum.has_value()) {
        throw LedgerException{
            LedgerError::INVALID_AMOUNT,
            fmt::format(
                "{}: {} {} + {} is not exactly representable", ctx, what, lhs, rhs)};
    }
    return *sum;
}

}  // namespace

//-------------------------------------------------------------------------

const BalanceUpdate& LedgerTransaction::at(const AccountId& account) const
{
    auto it = ranges::find(updates, account, &BalanceUpdate::account);
    if (it == updates.end()) {
        throw std::out_of_range{fmt::format(
            "{}: No update for account '{}'",
            std::source_location::current().function_name(),
            account)};
    }
    return *it;
}

//-------------------------------------------------------------------------

Balance AccountLedger::balance(const AccountId& account) const
{
    if (auto it = m_accounts.find(account); it != m_accounts.end()) {
        return it->second;
    }
    return Balance{};
}

//-------------------------------------------------------------------------

bool AccountLedger::contains(const AccountId& account) const
{
    return m_accounts.contains(account);
}

//-------------------------------------------------------------------------

wide_decimal_t AccountLedger::sumMargin() const
{
    return ranges::accumulate(
        m_accounts | views::values | views::transform(&Balance::getMargin),
        wide_decimal_t{0},
        [](wide_decimal_t acc, decimal_t val) { return acc + util::widen(val); });
}

//-------------------------------------------------------------------------

wide_decimal_t AccountLedger::sumPosition() const
{
    return ranges::accumulate(
        m_accounts | views::values | views::transform(&Balance::getPosition),
        wide_decimal_t{0},
        [](wide_decimal_t acc, decimal_t val) { return acc + util::widen(val); });
}

//-------------------------------------------------------------------------

LedgerTransaction AccountLedger::prepareCredit(const AccountId& account, decimal_t amount) const
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (!util::isFinite(amount) || amount < 0_dec) {
        throw LedgerException{
            LedgerError::INVALID_AMOUNT,
            fmt::format("{}: Credit amount must be non-negative, was {}", ctx, amount)};
    }

    const Balance before = balance(account);
    return {
        .updates = {{
            .account = account,
            .before = before,
            .after = Balance{
                exactSum(before.getMargin(), amount, "margin", ctx), before.getPosition()}
        }},
        .totalMarginBefore = m_totalMargin,
        .totalMarginAfter = exactSum(m_totalMargin, amount, "total margin", ctx)
    };
}

//-------------------------------------------------------------------------

LedgerTransaction AccountLedger::prepareDebit(const AccountId& account, decimal_t amount) const
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (!util::isFinite(amount) || amount < 0_dec) {
        throw LedgerException{
            LedgerError::INVALID_AMOUNT,
            fmt::format("{}: Debit amount must be non-negative, was {}", ctx, amount)};
    }

    const Balance before = balance(account);
    if (amount > 0_dec && amount > before.getMargin()) {
        throw LedgerException{
            LedgerError::INSUFFICIENT_BALANCE,
            fmt::format(
                "{}: Cannot debit {} from account '{}' with {}", ctx, amount, account, before)};
    }

    return {
        .updates = {{
            .account = account,
            .before = before,
            .after = Balance{
                exactSum(before.getMargin(), -amount, "margin", ctx), before.getPosition()}
        }},
        .totalMarginBefore = m_totalMargin,
        .totalMarginAfter = exactSum(m_totalMargin, -amount, "total margin", ctx)
    };
}

//-------------------------------------------------------------------------

LedgerTransaction AccountLedger::prepareTrade(
    const AccountId& buyer, const AccountId& seller, decimal_t size, decimal_t cost) const
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (buyer == seller) {
        throw LedgerException{
            LedgerError::INVALID_TRADE,
            fmt::format("{}: Account '{}' cannot trade with itself", ctx, buyer)};
    }
    if (!util::isFinite(size) || size <= 0_dec || !util::isFinite(cost) || cost < 0_dec) {
        throw LedgerException{
            LedgerError::INVALID_AMOUNT,
            fmt::format("{}: Ill-formed trade of size {} for cost {}", ctx, size, cost)};
    }

    const Balance buyerBefore = balance(buyer);
    const Balance sellerBefore = balance(seller);

    return {
        .updates = {
            {
                .account = buyer,
                .before = buyerBefore,
                .after = Balance{
                    exactSum(buyerBefore.getMargin(), -cost, "margin", ctx),
                    exactSum(buyerBefore.getPosition(), size, "position", ctx)}
            },
            {
                .account = seller,
                .before = sellerBefore,
                .after = Balance{
                    exactSum(sellerBefore.getMargin(), cost, "margin", ctx),
                    exactSum(sellerBefore.getPosition(), -size, "position", ctx)}
            }
        },
        .totalMarginBefore = m_totalMargin,
        .totalMarginAfter = m_totalMargin
    };
}

//-------------------------------------------------------------------------

void AccountLedger::commit(const LedgerTransaction& txn)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (txn.totalMarginBefore != m_totalMargin) {
        throw LedgerException{
            LedgerError::INTERNAL_INVARIANT_VIOLATION,
            fmt::format(
                "{}: Stale transaction, total margin moved from {} to {}",
                ctx, txn.totalMarginBefore, m_totalMargin)};
    }
    for (const auto& update : txn.updates) {
        if (balance(update.account) != update.before) {
            throw LedgerException{
                LedgerError::INTERNAL_INVARIANT_VIOLATION,
                fmt::format(
                    "{}: Stale transaction for account '{}', expected {} but found {}",
                    ctx, update.account, update.before, balance(update.account))};
        }
    }

    for (const auto& update : txn.updates) {
        m_accounts.insert_or_assign(update.account, update.after);
    }
    m_totalMargin = txn.totalMarginAfter;
}

//-------------------------------------------------------------------------

void AccountLedger::credit(const AccountId& account, decimal_t amount)
{
    commit(prepareCredit(account, amount));
}

//-------------------------------------------------------------------------

void AccountLedger::debit(const AccountId& account, decimal_t amount)
{
    commit(prepareDebit(account, amount));
}

//-------------------------------------------------------------------------

void AccountLedger::checkConsistency(std::source_location sl) const
{
    if (const auto sum = sumMargin(); sum != util::widen(m_totalMargin)) {
        throw LedgerException{
            LedgerError::INTERNAL_INVARIANT_VIOLATION,
            fmt::format(
                "{}: Inconsistent accounting where total margin {} "
                "is not equal to the sum of account margins {}",
                sl.function_name(), m_totalMargin, sum)};
    }
    if (const auto sum = sumPosition(); sum != wide_decimal_t{0}) {
        throw LedgerException{
            LedgerError::INTERNAL_INVARIANT_VIOLATION,
            fmt::format(
                "{}: Positions do not net to zero, sum is {}", sl.function_name(), sum)};
    }
    for (const auto& [account, bal] : m_accounts) {
        if (bal.getPosition() == 0_dec && bal.getMargin() < 0_dec) {
            throw LedgerException{
                LedgerError::INTERNAL_INVARIANT_VIOLATION,
                fmt::format(
                    "{}: Account '{}' has negative margin without a position: {}",
                    sl.function_name(), account, bal)};
        }
    }
}

//-------------------------------------------------------------------------

void AccountLedger::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember(
            "totalMargin", json::makeDecimalString(m_totalMargin, allocator), allocator);
        json::serializeHelper(
            json,
            "accounts",
            [this](rapidjson::Document& json) {
                json.SetObject();
                auto& allocator = json.GetAllocator();
                for (const auto& [account, bal] : m_accounts) {
                    rapidjson::Document balanceJson{&allocator};
                    bal.jsonSerialize(balanceJson);
                    json.AddMember(
                        rapidjson::Value{account.c_str(), allocator}, balanceJson, allocator);
                }
            });
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void AccountLedger::checkpointSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember(
            "totalMargin", rapidjson::Value{util::packDecimal(m_totalMargin)}, allocator);
        json::serializeHelper(
            json,
            "accounts",
            [this](rapidjson::Document& json) {
                json.SetObject();
                auto& allocator = json.GetAllocator();
                for (const auto& [account, bal] : m_accounts) {
                    rapidjson::Document balanceJson{&allocator};
                    bal.checkpointSerialize(balanceJson);
                    json.AddMember(
                        rapidjson::Value{account.c_str(), allocator}, balanceJson, allocator);
                }
            });
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

AccountLedger AccountLedger::fromJson(const rapidjson::Value& json)
{
    AccountLedger ledger;
    ledger.m_totalMargin = json::getDecimal(json["totalMargin"]);
    for (const auto& member : json["accounts"].GetObject()) {
        ledger.m_accounts.emplace(member.name.GetString(), Balance::fromJson(member.value));
    }
    ledger.checkConsistency();
    return ledger;
}

//-------------------------------------------------------------------------

}  // namespace margincore::accounting

//-------------------------------------------------------------------------
