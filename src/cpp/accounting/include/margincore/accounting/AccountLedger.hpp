/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "margincore/accounting/Balance.hpp"
#include "margincore/accounting/LedgerError.hpp"
#include "margincore/common.hpp"
#include "margincore/serialization/CheckpointSerializable.hpp"
#include "margincore/serialization/JsonSerializable.hpp"

//-------------------------------------------------------------------------

namespace margincore::accounting
{

//-------------------------------------------------------------------------

struct BalanceUpdate
{
    AccountId account;
    Balance before;
    Balance after;
};

// A fully computed post-state. Nothing is observable until AccountLedger::commit.
struct LedgerTransaction
{
    std::vector<BalanceUpdate> updates;
    decimal_t totalMarginBefore{0};
    decimal_t totalMarginAfter{0};

    [[nodiscard]] const BalanceUpdate& at(const AccountId& account) const;
};

//-------------------------------------------------------------------------

class AccountLedger : public JsonSerializable, public CheckpointSerializable
{
public:
    using ContainerType = std::map<AccountId, Balance>;

    [[nodiscard]] Balance balance(const AccountId& account) const;
    [[nodiscard]] decimal_t totalMargin() const noexcept { return m_totalMargin; }
    [[nodiscard]] bool contains(const AccountId& account) const;
    [[nodiscard]] const ContainerType& accounts() const noexcept { return m_accounts; }

    [[nodiscard]] wide_decimal_t sumMargin() const;
    [[nodiscard]] wide_decimal_t sumPosition() const;

    [[nodiscard]] LedgerTransaction prepareCredit(const AccountId& account, decimal_t amount) const;
    [[nodiscard]] LedgerTransaction prepareDebit(const AccountId& account, decimal_t amount) const;
    [[nodiscard]] LedgerTransaction prepareTrade(
        const AccountId& buyer, const AccountId& seller, decimal_t size, decimal_t cost) const;

    void commit(const LedgerTransaction& txn);

    void credit(const AccountId& account, decimal_t amount);
    void debit(const AccountId& account, decimal_t amount);

    void checkConsistency(std::source_location sl = std::source_location::current()) const;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
    virtual void checkpointSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    [[nodiscard]] static AccountLedger fromJson(const rapidjson::Value& json);

private:
    ContainerType m_accounts;
    decimal_t m_totalMargin{0};
};

//-------------------------------------------------------------------------

}  // namespace margincore::accounting

//-------------------------------------------------------------------------
