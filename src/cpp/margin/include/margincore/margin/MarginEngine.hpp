/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "margincore/accounting/AccountLedger.hpp"
#include "margincore/accounting/Collateral.hpp"
#include "margincore/accounting/OperatorRegistry.hpp"
#include "margincore/margin/IPriceOracle.hpp"
#include "margincore/margin/ITransferGateway.hpp"
#include "margincore/margin/MarginConfig.hpp"
#include "margincore/margin/MarginSignals.hpp"

#include <shared_mutex>

//-------------------------------------------------------------------------

namespace margincore::margin
{

//-------------------------------------------------------------------------

struct TradeSettlement
{
    AccountId buyer;
    AccountId seller;
    decimal_t size;
    decimal_t price;
};

//-------------------------------------------------------------------------

/**
 * Single choke point for every balance mutation.
 *
 * Each operation computes its post-state against the ledger, validates it
 * (authorization, balance, collateralization at the oracle price), performs
 * the custody transfer and only then commits. All of this happens under one
 * exclusive lock, so readers never observe an unchecked state and a failed
 * operation leaves ledger and custody untouched.
 *
 * An internal invariant violation halts the engine: every later mutation
 * fails with INTERNAL_INVARIANT_VIOLATION while reads keep working.
 */
class MarginEngine : public JsonSerializable, public CheckpointSerializable
{
public:
    MarginEngine(const MarginConfig& config, ITransferGateway& gateway, IPriceOracle& oracle);

    void deposit(const AccountId& owner, decimal_t amount, const AccountId& payer);
    void deposit(const AccountId& owner, decimal_t amount) { deposit(owner, amount, owner); }
    void withdraw(const AccountId& owner, decimal_t amount, const AccountId& caller);
    void settleTrade(const TradeSettlement& trade);

    void setGlobalOperator(const AccountId& identity, bool enabled);
    void setLocalOperator(const AccountId& owner, const AccountId& identity, bool enabled);

    [[nodiscard]] accounting::Balance getAccountBalance(const AccountId& owner) const;
    [[nodiscard]] decimal_t getTotalMargin() const;
    [[nodiscard]] bool canWithdraw(const AccountId& owner, const AccountId& caller) const;
    [[nodiscard]] accounting::CollateralStatus collateralStatus(const AccountId& owner);
    [[nodiscard]] SettlementIndex settlementIndex() const;
    [[nodiscard]] bool halted() const;

    void verifySolvency();

    [[nodiscard]] const MarginConfig& config() const noexcept { return m_config; }
    [[nodiscard]] MarginSignals& signals() noexcept { return m_signals; }

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
    virtual void checkpointSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    [[nodiscard]] static std::unique_ptr<MarginEngine> fromCheckpoint(
        const rapidjson::Value& json,
        const MarginConfig& config,
        ITransferGateway& gateway,
        IPriceOracle& oracle);

private:
    enum class TransferKind : uint32_t
    {
        PULL,
        PUSH
    };

    template<typename Operation>
    void guarded(std::string_view name, Operation&& op)
    {
        try {
            std::forward<Operation>(op)();
        }
        catch (const accounting::LedgerException& exc) {
            onRejected(name, exc);
            throw;
        }
    }

    // The operation has already committed when events go out, so a failing
    // slot is logged and does not reach the caller.
    template<typename SignalType, typename Event>
    void publish(std::string_view name, SignalType& signal, const Event& event)
    {
        try {
            signal(event);
        }
        catch (const std::exception& exc) {
            onSlotFailure(name, exc);
        }
    }

    void onRejected(std::string_view name, const accounting::LedgerException& exc);
    void onSlotFailure(std::string_view name, const std::exception& exc) noexcept;
    void ensureOperational(std::string_view name) const;
    void validateAmount(
        decimal_t amount, uint32_t decimalPlaces, std::string_view what, bool allowZero) const;
    void requireCollateralized(
        const accounting::Balance& post, const AccountId& account, decimal_t price) const;

    [[nodiscard]] decimal_t fetchPrice();
    void transfer(TransferKind kind, const AccountId& counterparty, decimal_t amount);
    void commit(const accounting::LedgerTransaction& txn);
    void checkSolvency() const;

    MarginConfig m_config;
    ITransferGateway& m_gateway;
    IPriceOracle& m_oracle;
    accounting::Collateral m_collateral;
    accounting::AccountLedger m_ledger;
    accounting::OperatorRegistry m_operators;
    MarginSignals m_signals;
    SettlementIndex m_settlementIndex{};
    bool m_halted{};
    mutable std::shared_mutex m_mtx;
};

//-------------------------------------------------------------------------

}  // namespace margincore::margin

//-------------------------------------------------------------------------
