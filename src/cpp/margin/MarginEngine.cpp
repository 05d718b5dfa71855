/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "margincore/margin/MarginEngine.hpp"

#include <spdlog/spdlog.h>

#include <mutex>

//-------------------------------------------------------------------------

namespace margincore::margin
{

using accounting::LedgerError;
using accounting::LedgerException;

//-------------------------------------------------------------------------

MarginEngine::MarginEngine(
    const MarginConfig& config, ITransferGateway& gateway, IPriceOracle& oracle)
    : m_config{config},
      m_gateway{gateway},
      m_oracle{oracle},
      m_collateral{config.minCollateral}
{}

//-------------------------------------------------------------------------

void MarginEngine::deposit(const AccountId& owner, decimal_t amount, const AccountId& payer)
{
    std::unique_lock lock{m_mtx};
    guarded("deposit", [&] {
        ensureOperational("deposit");
        validateAmount(amount, m_config.marginDecimals, "Deposit amount", true);

        const auto txn = m_ledger.prepareCredit(owner, amount);
        if (amount > 0_dec) {
            transfer(TransferKind::PULL, payer, amount);
        }
        commit(txn);

        publish("IndexUpdated", m_signals.indexUpdated, IndexUpdatedEvent{
            .index = m_settlementIndex, .account = owner, .amount = amount});
        publish("Deposit", m_signals.deposit, DepositEvent{
            .account = owner, .payer = payer, .amount = amount});
    });
}

//-------------------------------------------------------------------------

void MarginEngine::withdraw(const AccountId& owner, decimal_t amount, const AccountId& caller)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    std::unique_lock lock{m_mtx};
    guarded("withdraw", [&] {
        ensureOperational("withdraw");
        validateAmount(amount, m_config.marginDecimals, "Withdrawal amount", true);

        if (!m_operators.canWithdraw(owner, caller)) {
            throw LedgerException{
                LedgerError::UNAUTHORIZED,
                fmt::format(
                    "{}: '{}' does not have permission to withdraw from '{}'",
                    ctx, caller, owner)};
        }

        const auto txn = m_ledger.prepareDebit(owner, amount);
        const auto& post = txn.at(owner).after;
        requireCollateralized(
            post, owner, post.getPosition() != 0_dec ? fetchPrice() : 0_dec);

        if (amount > 0_dec) {
            transfer(TransferKind::PUSH, caller, amount);
        }
        commit(txn);

        publish("IndexUpdated", m_signals.indexUpdated, IndexUpdatedEvent{
            .index = m_settlementIndex, .account = owner, .amount = amount});
        publish("Withdrawal", m_signals.withdrawal, WithdrawalEvent{
            .account = owner, .destination = caller, .amount = amount});
    });
}

//-------------------------------------------------------------------------

void MarginEngine::settleTrade(const TradeSettlement& trade)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    std::unique_lock lock{m_mtx};
    guarded("settleTrade", [&] {
        ensureOperational("settleTrade");
        validateAmount(trade.size, m_config.positionDecimals, "Trade size", false);
        validateAmount(trade.price, m_config.priceDecimals, "Trade price", true);

        const auto cost = util::narrowExact(util::widen(trade.size) * util::widen(trade.price));
        if (!cost.has_value() || !util::hasAtMostDecimalPlaces(*cost, m_config.marginDecimals)) {
            throw LedgerException{
                LedgerError::INVALID_AMOUNT,
                fmt::format(
                    "{}: Cost of {} at {} is not representable with {} margin decimals",
                    ctx, trade.size, trade.price, m_config.marginDecimals)};
        }

        const auto txn = m_ledger.prepareTrade(trade.buyer, trade.seller, trade.size, *cost);
        const decimal_t price = fetchPrice();
        requireCollateralized(txn.at(trade.buyer).after, trade.buyer, price);
        requireCollateralized(txn.at(trade.seller).after, trade.seller, price);
        commit(txn);

        publish("IndexUpdated", m_signals.indexUpdated, IndexUpdatedEvent{
            .index = m_settlementIndex, .account = trade.buyer, .amount = *cost});
        publish("IndexUpdated", m_signals.indexUpdated, IndexUpdatedEvent{
            .index = m_settlementIndex, .account = trade.seller, .amount = *cost});
        publish("Trade", m_signals.trade, TradeEvent{
            .buyer = trade.buyer,
            .seller = trade.seller,
            .size = trade.size,
            .price = trade.price,
            .cost = *cost});
    });
}

//-------------------------------------------------------------------------

void MarginEngine::setGlobalOperator(const AccountId& identity, bool enabled)
{
    std::unique_lock lock{m_mtx};
    guarded("setGlobalOperator", [&] {
        ensureOperational("setGlobalOperator");
        if (m_operators.setGlobalOperator(identity, enabled)) {
            spdlog::debug("Global operator '{}' {}", identity, enabled ? "granted" : "revoked");
        }
    });
}

//-------------------------------------------------------------------------

void MarginEngine::setLocalOperator(
    const AccountId& owner, const AccountId& identity, bool enabled)
{
    std::unique_lock lock{m_mtx};
    guarded("setLocalOperator", [&] {
        ensureOperational("setLocalOperator");
        if (m_operators.setLocalOperator(owner, identity, enabled)) {
            spdlog::debug(
                "Local operator '{}' for '{}' {}",
                identity, owner, enabled ? "granted" : "revoked");
        }
    });
}

//-------------------------------------------------------------------------

accounting::Balance MarginEngine::getAccountBalance(const AccountId& owner) const
{
    std::shared_lock lock{m_mtx};
    return m_ledger.balance(owner);
}

//-------------------------------------------------------------------------

decimal_t MarginEngine::getTotalMargin() const
{
    std::shared_lock lock{m_mtx};
    return m_ledger.totalMargin();
}

//-------------------------------------------------------------------------

bool MarginEngine::canWithdraw(const AccountId& owner, const AccountId& caller) const
{
    std::shared_lock lock{m_mtx};
    return m_operators.canWithdraw(owner, caller);
}

//-------------------------------------------------------------------------

accounting::CollateralStatus MarginEngine::collateralStatus(const AccountId& owner)
{
    std::unique_lock lock{m_mtx};
    accounting::CollateralStatus status;
    guarded("collateralStatus", [&] {
        const auto bal = m_ledger.balance(owner);
        status = m_collateral.status(
            bal, bal.getPosition() != 0_dec ? fetchPrice() : 0_dec);
    });
    return status;
}

//-------------------------------------------------------------------------

SettlementIndex MarginEngine::settlementIndex() const
{
    std::shared_lock lock{m_mtx};
    return m_settlementIndex;
}

//-------------------------------------------------------------------------

bool MarginEngine::halted() const
{
    std::shared_lock lock{m_mtx};
    return m_halted;
}

//-------------------------------------------------------------------------

void MarginEngine::verifySolvency()
{
    static constexpr auto ctx = std::source_location::current().function_name();

    std::unique_lock lock{m_mtx};
    guarded("verifySolvency", [&] {
        m_ledger.checkConsistency();
        if (const auto custody = m_gateway.custodyBalance(); custody != m_ledger.totalMargin()) {
            throw LedgerException{
                LedgerError::INTERNAL_INVARIANT_VIOLATION,
                fmt::format(
                    "{}: Custody holds {} but total margin is {}",
                    ctx, custody, m_ledger.totalMargin())};
        }
    });
}

//-------------------------------------------------------------------------

void MarginEngine::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    std::shared_lock lock{m_mtx};
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("settlementIndex", rapidjson::Value{m_settlementIndex}, allocator);
        json.AddMember("halted", rapidjson::Value{m_halted}, allocator);
        json.AddMember(
            "minCollateral",
            json::makeDecimalString(m_collateral.minCollateral(), allocator),
            allocator);
        m_ledger.jsonSerialize(json, "ledger");
        m_operators.jsonSerialize(json, "operators");
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void MarginEngine::checkpointSerialize(rapidjson::Document& json, const std::string& key) const
{
    std::shared_lock lock{m_mtx};
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("settlementIndex", rapidjson::Value{m_settlementIndex}, allocator);
        json.AddMember("halted", rapidjson::Value{m_halted}, allocator);
        m_ledger.checkpointSerialize(json, "ledger");
        m_operators.checkpointSerialize(json, "operators");
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

std::unique_ptr<MarginEngine> MarginEngine::fromCheckpoint(
    const rapidjson::Value& json,
    const MarginConfig& config,
    ITransferGateway& gateway,
    IPriceOracle& oracle)
{
    auto engine = std::make_unique<MarginEngine>(config, gateway, oracle);
    engine->m_ledger = accounting::AccountLedger::fromJson(json["ledger"]);
    engine->m_operators = accounting::OperatorRegistry::fromJson(json["operators"]);
    engine->m_settlementIndex = json["settlementIndex"].GetUint64();
    engine->m_halted = json["halted"].GetBool();
    return engine;
}

//-------------------------------------------------------------------------

void MarginEngine::onSlotFailure(std::string_view name, const std::exception& exc) noexcept
{
    spdlog::error("{} event handler failed after commit: {}", name, exc.what());
}

//-------------------------------------------------------------------------

void MarginEngine::onRejected(std::string_view name, const LedgerException& exc)
{
    if (exc.error() == LedgerError::INTERNAL_INVARIANT_VIOLATION && !m_halted) {
        m_halted = true;
        spdlog::critical("{} halted the margin engine: {}", name, exc.what());
        return;
    }
    spdlog::debug("{} rejected: {}", name, exc.what());
}

//-------------------------------------------------------------------------

void MarginEngine::ensureOperational(std::string_view name) const
{
    if (m_halted) {
        throw LedgerException{
            LedgerError::INTERNAL_INVARIANT_VIOLATION,
            fmt::format("{} refused, engine is halted after an invariant violation", name)};
    }
}

//-------------------------------------------------------------------------

void MarginEngine::validateAmount(
    decimal_t amount, uint32_t decimalPlaces, std::string_view what, bool allowZero) const
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (!util::isFinite(amount)) {
        throw LedgerException{
            LedgerError::INVALID_AMOUNT, fmt::format("{}: {} is not finite", ctx, what)};
    }
    if (amount < 0_dec || (!allowZero && amount == 0_dec)) {
        throw LedgerException{
            LedgerError::INVALID_AMOUNT,
            fmt::format(
                "{}: {} must be {}, was {}",
                ctx, what, allowZero ? "non-negative" : "positive", amount)};
    }
    if (!util::hasAtMostDecimalPlaces(amount, decimalPlaces)) {
        throw LedgerException{
            LedgerError::INVALID_AMOUNT,
            fmt::format(
                "{}: {} {} has more than {} decimal places", ctx, what, amount, decimalPlaces)};
    }
}

//-------------------------------------------------------------------------

void MarginEngine::requireCollateralized(
    const accounting::Balance& post, const AccountId& account, decimal_t price) const
{
    static constexpr auto ctx = std::source_location::current().function_name();

    // A proposal that closes out with debt is a rejection, not a corrupted ledger.
    if (post.getPosition() == 0_dec && post.getMargin() < 0_dec) {
        throw LedgerException{
            LedgerError::UNDERCOLLATERALIZED,
            fmt::format(
                "{}: Account '{}' would be left with {} and no position", ctx, account, post)};
    }
    if (const auto status = m_collateral.status(post, price); !status.collateralized) {
        throw LedgerException{
            LedgerError::UNDERCOLLATERALIZED,
            fmt::format(
                "{}: Account '{}' not collateralized at price {} with {}: {}",
                ctx, account, price, post, status)};
    }
}

//-------------------------------------------------------------------------

decimal_t MarginEngine::fetchPrice()
{
    static constexpr auto ctx = std::source_location::current().function_name();

    const uint64_t attempts = uint64_t{m_config.oracleRetries} + 1;
    for (uint64_t attempt = 1; attempt <= attempts; ++attempt) {
        std::optional<decimal_t> price;
        try {
            price = m_oracle.currentPrice();
        }
        catch (const std::exception& exc) {
            throw LedgerException{
                LedgerError::PRICE_UNAVAILABLE,
                fmt::format("{}: Oracle failed: {}", ctx, exc.what())};
        }
        if (!price.has_value()) {
            spdlog::debug("Oracle unavailable (attempt {}/{})", attempt, attempts);
            continue;
        }
        if (!util::isFinite(*price) || *price < 0_dec) {
            throw LedgerException{
                LedgerError::PRICE_UNAVAILABLE,
                fmt::format("{}: Oracle returned invalid price {}", ctx, *price)};
        }
        return *price;
    }
    throw LedgerException{
        LedgerError::PRICE_UNAVAILABLE,
        fmt::format("{}: Oracle unavailable after {} attempts", ctx, attempts)};
}

//-------------------------------------------------------------------------

void MarginEngine::transfer(TransferKind kind, const AccountId& counterparty, decimal_t amount)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    const uint64_t attempts = uint64_t{m_config.transferRetries} + 1;
    for (uint64_t attempt = 1; attempt <= attempts; ++attempt) {
        TransferStatus status;
        try {
            status = kind == TransferKind::PULL
                ? m_gateway.pull(counterparty, amount)
                : m_gateway.push(counterparty, amount);
        }
        catch (const std::exception& exc) {
            throw LedgerException{
                LedgerError::TRANSFER_FAILED,
                fmt::format(
                    "{}: {} of {} for '{}' raised: {}",
                    ctx, magic_enum::enum_name(kind), amount, counterparty, exc.what())};
        }
        if (status == TransferStatus::OK) {
            return;
        }
        if (status == TransferStatus::FAILED) {
            break;
        }
        spdlog::debug(
            "Transient {} failure for '{}' (attempt {}/{})",
            magic_enum::enum_name(kind), counterparty, attempt, attempts);
    }
    throw LedgerException{
        LedgerError::TRANSFER_FAILED,
        fmt::format(
            "{}: {} of {} for '{}' did not succeed",
            ctx, magic_enum::enum_name(kind), amount, counterparty)};
}

//-------------------------------------------------------------------------

void MarginEngine::commit(const accounting::LedgerTransaction& txn)
{
    m_ledger.commit(txn);
    ++m_settlementIndex;
    checkSolvency();
}

//-------------------------------------------------------------------------

void MarginEngine::checkSolvency() const
{
    static constexpr auto ctx = std::source_location::current().function_name();

    m_ledger.checkConsistency();
    if (!m_config.reconcileCustody) {
        return;
    }
    if (const auto custody = m_gateway.custodyBalance(); custody != m_ledger.totalMargin()) {
        throw LedgerException{
            LedgerError::INTERNAL_INVARIANT_VIOLATION,
            fmt::format(
                "{}: Custody holds {} but total margin is {}",
                ctx, custody, m_ledger.totalMargin())};
    }
}

//-------------------------------------------------------------------------

}  // namespace margincore::margin

//-------------------------------------------------------------------------
