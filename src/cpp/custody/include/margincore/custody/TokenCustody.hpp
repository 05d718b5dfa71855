/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "margincore/margin/ITransferGateway.hpp"
#include "margincore/serialization/CheckpointSerializable.hpp"
#include "margincore/serialization/JsonSerializable.hpp"

#include <mutex>

//-------------------------------------------------------------------------

namespace margincore::custody
{

//-------------------------------------------------------------------------

/**
 * In-memory token ledger standing in for the custody side of the engine.
 *
 * Wallets hold tokens outside the engine; the custody account holds what has
 * been deposited. A pull fails if the payer's wallet cannot cover it and a
 * push fails if custody cannot.
 */
class TokenCustody
    : public margin::ITransferGateway,
      public JsonSerializable,
      public CheckpointSerializable
{
public:
    TokenCustody() noexcept = default;

    void mint(const AccountId& wallet, decimal_t amount);

    [[nodiscard]] decimal_t balanceOf(const AccountId& wallet) const;
    [[nodiscard]] const std::map<AccountId, decimal_t>& wallets() const noexcept
    {
        return m_wallets;
    }

    [[nodiscard]] virtual margin::TransferStatus pull(
        const AccountId& from, decimal_t amount) override;
    [[nodiscard]] virtual margin::TransferStatus push(
        const AccountId& to, decimal_t amount) override;
    [[nodiscard]] virtual decimal_t custodyBalance() const override;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
    virtual void checkpointSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    [[nodiscard]] static std::unique_ptr<TokenCustody> fromJson(const rapidjson::Value& json);

private:
    std::map<AccountId, decimal_t> m_wallets;
    decimal_t m_custody{0};
    mutable std::mutex m_mtx;
};

//-------------------------------------------------------------------------

}  // namespace margincore::custody

//-------------------------------------------------------------------------
