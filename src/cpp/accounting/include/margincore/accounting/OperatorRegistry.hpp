/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "margincore/common.hpp"
#include "margincore/serialization/CheckpointSerializable.hpp"
#include "margincore/serialization/JsonSerializable.hpp"

//-------------------------------------------------------------------------

namespace margincore::accounting
{

//-------------------------------------------------------------------------

enum class Grant : uint32_t
{
    SELF,
    GLOBAL_OPERATOR,
    LOCAL_OPERATOR
};

//-------------------------------------------------------------------------

// Withdrawal rights: the owner itself, any global operator, or an operator
// the owner has appointed. The grant sets are independent of each other.
class OperatorRegistry : public JsonSerializable, public CheckpointSerializable
{
public:
    using LocalOperatorMap = std::map<AccountId, std::set<AccountId>>;

    [[nodiscard]] std::optional<Grant> grant(
        const AccountId& owner, const AccountId& caller) const;
    [[nodiscard]] bool canWithdraw(const AccountId& owner, const AccountId& caller) const;

    [[nodiscard]] bool isGlobalOperator(const AccountId& identity) const;
    [[nodiscard]] bool isLocalOperator(const AccountId& owner, const AccountId& identity) const;

    [[nodiscard]] const std::set<AccountId>& globalOperators() const noexcept
    {
        return m_globalOperators;
    }
    [[nodiscard]] const LocalOperatorMap& localOperators() const noexcept
    {
        return m_localOperators;
    }

    // Both return whether the registry changed.
    bool setGlobalOperator(const AccountId& identity, bool enabled);
    bool setLocalOperator(const AccountId& owner, const AccountId& identity, bool enabled);

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
    virtual void checkpointSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    [[nodiscard]] static OperatorRegistry fromJson(const rapidjson::Value& json);

private:
    std::set<AccountId> m_globalOperators;
    LocalOperatorMap m_localOperators;
};

//-------------------------------------------------------------------------

}  // namespace margincore::accounting

//-------------------------------------------------------------------------
