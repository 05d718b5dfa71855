/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "margincore/custody/TokenCustody.hpp"

#include "margincore/serialization/json_util.hpp"

//-------------------------------------------------------------------------

namespace margincore::custody
{

//-------------------------------------------------------------------------

void TokenCustody::mint(const AccountId& wallet, decimal_t amount)
{
    if (!util::isFinite(amount) || amount < 0_dec) {
        throw std::invalid_argument{fmt::format(
            "{}: Cannot mint {} to '{}'",
            std::source_location::current().function_name(), amount, wallet)};
    }
    std::lock_guard lock{m_mtx};
    m_wallets[wallet] += amount;
}

//-------------------------------------------------------------------------

decimal_t TokenCustody::balanceOf(const AccountId& wallet) const
{
    std::lock_guard lock{m_mtx};
    auto it = m_wallets.find(wallet);
    return it != m_wallets.end() ? it->second : 0_dec;
}

//-------------------------------------------------------------------------

margin::TransferStatus TokenCustody::pull(const AccountId& from, decimal_t amount)
{
    std::lock_guard lock{m_mtx};
    auto it = m_wallets.find(from);
    if (amount < 0_dec || it == m_wallets.end() || it->second < amount) {
        return margin::TransferStatus::FAILED;
    }
    it->second -= amount;
    m_custody += amount;
    return margin::TransferStatus::OK;
}

//-------------------------------------------------------------------------

margin::TransferStatus TokenCustody::push(const AccountId& to, decimal_t amount)
{
    std::lock_guard lock{m_mtx};
    if (amount < 0_dec || m_custody < amount) {
        return margin::TransferStatus::FAILED;
    }
    m_custody -= amount;
    m_wallets[to] += amount;
    return margin::TransferStatus::OK;
}

//-------------------------------------------------------------------------

decimal_t TokenCustody::custodyBalance() const
{
    std::lock_guard lock{m_mtx};
    return m_custody;
}

//-------------------------------------------------------------------------

void TokenCustody::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        std::lock_guard lock{m_mtx};
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("custody", json::makeDecimalString(m_custody, allocator), allocator);
        rapidjson::Value walletsJson{rapidjson::kObjectType};
        for (const auto& [wallet, amount] : m_wallets) {
            walletsJson.AddMember(
                rapidjson::Value{wallet.c_str(), allocator},
                json::makeDecimalString(amount, allocator),
                allocator);
        }
        json.AddMember("wallets", walletsJson, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void TokenCustody::checkpointSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        std::lock_guard lock{m_mtx};
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("custody", rapidjson::Value{util::packDecimal(m_custody)}, allocator);
        rapidjson::Value walletsJson{rapidjson::kObjectType};
        for (const auto& [wallet, amount] : m_wallets) {
            walletsJson.AddMember(
                rapidjson::Value{wallet.c_str(), allocator},
                rapidjson::Value{util::packDecimal(amount)},
                allocator);
        }
        json.AddMember("wallets", walletsJson, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

std::unique_ptr<TokenCustody> TokenCustody::fromJson(const rapidjson::Value& json)
{
    auto custody = std::make_unique<TokenCustody>();
    custody->m_custody = json::getDecimal(json["custody"]);
    for (const auto& member : json["wallets"].GetObject()) {
        custody->m_wallets.emplace(member.name.GetString(), json::getDecimal(member.value));
    }
    return custody;
}

//-------------------------------------------------------------------------

}  // namespace margincore::custody

//-------------------------------------------------------------------------
