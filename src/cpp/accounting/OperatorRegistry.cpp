/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "margincore/accounting/OperatorRegistry.hpp"

//-------------------------------------------------------------------------

namespace margincore::accounting
{

//-------------------------------------------------------------------------

std::optional<Grant> OperatorRegistry::grant(
    const AccountId& owner, const AccountId& caller) const
{
    if (caller == owner) {
        return Grant::SELF;
    }
    if (isGlobalOperator(caller)) {
        return Grant::GLOBAL_OPERATOR;
    }
    if (isLocalOperator(owner, caller)) {
        return Grant::LOCAL_OPERATOR;
    }
    return std::nullopt;
}

//-------------------------------------------------------------------------

bool OperatorRegistry::canWithdraw(const AccountId& owner, const AccountId& caller) const
{
    return grant(owner, caller).has_value();
}

//-------------------------------------------------------------------------

bool OperatorRegistry::isGlobalOperator(const AccountId& identity) const
{
    return m_globalOperators.contains(identity);
}

//-------------------------------------------------------------------------

bool OperatorRegistry::isLocalOperator(const AccountId& owner, const AccountId& identity) const
{
    auto it = m_localOperators.find(owner);
    return it != m_localOperators.end() && it->second.contains(identity);
}

//-------------------------------------------------------------------------

bool OperatorRegistry::setGlobalOperator(const AccountId& identity, bool enabled)
{
    if (enabled) {
        return m_globalOperators.insert(identity).second;
    }
    return m_globalOperators.erase(identity) > 0;
}

//-------------------------------------------------------------------------

bool OperatorRegistry::setLocalOperator(
    const AccountId& owner, const AccountId& identity, bool enabled)
{
    if (enabled) {
        return m_localOperators[owner].insert(identity).second;
    }
    auto it = m_localOperators.find(owner);
    if (it == m_localOperators.end()) {
        return false;
    }
    const bool erased = it->second.erase(identity) > 0;
    if (it->second.empty()) {
        m_localOperators.erase(it);
    }
    return erased;
}

//-------------------------------------------------------------------------

void OperatorRegistry::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        rapidjson::Value globalJson{rapidjson::kArrayType};
        for (const auto& identity : m_globalOperators) {
            globalJson.PushBack(rapidjson::Value{identity.c_str(), allocator}, allocator);
        }
        json.AddMember("global", globalJson, allocator);
        rapidjson::Value localJson{rapidjson::kObjectType};
        for (const auto& [owner, identities] : m_localOperators) {
            rapidjson::Value identitiesJson{rapidjson::kArrayType};
            for (const auto& identity : identities) {
                identitiesJson.PushBack(rapidjson::Value{identity.c_str(), allocator}, allocator);
            }
            localJson.AddMember(
                rapidjson::Value{owner.c_str(), allocator}, identitiesJson, allocator);
        }
        json.AddMember("local", localJson, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void OperatorRegistry::checkpointSerialize(rapidjson::Document& json, const std::string& key) const
{
    jsonSerialize(json, key);
}

//-------------------------------------------------------------------------

OperatorRegistry OperatorRegistry::fromJson(const rapidjson::Value& json)
{
    OperatorRegistry registry;
    for (const rapidjson::Value& identity : json["global"].GetArray()) {
        registry.m_globalOperators.insert(identity.GetString());
    }
    for (const auto& member : json["local"].GetObject()) {
        for (const rapidjson::Value& identity : member.value.GetArray()) {
            registry.m_localOperators[member.name.GetString()].insert(identity.GetString());
        }
    }
    return registry;
}

//-------------------------------------------------------------------------

}  // namespace margincore::accounting

//-------------------------------------------------------------------------
