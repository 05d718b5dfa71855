/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "margincore/accounting/Balance.hpp"

//-------------------------------------------------------------------------

namespace margincore::accounting
{

//-------------------------------------------------------------------------

Balance::Balance(decimal_t margin, decimal_t position) noexcept
    : m_margin{margin}, m_position{position}
{}

//-------------------------------------------------------------------------

bool Balance::operator==(const Balance& other) const noexcept
{
    return m_margin == other.m_margin && m_position == other.m_position;
}

//-------------------------------------------------------------------------

void Balance::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("margin", json::makeDecimalString(m_margin, allocator), allocator);
        json.AddMember("position", json::makeDecimalString(m_position, allocator), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void Balance::checkpointSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("margin", rapidjson::Value{util::packDecimal(m_margin)}, allocator);
        json.AddMember("position", rapidjson::Value{util::packDecimal(m_position)}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

std::ostream& operator<<(std::ostream& os, const Balance& bal) noexcept
{
    return os << fmt::format("{}", bal);
}

//-------------------------------------------------------------------------

Balance Balance::fromJson(const rapidjson::Value& json)
{
    return Balance{json::getDecimal(json["margin"]), json::getDecimal(json["position"])};
}

//-------------------------------------------------------------------------

}  // namespace margincore::accounting

//-------------------------------------------------------------------------
