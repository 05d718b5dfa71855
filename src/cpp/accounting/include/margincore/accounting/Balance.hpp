/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "margincore/common.hpp"
#include "margincore/serialization/CheckpointSerializable.hpp"
#include "margincore/serialization/JsonSerializable.hpp"

#include <ostream>

//-------------------------------------------------------------------------

namespace margincore::accounting
{

//-------------------------------------------------------------------------

// Collateral and signed exposure of one account. Position > 0 is long, < 0 short.
class Balance : public JsonSerializable, public CheckpointSerializable
{
public:
    Balance() noexcept = default;
    explicit Balance(decimal_t margin, decimal_t position = {}) noexcept;

    [[nodiscard]] decimal_t getMargin() const noexcept { return m_margin; }
    [[nodiscard]] decimal_t getPosition() const noexcept { return m_position; }

    [[nodiscard]] bool operator==(const Balance& other) const noexcept;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
    virtual void checkpointSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    friend std::ostream& operator<<(std::ostream& os, const Balance& bal) noexcept;

    [[nodiscard]] static Balance fromJson(const rapidjson::Value& json);

private:
    decimal_t m_margin{0};
    decimal_t m_position{0};
};

//-------------------------------------------------------------------------

}  // namespace margincore::accounting

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<margincore::accounting::Balance>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const margincore::accounting::Balance& bal, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(), "margin {} | position {}", bal.getMargin(), bal.getPosition());
    }
};

//-------------------------------------------------------------------------
