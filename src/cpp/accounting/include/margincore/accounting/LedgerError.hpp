/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "margincore/common.hpp"

#include <exception>

//-------------------------------------------------------------------------

namespace margincore::accounting
{

//-------------------------------------------------------------------------

enum class LedgerError : uint32_t
{
    INVALID_AMOUNT,
    INVALID_TRADE,
    UNAUTHORIZED,
    INSUFFICIENT_BALANCE,
    UNDERCOLLATERALIZED,
    TRANSFER_FAILED,
    PRICE_UNAVAILABLE,
    INTERNAL_INVARIANT_VIOLATION
};

//-------------------------------------------------------------------------

class LedgerException : public std::exception
{
public:
    LedgerException(LedgerError error, std::string msg);

    [[nodiscard]] LedgerError error() const noexcept { return m_error; }

    virtual const char* what() const noexcept override;

private:
    LedgerError m_error;
    std::string m_msg;
};

//-------------------------------------------------------------------------

}  // namespace margincore::accounting

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<margincore::accounting::LedgerError>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(margincore::accounting::LedgerError error, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(error));
    }
};

//-------------------------------------------------------------------------
