/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <bdldfp_decimal.h>
#include <bdldfp_decimalconvertutil.h>
#include <bdldfp_decimalutil.h>
#include <fmt/format.h>

#include <bit>
#include <cstdint>
#include <optional>
#include <spanstream>
#include <string>

//-------------------------------------------------------------------------

#define DEC(lit) BDLDFP_DECIMAL_DD(lit)

//-------------------------------------------------------------------------

namespace margincore
{

using decimal_t = BloombergLP::bdldfp::Decimal64;

// 34 significant digits; products of two decimal_t values are exact.
using wide_decimal_t = BloombergLP::bdldfp::Decimal128;

}  // namespace margincore

//-------------------------------------------------------------------------

namespace margincore::util
{

inline constexpr uint32_t kMaxDecimalPlaces = 16;

[[nodiscard]] inline decimal_t round(decimal_t val, uint32_t decimalPlaces)
{
    return BloombergLP::bdldfp::DecimalUtil::trunc(val, decimalPlaces);
}

[[nodiscard]] inline bool isFinite(decimal_t val) noexcept
{
    return BloombergLP::bdldfp::DecimalUtil::isFinite(val);
}

[[nodiscard]] inline bool hasAtMostDecimalPlaces(decimal_t val, uint32_t decimalPlaces)
{
    return isFinite(val) && round(val, decimalPlaces) == val;
}

[[nodiscard]] inline wide_decimal_t widen(decimal_t val) noexcept
{
    return wide_decimal_t{val};
}

// Empty if the value does not survive the round trip to 16 digits.
[[nodiscard]] inline std::optional<decimal_t> narrowExact(wide_decimal_t val)
{
    const decimal_t narrowed{val};
    if (widen(narrowed) != val) {
        return std::nullopt;
    }
    return narrowed;
}

[[nodiscard]] inline wide_decimal_t fma(
    wide_decimal_t a, wide_decimal_t b, wide_decimal_t c) noexcept
{
    return BloombergLP::bdldfp::DecimalUtil::fma(a, b, c);
}

[[nodiscard]] inline uint64_t packDecimal(decimal_t val)
{
    uint64_t packed;
    BloombergLP::bdldfp::DecimalConvertUtil::decimalToDPD(
        std::bit_cast<uint8_t*>(&packed), val);
    return packed;
}

[[nodiscard]] inline decimal_t unpackDecimal(uint64_t val)
{
    decimal_t unpacked;
    BloombergLP::bdldfp::DecimalConvertUtil::decimalFromDPD(
        &unpacked, std::bit_cast<uint8_t*>(&val));
    return unpacked;
}

// Parses a plain decimal literal such as "-12.5"; NaN and infinities are rejected.
[[nodiscard]] inline std::optional<decimal_t> parseDecimal(const std::string& str)
{
    decimal_t parsed;
    if (str.empty()
        || BloombergLP::bdldfp::DecimalUtil::parseDecimal64(&parsed, str.c_str()) != 0
        || !isFinite(parsed)) {
        return std::nullopt;
    }
    return parsed;
}

}  // namespace margincore::util

//-------------------------------------------------------------------------

namespace margincore::literals
{

[[nodiscard]] constexpr decimal_t operator"" _dec(unsigned long long int val)
{
    return decimal_t{val};
}

}  // namespace margincore::literals

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<margincore::decimal_t>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(margincore::decimal_t val, FormatContext& ctx) const
    {
        using namespace margincore::literals;
        char buf[32]{};
        std::ospanstream oss{buf};
        if (val == 0_dec) [[unlikely]] {
            oss << "0.0";
        } else {
            oss << val;
        }
        return fmt::format_to(ctx.out(), "{}", buf);
    }
};

template<>
struct fmt::formatter<margincore::wide_decimal_t>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(margincore::wide_decimal_t val, FormatContext& ctx) const
    {
        char buf[64]{};
        std::ospanstream oss{buf};
        if (val == margincore::wide_decimal_t{0}) [[unlikely]] {
            oss << "0.0";
        } else {
            oss << val;
        }
        return fmt::format_to(ctx.out(), "{}", buf);
    }
};

//-------------------------------------------------------------------------

namespace margincore::util
{

[[nodiscard]] inline std::string decimal2str(decimal_t val)
{
    return fmt::format("{}", val);
}

}  // namespace margincore::util

//-------------------------------------------------------------------------
