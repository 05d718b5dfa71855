/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "margincore/serialization/json_util.hpp"

#include <rapidjson/error/en.h>
#include <rapidjson/istreamwrapper.h>
#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <source_location>
#include <string_view>

//-------------------------------------------------------------------------

namespace margincore::json
{

//-------------------------------------------------------------------------

namespace
{

template<typename OutputStream>
void write(const rapidjson::Value& json, OutputStream& os, const FormatOptions& formatOptions)
{
    if (!formatOptions.indent.has_value()) {
        rapidjson::Writer writer{os};
        json.Accept(writer);
        return;
    }
    rapidjson::PrettyWriter writer{os};
    writer.SetIndent(formatOptions.indent->indentChar, formatOptions.indent->indentCharCount);
    json.Accept(writer);
}

std::string describeParseError(const rapidjson::Document& json)
{
    return fmt::format(
        "{} (offset {})", rapidjson::GetParseError_En(json.GetParseError()), json.GetErrorOffset());
}

}  // namespace

//-------------------------------------------------------------------------

std::string json2str(const rapidjson::Value& json, const FormatOptions& formatOptions)
{
    rapidjson::StringBuffer buffer;
    write(json, buffer, formatOptions);
    return buffer.GetString();
}

//-------------------------------------------------------------------------

rapidjson::Document str2json(const std::string& str)
{
    rapidjson::Document json;
    if (json.Parse(str.c_str()).HasParseError()) {
        static constexpr size_t excerptLength = 120uz;
        const std::string_view excerpt{str.data(), std::min(excerptLength, str.size())};
        throw std::invalid_argument{fmt::format(
            "{}: {} in '{}{}'",
            std::source_location::current().function_name(),
            describeParseError(json),
            excerpt,
            excerpt.size() < str.size() ? "..." : "")};
    }
    return json;
}

//-------------------------------------------------------------------------

void dumpJson(
    const rapidjson::Value& json,
    std::ofstream& ofs,
    const FormatOptions& formatOptions)
{
    rapidjson::OStreamWrapper osw{ofs};
    write(json, osw, formatOptions);
}

//-------------------------------------------------------------------------

rapidjson::Document loadJson(const std::filesystem::path& path)
{
    static constexpr auto ctx = std::source_location::current().function_name();
    std::ifstream ifs{path};
    if (!ifs) {
        throw std::invalid_argument{fmt::format("{}: Cannot open checkpoint '{}'", ctx, path.c_str())};
    }
    rapidjson::IStreamWrapper isw{ifs};
    rapidjson::Document json;
    if (json.ParseStream(isw).HasParseError()) {
        throw std::invalid_argument{fmt::format(
            "{}: Malformed checkpoint '{}': {}", ctx, path.c_str(), describeParseError(json))};
    }
    return json;
}

//-------------------------------------------------------------------------

decimal_t getDecimal(const rapidjson::Value& json)
{
    static constexpr auto ctx = std::source_location::current().function_name();
    if (json.IsUint64()) [[likely]] {
        return util::unpackDecimal(json.GetUint64());
    } else if (json.IsString()) {
        if (auto parsed = util::parseDecimal(json.GetString())) {
            return *parsed;
        }
    }
    throw std::invalid_argument{fmt::format(
        "{}: Ill-formed Json value to form a decimal with: {}", ctx, json2str(json))};
}

//-------------------------------------------------------------------------

rapidjson::Value makeDecimalString(
    decimal_t val, rapidjson::Document::AllocatorType& allocator)
{
    return rapidjson::Value{util::decimal2str(val).c_str(), allocator};
}

//-------------------------------------------------------------------------

void serializeHelper(
    rapidjson::Document& json,
    const std::string& key,
    std::function<void(rapidjson::Document&)> serializer)
{
    if (key.empty()) return serializer(json);
    auto& allocator = json.GetAllocator();
    rapidjson::Document subJson{&allocator};
    serializer(subJson);
    json.AddMember(rapidjson::Value{key.c_str(), allocator}, subJson, allocator);
}

//-------------------------------------------------------------------------

}  // namespace margincore::json

//-------------------------------------------------------------------------
