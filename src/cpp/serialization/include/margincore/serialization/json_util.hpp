/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "margincore/decimal/decimal.hpp"

#include <rapidjson/document.h>

#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <string>

//-------------------------------------------------------------------------

namespace margincore::json
{

//-------------------------------------------------------------------------

struct IndentOptions
{
    char indentChar = ' ';
    uint8_t indentCharCount = 4;
};

struct FormatOptions
{
    std::optional<IndentOptions> indent = {};
};

[[nodiscard]] std::string json2str(
    const rapidjson::Value& json, const FormatOptions& formatOptions = {});

[[nodiscard]] rapidjson::Document str2json(const std::string& str);

void dumpJson(
    const rapidjson::Value& json,
    std::ofstream& ofs,
    const FormatOptions& formatOptions = {});

[[nodiscard]] rapidjson::Document loadJson(const std::filesystem::path& path);

// Accepts both the packed checkpoint form (uint64 DPD) and the human-readable string form.
[[nodiscard]] decimal_t getDecimal(const rapidjson::Value& json);

[[nodiscard]] rapidjson::Value makeDecimalString(
    decimal_t val, rapidjson::Document::AllocatorType& allocator);

void serializeHelper(
    rapidjson::Document& json,
    const std::string& key,
    std::function<void(rapidjson::Document&)> serializer);

//-------------------------------------------------------------------------

}  // namespace margincore::json

//-------------------------------------------------------------------------
