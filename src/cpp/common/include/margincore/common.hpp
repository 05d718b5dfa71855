/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "margincore/decimal/decimal.hpp"

#include <boost/signals2.hpp>
#include <fmt/core.h>
#include <fmt/format.h>
#include <magic_enum.hpp>
#include <pugixml.hpp>
#include <range/v3/all.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

//-------------------------------------------------------------------------

namespace fs = std::filesystem;

namespace bs2 = boost::signals2;
namespace views = ranges::views;

using namespace margincore::literals;

//-------------------------------------------------------------------------

namespace margincore
{

// Stable external identity of an account owner, operator or wallet.
using AccountId = std::string;

// Monotonic counter of committed ledger operations.
using SettlementIndex = uint64_t;

}  // namespace margincore

//-------------------------------------------------------------------------

template<typename SlotType>
requires requires { typename std::function<SlotType>; }
using Signal = bs2::signal<SlotType>;

//-------------------------------------------------------------------------
