/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "margincore/accounting/LedgerError.hpp"

#include <gmock/gmock.h>

//-------------------------------------------------------------------------

namespace margincore::test
{

// Matches a callable that throws a LedgerException of the given kind.
inline auto ThrowsLedgerError(accounting::LedgerError kind)
{
    return ::testing::Throws<accounting::LedgerException>(
        ::testing::Property(&accounting::LedgerException::error, kind));
}

}  // namespace margincore::test

//-------------------------------------------------------------------------
