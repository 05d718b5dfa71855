/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "margincore/accounting/LedgerError.hpp"

//-------------------------------------------------------------------------

namespace margincore::accounting
{

//-------------------------------------------------------------------------

LedgerException::LedgerException(LedgerError error, std::string msg)
    : m_error{error}, m_msg{fmt::format("{}: {}", error, msg)}
{}

//-------------------------------------------------------------------------

const char* LedgerException::what() const noexcept
{
    return m_msg.c_str();
}

//-------------------------------------------------------------------------

}  // namespace margincore::accounting

//-------------------------------------------------------------------------
