/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "margincore/common.hpp"

//-------------------------------------------------------------------------

namespace margincore::margin
{

//-------------------------------------------------------------------------

enum class TransferStatus : uint32_t
{
    OK,
    FAILED,
    TRANSIENT_FAILURE
};

//-------------------------------------------------------------------------

// Custody side of collateral movements. The ledger trusts the reported status.
class ITransferGateway
{
public:
    virtual ~ITransferGateway() = default;

    // Moves amount from an external wallet into custody.
    [[nodiscard]] virtual TransferStatus pull(const AccountId& from, decimal_t amount) = 0;
    // Moves amount from custody out to an external wallet.
    [[nodiscard]] virtual TransferStatus push(const AccountId& to, decimal_t amount) = 0;

    [[nodiscard]] virtual decimal_t custodyBalance() const = 0;

protected:
    ITransferGateway() = default;
};

//-------------------------------------------------------------------------

}  // namespace margincore::margin

//-------------------------------------------------------------------------
