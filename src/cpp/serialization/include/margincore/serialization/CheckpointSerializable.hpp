/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "margincore/serialization/json_util.hpp"

//-------------------------------------------------------------------------

class CheckpointSerializable
{
public:
    virtual ~CheckpointSerializable() noexcept = default;

    virtual void checkpointSerialize(
        rapidjson::Document& json, const std::string& key = {}) const = 0;

protected:
    CheckpointSerializable() noexcept = default;
};

//-------------------------------------------------------------------------
