// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <sdupi/core/address.hpp>
#include <sdupi/core/int.hpp>
#include <sdupi/token/config.hpp>

#include <cstdint>
#include <string_view>
#include <variant>

SDUPI_TOKEN_NAMESPACE_BEGIN

// Typed requests against TokenCore. The caller and the time come from the
// CallContext passed alongside.

struct TransferOp
{
    Address to;
    uint256_t amount;
};

struct TransferFromOp
{
    Address from;
    Address to;
    uint256_t amount;
};

struct ApproveOp
{
    Address spender;
    uint256_t amount;
};

struct MintOp
{
    Address to;
    uint256_t amount;
};

struct BurnOp
{
    uint256_t amount;
};

struct StakeOp
{
    uint256_t amount;
};

struct UnstakeOp
{
};

struct ClaimRewardsOp
{
};

struct UpdateStakingPoolOp
{
    uint64_t apy_percent;
    uint64_t lock_period;
};

struct SetStakingActiveOp
{
    bool active;
};

struct PauseOp
{
};

struct UnpauseOp
{
};

struct TransferOwnershipOp
{
    Address new_owner;
};

using Operation = std::variant<
    TransferOp, TransferFromOp, ApproveOp, MintOp, BurnOp, StakeOp, UnstakeOp,
    ClaimRewardsOp, UpdateStakingPoolOp, SetStakingActiveOp, PauseOp,
    UnpauseOp, TransferOwnershipOp>;

// Script name of the operation, e.g. "claim_rewards"
std::string_view operation_name(Operation const &) noexcept;

SDUPI_TOKEN_NAMESPACE_END
