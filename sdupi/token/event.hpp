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

// Mint is reported as a transfer from the null address and burn as a transfer
// to it.
struct TransferEvent
{
    Address from;
    Address to;
    uint256_t amount;

    bool operator==(TransferEvent const &) const = default;
};

struct ApprovalEvent
{
    Address owner;
    Address spender;
    uint256_t amount;

    bool operator==(ApprovalEvent const &) const = default;
};

struct StakedEvent
{
    Address account;
    uint256_t amount;
    uint64_t start_time;
    uint64_t lock_end_time;

    bool operator==(StakedEvent const &) const = default;
};

struct UnstakedEvent
{
    Address account;
    uint256_t amount;
    uint256_t reward;

    bool operator==(UnstakedEvent const &) const = default;
};

struct RewardsClaimedEvent
{
    Address account;
    uint256_t reward;

    bool operator==(RewardsClaimedEvent const &) const = default;
};

struct StakingPoolUpdatedEvent
{
    uint64_t apy_percent;
    uint64_t lock_period;

    bool operator==(StakingPoolUpdatedEvent const &) const = default;
};

struct StakingStatusChangedEvent
{
    bool is_active;

    bool operator==(StakingStatusChangedEvent const &) const = default;
};

struct PausedEvent
{
    Address account;

    bool operator==(PausedEvent const &) const = default;
};

struct UnpausedEvent
{
    Address account;

    bool operator==(UnpausedEvent const &) const = default;
};

struct OwnershipTransferredEvent
{
    Address previous_owner;
    Address new_owner;

    bool operator==(OwnershipTransferredEvent const &) const = default;
};

using Event = std::variant<
    TransferEvent, ApprovalEvent, StakedEvent, UnstakedEvent,
    RewardsClaimedEvent, StakingPoolUpdatedEvent, StakingStatusChangedEvent,
    PausedEvent, UnpausedEvent, OwnershipTransferredEvent>;

std::string_view event_name(Event const &) noexcept;

class TokenCore;

// Receives the events of every successful mutation, in order, before the
// mutating call returns. The core is still inside that call, so any mutation
// attempted through `core` fails with TokenError::ReentrancyDetected; queries
// are allowed.
class TokenObserver
{
public:
    virtual ~TokenObserver() = default;

    virtual void on_event(TokenCore &core, Event const &) = 0;
};

SDUPI_TOKEN_NAMESPACE_END
