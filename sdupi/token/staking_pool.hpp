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

#include <sdupi/core/int.hpp>
#include <sdupi/core/result.hpp>
#include <sdupi/token/config.hpp>
#include <sdupi/token/constants.hpp>

#include <cstdint>

SDUPI_TOKEN_NAMESPACE_BEGIN

// Administrative parameters of the pool
struct StakingPoolParams
{
    uint64_t apy_percent{DEFAULT_APY_PERCENT};
    uint64_t lock_period{DEFAULT_LOCK_PERIOD};
    bool is_active{true};

    bool operator==(StakingPoolParams const &) const = default;
};

struct StakingPoolInfo
{
    uint256_t total_staked{0};
    uint256_t total_rewards_paid{0};
    uint64_t apy_percent{DEFAULT_APY_PERCENT};
    uint64_t lock_period{DEFAULT_LOCK_PERIOD};
    bool is_active{true};

    bool operator==(StakingPoolInfo const &) const = default;
};

// The single global pool. Totals are updated by the stake lifecycle,
// parameters by the owner. The `with_*` members compute the post-operation
// record without touching the pool so that a caller can validate a whole
// operation before committing any part of it.
class StakingPool
{
    StakingPoolInfo info_;

public:
    StakingPool() = default;
    explicit StakingPool(StakingPoolParams const &);

    StakingPoolInfo const &info() const noexcept
    {
        return info_;
    }

    uint64_t apy_percent() const noexcept
    {
        return info_.apy_percent;
    }

    uint64_t lock_period() const noexcept
    {
        return info_.lock_period;
    }

    bool is_active() const noexcept
    {
        return info_.is_active;
    }

    Result<StakingPoolInfo> with_stake(uint256_t const &amount) const;
    Result<StakingPoolInfo>
    with_unstake(uint256_t const &amount, uint256_t const &reward) const;
    Result<StakingPoolInfo> with_claim(uint256_t const &reward) const;

    void commit(StakingPoolInfo const &);

    void update(uint64_t apy_percent, uint64_t lock_period) noexcept;
    void set_active(bool) noexcept;
};

SDUPI_TOKEN_NAMESPACE_END
