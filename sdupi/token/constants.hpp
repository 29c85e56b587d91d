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

#include <intx/intx.hpp>

SDUPI_TOKEN_NAMESPACE_BEGIN

using namespace intx::literals;

inline constexpr std::string_view TOKEN_NAME{
    "Secure Decentralized Unified Payments Interface"};
inline constexpr std::string_view TOKEN_SYMBOL{"SDUPI"};
inline constexpr uint8_t TOKEN_DECIMALS{18};

// one whole token in the smallest unit
inline constexpr uint256_t SDUPI{1000000000000000000_u256};

inline constexpr uint256_t GENESIS_SUPPLY{100'000'000'000 * SDUPI}; // 1e29
inline constexpr uint256_t MIN_STAKE{1'000'000 * SDUPI};
inline constexpr uint256_t MAX_STAKE{10'000'000'000 * SDUPI};

inline constexpr uint64_t SECONDS_PER_DAY{86'400};
inline constexpr uint64_t SECONDS_PER_YEAR{365 * SECONDS_PER_DAY};

inline constexpr uint64_t DEFAULT_APY_PERCENT{15};
inline constexpr uint64_t DEFAULT_LOCK_PERIOD{30 * SECONDS_PER_DAY};

// Custody account for staked principal. Its balance always equals the pool's
// total_staked.
inline constexpr Address STAKING_RESERVE{0x1000};

static_assert(MIN_STAKE <= MAX_STAKE);
static_assert(MAX_STAKE <= GENESIS_SUPPLY);
static_assert(GENESIS_SUPPLY == 100000000000000000000000000000_u256);

SDUPI_TOKEN_NAMESPACE_END
