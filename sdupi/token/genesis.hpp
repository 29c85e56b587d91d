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
#include <sdupi/core/result.hpp>
#include <sdupi/token/config.hpp>
#include <sdupi/token/staking_pool.hpp>
#include <sdupi/token/token_core.hpp>

#include <nlohmann/json_fwd.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <memory>
#include <vector>

SDUPI_TOKEN_NAMESPACE_BEGIN

enum class GenesisError
{
    Success = 0,
    InvalidJson,
    MissingField,
    InvalidField,
    InvalidAddress,
    InvalidAmount,
    AllocationExceedsSupply,
};

struct GenesisAllocation
{
    Address address;
    uint256_t balance;
};

struct GenesisConfig
{
    Address owner;
    uint64_t timestamp{0};
    std::vector<GenesisAllocation> alloc;
    StakingPoolParams staking_pool{};
};

Result<GenesisConfig> parse_genesis(nlohmann::json const &);
Result<GenesisConfig> read_genesis(std::filesystem::path const &);

// Mints the genesis supply to the owner and hands out each allocation from
// the owner's balance, in file order, at the genesis timestamp.
Result<std::unique_ptr<TokenCore>> load_genesis(GenesisConfig const &);

SDUPI_TOKEN_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<sdupi::token::GenesisError>
    : quick_status_code_from_enum_defaults<sdupi::token::GenesisError>
{
    static constexpr auto const domain_name = "Genesis Error";
    static constexpr auto const domain_uuid =
        "5e8b2d41-c07a-4f93-b6e1-2a94d0f7c813";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
