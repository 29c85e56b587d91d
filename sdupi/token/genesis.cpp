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

#include <sdupi/core/checked_math.hpp>
#include <sdupi/core/fmt/address_fmt.hpp>
#include <sdupi/core/fmt/int_fmt.hpp>
#include <sdupi/token/call_context.hpp>
#include <sdupi/token/constants.hpp>
#include <sdupi/token/genesis.hpp>
#include <sdupi/token/json_util.hpp>

#include <boost/outcome/try.hpp>
// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
#else
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
#endif

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <fstream>
#include <memory>
#include <iterator>
#include <string>

SDUPI_TOKEN_NAMESPACE_BEGIN

SDUPI_TOKEN_ANONYMOUS_NAMESPACE_BEGIN

bool is_assignable(Address const &address)
{
    return !is_null(address) && address != STAKING_RESERVE;
}

Result<StakingPoolParams> parse_staking_pool(nlohmann::json const &j)
{
    if (!j.is_object()) {
        return GenesisError::InvalidField;
    }
    StakingPoolParams params{};
    if (j.contains("apy_percent")) {
        auto const apy = parse_u64(j["apy_percent"]);
        if (!apy.has_value()) {
            return GenesisError::InvalidAmount;
        }
        params.apy_percent = *apy;
    }
    if (j.contains("lock_period")) {
        auto const lock = parse_u64(j["lock_period"]);
        if (!lock.has_value()) {
            return GenesisError::InvalidAmount;
        }
        params.lock_period = *lock;
    }
    if (j.contains("is_active")) {
        if (!j["is_active"].is_boolean()) {
            return GenesisError::InvalidField;
        }
        params.is_active = j["is_active"].get<bool>();
    }
    return params;
}

SDUPI_TOKEN_ANONYMOUS_NAMESPACE_END

Result<GenesisConfig> parse_genesis(nlohmann::json const &j)
{
    if (!j.is_object()) {
        return GenesisError::InvalidJson;
    }
    GenesisConfig config{};

    if (!j.contains("owner")) {
        return GenesisError::MissingField;
    }
    auto const owner = parse_address(j["owner"]);
    if (!owner.has_value() || !is_assignable(*owner)) {
        return GenesisError::InvalidAddress;
    }
    config.owner = *owner;

    if (j.contains("timestamp")) {
        auto const timestamp = parse_u64(j["timestamp"]);
        if (!timestamp.has_value()) {
            return GenesisError::InvalidField;
        }
        config.timestamp = *timestamp;
    }

    if (j.contains("alloc")) {
        auto const &alloc = j["alloc"];
        if (!alloc.is_object()) {
            return GenesisError::InvalidField;
        }
        for (auto const &item : alloc.items()) {
            auto const address = parse_address(item.key());
            if (!address.has_value() || !is_assignable(*address)) {
                return GenesisError::InvalidAddress;
            }
            auto const &entry = item.value();
            if (!entry.is_object() || !entry.contains("balance")) {
                return GenesisError::MissingField;
            }
            auto const balance = parse_amount(entry["balance"]);
            if (!balance.has_value()) {
                return GenesisError::InvalidAmount;
            }
            config.alloc.push_back(
                GenesisAllocation{.address = *address, .balance = *balance});
        }
    }

    if (j.contains("staking_pool")) {
        BOOST_OUTCOME_TRY(
            auto const params, parse_staking_pool(j["staking_pool"]));
        config.staking_pool = params;
    }
    return config;
}

Result<GenesisConfig> read_genesis(std::filesystem::path const &path)
{
    std::ifstream in{path};
    if (!in) {
        LOG_ERROR("cannot open genesis file {}", path.string());
        return GenesisError::InvalidJson;
    }
    std::string const text{
        std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    auto const j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        LOG_ERROR("genesis file {} is not valid json", path.string());
        return GenesisError::InvalidJson;
    }
    return parse_genesis(j);
}

Result<std::unique_ptr<TokenCore>> load_genesis(GenesisConfig const &config)
{
    uint256_t allocated{0};
    for (auto const &entry : config.alloc) {
        auto const sum = checked_add(allocated, entry.balance);
        if (sum.has_error() || sum.value() > GENESIS_SUPPLY) {
            return GenesisError::AllocationExceedsSupply;
        }
        allocated = sum.value();
    }

    auto core = std::make_unique<TokenCore>(
        config.owner, config.staking_pool, GENESIS_SUPPLY);
    CallContext const ctx{.sender = config.owner, .timestamp = config.timestamp};
    for (auto const &entry : config.alloc) {
        BOOST_OUTCOME_TRYV(core->transfer(ctx, entry.address, entry.balance));
    }
    LOG_INFO(
        "genesis loaded: owner {} supply {} allocated {} to {} accounts",
        config.owner,
        GENESIS_SUPPLY,
        allocated,
        config.alloc.size());
    return core;
}

SDUPI_TOKEN_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<sdupi::token::GenesisError>::mapping> const &
quick_status_code_from_enum<sdupi::token::GenesisError>::value_mappings()
{
    using sdupi::token::GenesisError;

    static std::initializer_list<mapping> const v = {
        {GenesisError::Success, "success", {errc::success}},
        {GenesisError::InvalidJson, "invalid json", {}},
        {GenesisError::MissingField, "missing field", {}},
        {GenesisError::InvalidField, "invalid field", {}},
        {GenesisError::InvalidAddress, "invalid address", {}},
        {GenesisError::InvalidAmount, "invalid amount", {}},
        {GenesisError::AllocationExceedsSupply,
         "allocation exceeds genesis supply",
         {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
