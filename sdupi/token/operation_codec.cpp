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

#include <sdupi/core/address.hpp>
#include <sdupi/core/int.hpp>
#include <sdupi/token/json_util.hpp>
#include <sdupi/token/operation_codec.hpp>

#include <boost/outcome/try.hpp>
// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
#else
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
#endif

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <cstdint>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>

SDUPI_TOKEN_NAMESPACE_BEGIN

SDUPI_TOKEN_ANONYMOUS_NAMESPACE_BEGIN

Result<Address> address_field(nlohmann::json const &j, char const *const key)
{
    if (!j.contains(key)) {
        return OperationCodecError::MissingField;
    }
    auto const address = parse_address(j[key]);
    if (!address.has_value()) {
        return OperationCodecError::InvalidAddress;
    }
    return *address;
}

Result<uint256_t> amount_field(nlohmann::json const &j, char const *const key)
{
    if (!j.contains(key)) {
        return OperationCodecError::MissingField;
    }
    auto const amount = parse_amount(j[key]);
    if (!amount.has_value()) {
        return OperationCodecError::InvalidAmount;
    }
    return *amount;
}

Result<uint64_t> u64_field(nlohmann::json const &j, char const *const key)
{
    if (!j.contains(key)) {
        return OperationCodecError::MissingField;
    }
    auto const value = parse_u64(j[key]);
    if (!value.has_value()) {
        return OperationCodecError::InvalidField;
    }
    return *value;
}

Result<bool> bool_field(nlohmann::json const &j, char const *const key)
{
    if (!j.contains(key)) {
        return OperationCodecError::MissingField;
    }
    if (!j[key].is_boolean()) {
        return OperationCodecError::InvalidField;
    }
    return j[key].get<bool>();
}

Result<Operation>
parse_operation_body(std::string_view const name, nlohmann::json const &j)
{
    if (name == "transfer") {
        BOOST_OUTCOME_TRY(auto const to, address_field(j, "to"));
        BOOST_OUTCOME_TRY(auto const amount, amount_field(j, "amount"));
        return TransferOp{.to = to, .amount = amount};
    }
    if (name == "transfer_from") {
        BOOST_OUTCOME_TRY(auto const from, address_field(j, "from"));
        BOOST_OUTCOME_TRY(auto const to, address_field(j, "to"));
        BOOST_OUTCOME_TRY(auto const amount, amount_field(j, "amount"));
        return TransferFromOp{.from = from, .to = to, .amount = amount};
    }
    if (name == "approve") {
        BOOST_OUTCOME_TRY(auto const spender, address_field(j, "spender"));
        BOOST_OUTCOME_TRY(auto const amount, amount_field(j, "amount"));
        return ApproveOp{.spender = spender, .amount = amount};
    }
    if (name == "mint") {
        BOOST_OUTCOME_TRY(auto const to, address_field(j, "to"));
        BOOST_OUTCOME_TRY(auto const amount, amount_field(j, "amount"));
        return MintOp{.to = to, .amount = amount};
    }
    if (name == "burn") {
        BOOST_OUTCOME_TRY(auto const amount, amount_field(j, "amount"));
        return BurnOp{.amount = amount};
    }
    if (name == "stake") {
        BOOST_OUTCOME_TRY(auto const amount, amount_field(j, "amount"));
        return StakeOp{.amount = amount};
    }
    if (name == "unstake") {
        return UnstakeOp{};
    }
    if (name == "claim_rewards") {
        return ClaimRewardsOp{};
    }
    if (name == "update_staking_pool") {
        BOOST_OUTCOME_TRY(auto const apy, u64_field(j, "apy_percent"));
        BOOST_OUTCOME_TRY(auto const lock, u64_field(j, "lock_period"));
        return UpdateStakingPoolOp{.apy_percent = apy, .lock_period = lock};
    }
    if (name == "set_staking_active") {
        BOOST_OUTCOME_TRY(auto const active, bool_field(j, "active"));
        return SetStakingActiveOp{.active = active};
    }
    if (name == "pause") {
        return PauseOp{};
    }
    if (name == "unpause") {
        return UnpauseOp{};
    }
    if (name == "transfer_ownership") {
        BOOST_OUTCOME_TRY(auto const new_owner, address_field(j, "new_owner"));
        return TransferOwnershipOp{.new_owner = new_owner};
    }
    return OperationCodecError::UnknownOperation;
}

SDUPI_TOKEN_ANONYMOUS_NAMESPACE_END

Result<ScriptedOperation> parse_operation(nlohmann::json const &j)
{
    if (!j.is_object()) {
        return OperationCodecError::InvalidField;
    }
    if (!j.contains("op")) {
        return OperationCodecError::MissingField;
    }
    if (!j["op"].is_string()) {
        return OperationCodecError::InvalidField;
    }
    BOOST_OUTCOME_TRY(auto const sender, address_field(j, "sender"));
    BOOST_OUTCOME_TRY(auto const timestamp, u64_field(j, "timestamp"));
    BOOST_OUTCOME_TRY(
        auto const op,
        parse_operation_body(j["op"].get_ref<std::string const &>(), j));
    return ScriptedOperation{
        .ctx = CallContext{.sender = sender, .timestamp = timestamp},
        .op = op};
}

Result<std::vector<ScriptedOperation>>
parse_operations(nlohmann::json const &j)
{
    if (!j.is_array()) {
        return OperationCodecError::NotAnArray;
    }
    std::vector<ScriptedOperation> ops;
    ops.reserve(j.size());
    for (size_t i = 0; i < j.size(); ++i) {
        auto res = parse_operation(j[i]);
        if (res.has_error()) {
            LOG_ERROR(
                "operation {} is malformed: {}",
                i,
                res.error().message().c_str());
            return std::move(res).as_failure();
        }
        ops.push_back(std::move(res).value());
    }
    return ops;
}

Result<std::vector<ScriptedOperation>>
read_operations(std::filesystem::path const &path)
{
    std::ifstream in{path};
    if (!in) {
        LOG_ERROR("cannot open operations file {}", path.string());
        return OperationCodecError::InvalidJson;
    }
    std::string const text{
        std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    auto const j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        LOG_ERROR("operations file {} is not valid json", path.string());
        return OperationCodecError::InvalidJson;
    }
    return parse_operations(j);
}

SDUPI_TOKEN_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<sdupi::token::OperationCodecError>::mapping> const &
quick_status_code_from_enum<sdupi::token::OperationCodecError>::value_mappings()
{
    using sdupi::token::OperationCodecError;

    static std::initializer_list<mapping> const v = {
        {OperationCodecError::Success, "success", {errc::success}},
        {OperationCodecError::InvalidJson, "invalid json", {}},
        {OperationCodecError::NotAnArray, "operations must be an array", {}},
        {OperationCodecError::UnknownOperation, "unknown operation", {}},
        {OperationCodecError::MissingField, "missing field", {}},
        {OperationCodecError::InvalidField, "invalid field", {}},
        {OperationCodecError::InvalidAddress, "invalid address", {}},
        {OperationCodecError::InvalidAmount, "invalid amount", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
