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
#include <sdupi/token/operation.hpp>
#include <sdupi/token/operation_codec.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <variant>

using namespace sdupi;
using namespace sdupi::token;

namespace
{
    constexpr Address OWNER{0xa0};
    constexpr Address ALICE{0xa11ce};
    constexpr Address BOB{0xb0b};

    Result<ScriptedOperation> parse(char const *const text)
    {
        return parse_operation(nlohmann::json::parse(text));
    }
}

TEST(OperationCodec, transfer)
{
    auto const res = parse(R"({
        "op": "transfer",
        "sender": "0x00000000000000000000000000000000000a11ce",
        "timestamp": 1735689600,
        "to": "0xb0b0",
        "amount": "1000000000000000000"
    })");
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().ctx.sender, ALICE);
    EXPECT_EQ(res.value().ctx.timestamp, 1735689600);
    auto const *const op = std::get_if<TransferOp>(&res.value().op);
    ASSERT_NE(op, nullptr);
    EXPECT_EQ(op->to, Address{0xb0b0});
    EXPECT_EQ(op->amount, 1'000'000'000'000'000'000ULL);
}

TEST(OperationCodec, every_operation)
{
    auto const res = parse_operations(nlohmann::json::parse(R"([
        {"op": "transfer", "sender": "0xa0", "timestamp": 1,
         "to": "0x0b0b", "amount": 5},
        {"op": "transfer_from", "sender": "0x0b0b", "timestamp": 2,
         "from": "0xa0", "to": "0x0b0b", "amount": "0x10"},
        {"op": "approve", "sender": "0xa0", "timestamp": 3,
         "spender": "0x0b0b", "amount": "7"},
        {"op": "mint", "sender": "0xa0", "timestamp": 4,
         "to": "0x0b0b", "amount": "8"},
        {"op": "burn", "sender": "0x0b0b", "timestamp": 5, "amount": "9"},
        {"op": "stake", "sender": "0x0b0b", "timestamp": 6, "amount": "10"},
        {"op": "unstake", "sender": "0x0b0b", "timestamp": 7},
        {"op": "claim_rewards", "sender": "0x0b0b", "timestamp": 8},
        {"op": "update_staking_pool", "sender": "0xa0", "timestamp": 9,
         "apy_percent": 20, "lock_period": "86400"},
        {"op": "set_staking_active", "sender": "0xa0", "timestamp": 10,
         "active": false},
        {"op": "pause", "sender": "0xa0", "timestamp": 11},
        {"op": "unpause", "sender": "0xa0", "timestamp": 12},
        {"op": "transfer_ownership", "sender": "0xa0", "timestamp": 13,
         "new_owner": "0x0b0b"}
    ])"));
    ASSERT_FALSE(res.has_error());
    auto const &ops = res.value();
    ASSERT_EQ(ops.size(), 13);

    char const *const names[] = {
        "transfer",
        "transfer_from",
        "approve",
        "mint",
        "burn",
        "stake",
        "unstake",
        "claim_rewards",
        "update_staking_pool",
        "set_staking_active",
        "pause",
        "unpause",
        "transfer_ownership"};
    for (size_t i = 0; i < ops.size(); ++i) {
        EXPECT_EQ(operation_name(ops[i].op), names[i]);
        EXPECT_EQ(ops[i].ctx.timestamp, i + 1);
    }

    auto const &transfer_from = std::get<TransferFromOp>(ops[1].op);
    EXPECT_EQ(transfer_from.from, OWNER);
    EXPECT_EQ(transfer_from.to, BOB);
    EXPECT_EQ(transfer_from.amount, 16);

    auto const &update = std::get<UpdateStakingPoolOp>(ops[8].op);
    EXPECT_EQ(update.apy_percent, 20);
    EXPECT_EQ(update.lock_period, 86400);

    EXPECT_FALSE(std::get<SetStakingActiveOp>(ops[9].op).active);
    EXPECT_EQ(std::get<TransferOwnershipOp>(ops[12].op).new_owner, BOB);
}

TEST(OperationCodec, errors)
{
    auto check = [](char const *const text, OperationCodecError const expected) {
        auto const res = parse(text);
        ASSERT_TRUE(res.has_error()) << text;
        EXPECT_EQ(res.assume_error(), expected) << text;
    };

    check(R"(5)", OperationCodecError::InvalidField);
    check(R"({"sender": "0xa0", "timestamp": 1})", OperationCodecError::MissingField);
    check(
        R"({"op": 3, "sender": "0xa0", "timestamp": 1})",
        OperationCodecError::InvalidField);
    check(
        R"({"op": "selfdestruct", "sender": "0xa0", "timestamp": 1})",
        OperationCodecError::UnknownOperation);
    check(R"({"op": "pause", "timestamp": 1})", OperationCodecError::MissingField);
    check(
        R"({"op": "pause", "sender": "0xa0"})",
        OperationCodecError::MissingField);
    check(
        R"({"op": "pause", "sender": "0xa0", "timestamp": -1})",
        OperationCodecError::InvalidField);
    check(
        R"({"op": "pause", "sender": "not hex", "timestamp": 1})",
        OperationCodecError::InvalidAddress);
    check(
        R"({"op": "stake", "sender": "0xa0", "timestamp": 1})",
        OperationCodecError::MissingField);
    check(
        R"({"op": "stake", "sender": "0xa0", "timestamp": 1, "amount": 1.5})",
        OperationCodecError::InvalidAmount);
    check(
        R"({"op": "transfer", "sender": "0xa0", "timestamp": 1,
            "to": "0x0123456789012345678901234567890123456789ab",
            "amount": "1"})",
        OperationCodecError::InvalidAddress);
    check(
        R"({"op": "set_staking_active", "sender": "0xa0", "timestamp": 1,
            "active": "yes"})",
        OperationCodecError::InvalidField);
}

TEST(OperationCodec, script_must_be_array)
{
    auto const res = parse_operations(nlohmann::json::parse(R"({})"));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), OperationCodecError::NotAnArray);

    auto const bad_entry = parse_operations(nlohmann::json::parse(
        R"([{"op": "pause", "sender": "0xa0", "timestamp": 1}, {"op": "x"}])"));
    ASSERT_TRUE(bad_entry.has_error());
    EXPECT_EQ(bad_entry.assume_error(), OperationCodecError::MissingField);
}
