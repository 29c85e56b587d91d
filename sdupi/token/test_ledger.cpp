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
#include <sdupi/core/checked_math.hpp>
#include <sdupi/core/int.hpp>
#include <sdupi/token/ledger.hpp>
#include <sdupi/token/token_error.hpp>

#include <gtest/gtest.h>

using namespace sdupi;
using namespace sdupi::token;

namespace
{
    constexpr Address ALICE{0xa11ce};
    constexpr Address BOB{0xb0b};
    constexpr Address CAROL{0xca201};
}

TEST(Ledger, mint_increases_balance_and_supply)
{
    Ledger ledger;
    ASSERT_FALSE(ledger.mint(ALICE, 100).has_error());
    ASSERT_FALSE(ledger.mint(ALICE, 50).has_error());
    EXPECT_EQ(ledger.balance_of(ALICE), 150);
    EXPECT_EQ(ledger.total_supply(), 150);
    EXPECT_EQ(ledger.sum_of_balances(), ledger.total_supply());
}

TEST(Ledger, mint_rejects_zero_and_null)
{
    Ledger ledger;
    auto res = ledger.mint(ALICE, 0);
    EXPECT_EQ(res.assume_error(), TokenError::InvalidAmount);
    res = ledger.mint(NULL_ADDRESS, 1);
    EXPECT_EQ(res.assume_error(), TokenError::InvalidRecipient);
    EXPECT_EQ(ledger.total_supply(), 0);
    EXPECT_EQ(ledger.account_count(), 0);
}

TEST(Ledger, mint_overflow_is_rejected)
{
    Ledger ledger;
    ASSERT_FALSE(ledger.mint(ALICE, UINT256_MAX).has_error());
    auto const res = ledger.mint(BOB, 1);
    EXPECT_EQ(res.assume_error(), MathError::Overflow);
    EXPECT_EQ(ledger.balance_of(BOB), 0);
    EXPECT_EQ(ledger.total_supply(), UINT256_MAX);
}

TEST(Ledger, transfer)
{
    Ledger ledger;
    ASSERT_FALSE(ledger.mint(ALICE, 100).has_error());

    ASSERT_FALSE(ledger.transfer(ALICE, BOB, 40).has_error());
    EXPECT_EQ(ledger.balance_of(ALICE), 60);
    EXPECT_EQ(ledger.balance_of(BOB), 40);

    // whole balance, sender drops out of the account set
    ASSERT_FALSE(ledger.transfer(ALICE, BOB, 60).has_error());
    EXPECT_EQ(ledger.balance_of(ALICE), 0);
    EXPECT_EQ(ledger.account_count(), 1);
    EXPECT_EQ(ledger.total_supply(), 100);
}

TEST(Ledger, transfer_zero_and_self)
{
    Ledger ledger;
    ASSERT_FALSE(ledger.mint(ALICE, 10).has_error());
    ASSERT_FALSE(ledger.transfer(ALICE, BOB, 0).has_error());
    ASSERT_FALSE(ledger.transfer(ALICE, ALICE, 10).has_error());
    EXPECT_EQ(ledger.balance_of(ALICE), 10);
    EXPECT_EQ(ledger.balance_of(BOB), 0);

    auto const res = ledger.transfer(ALICE, ALICE, 11);
    EXPECT_EQ(res.assume_error(), TokenError::InsufficientBalance);
}

TEST(Ledger, transfer_failures_leave_balances)
{
    Ledger ledger;
    ASSERT_FALSE(ledger.mint(ALICE, 10).has_error());

    auto res = ledger.transfer(ALICE, BOB, 11);
    EXPECT_EQ(res.assume_error(), TokenError::InsufficientBalance);
    res = ledger.transfer(ALICE, NULL_ADDRESS, 1);
    EXPECT_EQ(res.assume_error(), TokenError::InvalidRecipient);

    EXPECT_EQ(ledger.balance_of(ALICE), 10);
    EXPECT_EQ(ledger.balance_of(BOB), 0);
}

TEST(Ledger, burn)
{
    Ledger ledger;
    ASSERT_FALSE(ledger.mint(ALICE, 10).has_error());

    auto res = ledger.burn(ALICE, 0);
    EXPECT_EQ(res.assume_error(), TokenError::InvalidAmount);
    res = ledger.burn(ALICE, 11);
    EXPECT_EQ(res.assume_error(), TokenError::InsufficientBalance);

    ASSERT_FALSE(ledger.burn(ALICE, 4).has_error());
    EXPECT_EQ(ledger.balance_of(ALICE), 6);
    EXPECT_EQ(ledger.total_supply(), 6);
}

TEST(Ledger, allowance_flow)
{
    Ledger ledger;
    ASSERT_FALSE(ledger.mint(ALICE, 100).has_error());
    ASSERT_FALSE(ledger.approve(ALICE, BOB, 30).has_error());
    EXPECT_EQ(ledger.allowance(ALICE, BOB), 30);
    EXPECT_EQ(ledger.allowance(BOB, ALICE), 0);

    auto res = ledger.transfer_from(BOB, ALICE, CAROL, 31);
    EXPECT_EQ(res.assume_error(), TokenError::InsufficientAllowance);

    ASSERT_FALSE(ledger.transfer_from(BOB, ALICE, CAROL, 20).has_error());
    EXPECT_EQ(ledger.allowance(ALICE, BOB), 10);
    EXPECT_EQ(ledger.balance_of(CAROL), 20);
    EXPECT_EQ(ledger.balance_of(ALICE), 80);

    // allowance is not consumed when the transfer itself fails
    res = ledger.transfer_from(BOB, ALICE, NULL_ADDRESS, 5);
    EXPECT_EQ(res.assume_error(), TokenError::InvalidRecipient);
    EXPECT_EQ(ledger.allowance(ALICE, BOB), 10);

    ASSERT_FALSE(ledger.approve(ALICE, BOB, 0).has_error());
    EXPECT_EQ(ledger.allowance(ALICE, BOB), 0);

    res = ledger.approve(ALICE, NULL_ADDRESS, 1);
    EXPECT_EQ(res.assume_error(), TokenError::InvalidRecipient);
}

TEST(Ledger, allowance_larger_than_balance)
{
    Ledger ledger;
    ASSERT_FALSE(ledger.mint(ALICE, 5).has_error());
    ASSERT_FALSE(ledger.approve(ALICE, BOB, 50).has_error());

    auto const res = ledger.transfer_from(BOB, ALICE, BOB, 6);
    EXPECT_EQ(res.assume_error(), TokenError::InsufficientBalance);
    EXPECT_EQ(ledger.allowance(ALICE, BOB), 50);
}
