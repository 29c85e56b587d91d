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
#include <sdupi/token/access_control.hpp>
#include <sdupi/token/token_error.hpp>

#include <gtest/gtest.h>

using namespace sdupi;
using namespace sdupi::token;

namespace
{
    constexpr Address OWNER{0x0a};
    constexpr Address MALLORY{0x0bad};
    constexpr Address HEIR{0x0e1};
}

TEST(AccessControl, owner_checks)
{
    AccessControl access{OWNER};
    EXPECT_EQ(access.owner(), OWNER);
    EXPECT_FALSE(access.require_owner(OWNER).has_error());
    EXPECT_EQ(
        access.require_owner(MALLORY).assume_error(),
        TokenError::Unauthorized);
}

TEST(AccessControl, pause_is_owner_only_and_idempotent)
{
    AccessControl access{OWNER};
    EXPECT_FALSE(access.paused());
    EXPECT_FALSE(access.require_not_paused().has_error());

    EXPECT_EQ(access.pause(MALLORY).assume_error(), TokenError::Unauthorized);
    EXPECT_FALSE(access.paused());

    ASSERT_FALSE(access.pause(OWNER).has_error());
    ASSERT_FALSE(access.pause(OWNER).has_error());
    EXPECT_TRUE(access.paused());
    EXPECT_EQ(
        access.require_not_paused().assume_error(), TokenError::SystemPaused);

    EXPECT_EQ(access.unpause(MALLORY).assume_error(), TokenError::Unauthorized);
    ASSERT_FALSE(access.unpause(OWNER).has_error());
    ASSERT_FALSE(access.unpause(OWNER).has_error());
    EXPECT_FALSE(access.paused());
}

TEST(AccessControl, transfer_ownership)
{
    AccessControl access{OWNER};
    EXPECT_EQ(
        access.transfer_ownership(MALLORY, MALLORY).assume_error(),
        TokenError::Unauthorized);
    EXPECT_EQ(
        access.transfer_ownership(OWNER, NULL_ADDRESS).assume_error(),
        TokenError::InvalidRecipient);

    ASSERT_FALSE(access.transfer_ownership(OWNER, HEIR).has_error());
    EXPECT_EQ(access.owner(), HEIR);
    EXPECT_EQ(access.pause(OWNER).assume_error(), TokenError::Unauthorized);
    EXPECT_FALSE(access.pause(HEIR).has_error());
}
