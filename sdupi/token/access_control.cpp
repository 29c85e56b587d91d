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

#include <sdupi/core/assert.h>
#include <sdupi/core/likely.h>
#include <sdupi/token/access_control.hpp>
#include <sdupi/token/token_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

SDUPI_TOKEN_NAMESPACE_BEGIN

AccessControl::AccessControl(Address const &owner)
    : owner_{owner}
{
    SDUPI_ASSERT(!is_null(owner_), "owner must not be the null address");
}

Result<void> AccessControl::require_owner(Address const &caller) const
{
    if (SDUPI_UNLIKELY(caller != owner_)) {
        return TokenError::Unauthorized;
    }
    return outcome::success();
}

Result<void> AccessControl::require_not_paused() const
{
    if (SDUPI_UNLIKELY(paused_)) {
        return TokenError::SystemPaused;
    }
    return outcome::success();
}

Result<void> AccessControl::pause(Address const &caller)
{
    BOOST_OUTCOME_TRYV(require_owner(caller));
    paused_ = true;
    return outcome::success();
}

Result<void> AccessControl::unpause(Address const &caller)
{
    BOOST_OUTCOME_TRYV(require_owner(caller));
    paused_ = false;
    return outcome::success();
}

Result<void> AccessControl::transfer_ownership(
    Address const &caller, Address const &new_owner)
{
    BOOST_OUTCOME_TRYV(require_owner(caller));
    if (SDUPI_UNLIKELY(is_null(new_owner))) {
        return TokenError::InvalidRecipient;
    }
    owner_ = new_owner;
    return outcome::success();
}

SDUPI_TOKEN_NAMESPACE_END
