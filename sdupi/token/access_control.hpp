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
#include <sdupi/core/result.hpp>
#include <sdupi/token/config.hpp>

SDUPI_TOKEN_NAMESPACE_BEGIN

// Owner and pause flag. Set at construction, changed only by the owner.
class AccessControl
{
    Address owner_;
    bool paused_{false};

public:
    explicit AccessControl(Address const &owner);

    Address const &owner() const noexcept
    {
        return owner_;
    }

    bool paused() const noexcept
    {
        return paused_;
    }

    Result<void> require_owner(Address const &caller) const;
    Result<void> require_not_paused() const;

    Result<void> pause(Address const &caller);
    Result<void> unpause(Address const &caller);
    Result<void>
    transfer_ownership(Address const &caller, Address const &new_owner);
};

SDUPI_TOKEN_NAMESPACE_END
