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

#include <unordered_map>
#include <utility>

SDUPI_TOKEN_NAMESPACE_BEGIN

// Account balances, allowances and total supply. Every mutating member either
// applies completely or returns an error and leaves the ledger untouched.
// Authorization and pause checks are the caller's concern.
class Ledger
{
    struct AllowanceKeyHash
    {
        size_t operator()(std::pair<Address, Address> const &key) const noexcept
        {
            size_t const h1 = std::hash<Address>{}(key.first);
            size_t const h2 = std::hash<Address>{}(key.second);
            return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
        }
    };

    std::unordered_map<Address, uint256_t> balances_;
    std::unordered_map<std::pair<Address, Address>, uint256_t, AllowanceKeyHash>
        allowances_;
    uint256_t total_supply_{0};

public:
    uint256_t balance_of(Address const &) const noexcept;
    uint256_t allowance(Address const &owner, Address const &spender) const
        noexcept;

    uint256_t const &total_supply() const noexcept
    {
        return total_supply_;
    }

    // Sum of every balance. Linear in the number of accounts; meant for
    // invariant checks and reporting.
    uint256_t sum_of_balances() const noexcept;

    size_t account_count() const noexcept
    {
        return balances_.size();
    }

    // Validation only. Succeeds iff the corresponding mutation would.
    Result<void> check_transfer(
        Address const &from, Address const &to, uint256_t const &amount) const;
    Result<void> check_mint(Address const &to, uint256_t const &amount) const;

    Result<void>
    transfer(Address const &from, Address const &to, uint256_t const &amount);
    Result<void> mint(Address const &to, uint256_t const &amount);
    Result<void> burn(Address const &from, uint256_t const &amount);

    Result<void> approve(
        Address const &owner, Address const &spender, uint256_t const &amount);

    // Debits the allowance and moves the tokens as one unit
    Result<void> transfer_from(
        Address const &spender, Address const &from, Address const &to,
        uint256_t const &amount);

private:
    void store_balance(Address const &, uint256_t const &);
};

SDUPI_TOKEN_NAMESPACE_END
