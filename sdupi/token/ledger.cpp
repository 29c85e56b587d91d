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
#include <sdupi/core/likely.h>
#include <sdupi/token/ledger.hpp>
#include <sdupi/token/token_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

SDUPI_TOKEN_NAMESPACE_BEGIN

uint256_t Ledger::balance_of(Address const &address) const noexcept
{
    auto const it = balances_.find(address);
    return it == balances_.end() ? uint256_t{0} : it->second;
}

uint256_t
Ledger::allowance(Address const &owner, Address const &spender) const noexcept
{
    auto const it = allowances_.find({owner, spender});
    return it == allowances_.end() ? uint256_t{0} : it->second;
}

uint256_t Ledger::sum_of_balances() const noexcept
{
    uint256_t sum{0};
    for (auto const &[_, balance] : balances_) {
        sum += balance;
    }
    return sum;
}

void Ledger::store_balance(Address const &address, uint256_t const &balance)
{
    if (balance == 0) {
        balances_.erase(address);
    }
    else {
        balances_[address] = balance;
    }
}

Result<void> Ledger::check_transfer(
    Address const &from, Address const &to, uint256_t const &amount) const
{
    if (SDUPI_UNLIKELY(is_null(to))) {
        return TokenError::InvalidRecipient;
    }
    if (SDUPI_UNLIKELY(balance_of(from) < amount)) {
        return TokenError::InsufficientBalance;
    }
    if (from != to) {
        BOOST_OUTCOME_TRYV(checked_add(balance_of(to), amount));
    }
    return outcome::success();
}

Result<void>
Ledger::check_mint(Address const &to, uint256_t const &amount) const
{
    if (SDUPI_UNLIKELY(amount == 0)) {
        return TokenError::InvalidAmount;
    }
    if (SDUPI_UNLIKELY(is_null(to))) {
        return TokenError::InvalidRecipient;
    }
    BOOST_OUTCOME_TRYV(checked_add(total_supply_, amount));
    BOOST_OUTCOME_TRYV(checked_add(balance_of(to), amount));
    return outcome::success();
}

Result<void> Ledger::transfer(
    Address const &from, Address const &to, uint256_t const &amount)
{
    BOOST_OUTCOME_TRYV(check_transfer(from, to, amount));
    if (from == to) {
        return outcome::success();
    }
    store_balance(from, balance_of(from) - amount);
    store_balance(to, balance_of(to) + amount);
    return outcome::success();
}

Result<void> Ledger::mint(Address const &to, uint256_t const &amount)
{
    BOOST_OUTCOME_TRYV(check_mint(to, amount));
    total_supply_ += amount;
    store_balance(to, balance_of(to) + amount);
    return outcome::success();
}

Result<void> Ledger::burn(Address const &from, uint256_t const &amount)
{
    if (SDUPI_UNLIKELY(amount == 0)) {
        return TokenError::InvalidAmount;
    }
    auto const balance = balance_of(from);
    if (SDUPI_UNLIKELY(balance < amount)) {
        return TokenError::InsufficientBalance;
    }
    store_balance(from, balance - amount);
    total_supply_ -= amount;
    return outcome::success();
}

Result<void> Ledger::approve(
    Address const &owner, Address const &spender, uint256_t const &amount)
{
    if (SDUPI_UNLIKELY(is_null(spender))) {
        return TokenError::InvalidRecipient;
    }
    if (amount == 0) {
        allowances_.erase({owner, spender});
    }
    else {
        allowances_[{owner, spender}] = amount;
    }
    return outcome::success();
}

Result<void> Ledger::transfer_from(
    Address const &spender, Address const &from, Address const &to,
    uint256_t const &amount)
{
    auto const allowed = allowance(from, spender);
    if (SDUPI_UNLIKELY(allowed < amount)) {
        return TokenError::InsufficientAllowance;
    }
    BOOST_OUTCOME_TRYV(transfer(from, to, amount));
    if (allowed == amount) {
        allowances_.erase({from, spender});
    }
    else {
        allowances_[{from, spender}] = allowed - amount;
    }
    return outcome::success();
}

SDUPI_TOKEN_NAMESPACE_END
