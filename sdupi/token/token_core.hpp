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
#include <sdupi/token/access_control.hpp>
#include <sdupi/token/call_context.hpp>
#include <sdupi/token/config.hpp>
#include <sdupi/token/constants.hpp>
#include <sdupi/token/event.hpp>
#include <sdupi/token/ledger.hpp>
#include <sdupi/token/operation.hpp>
#include <sdupi/token/stake_book.hpp>
#include <sdupi/token/staking_pool.hpp>

#include <cstdint>
#include <mutex>
#include <string_view>
#include <vector>

SDUPI_TOKEN_NAMESPACE_BEGIN

struct StakingInfo
{
    uint256_t amount{0};
    uint64_t start_time{0};
    uint64_t lock_end_time{0};
    uint256_t current_reward{0};
    bool is_staked{false};

    bool operator==(StakingInfo const &) const = default;
};

// The token and its staking engine behind one lock.
//
// Every mutation takes the lock, marks the core as entered for its whole
// duration and either commits all of its effects or none. Events of a
// successful mutation are delivered to the observers before the call returns,
// with the core still entered. A mutation reached from inside another one
// (an observer calling back into the core on the same thread) fails with
// TokenError::ReentrancyDetected. Queries never take the entered flag and may
// be issued from anywhere.
//
// Neither the null address nor the staking reserve may act as a sender
// (Unauthorized). The reserve may not receive transfers or mints or become
// owner (InvalidRecipient).
class TokenCore
{
    class MutationScope;

    mutable std::recursive_mutex mutex_;
    bool entered_{false};

    AccessControl access_;
    Ledger ledger_;
    StakeBook stakes_;
    StakingPool pool_;

    std::vector<TokenObserver *> observers_;
    std::vector<Event> pending_;

public:
    explicit TokenCore(
        Address const &owner, StakingPoolParams const & = {},
        uint256_t const &genesis_supply = GENESIS_SUPPLY);

    TokenCore(TokenCore const &) = delete;
    TokenCore &operator=(TokenCore const &) = delete;

    // The observer must outlive the core or be removed first. Both may be
    // called from inside a callback: an observer removed during a delivery
    // is not called again, one added during a delivery is first called for
    // the next mutation.
    void add_observer(TokenObserver &);
    void remove_observer(TokenObserver &);

    Result<void> transfer(
        CallContext const &, Address const &to, uint256_t const &amount);
    Result<void> transfer_from(
        CallContext const &, Address const &from, Address const &to,
        uint256_t const &amount);
    Result<void> approve(
        CallContext const &, Address const &spender, uint256_t const &amount);
    Result<void>
    mint(CallContext const &, Address const &to, uint256_t const &amount);
    Result<void> burn(CallContext const &, uint256_t const &amount);

    Result<void> stake(CallContext const &, uint256_t const &amount);
    Result<void> unstake(CallContext const &);
    Result<void> claim_rewards(CallContext const &);

    Result<void> update_staking_pool(
        CallContext const &, uint64_t apy_percent, uint64_t lock_period);
    Result<void> set_staking_active(CallContext const &, bool active);

    Result<void> pause(CallContext const &);
    Result<void> unpause(CallContext const &);
    Result<void>
    transfer_ownership(CallContext const &, Address const &new_owner);

    Result<void> execute(CallContext const &, Operation const &);

    uint256_t balance_of(Address const &) const;
    uint256_t allowance(Address const &owner, Address const &spender) const;
    uint256_t total_supply() const;

    // `current_reward` is what claim_rewards would pay at `now`
    Result<StakingInfo> get_staking_info(Address const &, uint64_t now) const;
    StakingPoolInfo get_staking_pool_info() const;

    Address owner() const;
    bool paused() const;

    std::string_view name() const noexcept
    {
        return TOKEN_NAME;
    }

    std::string_view symbol() const noexcept
    {
        return TOKEN_SYMBOL;
    }

    uint8_t decimals() const noexcept
    {
        return TOKEN_DECIMALS;
    }

    // Balances plus escrow add up to the total supply and the reserve holds
    // exactly the staked principal
    bool is_consistent() const;

private:
    template <typename Fn>
    Result<void>
    run_mutation(CallContext const &, std::string_view name, Fn &&);

    void emit(Event);
    void deliver_pending();
};

SDUPI_TOKEN_NAMESPACE_END
