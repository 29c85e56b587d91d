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
#include <sdupi/core/checked_math.hpp>
#include <sdupi/core/fmt/address_fmt.hpp>
#include <sdupi/core/fmt/int_fmt.hpp>
#include <sdupi/core/likely.h>
#include <sdupi/core/variant.hpp>
#include <sdupi/token/reward.hpp>
#include <sdupi/token/token_core.hpp>
#include <sdupi/token/token_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <limits>
#include <mutex>
#include <utility>

SDUPI_TOKEN_NAMESPACE_BEGIN

SDUPI_TOKEN_ANONYMOUS_NAMESPACE_BEGIN

uint64_t lock_end_time(StakeRecord const &record) noexcept
{
    if (record.lock_period >
        std::numeric_limits<uint64_t>::max() - record.start_time) {
        return std::numeric_limits<uint64_t>::max();
    }
    return record.start_time + record.lock_period;
}

bool lock_elapsed(StakeRecord const &record, uint64_t const now) noexcept
{
    return now >= record.start_time &&
           now - record.start_time >= record.lock_period;
}

Result<void> require_user_sender(Address const &sender)
{
    if (SDUPI_UNLIKELY(is_null(sender) || sender == STAKING_RESERVE)) {
        return TokenError::Unauthorized;
    }
    return outcome::success();
}

Result<void> require_user_recipient(Address const &to)
{
    if (SDUPI_UNLIKELY(to == STAKING_RESERVE)) {
        return TokenError::InvalidRecipient;
    }
    return outcome::success();
}

SDUPI_TOKEN_ANONYMOUS_NAMESPACE_END

class TokenCore::MutationScope
{
    TokenCore &core_;
    std::unique_lock<std::recursive_mutex> lock_;
    bool const outermost_;

public:
    explicit MutationScope(TokenCore &core)
        : core_{core}
        , lock_{core.mutex_}
        , outermost_{!core.entered_}
    {
        core_.entered_ = true;
    }

    MutationScope(MutationScope const &) = delete;
    MutationScope &operator=(MutationScope const &) = delete;

    ~MutationScope()
    {
        if (outermost_) {
            core_.pending_.clear();
            core_.entered_ = false;
        }
    }

    bool reentered() const noexcept
    {
        return !outermost_;
    }
};

TokenCore::TokenCore(
    Address const &owner, StakingPoolParams const &params,
    uint256_t const &genesis_supply)
    : access_{owner}
    , pool_{params}
{
    SDUPI_ASSERT(owner != STAKING_RESERVE);
    if (genesis_supply != 0) {
        auto const minted = ledger_.mint(owner, genesis_supply);
        SDUPI_ASSERT(minted.has_value());
    }
}

void TokenCore::add_observer(TokenObserver &observer)
{
    std::lock_guard const lock{mutex_};
    observers_.push_back(&observer);
}

void TokenCore::remove_observer(TokenObserver &observer)
{
    std::lock_guard const lock{mutex_};
    std::erase(observers_, &observer);
}

template <typename Fn>
Result<void> TokenCore::run_mutation(
    CallContext const &ctx, std::string_view const name, Fn &&fn)
{
    MutationScope const scope{*this};
    if (SDUPI_UNLIKELY(scope.reentered())) {
        LOG_DEBUG("{} from {} rejected: reentrant call", name, ctx.sender);
        return TokenError::ReentrancyDetected;
    }
    SDUPI_ASSERT(pending_.empty());

    auto res = std::forward<Fn>(fn)();
    if (SDUPI_UNLIKELY(res.has_error())) {
        LOG_DEBUG(
            "{} from {} rejected: {}",
            name,
            ctx.sender,
            res.error().message().c_str());
        return res;
    }
    SDUPI_DEBUG_ASSERT(is_consistent());
    deliver_pending();
    return outcome::success();
}

void TokenCore::emit(Event event)
{
    pending_.push_back(std::move(event));
}

void TokenCore::deliver_pending()
{
    auto const events = std::exchange(pending_, {});
    auto const observers = observers_;
    for (auto const &event : events) {
        for (auto *const observer : observers) {
            // removed by an earlier callback of this delivery
            if (std::ranges::find(observers_, observer) == observers_.end()) {
                continue;
            }
            observer->on_event(*this, event);
        }
    }
}

Result<void> TokenCore::transfer(
    CallContext const &ctx, Address const &to, uint256_t const &amount)
{
    return run_mutation(ctx, "transfer", [&]() -> Result<void> {
        BOOST_OUTCOME_TRYV(access_.require_not_paused());
        BOOST_OUTCOME_TRYV(require_user_sender(ctx.sender));
        BOOST_OUTCOME_TRYV(require_user_recipient(to));
        BOOST_OUTCOME_TRYV(ledger_.transfer(ctx.sender, to, amount));
        emit(TransferEvent{.from = ctx.sender, .to = to, .amount = amount});
        return outcome::success();
    });
}

Result<void> TokenCore::transfer_from(
    CallContext const &ctx, Address const &from, Address const &to,
    uint256_t const &amount)
{
    return run_mutation(ctx, "transfer_from", [&]() -> Result<void> {
        BOOST_OUTCOME_TRYV(access_.require_not_paused());
        BOOST_OUTCOME_TRYV(require_user_sender(ctx.sender));
        BOOST_OUTCOME_TRYV(require_user_sender(from));
        BOOST_OUTCOME_TRYV(require_user_recipient(to));
        BOOST_OUTCOME_TRYV(ledger_.transfer_from(ctx.sender, from, to, amount));
        emit(TransferEvent{.from = from, .to = to, .amount = amount});
        return outcome::success();
    });
}

Result<void> TokenCore::approve(
    CallContext const &ctx, Address const &spender, uint256_t const &amount)
{
    return run_mutation(ctx, "approve", [&]() -> Result<void> {
        BOOST_OUTCOME_TRYV(require_user_sender(ctx.sender));
        BOOST_OUTCOME_TRYV(ledger_.approve(ctx.sender, spender, amount));
        emit(ApprovalEvent{
            .owner = ctx.sender, .spender = spender, .amount = amount});
        return outcome::success();
    });
}

Result<void> TokenCore::mint(
    CallContext const &ctx, Address const &to, uint256_t const &amount)
{
    return run_mutation(ctx, "mint", [&]() -> Result<void> {
        BOOST_OUTCOME_TRYV(access_.require_owner(ctx.sender));
        BOOST_OUTCOME_TRYV(require_user_recipient(to));
        BOOST_OUTCOME_TRYV(ledger_.mint(to, amount));
        emit(TransferEvent{.from = NULL_ADDRESS, .to = to, .amount = amount});
        return outcome::success();
    });
}

Result<void> TokenCore::burn(CallContext const &ctx, uint256_t const &amount)
{
    return run_mutation(ctx, "burn", [&]() -> Result<void> {
        BOOST_OUTCOME_TRYV(access_.require_not_paused());
        BOOST_OUTCOME_TRYV(require_user_sender(ctx.sender));
        BOOST_OUTCOME_TRYV(ledger_.burn(ctx.sender, amount));
        emit(TransferEvent{
            .from = ctx.sender, .to = NULL_ADDRESS, .amount = amount});
        return outcome::success();
    });
}

Result<void> TokenCore::stake(CallContext const &ctx, uint256_t const &amount)
{
    return run_mutation(ctx, "stake", [&]() -> Result<void> {
        auto const &account = ctx.sender;
        BOOST_OUTCOME_TRYV(access_.require_not_paused());
        BOOST_OUTCOME_TRYV(require_user_sender(account));
        if (SDUPI_UNLIKELY(!pool_.is_active())) {
            return TokenError::StakingInactive;
        }
        if (SDUPI_UNLIKELY(amount < MIN_STAKE || amount > MAX_STAKE)) {
            return TokenError::AmountOutOfRange;
        }
        if (SDUPI_UNLIKELY(ledger_.balance_of(account) < amount)) {
            return TokenError::InsufficientBalance;
        }
        if (SDUPI_UNLIKELY(stakes_.has_active(account))) {
            return TokenError::AlreadyStaked;
        }
        BOOST_OUTCOME_TRYV(
            ledger_.check_transfer(account, STAKING_RESERVE, amount));
        BOOST_OUTCOME_TRY(auto const next_pool, pool_.with_stake(amount));

        uint64_t const now = ctx.timestamp;
        auto const escrowed = ledger_.transfer(account, STAKING_RESERVE, amount);
        SDUPI_ASSERT(escrowed.has_value());
        auto const opened =
            stakes_.open(account, amount, now, pool_.lock_period());
        SDUPI_ASSERT(opened.has_value());
        pool_.commit(next_pool);

        StakeRecord const *const record = stakes_.find(account);
        SDUPI_ASSERT(record != nullptr);
        emit(TransferEvent{
            .from = account, .to = STAKING_RESERVE, .amount = amount});
        emit(StakedEvent{
            .account = account,
            .amount = amount,
            .start_time = now,
            .lock_end_time = lock_end_time(*record)});
        return outcome::success();
    });
}

Result<void> TokenCore::unstake(CallContext const &ctx)
{
    return run_mutation(ctx, "unstake", [&]() -> Result<void> {
        auto const &account = ctx.sender;
        uint64_t const now = ctx.timestamp;
        BOOST_OUTCOME_TRYV(access_.require_not_paused());
        StakeRecord const *const record = stakes_.find(account);
        if (SDUPI_UNLIKELY(record == nullptr)) {
            return TokenError::NoActiveStake;
        }
        if (SDUPI_UNLIKELY(!lock_elapsed(*record, now))) {
            return TokenError::LockNotElapsed;
        }
        uint256_t const amount = record->amount;
        BOOST_OUTCOME_TRY(
            auto const reward,
            calculate_reward(*record, pool_.apy_percent(), now));
        BOOST_OUTCOME_TRY(
            auto const next_pool, pool_.with_unstake(amount, reward));
        BOOST_OUTCOME_TRYV(
            ledger_.check_transfer(STAKING_RESERVE, account, amount));
        if (reward != 0) {
            BOOST_OUTCOME_TRYV(ledger_.check_mint(account, reward));
            BOOST_OUTCOME_TRY(auto const credit, checked_add(amount, reward));
            BOOST_OUTCOME_TRYV(
                checked_add(ledger_.balance_of(account), credit));
        }

        stakes_.close(account);
        auto const released =
            ledger_.transfer(STAKING_RESERVE, account, amount);
        SDUPI_ASSERT(released.has_value());
        emit(TransferEvent{
            .from = STAKING_RESERVE, .to = account, .amount = amount});
        if (reward != 0) {
            auto const minted = ledger_.mint(account, reward);
            SDUPI_ASSERT(minted.has_value());
            emit(TransferEvent{
                .from = NULL_ADDRESS, .to = account, .amount = reward});
        }
        pool_.commit(next_pool);
        emit(UnstakedEvent{
            .account = account, .amount = amount, .reward = reward});
        return outcome::success();
    });
}

Result<void> TokenCore::claim_rewards(CallContext const &ctx)
{
    return run_mutation(ctx, "claim_rewards", [&]() -> Result<void> {
        auto const &account = ctx.sender;
        uint64_t const now = ctx.timestamp;
        BOOST_OUTCOME_TRYV(access_.require_not_paused());
        StakeRecord const *const record = stakes_.find(account);
        if (SDUPI_UNLIKELY(record == nullptr)) {
            return TokenError::NoActiveStake;
        }
        BOOST_OUTCOME_TRY(
            auto const reward,
            calculate_reward(*record, pool_.apy_percent(), now));
        if (SDUPI_UNLIKELY(reward == 0)) {
            return TokenError::NoRewardsAvailable;
        }
        BOOST_OUTCOME_TRY(auto const next_pool, pool_.with_claim(reward));
        BOOST_OUTCOME_TRYV(ledger_.check_mint(account, reward));

        auto const minted = ledger_.mint(account, reward);
        SDUPI_ASSERT(minted.has_value());
        stakes_.reset_snapshot(account, now);
        pool_.commit(next_pool);
        emit(TransferEvent{
            .from = NULL_ADDRESS, .to = account, .amount = reward});
        emit(RewardsClaimedEvent{.account = account, .reward = reward});
        return outcome::success();
    });
}

Result<void> TokenCore::update_staking_pool(
    CallContext const &ctx, uint64_t const apy_percent,
    uint64_t const lock_period)
{
    return run_mutation(ctx, "update_staking_pool", [&]() -> Result<void> {
        BOOST_OUTCOME_TRYV(access_.require_owner(ctx.sender));
        pool_.update(apy_percent, lock_period);
        LOG_INFO(
            "staking pool updated: apy {}% lock period {}s",
            apy_percent,
            lock_period);
        emit(StakingPoolUpdatedEvent{
            .apy_percent = apy_percent, .lock_period = lock_period});
        return outcome::success();
    });
}

Result<void>
TokenCore::set_staking_active(CallContext const &ctx, bool const active)
{
    return run_mutation(ctx, "set_staking_active", [&]() -> Result<void> {
        BOOST_OUTCOME_TRYV(access_.require_owner(ctx.sender));
        pool_.set_active(active);
        LOG_INFO("staking {}", active ? "activated" : "deactivated");
        emit(StakingStatusChangedEvent{.is_active = active});
        return outcome::success();
    });
}

Result<void> TokenCore::pause(CallContext const &ctx)
{
    return run_mutation(ctx, "pause", [&]() -> Result<void> {
        BOOST_OUTCOME_TRYV(access_.pause(ctx.sender));
        LOG_INFO("paused by {}", ctx.sender);
        emit(PausedEvent{.account = ctx.sender});
        return outcome::success();
    });
}

Result<void> TokenCore::unpause(CallContext const &ctx)
{
    return run_mutation(ctx, "unpause", [&]() -> Result<void> {
        BOOST_OUTCOME_TRYV(access_.unpause(ctx.sender));
        LOG_INFO("unpaused by {}", ctx.sender);
        emit(UnpausedEvent{.account = ctx.sender});
        return outcome::success();
    });
}

Result<void> TokenCore::transfer_ownership(
    CallContext const &ctx, Address const &new_owner)
{
    return run_mutation(ctx, "transfer_ownership", [&]() -> Result<void> {
        BOOST_OUTCOME_TRYV(access_.require_owner(ctx.sender));
        BOOST_OUTCOME_TRYV(require_user_recipient(new_owner));
        Address const previous = access_.owner();
        BOOST_OUTCOME_TRYV(access_.transfer_ownership(ctx.sender, new_owner));
        LOG_INFO("ownership transferred from {} to {}", previous, new_owner);
        emit(OwnershipTransferredEvent{
            .previous_owner = previous, .new_owner = new_owner});
        return outcome::success();
    });
}

Result<void> TokenCore::execute(CallContext const &ctx, Operation const &op)
{
    return std::visit(
        overloaded{
            [&](TransferOp const &o) { return transfer(ctx, o.to, o.amount); },
            [&](TransferFromOp const &o) {
                return transfer_from(ctx, o.from, o.to, o.amount);
            },
            [&](ApproveOp const &o) {
                return approve(ctx, o.spender, o.amount);
            },
            [&](MintOp const &o) { return mint(ctx, o.to, o.amount); },
            [&](BurnOp const &o) { return burn(ctx, o.amount); },
            [&](StakeOp const &o) { return stake(ctx, o.amount); },
            [&](UnstakeOp const &) { return unstake(ctx); },
            [&](ClaimRewardsOp const &) { return claim_rewards(ctx); },
            [&](UpdateStakingPoolOp const &o) {
                return update_staking_pool(ctx, o.apy_percent, o.lock_period);
            },
            [&](SetStakingActiveOp const &o) {
                return set_staking_active(ctx, o.active);
            },
            [&](PauseOp const &) { return pause(ctx); },
            [&](UnpauseOp const &) { return unpause(ctx); },
            [&](TransferOwnershipOp const &o) {
                return transfer_ownership(ctx, o.new_owner);
            }},
        op);
}

uint256_t TokenCore::balance_of(Address const &address) const
{
    std::lock_guard const lock{mutex_};
    return ledger_.balance_of(address);
}

uint256_t
TokenCore::allowance(Address const &owner, Address const &spender) const
{
    std::lock_guard const lock{mutex_};
    return ledger_.allowance(owner, spender);
}

uint256_t TokenCore::total_supply() const
{
    std::lock_guard const lock{mutex_};
    return ledger_.total_supply();
}

Result<StakingInfo>
TokenCore::get_staking_info(Address const &address, uint64_t const now) const
{
    std::lock_guard const lock{mutex_};
    StakeRecord const *const record = stakes_.find(address);
    if (record == nullptr) {
        return StakingInfo{};
    }
    BOOST_OUTCOME_TRY(
        auto const reward, calculate_reward(*record, pool_.apy_percent(), now));
    return StakingInfo{
        .amount = record->amount,
        .start_time = record->start_time,
        .lock_end_time = lock_end_time(*record),
        .current_reward = reward,
        .is_staked = true};
}

StakingPoolInfo TokenCore::get_staking_pool_info() const
{
    std::lock_guard const lock{mutex_};
    return pool_.info();
}

Address TokenCore::owner() const
{
    std::lock_guard const lock{mutex_};
    return access_.owner();
}

bool TokenCore::paused() const
{
    std::lock_guard const lock{mutex_};
    return access_.paused();
}

bool TokenCore::is_consistent() const
{
    std::lock_guard const lock{mutex_};
    auto const escrowed = stakes_.total_escrowed();
    return ledger_.sum_of_balances() == ledger_.total_supply() &&
           ledger_.balance_of(STAKING_RESERVE) == escrowed &&
           pool_.info().total_staked == escrowed;
}

SDUPI_TOKEN_NAMESPACE_END
