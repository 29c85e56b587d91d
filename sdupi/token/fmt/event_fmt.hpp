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

#include <sdupi/core/basic_formatter.hpp>
#include <sdupi/core/fmt/address_fmt.hpp>
#include <sdupi/core/fmt/int_fmt.hpp>
#include <sdupi/core/variant.hpp>
#include <sdupi/token/event.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

#include <variant>

template <>
struct quill::copy_loggable<sdupi::token::Event> : std::true_type
{
};

template <>
struct fmt::formatter<sdupi::token::Event> : public sdupi::BasicFormatter
{
    template <typename FormatContext>
    auto format(sdupi::token::Event const &value, FormatContext &ctx) const
    {
        using namespace sdupi::token;

        fmt::format_to(ctx.out(), "{}{{", event_name(value));
        std::visit(
            sdupi::overloaded{
                [&](TransferEvent const &e) {
                    fmt::format_to(
                        ctx.out(),
                        "from={} to={} amount={}",
                        e.from,
                        e.to,
                        e.amount);
                },
                [&](ApprovalEvent const &e) {
                    fmt::format_to(
                        ctx.out(),
                        "owner={} spender={} amount={}",
                        e.owner,
                        e.spender,
                        e.amount);
                },
                [&](StakedEvent const &e) {
                    fmt::format_to(
                        ctx.out(),
                        "account={} amount={} start_time={} lock_end_time={}",
                        e.account,
                        e.amount,
                        e.start_time,
                        e.lock_end_time);
                },
                [&](UnstakedEvent const &e) {
                    fmt::format_to(
                        ctx.out(),
                        "account={} amount={} reward={}",
                        e.account,
                        e.amount,
                        e.reward);
                },
                [&](RewardsClaimedEvent const &e) {
                    fmt::format_to(
                        ctx.out(), "account={} reward={}", e.account, e.reward);
                },
                [&](StakingPoolUpdatedEvent const &e) {
                    fmt::format_to(
                        ctx.out(),
                        "apy_percent={} lock_period={}",
                        e.apy_percent,
                        e.lock_period);
                },
                [&](StakingStatusChangedEvent const &e) {
                    fmt::format_to(ctx.out(), "is_active={}", e.is_active);
                },
                [&](PausedEvent const &e) {
                    fmt::format_to(ctx.out(), "account={}", e.account);
                },
                [&](UnpausedEvent const &e) {
                    fmt::format_to(ctx.out(), "account={}", e.account);
                },
                [&](OwnershipTransferredEvent const &e) {
                    fmt::format_to(
                        ctx.out(),
                        "previous_owner={} new_owner={}",
                        e.previous_owner,
                        e.new_owner);
                }},
            value);
        fmt::format_to(ctx.out(), "}}");
        return ctx.out();
    }
};
