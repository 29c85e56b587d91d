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

#include <sdupi/token/event.hpp>

#include <string_view>
#include <type_traits>
#include <variant>

SDUPI_TOKEN_NAMESPACE_BEGIN

std::string_view event_name(Event const &event) noexcept
{
    return std::visit(
        []<typename T>(T const &) -> std::string_view {
            if constexpr (std::is_same_v<T, TransferEvent>) {
                return "Transfer";
            }
            else if constexpr (std::is_same_v<T, ApprovalEvent>) {
                return "Approval";
            }
            else if constexpr (std::is_same_v<T, StakedEvent>) {
                return "Staked";
            }
            else if constexpr (std::is_same_v<T, UnstakedEvent>) {
                return "Unstaked";
            }
            else if constexpr (std::is_same_v<T, RewardsClaimedEvent>) {
                return "RewardsClaimed";
            }
            else if constexpr (std::is_same_v<T, StakingPoolUpdatedEvent>) {
                return "StakingPoolUpdated";
            }
            else if constexpr (std::is_same_v<T, StakingStatusChangedEvent>) {
                return "StakingStatusChanged";
            }
            else if constexpr (std::is_same_v<T, PausedEvent>) {
                return "Paused";
            }
            else if constexpr (std::is_same_v<T, UnpausedEvent>) {
                return "Unpaused";
            }
            else {
                static_assert(std::is_same_v<T, OwnershipTransferredEvent>);
                return "OwnershipTransferred";
            }
        },
        event);
}

SDUPI_TOKEN_NAMESPACE_END
