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

#include <sdupi/token/operation.hpp>

#include <string_view>
#include <type_traits>
#include <variant>

SDUPI_TOKEN_NAMESPACE_BEGIN

std::string_view operation_name(Operation const &op) noexcept
{
    return std::visit(
        []<typename T>(T const &) -> std::string_view {
            if constexpr (std::is_same_v<T, TransferOp>) {
                return "transfer";
            }
            else if constexpr (std::is_same_v<T, TransferFromOp>) {
                return "transfer_from";
            }
            else if constexpr (std::is_same_v<T, ApproveOp>) {
                return "approve";
            }
            else if constexpr (std::is_same_v<T, MintOp>) {
                return "mint";
            }
            else if constexpr (std::is_same_v<T, BurnOp>) {
                return "burn";
            }
            else if constexpr (std::is_same_v<T, StakeOp>) {
                return "stake";
            }
            else if constexpr (std::is_same_v<T, UnstakeOp>) {
                return "unstake";
            }
            else if constexpr (std::is_same_v<T, ClaimRewardsOp>) {
                return "claim_rewards";
            }
            else if constexpr (std::is_same_v<T, UpdateStakingPoolOp>) {
                return "update_staking_pool";
            }
            else if constexpr (std::is_same_v<T, SetStakingActiveOp>) {
                return "set_staking_active";
            }
            else if constexpr (std::is_same_v<T, PauseOp>) {
                return "pause";
            }
            else if constexpr (std::is_same_v<T, UnpauseOp>) {
                return "unpause";
            }
            else {
                static_assert(std::is_same_v<T, TransferOwnershipOp>);
                return "transfer_ownership";
            }
        },
        op);
}

SDUPI_TOKEN_NAMESPACE_END
