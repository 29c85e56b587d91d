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
#include <sdupi/token/config.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

SDUPI_TOKEN_NAMESPACE_BEGIN

// Hex address with or without 0x; short input is left padded with zeros
std::optional<Address> parse_address(std::string_view);
std::optional<Address> parse_address(nlohmann::json const &);

// Decimal or 0x-prefixed hex string, or a non-negative JSON integer
std::optional<uint256_t> parse_amount(nlohmann::json const &);

// Non-negative JSON integer, or a string holding one
std::optional<uint64_t> parse_u64(nlohmann::json const &);

SDUPI_TOKEN_NAMESPACE_END
