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

#include <sdupi/token/json_util.hpp>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <limits>
#include <stdexcept>
#include <string>

SDUPI_TOKEN_NAMESPACE_BEGIN

std::optional<Address> parse_address(std::string_view const hex)
{
    if (hex.empty()) {
        return std::nullopt;
    }
    return evmc::from_hex<Address>(hex);
}

std::optional<Address> parse_address(nlohmann::json const &j)
{
    if (!j.is_string()) {
        return std::nullopt;
    }
    return parse_address(j.get_ref<std::string const &>());
}

std::optional<uint256_t> parse_amount(nlohmann::json const &j)
{
    if (j.is_number_unsigned()) {
        return uint256_t{j.get<uint64_t>()};
    }
    if (j.is_number_integer() && j.get<int64_t>() >= 0) {
        return uint256_t{static_cast<uint64_t>(j.get<int64_t>())};
    }
    if (!j.is_string()) {
        return std::nullopt;
    }
    auto const &s = j.get_ref<std::string const &>();
    if (s.empty() || s == "0x") {
        return std::nullopt;
    }
    try {
        return intx::from_string<uint256_t>(s);
    }
    catch (std::invalid_argument const &) {
        return std::nullopt;
    }
    catch (std::out_of_range const &) {
        return std::nullopt;
    }
}

std::optional<uint64_t> parse_u64(nlohmann::json const &j)
{
    auto const value = parse_amount(j);
    if (!value.has_value() ||
        *value > std::numeric_limits<uint64_t>::max()) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(*value);
}

SDUPI_TOKEN_NAMESPACE_END
