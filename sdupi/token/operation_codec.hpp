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

#include <sdupi/core/result.hpp>
#include <sdupi/token/call_context.hpp>
#include <sdupi/token/config.hpp>
#include <sdupi/token/operation.hpp>

#include <nlohmann/json_fwd.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <filesystem>
#include <initializer_list>
#include <vector>

SDUPI_TOKEN_NAMESPACE_BEGIN

enum class OperationCodecError
{
    Success = 0,
    InvalidJson,
    NotAnArray,
    UnknownOperation,
    MissingField,
    InvalidField,
    InvalidAddress,
    InvalidAmount,
};

struct ScriptedOperation
{
    CallContext ctx;
    Operation op;
};

// One script entry:
//   {"op": "stake", "sender": "0x..", "timestamp": 1735000000, "amount": ".."}
Result<ScriptedOperation> parse_operation(nlohmann::json const &);

// A JSON array of entries, in order
Result<std::vector<ScriptedOperation>> parse_operations(nlohmann::json const &);
Result<std::vector<ScriptedOperation>>
read_operations(std::filesystem::path const &);

SDUPI_TOKEN_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<sdupi::token::OperationCodecError>
    : quick_status_code_from_enum_defaults<sdupi::token::OperationCodecError>
{
    static constexpr auto const domain_name = "Operation Codec Error";
    static constexpr auto const domain_uuid =
        "c4f7a290-1d6e-4b58-93a2-e80b5d1f6c47";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
