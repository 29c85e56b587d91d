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

#include <sdupi/core/address.hpp>
#include <sdupi/core/fmt/address_fmt.hpp>
#include <sdupi/core/fmt/int_fmt.hpp>
#include <sdupi/core/log_level_map.hpp>
#include <sdupi/token/event.hpp>
#include <sdupi/token/fmt/event_fmt.hpp>
#include <sdupi/token/genesis.hpp>
#include <sdupi/token/json_util.hpp>
#include <sdupi/token/operation.hpp>
#include <sdupi/token/operation_codec.hpp>
#include <sdupi/token/token_core.hpp>

#include <CLI/CLI.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

using namespace sdupi;
using namespace sdupi::token;

namespace
{
    struct EventLogger final : TokenObserver
    {
        void on_event(TokenCore &, Event const &event) override
        {
            LOG_INFO("event {}", event);
        }
    };

    void report_account(
        TokenCore const &core, Address const &address, uint64_t const now)
    {
        LOG_INFO("account {} balance {}", address, core.balance_of(address));
        auto const info = core.get_staking_info(address, now);
        if (info.has_error()) {
            LOG_ERROR(
                "account {} staking info unavailable: {}",
                address,
                info.error().message().c_str());
            return;
        }
        auto const &stake = info.value();
        if (stake.is_staked) {
            LOG_INFO(
                "account {} staked {} since {} locked until {} reward {}",
                address,
                stake.amount,
                stake.start_time,
                stake.lock_end_time,
                stake.current_reward);
        }
    }
}

int main(int const argc, char const *argv[])
{
    CLI::App cli{"sdupi_replay"};
    cli.option_defaults()->always_capture_default();

    fs::path genesis_path;
    fs::path ops_path;
    bool stop_on_error = false;
    std::vector<std::string> report;
    auto log_level = quill::LogLevel::Info;

    cli.add_option("--genesis", genesis_path, "genesis configuration file")
        ->required()
        ->check(CLI::ExistingFile);
    cli.add_option("--ops", ops_path, "operations script to replay")
        ->check(CLI::ExistingFile);
    cli.add_option(
           "--log_level",
           log_level,
           "level of logging: debug, info, warning, error, critical or none")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));
    cli.add_flag(
        "--stop_on_error",
        stop_on_error,
        "stop at the first rejected operation");
    cli.add_option(
        "--report", report, "accounts to report once the replay is done");

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(time) [%(thread_id)] %(file_name):%(line_number) LOG_%(log_level)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    std::vector<Address> report_addresses;
    for (auto const &hex : report) {
        auto const address = parse_address(hex);
        if (!address.has_value()) {
            LOG_ERROR("invalid report address '{}'", hex);
            quill::flush();
            return EXIT_FAILURE;
        }
        report_addresses.push_back(*address);
    }

    auto const genesis = read_genesis(genesis_path);
    if (genesis.has_error()) {
        LOG_ERROR(
            "failed to read genesis {}: {}",
            genesis_path.string(),
            genesis.error().message().c_str());
        quill::flush();
        return EXIT_FAILURE;
    }
    auto core_res = load_genesis(genesis.value());
    if (core_res.has_error()) {
        LOG_ERROR(
            "failed to load genesis {}: {}",
            genesis_path.string(),
            core_res.error().message().c_str());
        quill::flush();
        return EXIT_FAILURE;
    }
    auto const core = std::move(core_res).value();

    std::vector<ScriptedOperation> ops;
    if (!ops_path.empty()) {
        auto ops_res = read_operations(ops_path);
        if (ops_res.has_error()) {
            LOG_ERROR(
                "failed to read operations {}: {}",
                ops_path.string(),
                ops_res.error().message().c_str());
            quill::flush();
            return EXIT_FAILURE;
        }
        ops = std::move(ops_res).value();
    }

    EventLogger event_logger;
    core->add_observer(event_logger);

    uint64_t now = genesis.value().timestamp;
    size_t applied = 0;
    size_t rejected = 0;
    int exit_code = EXIT_SUCCESS;
    for (size_t i = 0; i < ops.size(); ++i) {
        auto const &[ctx, op] = ops[i];
        now = std::max(now, ctx.timestamp);
        auto const res = core->execute(ctx, op);
        if (res.has_value()) {
            ++applied;
            continue;
        }
        ++rejected;
        LOG_WARNING(
            "operation {} {} from {} at {} rejected: {}",
            i,
            operation_name(op),
            ctx.sender,
            ctx.timestamp,
            res.error().message().c_str());
        if (stop_on_error) {
            exit_code = EXIT_FAILURE;
            break;
        }
    }
    core->remove_observer(event_logger);

    auto const pool = core->get_staking_pool_info();
    LOG_INFO(
        "replayed {} operations: {} applied, {} rejected",
        ops.size(),
        applied,
        rejected);
    LOG_INFO(
        "{} total supply {} owner {} paused {}",
        core->symbol(),
        core->total_supply(),
        core->owner(),
        core->paused());
    LOG_INFO(
        "staking pool: total staked {} rewards paid {} apy {}% lock period "
        "{}s active {}",
        pool.total_staked,
        pool.total_rewards_paid,
        pool.apy_percent,
        pool.lock_period,
        pool.is_active);
    for (auto const &address : report_addresses) {
        report_account(*core, address, now);
    }

    quill::flush();
    return exit_code;
}
