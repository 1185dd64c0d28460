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

#include "runloop.hpp"

#include <gravity/chain/chain_params.hpp>
#include <gravity/chain/runtime.hpp>
#include <gravity/core/config.hpp>
#include <gravity/core/fmt/address_fmt.hpp>
#include <gravity/core/fmt/int_fmt.hpp>
#include <gravity/core/log_level_map.hpp>

#include <CLI/CLI.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <signal.h>

sig_atomic_t volatile stop;

GRAVITY_ANONYMOUS_NAMESPACE_BEGIN

void signal_handler(int)
{
    stop = 1;
}

GRAVITY_ANONYMOUS_NAMESPACE_END

using namespace gravity;
namespace fs = std::filesystem;

int main(int const argc, char const *argv[])
{
    CLI::App cli{"gravity-sim"};
    cli.option_defaults()->always_capture_default();

    fs::path config_path;
    SimConfig sim{
        .nblocks = 10'000,
        .block_time_us = 500'000,
        .dkg_delay_blocks = 3,
        .nil_every = 0};
    uint64_t block_time_ms = sim.block_time_us / 1000;
    auto log_level = quill::LogLevel::Info;

    cli.add_option("--config", config_path, "chain parameters (genesis json)")
        ->required()
        ->check(CLI::ExistingFile);
    cli.add_option("--nblocks", sim.nblocks, "number of blocks to produce");
    cli.add_option("--block_time_ms", block_time_ms, "time between blocks");
    cli.add_option(
        "--dkg_delay_blocks",
        sim.dkg_delay_blocks,
        "blocks until the consensus engine delivers a dkg transcript");
    cli.add_option(
        "--nil_every", sim.nil_every, "make every nth block a nil block");
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }
    sim.block_time_us = block_time_ms * 1000;

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

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    auto const params = load_chain_params(config_path);
    if (params.has_error()) {
        LOG_ERROR(
            "failed to load {}: {}",
            config_path.string(),
            params.error().message().c_str());
        return EXIT_FAILURE;
    }

    auto const rt = std::make_unique<Runtime>();
    if (auto const res = rt->genesis(params.value()); res.has_error()) {
        LOG_ERROR("genesis failed: {}", res.error().message().c_str());
        return EXIT_FAILURE;
    }

    auto const stats = runloop_gravity(*rt, sim, stop);
    if (stats.has_error()) {
        LOG_ERROR(
            "block production failed at block {}: {}",
            rt->blocker.block_number() + 1,
            stats.error().message().c_str());
        return EXIT_FAILURE;
    }

    LOG_INFO(
        "final epoch {}, {} active validators",
        rt->reconfiguration.current_epoch(),
        rt->validators.active_count());
    for (auto const &info : rt->validators.current_consensus_infos()) {
        auto const perf = rt->performance.performance_of(info.validator_index);
        LOG_INFO(
            "  #{} {} voting power {} proposals ok={} failed={}",
            info.validator_index,
            info.validator,
            info.voting_power,
            perf ? perf->successful_proposals : 0,
            perf ? perf->failed_proposals : 0);
    }
    return EXIT_SUCCESS;
}
