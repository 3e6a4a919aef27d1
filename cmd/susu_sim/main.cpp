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

#include <susu/core/basic_formatter.hpp>
#include <susu/core/byte_string.hpp>
#include <susu/core/config.hpp>
#include <susu/core/int.hpp>
#include <susu/core/result.hpp>
#include <susu/execution/core/address.hpp>
#include <susu/execution/core/fmt/address_fmt.hpp>
#include <susu/execution/core/fmt/int_fmt.hpp>
#include <susu/execution/core/log_level_map.hpp>
#include <susu/execution/rosca/execute_call.hpp>
#include <susu/execution/rosca/host.hpp>
#include <susu/execution/rosca/rosca_contract.hpp>
#include <susu/execution/rosca/state_asset_ledger.hpp>
#include <susu/execution/rosca/util/constants.hpp>
#include <susu/execution/state/state.hpp>

#include <CLI/CLI.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <random>
#include <string>
#include <vector>

using namespace susu;
using namespace susu::rosca;

SUSU_ANONYMOUS_NAMESPACE_BEGIN

constexpr Address TOKEN{0x70c3e4};
constexpr Address TREASURY{0x7ea5};
constexpr Address PROTOCOL_ADMIN{0xad};
constexpr uint64_t DAY = 24 * 60 * 60;

Proof sign(Address const &principal)
{
    return Proof{
        .principal = principal,
        .signature = byte_string{principal.bytes, sizeof(principal.bytes)}};
}

// Every principal in the simulation is driven locally and signs for itself.
class SelfSignedAuthorizer final : public Authorizer
{
public:
    bool verify(Proof const &proof) override
    {
        return proof.signature ==
               byte_string{proof.principal.bytes, sizeof(proof.principal.bytes)};
    }
};

class SimClock final : public Clock
{
    uint64_t time_;

public:
    explicit SimClock(uint64_t const start)
        : time_{start}
    {
    }

    uint64_t now() override
    {
        return time_;
    }

    void advance(uint64_t const seconds)
    {
        time_ += seconds;
    }
};

class SeededShuffler final : public Shuffler
{
    std::mt19937_64 engine_;

public:
    explicit SeededShuffler(uint64_t const seed)
        : engine_{seed}
    {
    }

    std::vector<Address> permute(std::vector<Address> members) override
    {
        std::shuffle(members.begin(), members.end(), engine_);
        return members;
    }
};

template <typename T>
bool succeeded(Result<T> const &res, char const *const what)
{
    if (res.has_error()) {
        LOG_ERROR("{} failed: {}", what, res.error().message().c_str());
        return false;
    }
    return true;
}

SUSU_ANONYMOUS_NAMESPACE_END

int main(int const argc, char const *argv[])
{
    CLI::App cli{"susu-sim"};
    cli.option_defaults()->always_capture_default();

    unsigned members = 5;
    uint64_t contribution = 100;
    unsigned cycles = 1;
    uint32_t fee_bps = 0;
    uint32_t late_fee_bps = 0;
    uint32_t insurance_fee_bps = 0;
    bool random_queue = false;
    uint64_t seed = 0;
    auto log_level = quill::LogLevel::Info;

    cli.add_option("--members", members, "number of circle members")
        ->check(CLI::Range(1u, static_cast<unsigned>(MAX_MEMBERS)));
    cli.add_option(
           "--contribution", contribution, "amount owed per member per cycle")
        ->check(CLI::PositiveNumber);
    cli.add_option("--cycles", cycles, "number of full cycles to run");
    cli.add_option("--fee_bps", fee_bps, "protocol fee in basis points")
        ->check(CLI::Range(0u, static_cast<unsigned>(MAX_BASIS_POINTS)));
    cli.add_option(
           "--late_fee_bps", late_fee_bps, "late deposit fee in basis points")
        ->check(CLI::Range(0u, static_cast<unsigned>(MAX_BASIS_POINTS)));
    cli.add_option(
           "--insurance_fee_bps",
           insurance_fee_bps,
           "insurance surcharge in basis points")
        ->check(CLI::Range(0u, static_cast<unsigned>(MAX_BASIS_POINTS)));
    cli.add_flag("--random_queue", random_queue, "shuffle the payout queue");
    cli.add_option("--seed", seed, "seed for the queue shuffle");
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

    State state;
    StateAssetLedger ledger{state};
    SelfSignedAuthorizer authorizer;
    SimClock clock{1'700'000'000};
    SeededShuffler shuffler{seed};
    Host host{
        .authorizer = authorizer,
        .ledger = ledger,
        .clock = clock,
        .shuffler = shuffler};
    RoscaContract contract{state, host};

    auto const admin = sign(PROTOCOL_ADMIN);
    if (!succeeded(
            execute_call(
                state, "initialize", [&] { return contract.initialize(admin); }),
            "initialize") ||
        !succeeded(
            execute_call(
                state,
                "set_protocol_fee",
                [&] {
                    return contract.set_protocol_fee(admin, fee_bps, TREASURY);
                }),
            "set_protocol_fee")) {
        return EXIT_FAILURE;
    }

    std::vector<Address> roster;
    for (unsigned i = 0; i < members; ++i) {
        roster.emplace_back(0x1000 + i);
    }
    auto const circle_admin = sign(roster.front());

    auto const created =
        execute_call(state, "create_circle", [&] {
            return contract.create_circle(
                circle_admin,
                CircleParams{
                    .contribution = contribution,
                    .is_random_queue = random_queue,
                    .token = TOKEN,
                    .max_members = members,
                    .cycle_duration = 7 * DAY,
                    .late_fee_bps = late_fee_bps,
                    .insurance_fee_bps = insurance_fee_bps});
        });
    if (!succeeded(created, "create_circle")) {
        return EXIT_FAILURE;
    }
    uint64_t const id = created.value();

    // enough for every deposit to carry both surcharges
    uint256_t const budget =
        uint256_t{contribution} * uint256_t{3} *
        uint256_t{cycles == 0 ? 1u : cycles};
    for (auto const &member : roster) {
        ledger.mint(TOKEN, member, budget);
        ledger.approve(TOKEN, member, budget);
        if (!succeeded(
                execute_call(
                    state,
                    "join_circle",
                    [&] { return contract.join_circle(sign(member), id); }),
                "join_circle")) {
            return EXIT_FAILURE;
        }
    }

    if (!succeeded(
            execute_call(
                state,
                "finalize_circle",
                [&] { return contract.finalize_circle(circle_admin, id); }),
            "finalize_circle")) {
        return EXIT_FAILURE;
    }
    auto const queue = contract.get_payout_queue(id).value();

    for (unsigned cycle = 0; cycle < cycles; ++cycle) {
        for (auto const &member : roster) {
            clock.advance(DAY);
            if (!succeeded(
                    execute_call(
                        state,
                        "contribute",
                        [&] { return contract.contribute(sign(member), id); }),
                    "contribute")) {
                return EXIT_FAILURE;
            }
        }
        for (auto const &recipient : queue) {
            if (!succeeded(
                    execute_call(
                        state,
                        "process_payout",
                        [&] {
                            return contract.process_payout(
                                circle_admin, id, recipient);
                        }),
                    "process_payout")) {
                return EXIT_FAILURE;
            }
        }
        auto const info = contract.get_cycle_info(id).value();
        LOG_INFO(
            "cycle {} paid {} members, distributed {}",
            info.cycle_number,
            info.current_payout_index,
            info.total_volume_distributed);
        if (!succeeded(
                execute_call(
                    state,
                    "rollover_group",
                    [&] { return contract.rollover_group(circle_admin, id); }),
                "rollover_group")) {
            return EXIT_FAILURE;
        }
    }

    auto const circle = contract.get_circle(id).value();
    fmt::print(
        "circle {}: cycle {} index {} distributed {}\n"
        "custody {} reserve {} insurance {} treasury {}\n"
        "events {}\n",
        id,
        circle.cycle_number,
        circle.current_payout_index,
        circle.total_volume_distributed,
        circle.custody_balance,
        circle.reserve_balance,
        circle.insurance_balance,
        ledger.balance_of(TOKEN, TREASURY),
        state.logs().size());

    return EXIT_SUCCESS;
}
