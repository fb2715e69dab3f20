#include "../base_cli.hpp"
#include "../theme.hpp"
#include "../snapshot_view.hpp"
#include <core/utils.hpp>
#include <iostream>
#include <fmt/format.h>

// Optional slot argument at args[pos], slot 0 when absent.
static std::optional<size_t> slot_arg(const std::vector<std::string>& args, size_t pos) {
    if (args.size() <= pos) return size_t{0};
    auto slot = parse_index(args[pos]);
    if (!slot) {
        std::cout << theme::fail("Invalid slot: " + args[pos]);
        return std::nullopt;
    }
    return static_cast<size_t>(*slot);
}

static bool require_loaded(BaseCLI& cli) {
    if (!cli.playback.any_loaded()) {
        std::cout << theme::fail("Nothing loaded.");
        std::cout << theme::step("Load a file with 'load <slot> <file>'.");
        return false;
    }
    return true;
}

static void do_step(BaseCLI& cli, const std::string& arg, int direction) {
    if (!require_loaded(cli)) return;
    int n = arg.empty() ? 1 : safe_stoi(arg, 0);
    if (n <= 0) {
        std::cout << theme::fail("Step must be a positive number.");
        return;
    }
    cli.playback.step(static_cast<int64_t>(n) * direction);
}

static void do_next(BaseCLI& cli, const std::string& arg) { do_step(cli, arg, 1); }
static void do_prev(BaseCLI& cli, const std::string& arg) { do_step(cli, arg, -1); }

// seek <r> jumps; seek +n / -n moves relative to the current round.
static void do_seek(BaseCLI& cli, const std::string& arg) {
    if (!require_loaded(cli)) return;
    std::string target = arg;
    trim(target);
    if (target.empty()) {
        std::cout << theme::fail("Usage: seek <round> | seek +n | seek -n");
        return;
    }

    if (target[0] == '+' || target[0] == '-') {
        auto delta = parse_index(target.substr(1));
        if (!delta) {
            std::cout << theme::fail("Invalid offset: " + target);
            return;
        }
        int64_t signed_delta = target[0] == '-' ? -static_cast<int64_t>(*delta) : *delta;
        cli.playback.step(signed_delta);
        return;
    }

    auto round = parse_index(target);
    if (!round) {
        std::cout << theme::fail("Invalid round: " + target);
        return;
    }
    if (cli.playback.max_rounds() > 0 && *round >= cli.playback.max_rounds()) {
        std::cout << theme::step(fmt::format("Clamped to last round {}.", cli.playback.max_rounds() - 1));
    }
    cli.playback.set_current_round(*round);
}

static void do_show(BaseCLI& cli, const std::string& arg) {
    if (!require_loaded(cli)) return;
    uint32_t r = cli.playback.current_round();
    for (size_t slot = 0; slot < cli.playback.slot_count(); slot++) {
        auto sim = cli.playback.simulation(slot);
        if (!sim) continue;
        if (r >= sim->num_rounds()) {
            std::cout << theme::info(fmt::format("{} ended at round {}.", sim->label(), sim->num_rounds() - 1));
            continue;
        }
        SnapshotView::print_round(*sim, r);
    }
}

static void do_queue(BaseCLI& cli, const std::string& arg) {
    auto slot = slot_arg(split_args(arg), 0);
    if (!slot) return;
    auto sim = cli.require_simulation(*slot);
    if (!sim) return;
    SnapshotView::print_queue(*sim, cli.playback.current_round());
}

static void do_sharing(BaseCLI& cli, const std::string& arg) {
    auto slot = slot_arg(split_args(arg), 0);
    if (!slot) return;
    auto sim = cli.require_simulation(*slot);
    if (!sim) return;
    SnapshotView::print_sharing(*sim, cli.playback.current_round());
}

// frag [count] [slot]: metrics for `count` rounds from the current one.
static void do_frag(BaseCLI& cli, const std::string& arg) {
    auto args = split_args(arg);
    uint32_t count = 1;
    if (!args.empty()) {
        auto n = parse_index(args[0]);
        if (!n || *n == 0) {
            std::cout << theme::fail("Invalid count: " + args[0]);
            return;
        }
        count = *n;
    }
    auto slot = slot_arg(args, 1);
    if (!slot) return;
    auto sim = cli.require_simulation(*slot);
    if (!sim) return;
    SnapshotView::print_frag(*sim, cli.playback.current_round(), count);
}

void register_playback_commands(BaseCLI& cli) {
    cli.add_command("next", do_next, "Advance [n] rounds");
    cli.add_command("prev", do_prev, "Go back [n] rounds");
    cli.add_command("seek", do_seek, "Jump to a round, or +n / -n");
    cli.add_command("show", do_show, "Show the current round for every slot");
    cli.add_command("queue", do_queue, "Waiting jobs at the current round [slot]");
    cli.add_command("sharing", do_sharing, "Shared units at the current round [slot]");
    cli.add_command("frag", do_frag, "Fragmentation from the current round [count] [slot]");
}
