#include "../base_cli.hpp"
#include "../theme.hpp"
#include "../snapshot_view.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <iostream>
#include <fmt/format.h>

static std::optional<size_t> parse_slot(BaseCLI& cli, const std::string& text) {
    auto slot = parse_index(text);
    if (!slot || *slot >= cli.playback.slot_count()) {
        std::cout << theme::fail(fmt::format("Invalid slot: {} (0..{})", text, cli.playback.slot_count() - 1));
        return std::nullopt;
    }
    return static_cast<size_t>(*slot);
}

static void do_load(BaseCLI& cli, const std::string& arg) {
    auto args = split_args(arg);
    if (args.size() != 2) {
        std::cout << theme::fail("Usage: load <slot> <file>");
        return;
    }
    auto slot = parse_slot(cli, args[0]);
    if (!slot) return;

    std::cout << theme::step("Loading " + args[1]);
    auto result = cli.open_simulation(args[1]);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }
    auto sim = result.value;
    cli.playback.load(*slot, sim);
    std::cout << theme::ok(fmt::format("Slot {}: {} ({} rounds, {} jobs, {} units)",
                                       *slot, sim->label(), sim->num_rounds(),
                                       sim->header().num_jobs, sim->header().total_gpus));
}

static void do_clear(BaseCLI& cli, const std::string& arg) {
    std::string text = arg;
    trim(text);
    if (text.empty()) {
        std::cout << theme::fail("Usage: clear <slot>");
        return;
    }
    auto slot = parse_slot(cli, text);
    if (!slot) return;
    if (!cli.playback.simulation(*slot)) {
        std::cout << theme::dim(fmt::format("  Slot {} already empty.", *slot)) << "\n";
        return;
    }
    cli.playback.clear(*slot);
    std::cout << theme::ok(fmt::format("Cleared slot {}.", *slot));
}

static void do_info(BaseCLI& cli, const std::string& arg) {
    std::string text = arg;
    trim(text);
    size_t slot = 0;
    if (!text.empty()) {
        auto parsed = parse_slot(cli, text);
        if (!parsed) return;
        slot = *parsed;
    }
    auto sim = cli.require_simulation(slot);
    if (!sim) return;
    SnapshotView::print_info(*sim);
    const auto& cache = sim->cache();
    std::cout << theme::kv("Cache", fmt::format("{}/{} ranges, {} hits, {} misses",
                                                cache.entries(), cache.capacity(),
                                                cache.hits(), cache.misses()));
    std::cout << "\n";
}

static void do_jobs(BaseCLI& cli, const std::string& arg) {
    std::string text = arg;
    trim(text);
    size_t slot = 0;
    if (!text.empty()) {
        auto parsed = parse_slot(cli, text);
        if (!parsed) return;
        slot = *parsed;
    }
    auto sim = cli.require_simulation(slot);
    if (!sim) return;
    SnapshotView::print_jobs(*sim, MAX_JOB_ROWS);
}

void register_file_commands(BaseCLI& cli) {
    cli.add_command("load", do_load, "Load a snapshot into a slot");
    cli.add_command("clear", do_clear, "Unload a slot");
    cli.add_command("info", do_info, "Header, config and cache stats [slot]");
    cli.add_command("jobs", do_jobs, "Job table [slot]");
}
