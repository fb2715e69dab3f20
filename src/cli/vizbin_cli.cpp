#include "vizbin_cli.hpp"
#include "snapshot_view.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <fmt/format.h>
#include <readline/readline.h>
#include <readline/history.h>

VizbinCLI::VizbinCLI() : BaseCLI() {
    register_all_commands();

    playback.on_change([this](PlaybackEvent event, int slot) {
        if (event == PlaybackEvent::RoundChanged) {
            print_round_status(playback.current_round());
        } else if (event == PlaybackEvent::SimulationCleared) {
            vizbin_log(fmt::format("slot {} cleared", slot));
        } else {
            vizbin_log(fmt::format("slot {} loaded", slot));
        }
    });
}

void VizbinCLI::register_all_commands() {
    add_command("help", [this](BaseCLI& cli, const std::string& arg) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [](BaseCLI& cli, const std::string& arg) {
        exit(0);
    }, "Exit vizbin");

    add_command("exit", [](BaseCLI& cli, const std::string& arg) {
        exit(0);
    }, "Exit vizbin");

    register_playback_commands(*this);
    register_file_commands(*this);
}

// One line per loaded slot after every round change.
void VizbinCLI::print_round_status(uint32_t r) {
    for (size_t slot = 0; slot < playback.slot_count(); slot++) {
        auto sim = playback.simulation(slot);
        if (!sim) continue;
        if (r >= sim->num_rounds()) {
            std::cout << theme::log(fmt::format("[{}] {}: ended at round {}",
                                                slot, sim->label(), sim->num_rounds() - 1));
            continue;
        }
        auto rec = sim->round(r);
        std::cout << theme::log(fmt::format("[{}] {}: round {}  t={}  util {:.1f}%  run {}  queue {}  done {}",
                                            slot, sim->label(), rec.round, format_sim_time(rec.sim_time),
                                            rec.utilization * 100.0, rec.jobs_running,
                                            rec.jobs_queued, rec.jobs_completed));
    }
}

int VizbinCLI::run_play(const std::vector<std::string>& files) {
    if (platform::stdout_is_tty()) {
        std::cout << theme::banner();
    }

    if (files.size() > playback.slot_count()) {
        std::cout << theme::fail(fmt::format("At most {} files can be compared.", playback.slot_count()));
        return 1;
    }

    std::cout << theme::section("Loading");
    for (size_t slot = 0; slot < files.size(); slot++) {
        auto result = open_simulation(files[slot]);
        if (result.is_err()) {
            std::cout << theme::fail(result.error);
            return 1;
        }
        playback.load(slot, result.value);
        std::cout << theme::ok(fmt::format("[{}] {} ({} rounds)", slot,
                                           result.value->label(), result.value->num_rounds()));
    }

    std::cout << theme::divider();
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    std::string line;
    while (true) {
        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        trim(line);
        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        std::string args;
        std::getline(iss, args);
        trim(args);

        execute_command(command, args);
    }

    std::cout << "\n";
    return 0;
}

int VizbinCLI::run_info(const std::string& file) {
    auto result = open_simulation(file);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return 1;
    }
    SnapshotView::print_info(*result.value);
    return 0;
}

int VizbinCLI::run_jobs(const std::string& file) {
    auto result = open_simulation(file);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return 1;
    }
    SnapshotView::print_jobs(*result.value, result.value->jobs().size());
    return 0;
}

std::shared_ptr<Simulation> VizbinCLI::open_for_round(const std::string& file,
                                                      const std::string& round_arg,
                                                      uint32_t& round) {
    auto parsed = parse_index(round_arg);
    if (!parsed) {
        std::cout << theme::fail("Invalid round: " + round_arg);
        return nullptr;
    }

    auto result = open_simulation(file);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return nullptr;
    }
    auto sim = result.value;
    if (*parsed >= sim->num_rounds()) {
        std::cout << theme::fail(fmt::format("Round {} out of range (file has {}).",
                                             *parsed, sim->num_rounds()));
        return nullptr;
    }
    round = *parsed;
    return sim;
}

int VizbinCLI::run_round(const std::string& file, const std::string& round_arg) {
    uint32_t r = 0;
    auto sim = open_for_round(file, round_arg, r);
    if (!sim) return 1;
    SnapshotView::print_round(*sim, r);
    return 0;
}

int VizbinCLI::run_queue(const std::string& file, const std::string& round_arg) {
    uint32_t r = 0;
    auto sim = open_for_round(file, round_arg, r);
    if (!sim) return 1;
    SnapshotView::print_queue(*sim, r);
    return 0;
}

int VizbinCLI::run_sharing(const std::string& file, const std::string& round_arg) {
    uint32_t r = 0;
    auto sim = open_for_round(file, round_arg, r);
    if (!sim) return 1;
    SnapshotView::print_sharing(*sim, r);
    return 0;
}

int VizbinCLI::run_frag(const std::string& file, const std::string& start_arg,
                        const std::string& count_arg) {
    uint32_t start = 0;
    if (!start_arg.empty()) {
        auto parsed = parse_index(start_arg);
        if (!parsed) {
            std::cout << theme::fail("Invalid start round: " + start_arg);
            return 1;
        }
        start = *parsed;
    }

    auto result = open_simulation(file);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return 1;
    }
    auto sim = result.value;

    uint32_t count = sim->num_rounds();
    if (!count_arg.empty()) {
        auto parsed = parse_index(count_arg);
        if (!parsed || *parsed == 0) {
            std::cout << theme::fail("Invalid count: " + count_arg);
            return 1;
        }
        count = *parsed;
    }

    SnapshotView::print_frag(*sim, start, count);
    return 0;
}

int VizbinCLI::run_config(const std::string& action) {
    if (action == "init") {
        auto result = create_default_global_config();
        if (result.is_err()) {
            std::cout << theme::fail(result.error);
            return 1;
        }
        std::cout << theme::ok("Config at " + get_global_config_path().string());
        return 0;
    }
    if (!action.empty()) {
        std::cout << theme::fail("Unknown config action: " + action);
        std::cout << theme::step("Usage: vizbin config [init]");
        return 1;
    }

    std::cout << theme::section("Config");
    std::cout << theme::kv("File", global_config_exists()
                                       ? get_global_config_path().string()
                                       : theme::dim("(none, using defaults)"));
    std::cout << theme::kv("Cache", fmt::format("{} ranges", config.cache().max_entries));
    std::cout << theme::kv("Window", fmt::format("{} rounds", config.playback().window_rounds));
    std::cout << theme::kv("GPUs/node", config.fragmentation().gpus_per_node > 0
                                            ? std::to_string(config.fragmentation().gpus_per_node)
                                            : std::string("from file"));
    std::cout << theme::kv("Log", vizbin_log_path());
    std::cout << "\n";
    return 0;
}
