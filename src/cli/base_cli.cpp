#include "base_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <iostream>
#include <fmt/format.h>

BaseCLI::BaseCLI() {
    auto config_result = Config::load_global();
    if (config_result.is_ok()) {
        config = config_result.value;
    } else {
        std::cout << theme::fail(config_result.error);
        std::cout << theme::step("Using default settings.");
    }
    set_vizbin_log_path(config.log().path);
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

Result<std::shared_ptr<Simulation>> BaseCLI::open_simulation(const std::string& path) const {
    SimulationOptions options;
    options.cache_entries = config.cache().max_entries;
    options.window_rounds = config.playback().window_rounds;
    options.gpus_per_node = config.fragmentation().gpus_per_node;
    return Simulation::open_file(path, options);
}

std::shared_ptr<Simulation> BaseCLI::require_simulation(size_t slot) {
    if (slot >= playback.slot_count()) {
        std::cout << theme::fail(fmt::format("No slot {} (have {}).", slot, playback.slot_count()));
        return nullptr;
    }
    auto sim = playback.simulation(slot);
    if (!sim) {
        std::cout << theme::fail(fmt::format("Slot {} is empty.", slot));
        std::cout << theme::step("Load a file with 'load <slot> <file>'.");
    }
    return sim;
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        vizbin_log(fmt::format("command '{}' failed: {}", command, e.what()));
        std::cout << theme::fail(std::string(e.what()));
    }
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Playback", {"next", "prev", "seek", "show"}},
        {"Round",    {"queue", "sharing", "frag"}},
        {"Files",    {"load", "clear", "info", "jobs"}},
        {"General",  {"help", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::BROWN << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::BLUE
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    if (!playback.any_loaded()) {
        return rl_esc(theme::color::BROWN) + "vizbin"
             + rl_esc(theme::color::RESET) + "> ";
    }

    std::string name;
    for (size_t slot = 0; slot < playback.slot_count(); slot++) {
        auto sim = playback.simulation(slot);
        if (!sim) continue;
        if (!name.empty()) name += "|";
        name += sim->label();
    }

    return rl_esc(theme::color::BROWN) + "vizbin"
         + rl_esc(theme::color::RESET) + ":"
         + rl_esc(theme::color::BLUE) + name
         + rl_esc(theme::color::RESET) + "@"
         + rl_esc(theme::color::GREEN)
         + fmt::format("{}/{}", playback.current_round(), playback.max_rounds())
         + rl_esc(theme::color::RESET) + "> ";
}
