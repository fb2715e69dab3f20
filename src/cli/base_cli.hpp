#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <session/simulation.hpp>
#include <session/playback.hpp>

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    // Open a snapshot with the cache and window sizes from config.
    Result<std::shared_ptr<Simulation>> open_simulation(const std::string& path) const;

    // Simulation in `slot`, printing a failure when the slot is empty.
    std::shared_ptr<Simulation> require_simulation(size_t slot = 0);

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Public state
    Config config;
    PlaybackModel playback;

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};
