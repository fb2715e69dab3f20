#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Forward declarations for command registration
void register_playback_commands(BaseCLI& cli);
void register_file_commands(BaseCLI& cli);

class VizbinCLI : public BaseCLI {
public:
    VizbinCLI();

    // Interactive playback over up to two files. Returns the exit status.
    int run_play(const std::vector<std::string>& files);

    // ── One-shot commands ───────────────────────────────────
    int run_info(const std::string& file);
    int run_jobs(const std::string& file);
    int run_round(const std::string& file, const std::string& round_arg);
    int run_queue(const std::string& file, const std::string& round_arg);
    int run_sharing(const std::string& file, const std::string& round_arg);
    int run_frag(const std::string& file, const std::string& start_arg, const std::string& count_arg);

    // `config` shows the active settings, `config init` writes the default file.
    int run_config(const std::string& action);

private:
    void register_all_commands();
    void print_round_status(uint32_t r);

    // Opens `file` into slot 0 and parses `round_arg`; prints failures.
    std::shared_ptr<Simulation> open_for_round(const std::string& file,
                                               const std::string& round_arg,
                                               uint32_t& round);
};
