#include <iostream>
#include <vector>
#include <string>
#include "cli/vizbin_cli.hpp"
#include "cli/theme.hpp"
#include <core/constants.hpp>

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    auto row = [](const std::string& cmd, const std::string& args, const std::string& help) {
        std::cout << theme::color::BLUE << "    vizbin " << cmd
                  << theme::color::RESET << " " << theme::color::BROWN << fmt::format("{:<22}", args)
                  << theme::color::RESET << theme::color::DIM
                  << help << theme::color::RESET << "\n";
    };
    row("play   ", "<file> [file2]", "Interactive playback (two files side by side)");
    row("info   ", "<file>", "Header, config and section summary");
    row("jobs   ", "<file>", "Job table");
    row("round  ", "<file> <r>", "Telemetry, occupancy and allocation grid");
    row("queue  ", "<file> <r>", "Jobs waiting at round r");
    row("sharing", "<file> <r>", "Shared units at round r");
    row("frag   ", "<file> [start] [count]", "Fragmentation per round");
    row("config ", "[init]", "Show settings, or write ~/.vizbin/config.yaml");
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    vizbin --version        Show version\n"
              << "    vizbin --help           Show this help"
              << theme::color::RESET << "\n\n";
}

static std::string arg_or_empty(int argc, char** argv, int i) {
    return argc > i ? argv[i] : "";
}

int main(int argc, char** argv) {
    try {
        if (argc == 1) {
            print_usage();
            return 0;
        }

        std::string cmd = argv[1];

        if (cmd == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "vizbin"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << VIZBIN_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage();
            return 0;
        }

        VizbinCLI cli;

        if (cmd == "config") {
            return cli.run_config(arg_or_empty(argc, argv, 2));
        }

        // Everything else needs a file
        if (cmd == "play" || cmd == "info" || cmd == "jobs" || cmd == "round"
            || cmd == "queue" || cmd == "sharing" || cmd == "frag") {
            if (argc < 3) {
                std::cout << theme::fail("Missing snapshot file.");
                std::cout << theme::step("Usage: vizbin " + cmd + " <file> ...");
                return 1;
            }
        }

        std::string file = arg_or_empty(argc, argv, 2);

        if (cmd == "play") {
            std::vector<std::string> files(argv + 2, argv + argc);
            return cli.run_play(files);
        } else if (cmd == "info") {
            return cli.run_info(file);
        } else if (cmd == "jobs") {
            return cli.run_jobs(file);
        } else if (cmd == "round" || cmd == "queue" || cmd == "sharing") {
            if (argc < 4) {
                std::cout << theme::fail("Missing round number.");
                std::cout << theme::step("Usage: vizbin " + cmd + " <file> <round>");
                return 1;
            }
            std::string round = argv[3];
            if (cmd == "round") return cli.run_round(file, round);
            if (cmd == "queue") return cli.run_queue(file, round);
            return cli.run_sharing(file, round);
        } else if (cmd == "frag") {
            return cli.run_frag(file, arg_or_empty(argc, argv, 3), arg_or_empty(argc, argv, 4));
        } else {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
