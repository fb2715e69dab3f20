#include "snapshot_view.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/time_utils.hpp>
#include <format/sharing_codec.hpp>
#include <iostream>
#include <algorithm>
#include <fmt/format.h>

namespace SnapshotView {

static std::string yes_no(bool b) {
    return b ? theme::green("yes") : theme::dim("no");
}

static std::string job_label(const Simulation& sim, uint32_t job_id) {
    const auto* job = sim.find_job(job_id);
    if (!job) return fmt::format("{} ?", job_id);
    const auto* type = sim.find_job_type(job->type_id);
    std::string type_name = type ? type->name : fmt::format("type {}", job->type_id);
    return fmt::format("{} {} x{}", job_id, type_name, job->scale_factor);
}

void print_info(const Simulation& sim) {
    const auto& h = sim.header();
    const auto& cfg = sim.config();

    std::cout << theme::section("Snapshot");
    std::cout << theme::kv("File", sim.label());
    std::cout << theme::kv("Version", std::to_string(h.version));
    std::cout << theme::kv("Policy", cfg.policy);
    std::cout << theme::kv("Rounds", std::to_string(h.num_rounds));
    std::cout << theme::kv("Jobs", std::to_string(h.num_jobs));
    std::cout << theme::kv("Units", std::to_string(h.total_gpus));
    std::cout << theme::kv("Round size", fmt::format("{} bytes", sim.decoder().round_size()));
    std::cout << theme::kv("Queue", yes_no(sim.has_queue()));
    std::cout << theme::kv("Sharing", yes_no(sim.has_sharing()));
    if (cfg.measurement_window) {
        std::cout << theme::kv("Measured", fmt::format("jobs {}..{}",
                                                       cfg.measurement_window->start_job,
                                                       cfg.measurement_window->end_job));
    }

    std::cout << theme::section("GPU types");
    for (const auto& t : cfg.gpu_types) {
        std::string per_node = t.gpus_per_node ? fmt::format("{}/node", *t.gpus_per_node)
                                               : std::string("-");
        std::cout << fmt::format("    {:<12} {:>6}  ", t.name, t.count)
                  << theme::dim(per_node) << "\n";
    }

    if (!cfg.job_types.empty()) {
        std::cout << theme::section("Job types");
        for (const auto& jt : cfg.job_types) {
            std::cout << fmt::format("    {:>4}  {:<36} ", jt.id, jt.name)
                      << theme::dim(jt.category) << "\n";
        }
    }
    std::cout << "\n";
}

void print_jobs(const Simulation& sim, size_t limit) {
    const auto& jobs = sim.jobs().jobs();
    if (jobs.empty()) {
        std::cout << theme::dim("  No job table in this file.") << "\n";
        return;
    }

    std::cout << "\n" << theme::color::DIM
              << fmt::format("  {:<8} {:<28} {:<12} {:>5} {:>8} {:>8} {:>8}\n",
                             "JOB", "TYPE", "CATEGORY", "SCALE", "ARRIVAL", "DONE", "DURATION")
              << theme::color::RESET;

    size_t shown = std::min(limit, jobs.size());
    for (size_t i = 0; i < shown; i++) {
        const auto& j = jobs[i];
        const auto* type = sim.find_job_type(j.type_id);
        std::string type_name = type ? type->name : fmt::format("type {}", j.type_id);
        if (type_name.size() > 28) type_name = type_name.substr(0, 27) + "~";
        std::string done = j.completed() ? std::to_string(j.completion_round) : "-";
        std::string dur = j.completed() ? format_duration(j.duration) : "-";
        std::cout << fmt::format("  {:<8} {:<28} {:<12} {:>5} {:>8} {:>8} {:>8}\n",
                                 j.job_id, type_name, sim.category_of(j.job_id),
                                 j.scale_factor, j.arrival_round, done, dur);
    }
    if (shown < jobs.size()) {
        std::cout << theme::dim(fmt::format("  ... {} more", jobs.size() - shown)) << "\n";
    }
    std::cout << "\n";
}

// One cell per unit: allocated, shared, or idle.
static void print_alloc_grid(const Simulation& sim, const vizbin::RoundRecord& rec,
                             const vizbin::SharingMap* sharing) {
    const auto& types = sim.config().gpu_types;
    uint32_t unit = 0;
    for (const auto& t : types) {
        std::cout << "\n  " << theme::dim(t.name) << "\n";
        for (uint32_t i = 0; i < t.count; i++, unit++) {
            if (i % ALLOC_GRID_WIDTH == 0) std::cout << "    ";

            bool shared = sharing && unit <= UINT16_MAX
                && sharing->count(static_cast<uint16_t>(unit)) > 0;
            uint32_t job = unit < rec.allocations.size() ? rec.allocations[unit] : 0;
            if (shared) {
                std::cout << theme::yellow("\xe2\x96\x92");
            } else if (job != 0) {
                std::cout << theme::blue("\xe2\x96\x88");
            } else {
                std::cout << theme::dim("\xc2\xb7");
            }

            if (i % ALLOC_GRID_WIDTH == ALLOC_GRID_WIDTH - 1 || i + 1 == t.count) std::cout << "\n";
        }
    }
}

void print_round(const Simulation& sim, uint32_t r) {
    auto rec = sim.round(r);
    auto sharing = sim.sharing_at(r);
    const vizbin::SharingMap* sharing_ptr = sharing ? &*sharing : nullptr;

    std::cout << theme::section(fmt::format("{}  round {}/{}", sim.label(), rec.round, sim.num_rounds()));
    std::cout << theme::kv("Sim time", format_sim_time(rec.sim_time));
    std::cout << theme::kv("Utilization", theme::bar(rec.utilization * 100.0)
                           + fmt::format(" {:.1f}%", rec.utilization * 100.0));
    std::cout << theme::kv("Running", std::to_string(rec.jobs_running));
    std::cout << theme::kv("Queued", std::to_string(rec.jobs_queued));
    std::cout << theme::kv("Completed", std::to_string(rec.jobs_completed));
    std::cout << theme::kv("Avg JCT", format_duration(rec.avg_jct));
    std::cout << theme::kv("Completion", fmt::format("{:.3f}", rec.completion_rate));

    auto occupancy = compute_type_occupancy(rec, sim.config(), sim.jobs(), sharing_ptr);
    std::cout << theme::section("Occupancy");
    for (const auto& t : occupancy) {
        std::cout << fmt::format("    {:<12} ", t.gpu_type)
                  << theme::bar(t.used_pct())
                  << fmt::format(" {:>7.2f}/{:<5} {:5.1f}%\n", t.used, t.count, t.used_pct());
        for (const auto& [category, units] : t.by_category) {
            std::cout << theme::dim(fmt::format("        {:<16} {:>7.2f}", category, units)) << "\n";
        }
    }

    print_alloc_grid(sim, rec, sharing_ptr);
    std::cout << "\n";
}

void print_queue(const Simulation& sim, uint32_t r) {
    if (!sim.has_queue()) {
        std::cout << theme::dim("  No queue section in this file.") << "\n";
        return;
    }

    auto queue = sim.queue_at(r);
    std::cout << theme::section(fmt::format("Queue at round {} ({} waiting)", r, queue.size()));
    if (queue.empty()) {
        std::cout << theme::dim("    (empty)") << "\n\n";
        return;
    }

    size_t shown = std::min<size_t>(queue.size(), MAX_QUEUE_ROWS);
    for (size_t i = 0; i < shown; i++) {
        std::cout << fmt::format("    {:>4}  ", i + 1) << job_label(sim, queue[i]) << "\n";
    }
    if (shown < queue.size()) {
        std::cout << theme::dim(fmt::format("    ... {} more", queue.size() - shown)) << "\n";
    }
    std::cout << "\n";
}

void print_sharing(const Simulation& sim, uint32_t r) {
    if (!sim.has_sharing()) {
        std::cout << theme::dim("  No sharing section in this file.") << "\n";
        return;
    }

    auto sharing = sim.sharing_at(r);
    if (!sharing) {
        std::cout << theme::dim(fmt::format("  No shared units at round {}.", r)) << "\n";
        return;
    }

    const auto& types = sim.config().gpu_types;
    std::cout << theme::section(fmt::format("Shared units at round {} ({})", r, sharing->size()));
    for (const auto& [unit, slots] : *sharing) {
        int type = sim.config().gpu_type_of_unit(unit);
        std::string type_name = type >= 0 ? types[type].name : "?";
        std::cout << fmt::format("    {:>6} {:<10} ", unit, type_name);
        for (uint32_t job : slots) {
            std::cout << (job != 0 ? fmt::format("{:>8}", job) : theme::dim(fmt::format("{:>8}", "-")));
        }
        std::cout << theme::dim(fmt::format("   {}/4", vizbin::occupied_slots(slots))) << "\n";
    }
    std::cout << "\n";
}

void print_frag(const Simulation& sim, uint32_t start, uint32_t count) {
    auto rounds = sim.rounds(start, count);
    if (rounds.empty()) {
        std::cout << theme::dim(fmt::format("  No rounds at {} (file has {}).", start, sim.num_rounds())) << "\n";
        return;
    }

    std::cout << "\n" << theme::color::DIM
              << fmt::format("  {:>7} {:>7} {:>8} {:>9} {:>8} {:>8} {:>6}\n",
                             "ROUND", "UTIL", "UNALLOC", "FRAG", "RATE", "TOTAL", "NODES")
              << theme::color::RESET;

    for (const auto& rec : rounds) {
        auto m = sim.metrics(rec);
        std::cout << fmt::format("  {:>7} {:>6.1f}% {:>8} {:>9.2f} {:>7.1f}% {:>7.1f}% {:>6}\n",
                                 rec.round, rec.utilization * 100.0, m.unallocated_gpus,
                                 m.fragmentation, m.frag_rate, m.frag_total, m.occupied_nodes);
    }
    std::cout << "\n";
}

} // namespace SnapshotView
