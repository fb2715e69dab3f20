#pragma once

#include <cstdint>
#include <session/simulation.hpp>

// Terminal rendering of decoded snapshot data. Shared by the one-shot
// commands and the playback REPL; every function writes to stdout.
namespace SnapshotView {

void print_info(const Simulation& sim);
void print_jobs(const Simulation& sim, size_t limit);

// Telemetry, per-type occupancy and the allocation grid for round r.
void print_round(const Simulation& sim, uint32_t r);

void print_queue(const Simulation& sim, uint32_t r);
void print_sharing(const Simulation& sim, uint32_t r);

// One row of fragmentation metrics per round in [start, start + count).
void print_frag(const Simulation& sim, uint32_t start, uint32_t count);

} // namespace SnapshotView
