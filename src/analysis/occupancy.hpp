#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <format/config_codec.hpp>
#include <format/job_table.hpp>
#include <format/round_codec.hpp>
#include <format/sharing_codec.hpp>

// Usage of one GPU type in one round, broken down by job category.
struct TypeOccupancy {
    std::string gpu_type;
    uint32_t count = 0;                         // units of this type
    double used = 0.0;                          // may be fractional with sharing
    std::map<std::string, double> by_category;  // category -> units

    double idle() const { return count > used ? count - used : 0.0; }
    double used_pct() const { return count > 0 ? used / count * 100.0 : 0.0; }
};

// Category of a job via its type, "other" if either lookup fails.
std::string job_category(uint32_t job_id,
                         const vizbin::JobTable& jobs,
                         const vizbin::SimConfig& config);

// Per-type occupancy for one round.
//
// Units listed in `sharing` count 0.25 per occupied quarter slot, attributed
// to that slot's job category; every other unit counts 1 if allocated. When
// the file carries no job table, the round's gpu_used telemetry is reported
// under a single "active" category instead.
std::vector<TypeOccupancy> compute_type_occupancy(const vizbin::RoundRecord& round,
                                                  const vizbin::SimConfig& config,
                                                  const vizbin::JobTable& jobs,
                                                  const vizbin::SharingMap* sharing);
