#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <data/byte_source.hpp>
#include <data/range_cache.hpp>
#include <format/snapshot_decoder.hpp>
#include <format/job_table.hpp>
#include <analysis/fragmentation.hpp>
#include <analysis/occupancy.hpp>

struct SimulationOptions {
    int cache_entries = DEFAULT_CACHE_MAX_ENTRIES;
    int window_rounds = DEFAULT_WINDOW_ROUNDS;
    int gpus_per_node = 0;          // fragmentation node size override, 0 = file value
    std::string label;              // display name; defaults to the source description
};

// One loaded snapshot file: header, config and job table decoded up front,
// rounds, queues and sharing fetched on demand through an LRU range cache.
class Simulation {
public:
    // Fetch and decode header, config, job table and the section indexes.
    // Fails (no partial load) on any format or I/O error.
    static Result<std::shared_ptr<Simulation>> open(std::shared_ptr<ByteSource> source,
                                                    const SimulationOptions& options = {});

    static Result<std::shared_ptr<Simulation>> open_file(const std::filesystem::path& path,
                                                         SimulationOptions options = {});

    const vizbin::SnapshotHeader& header() const { return decoder_.header(); }
    const vizbin::SimConfig& config() const { return decoder_.config(); }
    const vizbin::SnapshotDecoder& decoder() const { return decoder_; }
    const vizbin::JobTable& jobs() const { return jobs_; }
    const std::string& label() const { return label_; }
    uint32_t num_rounds() const { return decoder_.num_rounds(); }
    const CachedByteSource& cache() const { return *cache_; }

    bool has_queue() const { return !queue_index_.empty(); }
    bool has_sharing() const { return !sharing_index_.empty(); }

    // Rounds [start, start + count), clamped to the file's round count.
    // Throws FormatError(TruncatedSection) if the file ends inside the range.
    std::vector<vizbin::RoundRecord> rounds(uint32_t start, uint32_t count) const;

    // Single round, read through its aligned playback window so neighbouring
    // rounds hit the cache. Throws std::out_of_range if r >= num_rounds().
    vizbin::RoundRecord round(uint32_t r) const;

    // Jobs waiting at round r. Empty when the file has no queue section, r is
    // not indexed, or the entry is corrupt (logged as a warning).
    std::vector<uint32_t> queue_at(uint32_t r) const;

    // Shared units at round r, nullopt under the same conditions as queue_at
    // or when the round shares nothing.
    std::optional<vizbin::SharingMap> sharing_at(uint32_t r) const;

    const vizbin::JobRecord* find_job(uint32_t job_id) const { return jobs_.find(job_id); }
    const vizbin::JobTypeInfo* find_job_type(uint16_t type_id) const;
    std::string category_of(uint32_t job_id) const;

    // ── Derived per-round views ─────────────────────────────

    // Scale-factor popularity over the whole job table, built once at load.
    const Workload& workload() const { return workload_; }

    // Fragmentation of an already-decoded round, using the configured node size.
    RoundMetrics metrics(const vizbin::RoundRecord& rec) const;
    RoundMetrics metrics_at(uint32_t r) const { return metrics(round(r)); }
    std::vector<TypeOccupancy> occupancy_at(uint32_t r) const;

private:
    Simulation(std::shared_ptr<CachedByteSource> cache,
               vizbin::SnapshotDecoder decoder,
               vizbin::JobTable jobs,
               std::vector<uint64_t> queue_index,
               std::vector<uint64_t> sharing_index,
               uint32_t window_rounds,
               uint32_t gpus_per_node,
               std::string label);

    std::shared_ptr<CachedByteSource> cache_;
    vizbin::SnapshotDecoder decoder_;
    vizbin::JobTable jobs_;
    std::vector<uint64_t> queue_index_;
    std::vector<uint64_t> sharing_index_;
    Workload workload_;
    uint32_t window_rounds_;
    uint32_t gpus_per_node_;
    std::string label_;
};
