#pragma once

// Writes complete snapshot files in memory for tests, section order as the
// simulator writes them: header, config, jobs, rounds, queue data, queue
// index, then (v2) sharing data and sharing index. Sections start on 8-byte
// boundaries.

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>
#include <format/byte_order.hpp>
#include <format/layout.hpp>
#include <format/header_codec.hpp>
#include <format/job_table.hpp>
#include <format/round_codec.hpp>
#include <format/sharing_codec.hpp>

namespace testing_support {

using vizbin::ByteBuffer;

struct TestSnapshot {
    uint32_t version = 2;
    uint8_t num_gpu_types = 0;
    uint16_t total_gpus = 0;
    std::string config_json = "{}";
    std::vector<vizbin::JobRecord> jobs;
    std::vector<vizbin::RoundRecord> rounds;
    bool write_queue = true;
    std::vector<std::vector<uint32_t>> queues;      // per round, missing = empty queue
    bool write_sharing = true;                      // ignored below version 2
    std::vector<vizbin::SharingMap> sharing;        // per round, missing = no shared units
};

struct BuiltSnapshot {
    ByteBuffer bytes;
    vizbin::SnapshotHeader header;
};

inline void pad_to_8(ByteBuffer& out) {
    out.resize(static_cast<size_t>(vizbin::align_to_8(out.size())), 0);
}

inline void append_job(ByteBuffer& out, const vizbin::JobRecord& j) {
    vizbin::append_le<uint32_t>(out, j.job_id);
    vizbin::append_le<uint16_t>(out, j.type_id);
    out.push_back(j.scale_factor);
    out.push_back(0);
    vizbin::append_le<uint32_t>(out, j.arrival_round);
    vizbin::append_le<uint32_t>(out, j.completion_round);
    vizbin::append_f32(out, j.duration);
    vizbin::append_le<uint32_t>(out, 0);
}

inline void append_round(ByteBuffer& out, const vizbin::RoundRecord& r,
                         uint8_t num_gpu_types, uint16_t total_gpus) {
    size_t start = out.size();
    vizbin::append_le<uint32_t>(out, r.round);
    vizbin::append_f32(out, r.sim_time);
    vizbin::append_f32(out, r.utilization);
    vizbin::append_le<uint16_t>(out, r.jobs_running);
    vizbin::append_le<uint16_t>(out, r.jobs_queued);
    vizbin::append_le<uint32_t>(out, r.jobs_completed);
    vizbin::append_f32(out, r.avg_jct);
    vizbin::append_f32(out, r.completion_rate);
    for (size_t t = 0; t < num_gpu_types; t++) {
        vizbin::append_le<uint16_t>(out, t < r.gpu_used.size() ? r.gpu_used[t] : 0);
    }
    for (size_t g = 0; g < total_gpus; g++) {
        vizbin::append_le<uint32_t>(out, g < r.allocations.size() ? r.allocations[g] : 0);
    }
    out.resize(start + vizbin::compute_round_record_size(num_gpu_types, total_gpus), 0);
}

inline BuiltSnapshot build_snapshot(const TestSnapshot& s) {
    vizbin::SnapshotHeader h;
    h.version = s.version;
    h.num_rounds = static_cast<uint32_t>(s.rounds.size());
    h.num_jobs = static_cast<uint32_t>(s.jobs.size());
    h.num_gpu_types = s.num_gpu_types;
    h.total_gpus = s.total_gpus;

    ByteBuffer out(vizbin::HEADER_SIZE, 0);

    h.config_offset = out.size();
    out.insert(out.end(), s.config_json.begin(), s.config_json.end());
    pad_to_8(out);

    h.job_metadata_offset = out.size();
    for (const auto& j : s.jobs) append_job(out, j);
    pad_to_8(out);

    h.rounds_offset = out.size();
    for (const auto& r : s.rounds) append_round(out, r, s.num_gpu_types, s.total_gpus);

    if (s.write_queue) {
        pad_to_8(out);
        h.queue_offset = out.size();
        std::vector<uint64_t> index;
        for (size_t r = 0; r < s.rounds.size(); r++) {
            index.push_back(out.size() - h.queue_offset);
            std::vector<uint32_t> q = r < s.queues.size() ? s.queues[r] : std::vector<uint32_t>{};
            vizbin::append_le<uint16_t>(out, static_cast<uint16_t>(q.size()));
            for (uint32_t id : q) vizbin::append_le<uint32_t>(out, id);
        }
        pad_to_8(out);
        h.queue_index_offset = out.size();
        for (uint64_t off : index) vizbin::append_le<uint64_t>(out, off);
    }

    if (s.version >= vizbin::SHARING_MIN_VERSION) {
        vizbin::SharingOffsets offsets;
        if (s.write_sharing) {
            pad_to_8(out);
            offsets.data_offset = out.size();
            std::vector<uint64_t> index;
            for (size_t r = 0; r < s.rounds.size(); r++) {
                index.push_back(out.size() - offsets.data_offset);
                vizbin::SharingMap m = r < s.sharing.size() ? s.sharing[r] : vizbin::SharingMap{};
                vizbin::append_le<uint16_t>(out, static_cast<uint16_t>(m.size()));
                for (const auto& [unit, slots] : m) {
                    vizbin::append_le<uint16_t>(out, unit);
                    for (uint32_t id : slots) vizbin::append_le<uint32_t>(out, id);
                }
            }
            pad_to_8(out);
            offsets.index_offset = out.size();
            for (uint64_t off : index) vizbin::append_le<uint64_t>(out, off);
        }
        h.sharing = offsets;
    }

    ByteBuffer header_bytes = vizbin::encode_header(h);
    std::copy(header_bytes.begin(), header_bytes.end(), out.begin());
    return {out, h};
}

inline vizbin::RoundRecord make_round(uint32_t round, uint8_t num_gpu_types, uint16_t total_gpus) {
    vizbin::RoundRecord r;
    r.round = round;
    r.sim_time = 360.0f * static_cast<float>(round);
    r.gpu_used.assign(num_gpu_types, 0);
    r.allocations.assign(total_gpus, 0);
    return r;
}

inline vizbin::JobRecord make_job(uint32_t id, uint16_t type_id, uint8_t scale,
                                  uint32_t arrival = 0, uint32_t completion = 0,
                                  float duration = 0.0f) {
    vizbin::JobRecord j;
    j.job_id = id;
    j.type_id = type_id;
    j.scale_factor = scale;
    j.arrival_round = arrival;
    j.completion_round = completion;
    j.duration = duration;
    return j;
}

// Three GPU types of four units each (12 units), two nodes of two per type.
inline std::string three_type_config_json() {
    return R"({"policy": "fifo",
  "gpu_types": [
    {"name": "v100", "count": 4, "gpus_per_node": 2},
    {"name": "p100", "count": 4, "gpus_per_node": 2},
    {"name": "k80", "count": 4, "gpus_per_node": 2}],
  "job_types": [
    {"id": 0, "name": "ResNet-18", "category": "resnet"},
    {"id": 1, "name": "Transformer", "category": "transformer"}],
  "measurement_window": {"start_job": 10, "end_job": 90}})";
}

} // namespace testing_support
