#pragma once

#include <cstdint>
#include <vector>
#include <format/byte_order.hpp>
#include <format/header_codec.hpp>

namespace vizbin {

// One scheduling round: fixed telemetry plus the full allocation snapshot.
struct RoundRecord {
    uint32_t round = 0;
    float sim_time = 0.0f;              // seconds
    float utilization = 0.0f;           // 0..1, scheduler-defined
    uint16_t jobs_running = 0;
    uint16_t jobs_queued = 0;
    uint32_t jobs_completed = 0;        // cumulative
    float avg_jct = 0.0f;               // average completion time so far, seconds
    float completion_rate = 0.0f;       // windowed
    std::vector<uint16_t> gpu_used;     // one per GPU type
    std::vector<uint32_t> allocations;  // job id per resource unit, 0 = idle
};

// Per-file round record geometry, fixed for the file's lifetime.
struct RoundLayout {
    uint8_t num_gpu_types = 0;
    uint16_t total_gpus = 0;
    size_t record_size = 0;
};

RoundLayout make_round_layout(uint8_t num_gpu_types, uint16_t total_gpus);
RoundLayout make_round_layout(const SnapshotHeader& header);

// Decode `count` consecutive records starting at buffer_offset.
//
// Records carry no length prefix, so each one is trusted to match the layout.
// The caller must supply at least buffer_offset + count * record_size bytes;
// a shorter buffer is a caller bug and throws std::out_of_range (checked once
// per call, not per record).
std::vector<RoundRecord> decode_round_range(const ByteBuffer& bytes,
                                            uint64_t buffer_offset,
                                            size_t count,
                                            const RoundLayout& layout);

} // namespace vizbin
