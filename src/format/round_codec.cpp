#include "round_codec.hpp"
#include <format/layout.hpp>
#include <fmt/format.h>
#include <stdexcept>

namespace vizbin {

RoundLayout make_round_layout(uint8_t num_gpu_types, uint16_t total_gpus) {
    RoundLayout layout;
    layout.num_gpu_types = num_gpu_types;
    layout.total_gpus = total_gpus;
    layout.record_size = compute_round_record_size(num_gpu_types, total_gpus);
    return layout;
}

RoundLayout make_round_layout(const SnapshotHeader& header) {
    return make_round_layout(header.num_gpu_types, header.total_gpus);
}

static RoundRecord decode_round(const uint8_t* p, const RoundLayout& layout) {
    RoundRecord r;
    r.round = load_le<uint32_t>(p);
    r.sim_time = load_f32(p + 4);
    r.utilization = load_f32(p + 8);
    r.jobs_running = load_le<uint16_t>(p + 12);
    r.jobs_queued = load_le<uint16_t>(p + 14);
    r.jobs_completed = load_le<uint32_t>(p + 16);
    r.avg_jct = load_f32(p + 20);
    r.completion_rate = load_f32(p + 24);

    const uint8_t* cur = p + ROUND_FIXED_SIZE;

    r.gpu_used.resize(layout.num_gpu_types);
    for (size_t t = 0; t < layout.num_gpu_types; t++) {
        r.gpu_used[t] = load_le<uint16_t>(cur);
        cur += 2;
    }

    r.allocations.resize(layout.total_gpus);
    for (size_t g = 0; g < layout.total_gpus; g++) {
        r.allocations[g] = load_le<uint32_t>(cur);
        cur += 4;
    }

    return r;
}

std::vector<RoundRecord> decode_round_range(const ByteBuffer& bytes,
                                            uint64_t buffer_offset,
                                            size_t count,
                                            const RoundLayout& layout) {
    uint64_t needed = static_cast<uint64_t>(count) * layout.record_size;
    if (!range_fits(bytes, buffer_offset, needed)) {
        throw std::out_of_range(fmt::format(
            "decode_round_range: {} records of {} bytes at {} need more than {} bytes",
            count, layout.record_size, buffer_offset, bytes.size()));
    }

    std::vector<RoundRecord> rounds;
    rounds.reserve(count);

    const uint8_t* base = bytes.data() + buffer_offset;
    for (size_t i = 0; i < count; i++) {
        rounds.push_back(decode_round(base + i * layout.record_size, layout));
    }

    return rounds;
}

} // namespace vizbin
