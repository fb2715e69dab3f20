#pragma once

#include <cstdint>
#include <cstddef>

namespace vizbin {

// ── File layout constants ───────────────────────────────────
// All integers little-endian; sections start on 8-byte boundaries.

constexpr char     MAGIC[]                = "GPUVIZ01";   // 8 bytes, no terminator on disk
constexpr size_t   MAGIC_SIZE             = 8;
constexpr uint32_t FORMAT_VERSION         = 2;            // newest layout this reader knows
constexpr uint32_t SHARING_MIN_VERSION    = 2;

constexpr size_t   HEADER_SIZE            = 256;          // reserved block at file start
constexpr size_t   HEADER_V1_PACKED_SIZE  = 64;
constexpr size_t   HEADER_V2_PACKED_SIZE  = 80;

constexpr size_t   JOB_RECORD_SIZE        = 24;
constexpr size_t   ROUND_FIXED_SIZE       = 28;           // 4+4+4+2+2+4+4+4
constexpr size_t   INDEX_ENTRY_SIZE       = 8;            // u64 relative offset per round
constexpr size_t   QUEUE_COUNT_SIZE       = 2;
constexpr size_t   QUEUE_JOB_ID_SIZE      = 4;
constexpr size_t   SHARING_COUNT_SIZE     = 2;
constexpr size_t   SHARING_SLOTS          = 4;            // quarter subdivisions of one unit
constexpr size_t   SHARING_ENTRY_SIZE     = 2 + SHARING_SLOTS * 4;  // 18

// ── Header field positions ──────────────────────────────────
namespace header_pos {
constexpr size_t VERSION            = 8;
constexpr size_t NUM_ROUNDS         = 12;
constexpr size_t NUM_JOBS           = 16;
constexpr size_t NUM_GPU_TYPES      = 20;
constexpr size_t TOTAL_GPUS         = 21;   // followed by one pad byte
constexpr size_t JOB_METADATA       = 24;
constexpr size_t ROUNDS             = 32;
constexpr size_t QUEUE              = 40;
constexpr size_t QUEUE_INDEX        = 48;
constexpr size_t CONFIG             = 56;
constexpr size_t SHARING_DATA       = 64;   // v2
constexpr size_t SHARING_INDEX      = 72;   // v2
} // namespace header_pos

// ── Alignment math ──────────────────────────────────────────

// Round up to the next multiple of 8.
constexpr uint64_t align_to_8(uint64_t offset) {
    return (offset + 7) & ~static_cast<uint64_t>(7);
}

// Size in bytes of one round record: 28 fixed bytes, a u16 used-count per GPU
// type and a u32 job id per resource unit, padded to 8.
constexpr size_t compute_round_record_size(size_t num_gpu_types, size_t total_gpus) {
    return static_cast<size_t>(
        align_to_8(ROUND_FIXED_SIZE + 2 * num_gpu_types + 4 * total_gpus));
}

static_assert(compute_round_record_size(3, 108) == 472, "round record size");

} // namespace vizbin
