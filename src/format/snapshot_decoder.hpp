#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include <format/byte_order.hpp>
#include <format/header_codec.hpp>
#include <format/config_codec.hpp>
#include <format/round_codec.hpp>
#include <format/sharing_codec.hpp>

namespace vizbin {

// Half-open absolute byte range [start, end) within a snapshot file.
struct ByteRange {
    uint64_t start = 0;
    uint64_t end = 0;

    uint64_t size() const { return end > start ? end - start : 0; }
    bool operator==(const ByteRange& o) const { return start == o.start && end == o.end; }
    bool operator!=(const ByteRange& o) const { return !(*this == o); }
};

// ── Ranges needed before a decoder exists ───────────────────

// The reserved header block at file start.
ByteRange header_byte_range();

// configOffset .. jobMetaOffset.
ByteRange config_byte_range(const SnapshotHeader& header);

// numJobs fixed-size records at jobMetaOffset.
ByteRange job_table_byte_range(const SnapshotHeader& header);

// Decoder for one loaded file. Holds the header and config, computes the
// round record size once, and is otherwise stateless: every decode takes an
// explicit buffer and returns fresh values, so one instance may be shared
// across threads without locking.
class SnapshotDecoder {
public:
    SnapshotDecoder(SnapshotHeader header, SimConfig config);

    const SnapshotHeader& header() const { return header_; }
    const SimConfig& config() const { return config_; }
    const RoundLayout& layout() const { return layout_; }
    size_t round_size() const { return layout_.record_size; }
    uint32_t num_rounds() const { return header_.num_rounds; }

    // ── Rounds ──────────────────────────────────────────────

    // Absolute offset of round r: roundsOffset + r * round_size.
    uint64_t round_offset(uint32_t round) const;

    // Absolute range holding exactly rounds [start_round, start_round + count).
    ByteRange round_byte_range(uint32_t start_round, uint32_t count) const;

    // Decode `count` records starting at buffer_offset within bytes.
    // See decode_round_range for the buffer-length contract.
    std::vector<RoundRecord> decode_rounds(const ByteBuffer& bytes, uint64_t buffer_offset, size_t count) const;

    // ── Queue section ───────────────────────────────────────

    // True when the file has both a queue section and its index.
    bool has_queue() const;

    ByteRange queue_index_byte_range() const;

    std::vector<uint64_t> decode_queue_index(const ByteBuffer& bytes, uint64_t offset, uint32_t num_rounds) const;

    // Absolute offset of round r's queue entry: queueOffset + index[r].
    // nullopt if r is not covered by the index.
    std::optional<uint64_t> queue_entry_offset(const std::vector<uint64_t>& queue_index, uint32_t round) const;

    std::vector<uint32_t> decode_queue_entry(const ByteBuffer& bytes, uint64_t offset) const;

    // ── Sharing section (v2) ────────────────────────────────

    bool has_sharing() const;

    ByteRange sharing_index_byte_range() const;

    // Sharing index from a whole-file buffer; empty if the file has none.
    std::vector<uint64_t> decode_sharing_index(const ByteBuffer& file_bytes) const;

    // Sharing index from a buffer holding just the index at `offset`.
    std::vector<uint64_t> decode_sharing_index_at(const ByteBuffer& bytes, uint64_t offset) const;

    // Absolute offset of round r's sharing block, nullopt if not indexed.
    std::optional<uint64_t> sharing_block_offset(const std::vector<uint64_t>& sharing_index, uint32_t round) const;

    std::optional<SharingMap> decode_sharing_round(const ByteBuffer& file_bytes,
                                                   const std::vector<uint64_t>& sharing_index,
                                                   uint32_t round) const;

    std::optional<SharingMap> decode_sharing_entries(const ByteBuffer& bytes, uint64_t offset) const;

private:
    SnapshotHeader header_;
    SimConfig config_;
    RoundLayout layout_;
};

} // namespace vizbin
