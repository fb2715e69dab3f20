#include "snapshot_decoder.hpp"
#include <format/layout.hpp>
#include <format/queue_codec.hpp>

namespace vizbin {

ByteRange header_byte_range() {
    return {0, HEADER_SIZE};
}

ByteRange config_byte_range(const SnapshotHeader& header) {
    return {header.config_offset, header.job_metadata_offset};
}

ByteRange job_table_byte_range(const SnapshotHeader& header) {
    uint64_t start = header.job_metadata_offset;
    return {start, start + static_cast<uint64_t>(header.num_jobs) * JOB_RECORD_SIZE};
}

SnapshotDecoder::SnapshotDecoder(SnapshotHeader header, SimConfig config)
    : header_(std::move(header)),
      config_(std::move(config)),
      layout_(make_round_layout(header_)) {}

uint64_t SnapshotDecoder::round_offset(uint32_t round) const {
    return header_.rounds_offset + static_cast<uint64_t>(round) * layout_.record_size;
}

ByteRange SnapshotDecoder::round_byte_range(uint32_t start_round, uint32_t count) const {
    uint64_t start = round_offset(start_round);
    return {start, start + static_cast<uint64_t>(count) * layout_.record_size};
}

std::vector<RoundRecord> SnapshotDecoder::decode_rounds(const ByteBuffer& bytes,
                                                        uint64_t buffer_offset,
                                                        size_t count) const {
    return decode_round_range(bytes, buffer_offset, count, layout_);
}

bool SnapshotDecoder::has_queue() const {
    return header_.queue_offset > 0 && header_.queue_index_offset > 0;
}

ByteRange SnapshotDecoder::queue_index_byte_range() const {
    uint64_t start = header_.queue_index_offset;
    return {start, start + static_cast<uint64_t>(header_.num_rounds) * INDEX_ENTRY_SIZE};
}

std::vector<uint64_t> SnapshotDecoder::decode_queue_index(const ByteBuffer& bytes,
                                                          uint64_t offset,
                                                          uint32_t num_rounds) const {
    return vizbin::decode_queue_index(bytes, offset, num_rounds);
}

std::optional<uint64_t> SnapshotDecoder::queue_entry_offset(const std::vector<uint64_t>& queue_index,
                                                            uint32_t round) const {
    if (round >= queue_index.size()) return std::nullopt;
    return header_.queue_offset + queue_index[round];
}

std::vector<uint32_t> SnapshotDecoder::decode_queue_entry(const ByteBuffer& bytes, uint64_t offset) const {
    return vizbin::decode_queue_entry(bytes, offset);
}

bool SnapshotDecoder::has_sharing() const {
    return vizbin::has_sharing(header_);
}

ByteRange SnapshotDecoder::sharing_index_byte_range() const {
    if (!has_sharing()) return {};
    uint64_t start = header_.sharing_index_offset();
    return {start, start + static_cast<uint64_t>(header_.num_rounds) * INDEX_ENTRY_SIZE};
}

std::vector<uint64_t> SnapshotDecoder::decode_sharing_index(const ByteBuffer& file_bytes) const {
    return vizbin::decode_sharing_index(file_bytes, header_);
}

std::vector<uint64_t> SnapshotDecoder::decode_sharing_index_at(const ByteBuffer& bytes, uint64_t offset) const {
    if (!has_sharing()) return {};
    return decode_offset_index(bytes, offset, header_.num_rounds);
}

std::optional<uint64_t> SnapshotDecoder::sharing_block_offset(const std::vector<uint64_t>& sharing_index,
                                                              uint32_t round) const {
    if (round >= sharing_index.size()) return std::nullopt;
    return header_.sharing_data_offset() + sharing_index[round];
}

std::optional<SharingMap> SnapshotDecoder::decode_sharing_round(const ByteBuffer& file_bytes,
                                                                const std::vector<uint64_t>& sharing_index,
                                                                uint32_t round) const {
    return vizbin::decode_sharing_round(file_bytes, header_, sharing_index, round);
}

std::optional<SharingMap> SnapshotDecoder::decode_sharing_entries(const ByteBuffer& bytes, uint64_t offset) const {
    return vizbin::decode_sharing_entries(bytes, offset);
}

} // namespace vizbin
