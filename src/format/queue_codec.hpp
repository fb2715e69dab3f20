#pragma once

#include <cstdint>
#include <vector>
#include <format/byte_order.hpp>

namespace vizbin {

// Read `count` consecutive u64 offsets at `offset`. Used for both the queue
// and the sharing index; stored values are relative to their section base.
// Throws FormatError(TruncatedSection) if the table does not fit in bytes.
std::vector<uint64_t> decode_offset_index(const ByteBuffer& bytes, uint64_t offset, uint32_t count);

// Queue index: one relative offset into the queue section per round.
std::vector<uint64_t> decode_queue_index(const ByteBuffer& bytes, uint64_t index_offset, uint32_t num_rounds);

// Decode one queue entry (u16 count, then count u32 job ids) at `offset`.
// Throws FormatError(TruncatedSection) if the declared count reads past bytes.
std::vector<uint32_t> decode_queue_entry(const ByteBuffer& bytes, uint64_t offset);

// Total encoded size of the entry whose count prefix is `count`.
uint64_t queue_entry_size(uint16_t count);

} // namespace vizbin
