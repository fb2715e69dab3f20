#include "queue_codec.hpp"
#include <format/format_error.hpp>
#include <format/layout.hpp>
#include <fmt/format.h>

namespace vizbin {

std::vector<uint64_t> decode_offset_index(const ByteBuffer& bytes, uint64_t offset, uint32_t count) {
    uint64_t table_size = static_cast<uint64_t>(count) * INDEX_ENTRY_SIZE;
    if (!range_fits(bytes, offset, table_size)) {
        throw FormatError(FormatErrorKind::TruncatedSection,
                          fmt::format("Index of {} entries at {} exceeds {}-byte buffer",
                                      count, offset, bytes.size()));
    }

    std::vector<uint64_t> index(count);
    const uint8_t* p = bytes.data() + offset;
    for (uint32_t i = 0; i < count; i++) {
        index[i] = load_le<uint64_t>(p + static_cast<uint64_t>(i) * INDEX_ENTRY_SIZE);
    }
    return index;
}

std::vector<uint64_t> decode_queue_index(const ByteBuffer& bytes, uint64_t index_offset, uint32_t num_rounds) {
    return decode_offset_index(bytes, index_offset, num_rounds);
}

uint64_t queue_entry_size(uint16_t count) {
    return QUEUE_COUNT_SIZE + static_cast<uint64_t>(count) * QUEUE_JOB_ID_SIZE;
}

std::vector<uint32_t> decode_queue_entry(const ByteBuffer& bytes, uint64_t offset) {
    if (!range_fits(bytes, offset, QUEUE_COUNT_SIZE)) {
        throw FormatError(FormatErrorKind::TruncatedSection,
                          fmt::format("Queue entry at {} outside {}-byte buffer",
                                      offset, bytes.size()));
    }

    uint16_t count = load_le<uint16_t>(bytes.data() + offset);
    if (!range_fits(bytes, offset, queue_entry_size(count))) {
        throw FormatError(FormatErrorKind::TruncatedSection,
                          fmt::format("Queue entry at {} declares {} jobs, past end of {}-byte buffer",
                                      offset, count, bytes.size()));
    }

    std::vector<uint32_t> queue(count);
    const uint8_t* p = bytes.data() + offset + QUEUE_COUNT_SIZE;
    for (uint16_t i = 0; i < count; i++) {
        queue[i] = load_le<uint32_t>(p + static_cast<size_t>(i) * QUEUE_JOB_ID_SIZE);
    }
    return queue;
}

} // namespace vizbin
