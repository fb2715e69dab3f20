#include "sharing_codec.hpp"
#include <format/format_error.hpp>
#include <format/queue_codec.hpp>
#include <fmt/format.h>

namespace vizbin {

bool has_sharing(const SnapshotHeader& header) {
    return header.sharing_data_offset() > 0 && header.sharing_index_offset() > 0;
}

std::vector<uint64_t> decode_sharing_index(const ByteBuffer& file_bytes, const SnapshotHeader& header) {
    if (!has_sharing(header)) return {};
    return decode_offset_index(file_bytes, header.sharing_index_offset(), header.num_rounds);
}

uint64_t sharing_block_size(uint16_t count) {
    return SHARING_COUNT_SIZE + static_cast<uint64_t>(count) * SHARING_ENTRY_SIZE;
}

std::optional<SharingMap> decode_sharing_entries(const ByteBuffer& bytes, uint64_t offset) {
    if (!range_fits(bytes, offset, SHARING_COUNT_SIZE)) {
        throw FormatError(FormatErrorKind::TruncatedSection,
                          fmt::format("Sharing block at {} outside {}-byte buffer",
                                      offset, bytes.size()));
    }

    uint16_t count = load_le<uint16_t>(bytes.data() + offset);
    if (count == 0) return std::nullopt;

    if (!range_fits(bytes, offset, sharing_block_size(count))) {
        throw FormatError(FormatErrorKind::TruncatedSection,
                          fmt::format("Sharing block at {} declares {} entries, past end of {}-byte buffer",
                                      offset, count, bytes.size()));
    }

    SharingMap map;
    const uint8_t* p = bytes.data() + offset + SHARING_COUNT_SIZE;
    for (uint16_t i = 0; i < count; i++) {
        uint16_t unit = load_le<uint16_t>(p);
        SlotArray slots;
        for (size_t s = 0; s < SHARING_SLOTS; s++) {
            slots[s] = load_le<uint32_t>(p + 2 + s * 4);
        }
        map[unit] = slots;
        p += SHARING_ENTRY_SIZE;
    }
    return map;
}

std::optional<SharingMap> decode_sharing_round(const ByteBuffer& file_bytes,
                                               const SnapshotHeader& header,
                                               const std::vector<uint64_t>& sharing_index,
                                               uint32_t round) {
    if (round >= sharing_index.size()) return std::nullopt;
    return decode_sharing_entries(file_bytes, header.sharing_data_offset() + sharing_index[round]);
}

size_t occupied_slots(const SlotArray& slots) {
    size_t n = 0;
    for (uint32_t id : slots) {
        if (id != 0) n++;
    }
    return n;
}

} // namespace vizbin
