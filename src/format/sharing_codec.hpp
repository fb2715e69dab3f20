#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>
#include <format/byte_order.hpp>
#include <format/header_codec.hpp>
#include <format/layout.hpp>

namespace vizbin {

// Job ids occupying the four quarter slots of one resource unit (0 = idle quarter).
using SlotArray = std::array<uint32_t, SHARING_SLOTS>;

// Unit index -> quarter slots, for the units a round reports as shared.
// Where a unit appears here it supersedes the round's allocation entry.
using SharingMap = std::map<uint16_t, SlotArray>;

// True iff the file carries a sharing section: version >= 2 and both
// offsets nonzero. A v2 encoder omits the section when nothing was shared.
bool has_sharing(const SnapshotHeader& header);

// Sharing index read from a whole-file buffer at the header's absolute
// offset. Empty when has_sharing() is false.
std::vector<uint64_t> decode_sharing_index(const ByteBuffer& file_bytes, const SnapshotHeader& header);

// Decode one round's sharing block (u16 count, then count 18-byte entries) at
// `offset`. nullopt when the round declares no entries.
// Throws FormatError(TruncatedSection) if the declared count reads past bytes.
std::optional<SharingMap> decode_sharing_entries(const ByteBuffer& bytes, uint64_t offset);

// Sharing map for `round` from a whole-file buffer. nullopt when the round is
// not covered by the index or declares no entries.
std::optional<SharingMap> decode_sharing_round(const ByteBuffer& file_bytes,
                                               const SnapshotHeader& header,
                                               const std::vector<uint64_t>& sharing_index,
                                               uint32_t round);

// Total encoded size of a sharing block whose count prefix is `count`.
uint64_t sharing_block_size(uint16_t count);

// Number of nonzero quarter slots.
size_t occupied_slots(const SlotArray& slots);

} // namespace vizbin
