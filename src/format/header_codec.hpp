#pragma once

#include <cstdint>
#include <optional>
#include <format/byte_order.hpp>

namespace vizbin {

// Offsets of the v2 sharing section pair. A zero offset means the encoder
// did not emit that part.
struct SharingOffsets {
    uint64_t data_offset = 0;
    uint64_t index_offset = 0;

    bool operator==(const SharingOffsets& o) const {
        return data_offset == o.data_offset && index_offset == o.index_offset;
    }
    bool operator!=(const SharingOffsets& o) const { return !(*this == o); }
};

// Decoded file header. Read once per file and never modified.
struct SnapshotHeader {
    uint32_t version = 1;
    uint32_t num_rounds = 0;
    uint32_t num_jobs = 0;
    uint8_t num_gpu_types = 0;
    uint16_t total_gpus = 0;
    uint64_t job_metadata_offset = 0;
    uint64_t rounds_offset = 0;
    uint64_t queue_offset = 0;
    uint64_t queue_index_offset = 0;
    uint64_t config_offset = 0;
    std::optional<SharingOffsets> sharing;   // present iff version >= 2

    uint64_t sharing_data_offset() const { return sharing ? sharing->data_offset : 0; }
    uint64_t sharing_index_offset() const { return sharing ? sharing->index_offset : 0; }

    bool operator==(const SnapshotHeader& o) const;
    bool operator!=(const SnapshotHeader& o) const { return !(*this == o); }
};

// Decode the header at the start of bytes.
// Throws FormatError(InvalidMagic) unless the first 8 bytes are the magic tag,
// and FormatError(TruncatedHeader) if fewer bytes than the version's packed
// prefix are supplied. Versions above the newest known one decode the known
// fields and ignore the rest.
SnapshotHeader decode_header(const ByteBuffer& bytes);

// Encode a header into the reserved 256-byte block. Sharing offsets are
// written only when version >= 2 (zeros if the optional is empty).
ByteBuffer encode_header(const SnapshotHeader& header);

} // namespace vizbin
