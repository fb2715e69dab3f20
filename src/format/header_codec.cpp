#include "header_codec.hpp"
#include <format/format_error.hpp>
#include <format/layout.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <string>

namespace vizbin {

bool SnapshotHeader::operator==(const SnapshotHeader& o) const {
    return version == o.version &&
           num_rounds == o.num_rounds &&
           num_jobs == o.num_jobs &&
           num_gpu_types == o.num_gpu_types &&
           total_gpus == o.total_gpus &&
           job_metadata_offset == o.job_metadata_offset &&
           rounds_offset == o.rounds_offset &&
           queue_offset == o.queue_offset &&
           queue_index_offset == o.queue_index_offset &&
           config_offset == o.config_offset &&
           sharing == o.sharing;
}

// Render up to 8 leading bytes for the error message, escaping non-printables.
static std::string printable_magic(const ByteBuffer& bytes) {
    std::string out;
    size_t n = std::min(bytes.size(), MAGIC_SIZE);
    for (size_t i = 0; i < n; i++) {
        unsigned char c = bytes[i];
        if (std::isprint(c)) {
            out += static_cast<char>(c);
        } else {
            out += fmt::format("\\x{:02x}", c);
        }
    }
    return out;
}

SnapshotHeader decode_header(const ByteBuffer& bytes) {
    if (bytes.size() < MAGIC_SIZE ||
        !std::equal(bytes.begin(), bytes.begin() + MAGIC_SIZE, MAGIC)) {
        throw FormatError(FormatErrorKind::InvalidMagic,
                          fmt::format("Invalid magic: '{}', expected '{}'",
                                      printable_magic(bytes), MAGIC));
    }
    if (bytes.size() < HEADER_V1_PACKED_SIZE) {
        throw FormatError(FormatErrorKind::TruncatedHeader,
                          fmt::format("Header too short: {} < {} bytes",
                                      bytes.size(), HEADER_V1_PACKED_SIZE));
    }

    const uint8_t* p = bytes.data();
    SnapshotHeader h;
    h.version = load_le<uint32_t>(p + header_pos::VERSION);
    h.num_rounds = load_le<uint32_t>(p + header_pos::NUM_ROUNDS);
    h.num_jobs = load_le<uint32_t>(p + header_pos::NUM_JOBS);
    h.num_gpu_types = p[header_pos::NUM_GPU_TYPES];
    h.total_gpus = load_le<uint16_t>(p + header_pos::TOTAL_GPUS);
    h.job_metadata_offset = load_le<uint64_t>(p + header_pos::JOB_METADATA);
    h.rounds_offset = load_le<uint64_t>(p + header_pos::ROUNDS);
    h.queue_offset = load_le<uint64_t>(p + header_pos::QUEUE);
    h.queue_index_offset = load_le<uint64_t>(p + header_pos::QUEUE_INDEX);
    h.config_offset = load_le<uint64_t>(p + header_pos::CONFIG);

    if (h.version >= SHARING_MIN_VERSION) {
        if (bytes.size() < HEADER_V2_PACKED_SIZE) {
            throw FormatError(FormatErrorKind::TruncatedHeader,
                              fmt::format("Version {} header too short: {} < {} bytes",
                                          h.version, bytes.size(), HEADER_V2_PACKED_SIZE));
        }
        SharingOffsets s;
        s.data_offset = load_le<uint64_t>(p + header_pos::SHARING_DATA);
        s.index_offset = load_le<uint64_t>(p + header_pos::SHARING_INDEX);
        h.sharing = s;
    }

    return h;
}

ByteBuffer encode_header(const SnapshotHeader& header) {
    ByteBuffer out(HEADER_SIZE, 0);
    uint8_t* p = out.data();

    std::copy(MAGIC, MAGIC + MAGIC_SIZE, p);
    store_le<uint32_t>(p + header_pos::VERSION, header.version);
    store_le<uint32_t>(p + header_pos::NUM_ROUNDS, header.num_rounds);
    store_le<uint32_t>(p + header_pos::NUM_JOBS, header.num_jobs);
    p[header_pos::NUM_GPU_TYPES] = header.num_gpu_types;
    store_le<uint16_t>(p + header_pos::TOTAL_GPUS, header.total_gpus);
    store_le<uint64_t>(p + header_pos::JOB_METADATA, header.job_metadata_offset);
    store_le<uint64_t>(p + header_pos::ROUNDS, header.rounds_offset);
    store_le<uint64_t>(p + header_pos::QUEUE, header.queue_offset);
    store_le<uint64_t>(p + header_pos::QUEUE_INDEX, header.queue_index_offset);
    store_le<uint64_t>(p + header_pos::CONFIG, header.config_offset);

    if (header.version >= SHARING_MIN_VERSION) {
        store_le<uint64_t>(p + header_pos::SHARING_DATA, header.sharing_data_offset());
        store_le<uint64_t>(p + header_pos::SHARING_INDEX, header.sharing_index_offset());
    }

    return out;
}

} // namespace vizbin
