#include <gtest/gtest.h>
#include <format/queue_codec.hpp>
#include <format/format_error.hpp>

using namespace vizbin;

static ByteBuffer queue_entry(const std::vector<uint32_t>& ids) {
    ByteBuffer out;
    append_le<uint16_t>(out, static_cast<uint16_t>(ids.size()));
    for (uint32_t id : ids) append_le<uint32_t>(out, id);
    return out;
}

TEST(QueueCodec, DecodesEntry) {
    auto bytes = queue_entry({12, 70000, 3});
    EXPECT_EQ(decode_queue_entry(bytes, 0), (std::vector<uint32_t>{12, 70000, 3}));
}

TEST(QueueCodec, EmptyEntry) {
    auto bytes = queue_entry({});
    EXPECT_TRUE(decode_queue_entry(bytes, 0).empty());
}

TEST(QueueCodec, EntryAtOffset) {
    ByteBuffer bytes(6, 0xAA);
    auto entry = queue_entry({9, 8});
    bytes.insert(bytes.end(), entry.begin(), entry.end());
    EXPECT_EQ(decode_queue_entry(bytes, 6), (std::vector<uint32_t>{9, 8}));
}

TEST(QueueCodec, DecodeIsIdempotent) {
    auto bytes = queue_entry({1, 2, 3, 4});
    auto first = decode_queue_entry(bytes, 0);
    auto second = decode_queue_entry(bytes, 0);
    EXPECT_EQ(first, second);
}

TEST(QueueCodec, EntrySize) {
    EXPECT_EQ(queue_entry_size(0), 2u);
    EXPECT_EQ(queue_entry_size(3), 14u);
}

TEST(QueueCodec, RejectsOverRead) {
    auto bytes = queue_entry({1, 2, 3});
    bytes.resize(bytes.size() - 1);
    try {
        decode_queue_entry(bytes, 0);
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.kind(), FormatErrorKind::TruncatedSection);
    }
}

TEST(QueueCodec, RejectsMissingCount) {
    ByteBuffer bytes = {0x01};
    EXPECT_THROW(decode_queue_entry(bytes, 0), FormatError);
    ByteBuffer empty;
    EXPECT_THROW(decode_queue_entry(empty, 0), FormatError);
}

TEST(QueueCodec, DecodesIndex) {
    ByteBuffer bytes(16, 0);
    append_le<uint64_t>(bytes, 0);
    append_le<uint64_t>(bytes, 14);
    append_le<uint64_t>(bytes, 0x100000000ull);
    auto index = decode_queue_index(bytes, 16, 3);
    EXPECT_EQ(index, (std::vector<uint64_t>{0, 14, 0x100000000ull}));
}

TEST(QueueCodec, RejectsShortIndex) {
    ByteBuffer bytes;
    append_le<uint64_t>(bytes, 0);
    EXPECT_THROW(decode_queue_index(bytes, 0, 2), FormatError);
}
