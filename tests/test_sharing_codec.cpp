#include <gtest/gtest.h>
#include <format/sharing_codec.hpp>
#include <format/format_error.hpp>
#include <format/layout.hpp>

using namespace vizbin;

static void append_entry(ByteBuffer& out, uint16_t unit, const SlotArray& slots) {
    append_le<uint16_t>(out, unit);
    for (uint32_t id : slots) append_le<uint32_t>(out, id);
}

TEST(SharingCodec, AbsentBelowVersion2) {
    SnapshotHeader h;
    h.version = 1;
    h.num_rounds = 4;
    EXPECT_FALSE(has_sharing(h));
    EXPECT_TRUE(decode_sharing_index(ByteBuffer(512, 0), h).empty());
}

TEST(SharingCodec, AbsentWhenOffsetsZero) {
    SnapshotHeader h;
    h.version = 2;
    h.sharing = SharingOffsets{0, 0};
    EXPECT_FALSE(has_sharing(h));
    h.sharing = SharingOffsets{400, 0};
    EXPECT_FALSE(has_sharing(h));
    h.sharing = SharingOffsets{400, 480};
    EXPECT_TRUE(has_sharing(h));
}

TEST(SharingCodec, ZeroCountIsNoData) {
    ByteBuffer bytes;
    append_le<uint16_t>(bytes, 0);
    EXPECT_FALSE(decode_sharing_entries(bytes, 0).has_value());
}

TEST(SharingCodec, DecodesEntries) {
    ByteBuffer bytes;
    append_le<uint16_t>(bytes, 2);
    append_entry(bytes, 5, {11, 12, 0, 0});
    append_entry(bytes, 300, {70000, 0, 0, 13});
    ASSERT_EQ(bytes.size(), sharing_block_size(2));

    auto map = decode_sharing_entries(bytes, 0);
    ASSERT_TRUE(map.has_value());
    ASSERT_EQ(map->size(), 2u);
    EXPECT_EQ(map->at(5), (SlotArray{11, 12, 0, 0}));
    EXPECT_EQ(map->at(300), (SlotArray{70000, 0, 0, 13}));
    EXPECT_EQ(occupied_slots(map->at(5)), 2u);
}

TEST(SharingCodec, LastDuplicateUnitWins) {
    ByteBuffer bytes;
    append_le<uint16_t>(bytes, 2);
    append_entry(bytes, 7, {1, 0, 0, 0});
    append_entry(bytes, 7, {2, 3, 0, 0});
    auto map = decode_sharing_entries(bytes, 0);
    ASSERT_TRUE(map.has_value());
    EXPECT_EQ(map->size(), 1u);
    EXPECT_EQ(map->at(7), (SlotArray{2, 3, 0, 0}));
}

TEST(SharingCodec, RejectsOverRead) {
    ByteBuffer bytes;
    append_le<uint16_t>(bytes, 3);
    append_entry(bytes, 1, {1, 0, 0, 0});
    try {
        decode_sharing_entries(bytes, 0);
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.kind(), FormatErrorKind::TruncatedSection);
    }
}

TEST(SharingCodec, DecodesRoundThroughIndex) {
    // [data: round 0 empty block | round 1 one entry] [index]
    ByteBuffer file(HEADER_SIZE, 0);
    uint64_t data_offset = file.size();
    append_le<uint16_t>(file, 0);
    append_le<uint16_t>(file, 1);
    append_entry(file, 9, {4, 4, 4, 4});
    file.resize(static_cast<size_t>(align_to_8(file.size())), 0);
    uint64_t index_offset = file.size();
    append_le<uint64_t>(file, 0);
    append_le<uint64_t>(file, 2);

    SnapshotHeader h;
    h.version = 2;
    h.num_rounds = 2;
    h.sharing = SharingOffsets{data_offset, index_offset};

    auto index = decode_sharing_index(file, h);
    ASSERT_EQ(index, (std::vector<uint64_t>{0, 2}));
    EXPECT_FALSE(decode_sharing_round(file, h, index, 0).has_value());
    auto r1 = decode_sharing_round(file, h, index, 1);
    ASSERT_TRUE(r1.has_value());
    EXPECT_EQ(occupied_slots(r1->at(9)), 4u);
    EXPECT_FALSE(decode_sharing_round(file, h, index, 2).has_value());
}
