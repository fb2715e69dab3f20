#include <gtest/gtest.h>
#include <session/simulation.hpp>
#include <format/format_error.hpp>
#include <format/layout.hpp>
#include "snapshot_builder.hpp"

using namespace testing_support;
using vizbin::SlotArray;

static TestSnapshot two_round_snapshot() {
    TestSnapshot s;
    s.num_gpu_types = 3;
    s.total_gpus = 12;
    s.config_json = three_type_config_json();
    s.jobs = {make_job(1, 0, 2), make_job(2, 1, 1), make_job(70000, 1, 1)};

    auto r0 = make_round(0, 3, 12);
    r0.allocations[0] = 1;
    r0.allocations[1] = 1;
    auto r1 = make_round(1, 3, 12);
    r1.allocations[8] = 70000;
    s.rounds = {r0, r1};
    s.queues = {{2, 70000}, {}};
    s.sharing = {{}, {{4, SlotArray{2, 2, 0, 0}}}};
    return s;
}

static std::shared_ptr<Simulation> open_bytes(const ByteBuffer& bytes, SimulationOptions options = {}) {
    auto result = Simulation::open(std::make_shared<MemoryByteSource>(bytes), options);
    EXPECT_TRUE(result.is_ok()) << result.error;
    return result.value;
}

TEST(Simulation, OpensAndDecodes) {
    auto built = build_snapshot(two_round_snapshot());
    auto sim = open_bytes(built.bytes);
    ASSERT_NE(sim, nullptr);

    EXPECT_EQ(sim->num_rounds(), 2u);
    EXPECT_EQ(sim->header(), built.header);
    EXPECT_EQ(sim->config().policy, "fifo");
    EXPECT_EQ(sim->jobs().size(), 3u);
    EXPECT_TRUE(sim->has_queue());
    EXPECT_TRUE(sim->has_sharing());
    EXPECT_EQ(sim->label(), "memory");
}

TEST(Simulation, RoundsAndClamping) {
    auto sim = open_bytes(build_snapshot(two_round_snapshot()).bytes);

    auto all = sim->rounds(0, 10);
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[1].allocations[8], 70000u);
    EXPECT_TRUE(sim->rounds(2, 1).empty());

    EXPECT_EQ(sim->round(1).round, 1u);
    EXPECT_THROW(sim->round(2), std::out_of_range);
}

TEST(Simulation, WindowedReadsHitCache) {
    SimulationOptions options;
    options.window_rounds = 2;
    auto sim = open_bytes(build_snapshot(two_round_snapshot()).bytes, options);

    uint64_t misses = sim->cache().misses();
    sim->round(0);
    sim->round(1);
    sim->round(0);
    EXPECT_EQ(sim->cache().misses(), misses + 1);
}

TEST(Simulation, QueueAndSharingLookups) {
    auto sim = open_bytes(build_snapshot(two_round_snapshot()).bytes);

    EXPECT_EQ(sim->queue_at(0), (std::vector<uint32_t>{2, 70000}));
    EXPECT_TRUE(sim->queue_at(1).empty());
    EXPECT_TRUE(sim->queue_at(5).empty());

    EXPECT_FALSE(sim->sharing_at(0).has_value());
    auto shared = sim->sharing_at(1);
    ASSERT_TRUE(shared.has_value());
    EXPECT_EQ(shared->at(4), (SlotArray{2, 2, 0, 0}));
    EXPECT_FALSE(sim->sharing_at(9).has_value());
}

TEST(Simulation, Lookups) {
    auto sim = open_bytes(build_snapshot(two_round_snapshot()).bytes);
    ASSERT_NE(sim->find_job(70000), nullptr);
    EXPECT_EQ(sim->find_job(3), nullptr);
    ASSERT_NE(sim->find_job_type(1), nullptr);
    EXPECT_EQ(sim->find_job_type(1)->name, "Transformer");
    EXPECT_EQ(sim->category_of(1), "resnet");
    EXPECT_EQ(sim->category_of(70000), "transformer");
    EXPECT_EQ(sim->category_of(12345), "other");
}

TEST(Simulation, CorruptQueueDegradesToEmpty) {
    auto built = build_snapshot(two_round_snapshot());
    // Round 0's queue entry claims far more jobs than the file holds
    vizbin::store_le<uint16_t>(built.bytes.data() + built.header.queue_offset, 0xFFFF);
    auto sim = open_bytes(built.bytes);
    ASSERT_NE(sim, nullptr);
    EXPECT_TRUE(sim->queue_at(0).empty());
    EXPECT_TRUE(sim->queue_at(1).empty());
}

TEST(Simulation, CorruptSharingDegradesToNone) {
    auto built = build_snapshot(two_round_snapshot());
    uint64_t block = built.header.sharing_data_offset() + 2;   // round 1's block
    vizbin::store_le<uint16_t>(built.bytes.data() + block, 0xFFFF);
    auto sim = open_bytes(built.bytes);
    ASSERT_NE(sim, nullptr);
    EXPECT_FALSE(sim->sharing_at(1).has_value());
}

TEST(Simulation, V1FileHasNoSharing) {
    auto s = two_round_snapshot();
    s.version = 1;
    auto sim = open_bytes(build_snapshot(s).bytes);
    EXPECT_FALSE(sim->has_sharing());
    EXPECT_FALSE(sim->sharing_at(1).has_value());
    EXPECT_EQ(sim->queue_at(0), (std::vector<uint32_t>{2, 70000}));
}

TEST(Simulation, RejectsNonSnapshot) {
    ByteBuffer junk(300, 'x');
    auto result = Simulation::open(std::make_shared<MemoryByteSource>(junk));
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("Not a valid snapshot file"), std::string::npos);
}

TEST(Simulation, RejectsTruncatedJobTable) {
    auto built = build_snapshot(two_round_snapshot());
    built.bytes.resize(built.header.job_metadata_offset + 30);
    auto result = Simulation::open(std::make_shared<MemoryByteSource>(built.bytes));
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("Failed to load snapshot"), std::string::npos);
}

TEST(Simulation, RejectsBadConfig) {
    auto s = two_round_snapshot();
    s.config_json = "{\"gpu_types\": ";
    auto result = Simulation::open(std::make_shared<MemoryByteSource>(build_snapshot(s).bytes));
    EXPECT_TRUE(result.is_err());
}

TEST(Simulation, TruncatedRoundsThrowFormatError) {
    auto s = two_round_snapshot();
    s.write_queue = false;
    s.version = 1;
    auto built = build_snapshot(s);
    built.bytes.resize(built.bytes.size() - 8);
    auto sim = open_bytes(built.bytes);
    ASSERT_NE(sim, nullptr);
    EXPECT_THROW(sim->rounds(0, 2), vizbin::FormatError);
    EXPECT_EQ(sim->rounds(0, 1).size(), 1u);
}

TEST(Simulation, OpenFileMissing) {
    auto result = Simulation::open_file("/nonexistent/vizbin/run.bin");
    EXPECT_TRUE(result.is_err());
}
