#include <gtest/gtest.h>
#include <session/playback.hpp>
#include "snapshot_builder.hpp"

using namespace testing_support;

static std::shared_ptr<Simulation> sim_with_rounds(uint32_t n) {
    TestSnapshot s;
    s.num_gpu_types = 1;
    s.total_gpus = 4;
    s.config_json = R"({"gpu_types": [{"name": "v100", "count": 4}]})";
    for (uint32_t r = 0; r < n; r++) s.rounds.push_back(make_round(r, 1, 4));
    auto result = Simulation::open(std::make_shared<MemoryByteSource>(build_snapshot(s).bytes));
    EXPECT_TRUE(result.is_ok()) << result.error;
    return result.value;
}

TEST(Playback, EmptyModel) {
    PlaybackModel model;
    EXPECT_EQ(model.slot_count(), 2u);
    EXPECT_FALSE(model.any_loaded());
    EXPECT_EQ(model.max_rounds(), 0u);
    model.set_current_round(5);
    EXPECT_EQ(model.current_round(), 0u);
}

TEST(Playback, ClampsToLoadedRounds) {
    PlaybackModel model;
    model.load(0, sim_with_rounds(10));
    model.set_current_round(25);
    EXPECT_EQ(model.current_round(), 9u);
    model.set_current_round(-3);
    EXPECT_EQ(model.current_round(), 0u);
    model.step(4);
    EXPECT_EQ(model.current_round(), 4u);
    model.step(-10);
    EXPECT_EQ(model.current_round(), 0u);
}

TEST(Playback, MaxOverSlots) {
    PlaybackModel model;
    model.load(0, sim_with_rounds(5));
    model.load(1, sim_with_rounds(12));
    EXPECT_EQ(model.max_rounds(), 12u);
    model.set_current_round(11);
    EXPECT_EQ(model.current_round(), 11u);

    // Dropping the longer run pulls the current round back into range
    model.clear(1);
    EXPECT_EQ(model.max_rounds(), 5u);
    EXPECT_EQ(model.current_round(), 4u);
    EXPECT_EQ(model.simulation(1), nullptr);
}

TEST(Playback, Events) {
    PlaybackModel model;
    std::vector<std::pair<PlaybackEvent, int>> seen;
    model.on_change([&seen](PlaybackEvent e, int slot) { seen.emplace_back(e, slot); });

    model.load(1, sim_with_rounds(3));
    model.set_current_round(2);
    model.set_current_round(2);   // unchanged, no event
    model.clear(1);

    ASSERT_EQ(seen.size(), 4u);
    EXPECT_EQ(seen[0], std::make_pair(PlaybackEvent::SimulationLoaded, 1));
    EXPECT_EQ(seen[1], std::make_pair(PlaybackEvent::RoundChanged, -1));
    EXPECT_EQ(seen[2], std::make_pair(PlaybackEvent::SimulationCleared, 1));
    EXPECT_EQ(seen[3], std::make_pair(PlaybackEvent::RoundChanged, -1));
    EXPECT_EQ(model.current_round(), 0u);
}

TEST(Playback, ClearEmptySlotIsQuiet) {
    PlaybackModel model;
    int events = 0;
    model.on_change([&events](PlaybackEvent, int) { events++; });
    model.clear(0);
    EXPECT_EQ(events, 0);
}

TEST(Playback, BadSlotThrows) {
    PlaybackModel model(1);
    EXPECT_THROW(model.load(1, nullptr), std::out_of_range);
    EXPECT_THROW(model.clear(3), std::out_of_range);
    EXPECT_THROW(model.simulation(1), std::out_of_range);
}
