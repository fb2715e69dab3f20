#include <gtest/gtest.h>
#include <analysis/fragmentation.hpp>
#include <format/config_codec.hpp>
#include "snapshot_builder.hpp"

using testing_support::make_job;

static std::vector<vizbin::GpuTypeInfo> three_types() {
    return vizbin::parse_config_document(testing_support::three_type_config_json()).gpu_types;
}

TEST(Fragmentation, NodesFollowGpusPerNode) {
    std::vector<uint32_t> allocs(12, 0);
    allocs[0] = 1;
    allocs[1] = 1;
    allocs[2] = 5;
    auto nodes = build_nodes(allocs, three_types());
    ASSERT_EQ(nodes.size(), 6u);
    EXPECT_EQ(nodes[0].free_gpus, 0u);
    EXPECT_EQ(nodes[1].free_gpus, 1u);
    EXPECT_EQ(nodes[5].free_gpus, 2u);
    EXPECT_EQ(nodes[5].total_gpus, 2u);
}

TEST(Fragmentation, MissingGpusPerNodeMeansOne) {
    std::vector<vizbin::GpuTypeInfo> types(1);
    types[0].name = "a100";
    types[0].count = 3;
    auto nodes = build_nodes({0, 7, 0}, types);
    ASSERT_EQ(nodes.size(), 3u);
    EXPECT_EQ(nodes[1].free_gpus, 0u);
}

TEST(Fragmentation, OverrideAndShortLastNode) {
    std::vector<uint32_t> allocs(12, 0);
    auto nodes = build_nodes(allocs, three_types(), 3);
    ASSERT_EQ(nodes.size(), 6u);
    EXPECT_EQ(nodes[0].total_gpus, 3u);
    EXPECT_EQ(nodes[1].total_gpus, 1u);
}

TEST(Fragmentation, ShortAllocationArrayCountsAsFree) {
    auto nodes = build_nodes({1}, three_types());
    EXPECT_EQ(nodes[0].free_gpus, 1u);
    EXPECT_EQ(nodes[1].free_gpus, 2u);
}

TEST(Fragmentation, WorkloadPopularity) {
    auto w = build_workload({make_job(1, 0, 2), make_job(2, 0, 1), make_job(3, 0, 0)});
    ASSERT_EQ(w.size(), 2u);
    EXPECT_NEAR(w[1], 2.0 / 3.0, 1e-9);
    EXPECT_NEAR(w[2], 1.0 / 3.0, 1e-9);
    EXPECT_TRUE(build_workload({}).empty());
}

TEST(Fragmentation, NodeFragmentation) {
    NodeState node{3, 4};
    EXPECT_DOUBLE_EQ(node_fragmentation(node, 4), 3.0);
    EXPECT_DOUBLE_EQ(node_fragmentation(node, 3), 0.0);
    EXPECT_DOUBLE_EQ(node_fragmentation(node, 1), 0.0);
}

TEST(Fragmentation, RoundMetrics) {
    std::vector<uint32_t> allocs(12, 0);
    allocs[0] = 1;
    allocs[1] = 1;
    allocs[2] = 5;
    Workload w = {{1, 2.0 / 3.0}, {2, 1.0 / 3.0}};

    auto m = compute_round_metrics(allocs, three_types(), w, 12);
    // Only node 1 (one free unit) strands anything, and only for 2-unit tasks
    EXPECT_NEAR(m.fragmentation, 1.0 / 3.0, 1e-9);
    EXPECT_EQ(m.unallocated_gpus, 9u);
    EXPECT_NEAR(m.frag_rate, (1.0 / 3.0) / 9.0 * 100.0, 1e-9);
    EXPECT_NEAR(m.frag_total, (1.0 / 3.0) / 12.0 * 100.0, 1e-9);
    EXPECT_EQ(m.occupied_nodes, 2u);
}

TEST(Fragmentation, FullClusterHasNoFragmentation) {
    std::vector<uint32_t> allocs(12, 9);
    Workload w = {{4, 1.0}};
    auto m = compute_round_metrics(allocs, three_types(), w, 12);
    EXPECT_DOUBLE_EQ(m.fragmentation, 0.0);
    EXPECT_EQ(m.unallocated_gpus, 0u);
    EXPECT_DOUBLE_EQ(m.frag_rate, 0.0);
    EXPECT_EQ(m.occupied_nodes, 6u);
}
