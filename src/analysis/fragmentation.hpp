#pragma once

#include <cstdint>
#include <map>
#include <vector>
#include <format/config_codec.hpp>
#include <format/job_table.hpp>

// FGD-style fragmentation for whole-unit allocations. A free unit counts as
// fragmented ("stranded") on a node whose free units cannot fit a task of the
// size being considered; tasks are weighted by how common their size is.

// A physical node: how many of its units are free.
struct NodeState {
    uint32_t free_gpus = 0;
    uint32_t total_gpus = 0;
};

// Scale factor (units requested) -> share of jobs with that scale factor.
using Workload = std::map<uint32_t, double>;

struct RoundMetrics {
    double fragmentation = 0.0;     // fragmented unit-equivalents
    uint32_t unallocated_gpus = 0;
    double frag_rate = 0.0;         // % of unallocated units that are fragmented
    double frag_total = 0.0;        // % of all units that are fragmented
    uint32_t occupied_nodes = 0;    // nodes with at least one allocated unit
};

// Group the flat allocation array into nodes, type by type. Each type uses its
// gpus_per_node (1 when absent) unless gpus_per_node_override > 0. The last
// node of a type may be smaller than the others.
std::vector<NodeState> build_nodes(const std::vector<uint32_t>& allocations,
                                   const std::vector<vizbin::GpuTypeInfo>& gpu_types,
                                   uint32_t gpus_per_node_override = 0);

// Popularity of each scale factor (a factor of 0 counts as 1). Sums to 1 for a
// non-empty job list; empty for no jobs.
Workload build_workload(const std::vector<vizbin::JobRecord>& jobs);

// Units stranded on `node` by a task needing `gpu_request` units.
double node_fragmentation(const NodeState& node, uint32_t gpu_request);

// Sum over nodes with free units of popularity-weighted node fragmentation.
double cluster_fragmentation(const std::vector<NodeState>& nodes, const Workload& workload);

RoundMetrics compute_round_metrics(const std::vector<uint32_t>& allocations,
                                   const std::vector<vizbin::GpuTypeInfo>& gpu_types,
                                   const Workload& workload,
                                   uint32_t total_gpus,
                                   uint32_t gpus_per_node_override = 0);
