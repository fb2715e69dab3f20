#include "fragmentation.hpp"
#include <core/constants.hpp>
#include <algorithm>

std::vector<NodeState> build_nodes(const std::vector<uint32_t>& allocations,
                                   const std::vector<vizbin::GpuTypeInfo>& gpu_types,
                                   uint32_t gpus_per_node_override) {
    std::vector<NodeState> nodes;
    size_t offset = 0;

    for (const auto& gt : gpu_types) {
        uint32_t per_node = gpus_per_node_override > 0
            ? gpus_per_node_override
            : gt.gpus_per_node.value_or(DEFAULT_GPUS_PER_NODE);
        if (per_node == 0) per_node = DEFAULT_GPUS_PER_NODE;

        uint32_t node_count = (gt.count + per_node - 1) / per_node;
        for (uint32_t n = 0; n < node_count; n++) {
            size_t start = offset + static_cast<size_t>(n) * per_node;
            size_t end = std::min(start + per_node, offset + gt.count);

            NodeState node;
            node.total_gpus = static_cast<uint32_t>(end - start);
            for (size_t g = start; g < end; g++) {
                // Units past the allocation array are treated as free
                if (g >= allocations.size() || allocations[g] == 0) node.free_gpus++;
            }
            nodes.push_back(node);
        }
        offset += gt.count;
    }

    return nodes;
}

Workload build_workload(const std::vector<vizbin::JobRecord>& jobs) {
    Workload popularity;
    if (jobs.empty()) return popularity;

    std::map<uint32_t, size_t> counts;
    for (const auto& job : jobs) {
        uint32_t sf = job.scale_factor > 0 ? job.scale_factor : 1;
        counts[sf]++;
    }

    double total = static_cast<double>(jobs.size());
    for (const auto& [sf, count] : counts) {
        popularity[sf] = static_cast<double>(count) / total;
    }
    return popularity;
}

double node_fragmentation(const NodeState& node, uint32_t gpu_request) {
    if (gpu_request > node.free_gpus) {
        return node.free_gpus;  // nothing of this size fits, every free unit is stranded
    }
    return 0.0;
}

double cluster_fragmentation(const std::vector<NodeState>& nodes, const Workload& workload) {
    double total = 0.0;
    for (const auto& node : nodes) {
        if (node.free_gpus == 0) continue;
        for (const auto& [gpu_request, popularity] : workload) {
            total += popularity * node_fragmentation(node, gpu_request);
        }
    }
    return total;
}

RoundMetrics compute_round_metrics(const std::vector<uint32_t>& allocations,
                                   const std::vector<vizbin::GpuTypeInfo>& gpu_types,
                                   const Workload& workload,
                                   uint32_t total_gpus,
                                   uint32_t gpus_per_node_override) {
    auto nodes = build_nodes(allocations, gpu_types, gpus_per_node_override);

    RoundMetrics m;
    m.fragmentation = cluster_fragmentation(nodes, workload);

    for (const auto& node : nodes) {
        m.unallocated_gpus += node.free_gpus;
        if (node.free_gpus < node.total_gpus) m.occupied_nodes++;
    }

    m.frag_rate = m.unallocated_gpus > 0 ? (m.fragmentation / m.unallocated_gpus) * 100.0 : 0.0;
    m.frag_total = total_gpus > 0 ? (m.fragmentation / total_gpus) * 100.0 : 0.0;
    return m;
}
