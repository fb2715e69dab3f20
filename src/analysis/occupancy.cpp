#include "occupancy.hpp"

std::string job_category(uint32_t job_id,
                         const vizbin::JobTable& jobs,
                         const vizbin::SimConfig& config) {
    const auto* job = jobs.find(job_id);
    if (!job) return "other";
    const auto* jt = config.find_job_type(job->type_id);
    return jt ? jt->category : "other";
}

std::vector<TypeOccupancy> compute_type_occupancy(const vizbin::RoundRecord& round,
                                                  const vizbin::SimConfig& config,
                                                  const vizbin::JobTable& jobs,
                                                  const vizbin::SharingMap* sharing) {
    constexpr double QUARTER = 1.0 / vizbin::SHARING_SLOTS;

    std::vector<TypeOccupancy> out;
    out.reserve(config.gpu_types.size());
    bool has_alloc_data = !jobs.empty();
    size_t offset = 0;

    for (size_t t = 0; t < config.gpu_types.size(); t++) {
        const auto& gt = config.gpu_types[t];
        TypeOccupancy occ;
        occ.gpu_type = gt.name;
        occ.count = gt.count;

        if (has_alloc_data) {
            for (uint32_t g = 0; g < gt.count; g++) {
                size_t unit = offset + g;

                const vizbin::SlotArray* slots = nullptr;
                if (sharing && unit <= UINT16_MAX) {
                    auto it = sharing->find(static_cast<uint16_t>(unit));
                    if (it != sharing->end()) slots = &it->second;
                }

                if (slots) {
                    for (uint32_t id : *slots) {
                        if (id == 0) continue;
                        occ.used += QUARTER;
                        occ.by_category[job_category(id, jobs, config)] += QUARTER;
                    }
                } else {
                    if (unit >= round.allocations.size()) continue;
                    uint32_t id = round.allocations[unit];
                    if (id == 0) continue;
                    occ.used += 1.0;
                    occ.by_category[job_category(id, jobs, config)] += 1.0;
                }
            }
        } else {
            double used = t < round.gpu_used.size() ? round.gpu_used[t] : 0;
            occ.used = used;
            if (used > 0) occ.by_category["active"] = used;
        }

        offset += gt.count;
        out.push_back(occ);
    }

    return out;
}
