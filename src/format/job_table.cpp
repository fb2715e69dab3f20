#include "job_table.hpp"
#include <format/format_error.hpp>
#include <format/layout.hpp>
#include <fmt/format.h>

namespace vizbin {

std::vector<JobRecord> decode_jobs(const ByteBuffer& bytes, uint64_t offset, uint32_t num_jobs) {
    uint64_t table_size = static_cast<uint64_t>(num_jobs) * JOB_RECORD_SIZE;
    if (!range_fits(bytes, offset, table_size)) {
        throw FormatError(FormatErrorKind::TruncatedSection,
                          fmt::format("Job table of {} records at {} exceeds {}-byte buffer",
                                      num_jobs, offset, bytes.size()));
    }

    std::vector<JobRecord> jobs;
    jobs.reserve(num_jobs);

    for (uint32_t i = 0; i < num_jobs; i++) {
        const uint8_t* p = bytes.data() + offset + static_cast<uint64_t>(i) * JOB_RECORD_SIZE;
        JobRecord j;
        j.job_id = load_le<uint32_t>(p);
        j.type_id = load_le<uint16_t>(p + 4);
        j.scale_factor = p[6];
        j.arrival_round = load_le<uint32_t>(p + 8);
        j.completion_round = load_le<uint32_t>(p + 12);
        j.duration = load_f32(p + 16);
        jobs.push_back(j);
    }

    return jobs;
}

JobTable::JobTable(std::vector<JobRecord> jobs) : jobs_(std::move(jobs)) {
    by_id_.reserve(jobs_.size());
    for (size_t i = 0; i < jobs_.size(); i++) {
        // First record wins if the encoder ever repeats an id
        by_id_.emplace(jobs_[i].job_id, i);
    }
}

const JobRecord* JobTable::find(uint32_t job_id) const {
    if (job_id == 0) return nullptr;
    auto it = by_id_.find(job_id);
    return it == by_id_.end() ? nullptr : &jobs_[it->second];
}

} // namespace vizbin
