#pragma once

#include <cstdint>
#include <vector>
#include <unordered_map>
#include <format/byte_order.hpp>

namespace vizbin {

// Fixed 24-byte job record. Job id 0 never appears: it is the idle sentinel
// in allocation arrays.
struct JobRecord {
    uint32_t job_id = 0;
    uint16_t type_id = 0;
    uint8_t scale_factor = 0;           // resource units the job needs at once
    uint32_t arrival_round = 0;
    uint32_t completion_round = 0;      // 0 = not completed
    float duration = 0.0f;              // seconds, 0 if not completed

    bool completed() const { return completion_round != 0; }
};

// Decode num_jobs consecutive records starting at offset.
// Throws FormatError(TruncatedSection) if the table does not fit in bytes.
std::vector<JobRecord> decode_jobs(const ByteBuffer& bytes, uint64_t offset, uint32_t num_jobs);

// Jobs in file order plus an id index for O(1) lookup.
class JobTable {
public:
    JobTable() = default;
    explicit JobTable(std::vector<JobRecord> jobs);

    // nullptr if no job has this id (always for id 0).
    const JobRecord* find(uint32_t job_id) const;

    const std::vector<JobRecord>& jobs() const { return jobs_; }
    size_t size() const { return jobs_.size(); }
    bool empty() const { return jobs_.empty(); }

private:
    std::vector<JobRecord> jobs_;
    std::unordered_map<uint32_t, size_t> by_id_;
};

} // namespace vizbin
