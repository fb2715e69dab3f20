#include "simulation.hpp"
#include <core/log.hpp>
#include <format/format_error.hpp>
#include <format/layout.hpp>
#include <format/queue_codec.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <stdexcept>

using vizbin::FormatError;
using vizbin::FormatErrorKind;

// Fetch a range and insist the file actually holds all of it.
static ByteBuffer fetch_exact(ByteSource& source, const ByteRange& range, const char* what) {
    if (range.end < range.start) {
        throw FormatError(FormatErrorKind::TruncatedSection,
                          fmt::format("{} range [{}, {}) is inverted", what, range.start, range.end));
    }
    ByteBuffer bytes = source.fetch(range);
    if (bytes.size() != range.size()) {
        throw FormatError(FormatErrorKind::TruncatedSection,
                          fmt::format("{} range [{}, {}) runs past end of {}-byte file",
                                      what, range.start, range.end, source.size()));
    }
    return bytes;
}

Result<std::shared_ptr<Simulation>> Simulation::open(std::shared_ptr<ByteSource> source,
                                                     const SimulationOptions& options) {
    using R = Result<std::shared_ptr<Simulation>>;
    if (!source) return R::Err("No byte source");

    std::string label = options.label.empty() ? source->describe() : options.label;

    try {
        auto cache = std::make_shared<CachedByteSource>(source, options.cache_entries);

        auto header = vizbin::decode_header(cache->fetch(vizbin::header_byte_range()));
        if (header.version > vizbin::FORMAT_VERSION) {
            vizbin_warn(fmt::format("{}: format version {} is newer than {}, reading known fields only",
                                    label, header.version, vizbin::FORMAT_VERSION));
        }

        auto config_bytes = fetch_exact(*cache, vizbin::config_byte_range(header), "Config");
        auto config = vizbin::decode_config(config_bytes, 0, config_bytes.size());

        if (config.gpu_types.size() != header.num_gpu_types) {
            vizbin_warn(fmt::format("{}: header declares {} GPU types, config lists {}",
                                    label, header.num_gpu_types, config.gpu_types.size()));
        }
        if (config.total_gpus() != header.total_gpus) {
            vizbin_warn(fmt::format("{}: header declares {} units, config sums to {}",
                                    label, header.total_gpus, config.total_gpus()));
        }

        auto job_bytes = fetch_exact(*cache, vizbin::job_table_byte_range(header), "Job table");
        vizbin::JobTable jobs(vizbin::decode_jobs(job_bytes, 0, header.num_jobs));

        vizbin::SnapshotDecoder decoder(header, std::move(config));

        std::vector<uint64_t> queue_index;
        if (decoder.has_queue()) {
            auto bytes = fetch_exact(*cache, decoder.queue_index_byte_range(), "Queue index");
            queue_index = decoder.decode_queue_index(bytes, 0, header.num_rounds);
        }

        std::vector<uint64_t> sharing_index;
        if (decoder.has_sharing()) {
            auto bytes = fetch_exact(*cache, decoder.sharing_index_byte_range(), "Sharing index");
            sharing_index = decoder.decode_sharing_index_at(bytes, 0);
        }

        vizbin_log(fmt::format("open {}: v{} rounds={} jobs={} gpu_types={} units={} "
                               "round_size={} queue={} sharing={}",
                               label, header.version, header.num_rounds, header.num_jobs,
                               header.num_gpu_types, header.total_gpus, decoder.round_size(),
                               !queue_index.empty(), !sharing_index.empty()));

        uint32_t window = static_cast<uint32_t>(std::max(1, options.window_rounds));
        uint32_t per_node = static_cast<uint32_t>(std::max(0, options.gpus_per_node));
        std::shared_ptr<Simulation> sim(new Simulation(
            cache, std::move(decoder), std::move(jobs),
            std::move(queue_index), std::move(sharing_index), window, per_node, label));
        return R::Ok(sim);

    } catch (const FormatError& e) {
        vizbin_log(fmt::format("open {} failed ({}): {}", label, vizbin::to_string(e.kind()), e.what()));
        if (e.kind() == FormatErrorKind::InvalidMagic) {
            return R::Err(fmt::format("Not a valid snapshot file: {}", e.what()));
        }
        return R::Err(fmt::format("Failed to load snapshot: {}", e.what()));
    } catch (const std::exception& e) {
        vizbin_log(fmt::format("open {} failed: {}", label, e.what()));
        return R::Err(fmt::format("Failed to load snapshot: {}", e.what()));
    }
}

Result<std::shared_ptr<Simulation>> Simulation::open_file(const std::filesystem::path& path,
                                                          SimulationOptions options) {
    std::shared_ptr<ByteSource> source;
    try {
        source = std::make_shared<FileByteSource>(path);
    } catch (const std::exception& e) {
        return Result<std::shared_ptr<Simulation>>::Err(e.what());
    }
    if (options.label.empty()) options.label = path.filename().string();
    return open(source, options);
}

Simulation::Simulation(std::shared_ptr<CachedByteSource> cache,
                       vizbin::SnapshotDecoder decoder,
                       vizbin::JobTable jobs,
                       std::vector<uint64_t> queue_index,
                       std::vector<uint64_t> sharing_index,
                       uint32_t window_rounds,
                       uint32_t gpus_per_node,
                       std::string label)
    : cache_(std::move(cache)),
      decoder_(std::move(decoder)),
      jobs_(std::move(jobs)),
      queue_index_(std::move(queue_index)),
      sharing_index_(std::move(sharing_index)),
      workload_(build_workload(jobs_.jobs())),
      window_rounds_(window_rounds),
      gpus_per_node_(gpus_per_node),
      label_(std::move(label)) {}

std::vector<vizbin::RoundRecord> Simulation::rounds(uint32_t start, uint32_t count) const {
    uint32_t total = num_rounds();
    if (start >= total || count == 0) return {};
    count = std::min(count, total - start);

    auto bytes = fetch_exact(*cache_, decoder_.round_byte_range(start, count), "Rounds");
    return decoder_.decode_rounds(bytes, 0, count);
}

vizbin::RoundRecord Simulation::round(uint32_t r) const {
    uint32_t total = num_rounds();
    if (r >= total) {
        throw std::out_of_range(fmt::format("Round {} out of range (file has {})", r, total));
    }

    uint32_t window_start = (r / window_rounds_) * window_rounds_;
    uint32_t window_count = std::min(window_rounds_, total - window_start);

    auto bytes = fetch_exact(*cache_, decoder_.round_byte_range(window_start, window_count), "Rounds");
    uint64_t within = static_cast<uint64_t>(r - window_start) * decoder_.round_size();
    return decoder_.decode_rounds(bytes, within, 1).front();
}

std::vector<uint32_t> Simulation::queue_at(uint32_t r) const {
    auto offset = decoder_.queue_entry_offset(queue_index_, r);
    if (!offset) return {};

    try {
        uint64_t start = *offset;
        ByteBuffer prefix = cache_->fetch_range(start, start + vizbin::QUEUE_COUNT_SIZE);
        uint16_t count = prefix.size() >= vizbin::QUEUE_COUNT_SIZE
            ? vizbin::load_le<uint16_t>(prefix.data()) : 0;
        ByteBuffer bytes = count == 0
            ? prefix
            : cache_->fetch_range(start, start + vizbin::queue_entry_size(count));
        return decoder_.decode_queue_entry(bytes, 0);
    } catch (const FormatError& e) {
        vizbin_warn(fmt::format("{}: queue for round {} unreadable: {}", label_, r, e.what()));
        return {};
    }
}

std::optional<vizbin::SharingMap> Simulation::sharing_at(uint32_t r) const {
    auto offset = decoder_.sharing_block_offset(sharing_index_, r);
    if (!offset) return std::nullopt;

    try {
        uint64_t start = *offset;
        ByteBuffer prefix = cache_->fetch_range(start, start + vizbin::SHARING_COUNT_SIZE);
        uint16_t count = prefix.size() >= vizbin::SHARING_COUNT_SIZE
            ? vizbin::load_le<uint16_t>(prefix.data()) : 0;
        ByteBuffer bytes = count == 0
            ? prefix
            : cache_->fetch_range(start, start + vizbin::sharing_block_size(count));
        return decoder_.decode_sharing_entries(bytes, 0);
    } catch (const FormatError& e) {
        vizbin_warn(fmt::format("{}: sharing for round {} unreadable: {}", label_, r, e.what()));
        return std::nullopt;
    }
}

const vizbin::JobTypeInfo* Simulation::find_job_type(uint16_t type_id) const {
    return config().find_job_type(type_id);
}

std::string Simulation::category_of(uint32_t job_id) const {
    return job_category(job_id, jobs_, config());
}

RoundMetrics Simulation::metrics(const vizbin::RoundRecord& rec) const {
    return compute_round_metrics(rec.allocations, config().gpu_types, workload_,
                                 header().total_gpus, gpus_per_node_);
}

std::vector<TypeOccupancy> Simulation::occupancy_at(uint32_t r) const {
    auto rec = round(r);
    auto sharing = sharing_at(r);
    return compute_type_occupancy(rec, config(), jobs_, sharing ? &*sharing : nullptr);
}
