#include "config_codec.hpp"
#include <format/format_error.hpp>
#include <fmt/format.h>

namespace vizbin {

uint32_t SimConfig::total_gpus() const {
    uint32_t total = 0;
    for (const auto& gt : gpu_types) total += gt.count;
    return total;
}

const JobTypeInfo* SimConfig::find_job_type(uint16_t id) const {
    for (const auto& jt : job_types) {
        if (jt.id == id) return &jt;
    }
    return nullptr;
}

int SimConfig::gpu_type_of_unit(uint32_t unit) const {
    uint32_t start = 0;
    for (size_t t = 0; t < gpu_types.size(); t++) {
        uint32_t end = start + gpu_types[t].count;
        if (unit < end) return static_cast<int>(t);
        start = end;
    }
    return -1;
}

std::string extract_config_text(const ByteBuffer& bytes, uint64_t offset, uint64_t end_offset) {
    if (end_offset < offset || !range_fits(bytes, offset, end_offset - offset)) {
        throw FormatError(FormatErrorKind::TruncatedSection,
                          fmt::format("Config range [{}, {}) outside {}-byte buffer",
                                      offset, end_offset, bytes.size()));
    }

    uint64_t len = end_offset - offset;
    while (len > 0 && bytes[offset + len - 1] == 0) len--;

    return std::string(reinterpret_cast<const char*>(bytes.data() + offset),
                       static_cast<size_t>(len));
}

static GpuTypeInfo parse_gpu_type(const YAML::Node& node) {
    GpuTypeInfo gt;
    gt.name = node["name"].as<std::string>("");
    gt.count = node["count"].as<uint32_t>(0);
    if (node["gpus_per_node"] && !node["gpus_per_node"].IsNull()) {
        gt.gpus_per_node = node["gpus_per_node"].as<uint32_t>();
    }
    return gt;
}

static JobTypeInfo parse_job_type(const YAML::Node& node) {
    JobTypeInfo jt;
    jt.id = node["id"].as<uint16_t>(0);
    jt.name = node["name"].as<std::string>("");
    jt.category = node["category"].as<std::string>("other");
    if (jt.category.empty()) jt.category = "other";
    return jt;
}

SimConfig parse_config_document(const std::string& text) {
    SimConfig config;

    try {
        YAML::Node root = YAML::Load(text);
        if (!root.IsMap()) {
            throw FormatError(FormatErrorKind::InvalidConfig,
                              "Config document is not an object");
        }

        config.policy = root["policy"].as<std::string>("unknown");

        if (root["gpu_types"]) {
            if (!root["gpu_types"].IsSequence()) {
                throw FormatError(FormatErrorKind::InvalidConfig,
                                  "Config 'gpu_types' is not a list");
            }
            for (const auto& n : root["gpu_types"]) {
                config.gpu_types.push_back(parse_gpu_type(n));
            }
        }

        if (root["job_types"]) {
            if (!root["job_types"].IsSequence()) {
                throw FormatError(FormatErrorKind::InvalidConfig,
                                  "Config 'job_types' is not a list");
            }
            for (const auto& n : root["job_types"]) {
                config.job_types.push_back(parse_job_type(n));
            }
        }

        if (root["measurement_window"] && root["measurement_window"].IsMap()) {
            MeasurementWindow w;
            w.start_job = root["measurement_window"]["start_job"].as<uint32_t>(0);
            w.end_job = root["measurement_window"]["end_job"].as<uint32_t>(0);
            config.measurement_window = w;
        }

        config.document = root;
    } catch (const YAML::Exception& e) {
        throw FormatError(FormatErrorKind::InvalidConfig,
                          fmt::format("Failed to parse config document: {}", e.what()));
    }

    return config;
}

SimConfig decode_config(const ByteBuffer& bytes, uint64_t offset, uint64_t end_offset) {
    return parse_config_document(extract_config_text(bytes, offset, end_offset));
}

} // namespace vizbin
