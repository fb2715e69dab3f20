#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <yaml-cpp/yaml.h>
#include <format/byte_order.hpp>

namespace vizbin {

// One resource type of the simulated cluster. Units of all types share one
// flat index space, in the order the types are listed.
struct GpuTypeInfo {
    std::string name;                       // "v100"
    uint32_t count = 0;                     // resource units of this type
    std::optional<uint32_t> gpus_per_node;  // physical grouping, absent in older files
};

struct JobTypeInfo {
    uint16_t id = 0;
    std::string name;                       // "ResNet-18 (batch size 64)"
    std::string category;                   // "resnet", "other" if the file has none
};

struct MeasurementWindow {
    uint32_t start_job = 0;
    uint32_t end_job = 0;
};

// The embedded configuration document. Read-only for the session.
struct SimConfig {
    std::string policy;                     // scheduler name, "unknown" if absent
    std::vector<GpuTypeInfo> gpu_types;
    std::vector<JobTypeInfo> job_types;
    std::optional<MeasurementWindow> measurement_window;
    YAML::Node document;                    // whole parsed document, for keys not modelled above

    // Sum of unit counts over all GPU types.
    uint32_t total_gpus() const;

    const JobTypeInfo* find_job_type(uint16_t id) const;

    // Index into gpu_types of the type owning flat unit index `unit`, or -1.
    int gpu_type_of_unit(uint32_t unit) const;
};

// Bytes in [offset, end_offset) with trailing NUL padding removed.
// Throws FormatError(TruncatedSection) if the range is inverted or not inside bytes.
std::string extract_config_text(const ByteBuffer& bytes, uint64_t offset, uint64_t end_offset);

// Parse a config document. Throws FormatError(InvalidConfig) when the text is
// not a mapping or a known key has the wrong shape.
SimConfig parse_config_document(const std::string& text);

// extract_config_text + parse_config_document.
SimConfig decode_config(const ByteBuffer& bytes, uint64_t offset, uint64_t end_offset);

} // namespace vizbin
