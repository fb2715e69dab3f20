#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Configuration structures
struct CacheSettings {
    int max_entries = 100;              // cached byte ranges kept per file
};

struct PlaybackSettings {
    int window_rounds = 32;             // rounds fetched per window while scrubbing
};

struct FragmentationSettings {
    int gpus_per_node = 0;              // 0 = use the file's gpus_per_node (or 1)
};

struct LogSettings {
    std::string path;                   // empty = <tmp>/vizbin_debug.log
};
