#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load global config from ~/.vizbin/config.yaml (defaults if absent)
    static Result<Config> load_global();

    // Load from an explicit path (defaults if absent)
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const CacheSettings& cache() const { return cache_; }
    const PlaybackSettings& playback() const { return playback_; }
    const FragmentationSettings& fragmentation() const { return fragmentation_; }
    const LogSettings& log() const { return log_; }
    const fs::path& source_path() const { return source_path_; }

public:
    Config() = default;

private:
    CacheSettings cache_;
    PlaybackSettings playback_;
    FragmentationSettings fragmentation_;
    LogSettings log_;
    fs::path source_path_;      // empty when built from defaults or text

    friend class ConfigBuilder;
};

// Helper to check if the global config exists
bool global_config_exists();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Write the commented default config to path (no-op if it already exists)
Result<void> write_default_config(const fs::path& path);

// Create default global config
Result<void> create_default_global_config();
