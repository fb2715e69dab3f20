#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

namespace fs = std::filesystem;

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return platform::home_dir() / CONFIG_DIR_NAME;
}

fs::path get_global_config_path() {
    return get_global_config_dir() / CONFIG_FILE_NAME;
}

Result<void> write_default_config(const fs::path& config_path) {
    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    // Default config content
    const char* default_config = R"(# vizbin configuration

# Byte ranges kept in memory per open snapshot (0 disables caching)
cache:
  max_entries: 100

# Rounds fetched per window while stepping through a simulation
playback:
  window_rounds: 32

# Physical grouping used for fragmentation metrics.
# 0 = use gpus_per_node from the file (1 for files that lack it)
fragmentation:
  gpus_per_node: 0

# Optional: debug log location (default: system temp dir)
# log:
#   path: "/tmp/vizbin_debug.log"
)";

    try {
        if (config_path.has_parent_path()) {
            fs::create_directories(config_path.parent_path());
        }
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

Result<void> create_default_global_config() {
    return write_default_config(get_global_config_path());
}

static CacheSettings parse_cache_config(const YAML::Node& node) {
    CacheSettings cache;
    cache.max_entries = node["max_entries"].as<int>(DEFAULT_CACHE_MAX_ENTRIES);
    return cache;
}

static PlaybackSettings parse_playback_config(const YAML::Node& node) {
    PlaybackSettings playback;
    playback.window_rounds = node["window_rounds"].as<int>(DEFAULT_WINDOW_ROUNDS);
    return playback;
}

static FragmentationSettings parse_fragmentation_config(const YAML::Node& node) {
    FragmentationSettings frag;
    frag.gpus_per_node = node["gpus_per_node"].as<int>(0);
    return frag;
}

static LogSettings parse_log_config(const YAML::Node& node) {
    LogSettings log;
    log.path = node["path"].as<std::string>("");
    return log;
}

class ConfigBuilder {
public:
    static Result<Config> build(const YAML::Node& root, const fs::path& source);
};

Result<Config> ConfigBuilder::build(const YAML::Node& root, const fs::path& source) {
    Config config;
    config.source_path_ = source;
    if (root.IsNull()) {
        return Result<Config>::Ok(config);
    }
    if (!root.IsMap()) {
        return Result<Config>::Err("config root must be a mapping");
    }

    CacheSettings cache;
    PlaybackSettings playback;
    FragmentationSettings frag;
    LogSettings log;

    if (root["cache"] && root["cache"].IsMap()) cache = parse_cache_config(root["cache"]);
    if (root["playback"] && root["playback"].IsMap()) playback = parse_playback_config(root["playback"]);
    if (root["fragmentation"] && root["fragmentation"].IsMap()) frag = parse_fragmentation_config(root["fragmentation"]);
    if (root["log"] && root["log"].IsMap()) log = parse_log_config(root["log"]);

    if (cache.max_entries < 0) {
        return Result<Config>::Err(fmt::format("cache.max_entries must be >= 0 (got {})",
                                               cache.max_entries));
    }
    if (playback.window_rounds < 1) {
        return Result<Config>::Err(fmt::format("playback.window_rounds must be >= 1 (got {})",
                                               playback.window_rounds));
    }
    if (frag.gpus_per_node < 0) {
        return Result<Config>::Err(fmt::format("fragmentation.gpus_per_node must be >= 0 (got {})",
                                               frag.gpus_per_node));
    }

    config.cache_ = cache;
    config.playback_ = playback;
    config.fragmentation_ = frag;
    config.log_ = log;
    return Result<Config>::Ok(config);
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        return ConfigBuilder::build(root, fs::path());
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err("Failed to parse config: " + std::string(e.what()));
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Ok(Config{});
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        auto result = ConfigBuilder::build(root, path);
        if (result.is_err()) {
            return Result<Config>::Err(path.string() + ": " + result.error);
        }
        return result;
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err("Failed to parse " + path.string() + ": " + std::string(e.what()));
    }
}

Result<Config> Config::load_global() {
    return load_file(get_global_config_path());
}
