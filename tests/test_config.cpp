#include <gtest/gtest.h>
#include <core/config.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

TEST(Config, Defaults) {
    auto result = Config::parse("");
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value.cache().max_entries, 100);
    EXPECT_EQ(result.value.playback().window_rounds, 32);
    EXPECT_EQ(result.value.fragmentation().gpus_per_node, 0);
    EXPECT_TRUE(result.value.log().path.empty());
}

TEST(Config, ParsesAllSections) {
    auto result = Config::parse(R"(
cache:
  max_entries: 8
playback:
  window_rounds: 64
fragmentation:
  gpus_per_node: 4
log:
  path: /var/tmp/vizbin.log
)");
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value.cache().max_entries, 8);
    EXPECT_EQ(result.value.playback().window_rounds, 64);
    EXPECT_EQ(result.value.fragmentation().gpus_per_node, 4);
    EXPECT_EQ(result.value.log().path, "/var/tmp/vizbin.log");
}

TEST(Config, PartialSectionKeepsDefaults) {
    auto result = Config::parse("playback:\n  window_rounds: 4\n");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value.playback().window_rounds, 4);
    EXPECT_EQ(result.value.cache().max_entries, 100);
}

TEST(Config, RejectsInvalidValues) {
    EXPECT_TRUE(Config::parse("cache:\n  max_entries: -1\n").is_err());
    EXPECT_TRUE(Config::parse("playback:\n  window_rounds: 0\n").is_err());
    EXPECT_TRUE(Config::parse("fragmentation:\n  gpus_per_node: -2\n").is_err());
}

TEST(Config, RejectsMalformedYaml) {
    EXPECT_TRUE(Config::parse("cache: [unclosed").is_err());
    EXPECT_TRUE(Config::parse("- just\n- a list\n").is_err());
}

TEST(Config, MissingFileGivesDefaults) {
    auto result = Config::load_file("/nonexistent/vizbin/config.yaml");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value.cache().max_entries, 100);
}

TEST(Config, DefaultFileRoundTrips) {
    fs::path dir = fs::temp_directory_path() / "vizbin_test_config";
    fs::remove_all(dir);
    fs::path path = dir / "config.yaml";

    ASSERT_TRUE(write_default_config(path).is_ok());
    ASSERT_TRUE(fs::exists(path));

    auto result = Config::load_file(path);
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value.cache().max_entries, 100);
    EXPECT_EQ(result.value.playback().window_rounds, 32);
    EXPECT_EQ(result.value.source_path().string(), path.string());

    // Existing files are left alone
    {
        std::ofstream out(path);
        out << "cache:\n  max_entries: 7\n";
    }
    ASSERT_TRUE(write_default_config(path).is_ok());
    EXPECT_EQ(Config::load_file(path).value.cache().max_entries, 7);

    fs::remove_all(dir);
}
