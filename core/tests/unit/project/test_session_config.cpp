// tests/unit/project/test_session_config.cpp - Unit tests for gstat.yaml loading
//

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "gradual/project/session_config.hpp"

using namespace gradual;
namespace fs = std::filesystem;

// ============================================================================
// Parsing
// ============================================================================

TEST(SessionConfigTest, EmptyDocumentKeepsDefaults)
{
  const auto result = parse_session_config("");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.cache.capacity, MemoCache::k_default_capacity);
  EXPECT_EQ(result.config.output.format, OutputFormat::Diagnostics);
  EXPECT_EQ(result.config.output.color, ColorMode::Auto);
  EXPECT_TRUE(result.config.statics.builtins);
  EXPECT_TRUE(result.config.statics.warn_unused);
  EXPECT_TRUE(result.config.config_root.empty());
}

TEST(SessionConfigTest, ParsesAllSections)
{
  const auto result = parse_session_config(R"(
cache:
  capacity: 8
output:
  format: json
  color: never
statics:
  builtins: false
  warn_unused: false
)");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.cache.capacity, 8u);
  EXPECT_EQ(result.config.output.format, OutputFormat::Json);
  EXPECT_EQ(result.config.output.color, ColorMode::Never);
  EXPECT_FALSE(result.config.statics.builtins);
  EXPECT_FALSE(result.config.statics.warn_unused);

  const SessionOptions options = session_options(result.config);
  EXPECT_EQ(options.cache_capacity, 8u);
  EXPECT_FALSE(options.builtins);
  EXPECT_FALSE(collect_options(result.config).warn_unused);
}

TEST(SessionConfigTest, RejectsInvalidValues)
{
  const auto zero = parse_session_config("cache:\n  capacity: 0\n");
  EXPECT_FALSE(zero.success);
  EXPECT_EQ(zero.error, "cache.capacity must be greater than 0");

  const auto format = parse_session_config("output:\n  format: xml\n");
  EXPECT_FALSE(format.success);
  EXPECT_NE(format.error.find("invalid output.format: 'xml'"), std::string::npos);

  const auto color = parse_session_config("output:\n  color: sometimes\n");
  EXPECT_FALSE(color.success);

  const auto wrong_type = parse_session_config("statics:\n  builtins: maybe\n");
  EXPECT_FALSE(wrong_type.success);
  EXPECT_EQ(wrong_type.error.rfind("invalid configuration value: ", 0), 0u);

  const auto not_a_map = parse_session_config("- a\n- b\n");
  EXPECT_FALSE(not_a_map.success);
  EXPECT_EQ(not_a_map.error, "configuration must be a map");
}

TEST(SessionConfigTest, RejectsBrokenYaml)
{
  const auto result = parse_session_config("cache: [1, 2");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.rfind("failed to parse YAML: ", 0), 0u);
}

// ============================================================================
// Files
// ============================================================================

class SessionConfigFileTest : public ::testing::Test
{
protected:
  fs::path root;

  void SetUp() override
  {
    root = fs::temp_directory_path() / "gradual_session_config_test";
    fs::remove_all(root);
    fs::create_directories(root / "a" / "b");
  }

  void TearDown() override { fs::remove_all(root); }

  void write(const fs::path & path, const std::string & text)
  {
    std::ofstream out(path);
    out << text;
  }
};

TEST_F(SessionConfigFileTest, LoadSetsConfigRoot)
{
  write(root / "gstat.yaml", "cache:\n  capacity: 3\n");
  const auto result = load_session_config(root / "gstat.yaml");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.cache.capacity, 3u);
  EXPECT_EQ(result.config.config_root, fs::absolute(root));
}

TEST_F(SessionConfigFileTest, MissingFile)
{
  const auto result = load_session_config(root / "nope.yaml");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.rfind("configuration file not found: ", 0), 0u);
}

TEST_F(SessionConfigFileTest, FindSearchesUpward)
{
  write(root / "gstat.yaml", "");
  const auto from_dir = find_session_config(root / "a" / "b");
  ASSERT_TRUE(from_dir.has_value());
  EXPECT_EQ(*from_dir, fs::absolute(root) / "gstat.yaml");

  write(root / "a" / "term.json", "{}");
  const auto from_file = find_session_config(root / "a" / "term.json");
  ASSERT_TRUE(from_file.has_value());
  EXPECT_EQ(*from_file, fs::absolute(root) / "gstat.yaml");
}

TEST_F(SessionConfigFileTest, NearestFileWins)
{
  write(root / "gstat.yaml", "");
  write(root / "a" / "gstat.yaml", "");
  const auto found = find_session_config(root / "a" / "b");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, fs::absolute(root) / "a" / "gstat.yaml");
}
