// Keel-Prod headers
#include "core/ConfigLoader.hpp"
#include "core/DeployErrors.hpp"
#include "core/DeploySettings.hpp"
#include "core/EnvFile.hpp"

// 3rd-party headers
#include <nlohmann/json.hpp>

// GTest headers
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace keel::test {

  using namespace std::chrono_literals;
  using keel::core::ConfigError;
  using keel::core::ConfigLoader;
  using keel::core::DeploySettings;
  using keel::core::EnvFile;
  using nlohmann::json;
  namespace fs = std::filesystem;

  TEST(EnvFile, parsesKeyValueLines) {
    auto cfg = EnvFile::parse("# database\n"
                              "DB_HOST=db.internal\n"
                              "export AWS_REGION = us-east-1\n"
                              "\n"
                              "DB_PASSWORD=\"p@ss word\"\n"
                              "OPENAI_API_KEY='sk-proj-1'\n"
                              "DB_USER=svc # service account\n"
                              "not a pair\n");

    EXPECT_EQ(cfg.get("DB_HOST"), "db.internal");
    EXPECT_EQ(cfg.get("AWS_REGION"), "us-east-1");
    EXPECT_EQ(cfg.get("DB_PASSWORD"), "p@ss word");
    EXPECT_EQ(cfg.get("OPENAI_API_KEY"), "sk-proj-1");
    EXPECT_EQ(cfg.get("DB_USER"), "svc");
    EXPECT_EQ(cfg.size(), 5u);
  }

  TEST(EnvFile, emptyValueIsPresentButEmpty) {
    auto cfg = EnvFile::parse("AWS_REGION=\n");

    EXPECT_TRUE(cfg.contains("AWS_REGION"));
    EXPECT_EQ(cfg.get("AWS_REGION"), "");
    EXPECT_FALSE(cfg.get("DB_HOST").has_value());
  }

  TEST(EnvFile, laterDuplicateWins) {
    auto cfg = EnvFile::parse("DB_NAME=first\nDB_NAME=second\n");

    EXPECT_EQ(cfg.get("DB_NAME"), "second");
  }

  TEST(EnvFile, missingFileThrows) {
    EnvFile f("/nonexistent/keel/.env");

    EXPECT_THROW(f.load(), std::runtime_error);
  }

  TEST(DeploySettings, defaultsDescribeTheStack) {
    auto s = DeploySettings::defaults();

    EXPECT_EQ(s.stackName, "lendingwise");
    EXPECT_EQ(s.requiredKeys.size(), 8u);
    EXPECT_EQ(s.directories.size(), 6u);
    EXPECT_EQ(s.health.settleWindow, 30s);
    EXPECT_EQ(s.health.pollInterval, 2s);
    EXPECT_EQ(s.health.maxWait, 90s);
    EXPECT_EQ(s.envFilePath(), "./.env");
  }

  TEST(DeploySettings, jsonOverridesOnlyNamedFields) {
    auto s = DeploySettings::defaults();

    s.applyJson(json{ { "stack_name", "staging" },
                      { "required_keys", json::array({ "DB_HOST",
                                                       { { "name", "TOKEN" },
                                                         { "placeholder", "changeme" } } }) },
                      { "health", { { "url", "http://localhost:9000/ping" },
                                    { "max_wait_s", 120 },
                                    { "poll_interval_s", 0.5 } } } });

    EXPECT_EQ(s.stackName, "staging");
    ASSERT_EQ(s.requiredKeys.size(), 2u);
    EXPECT_EQ(s.requiredKeys[1].placeholder, "changeme");
    EXPECT_EQ(s.health.url, "http://localhost:9000/ping");
    EXPECT_EQ(s.health.maxWait, 120s);
    EXPECT_EQ(s.health.pollInterval, 500ms);
    EXPECT_EQ(s.health.settleWindow, 30s);
    EXPECT_EQ(s.directories.size(), 6u);
  }

  TEST(DeploySettings, wrongTypesAreConfigErrors) {
    auto s = DeploySettings::defaults();

    EXPECT_THROW(s.applyJson(json{ { "directories", "outputs" } }), ConfigError);
    EXPECT_THROW(s.applyJson(json{ { "health", { { "max_wait_s", -1 } } } }), ConfigError);
    EXPECT_THROW(s.applyJson(json{ { "required_keys", json::array({ 42 }) } }), ConfigError);
    EXPECT_THROW(s.applyJson(json{ { "stack_name", "" } }), ConfigError);
    EXPECT_THROW(s.applyJson(json::array()), ConfigError);
  }

  TEST(DeploySettings, durationsAboveCapAreConfigErrors) {
    auto s = DeploySettings::defaults();

    EXPECT_THROW(s.applyJson(json{ { "health", { { "max_wait_s", 1e10 } } } }), ConfigError);
    EXPECT_THROW(s.applyJson(json{ { "health", { { "settle_window_s", 86401 } } } }), ConfigError);
    EXPECT_THROW(s.applyJson(json{ { "command_timeout_s", 1e300 } }), ConfigError);
    EXPECT_EQ(s.health.maxWait, 90s);
  }

  TEST(DeploySettings, durationAtCapIsAccepted) {
    auto s = DeploySettings::defaults();

    s.applyJson(json{ { "health", { { "max_wait_s", 86400 } } } });

    EXPECT_EQ(s.health.maxWait, core::kMaxDuration);
  }

  TEST(DeploySettings, zeroPollIntervalIsConfigError) {
    auto s = DeploySettings::defaults();

    EXPECT_THROW(s.applyJson(json{ { "health", { { "poll_interval_s", 0 } } } }), ConfigError);
  }

  class ConfigLoaderTest : public ::testing::Test {
  protected:
    void SetUp() override {
      path = fs::temp_directory_path() / ("keel-settings-" + std::to_string(::getpid()) + ".json");
    }
    void TearDown() override {
      std::error_code ec;
      fs::remove(path, ec);
    }

    void write(const std::string& text) { std::ofstream(path) << text; }

    fs::path path;
  };

  TEST_F(ConfigLoaderTest, loadsSettingsWithComments) {
    write("{\n  // local override\n  \"project_dir\": \"/srv/lw\",\n  \"log_tail_lines\": 80\n}\n");

    auto s = ConfigLoader(path.string()).loadSettings();

    EXPECT_EQ(s.projectDir, "/srv/lw");
    EXPECT_EQ(s.logTailLines, 80u);
    EXPECT_EQ(s.envFilePath(), "/srv/lw/.env");
  }

  TEST_F(ConfigLoaderTest, malformedJsonIsConfigError) {
    write("{ \"stack_name\": ");

    EXPECT_THROW(ConfigLoader(path.string()).load(), ConfigError);
  }

  TEST_F(ConfigLoaderTest, missingFileIsConfigError) {
    EXPECT_THROW(ConfigLoader((path / "absent").string()).load(), ConfigError);
  }

} // namespace keel::test
