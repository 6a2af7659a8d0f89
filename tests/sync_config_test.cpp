// =============================================================================
// sync_config_test.cpp
// =============================================================================
// Unit tests for SyncConfig loading.
//
// Validates:
//   - Defaults when the file is empty
//   - Nested venue / ipc keys
//   - Environment overrides through an injected lookup table
//   - ConfigError for wrong types, bad values, bad files
// =============================================================================

#include "pnlsync/config/sync_config.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <map>
#include <string>

using nlohmann::json;
using pnlsync::ConfigError;

namespace {

pnlsync::EnvLookup tableLookup(std::map<std::string, std::string> table) {
  return [table](const std::string& name) -> std::optional<std::string> {
    auto it = table.find(name);
    if (it == table.end()) {
      return std::nullopt;
    }
    return it->second;
  };
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. An empty object yields the production defaults.
// -----------------------------------------------------------------------------
TEST(SyncConfigTest, EmptyObjectGivesDefaults) {
  const auto config = pnlsync::parseSyncConfig(json::object());
  EXPECT_TRUE(config.account.empty());
  EXPECT_EQ(config.base_currency, "USD");
  EXPECT_FALSE(config.readonly);
  EXPECT_EQ(config.venue.mode, "zmq");
  EXPECT_EQ(config.order_queue_max, 50u);
  EXPECT_EQ(config.order_timeout_sec, 8);
  EXPECT_EQ(config.reconnect_min_sec, 3);
  EXPECT_EQ(config.reconnect_max_sec, 60);
  EXPECT_EQ(config.keepalive_sec, 15);
  EXPECT_EQ(config.cache_flush_sec, 30);
  EXPECT_TRUE(config.store_path.empty());
  EXPECT_FALSE(config.ipc.command_endpoint.empty());
}

// -----------------------------------------------------------------------------
// 2. Keys present in the file override the defaults, others keep them.
// -----------------------------------------------------------------------------
TEST(SyncConfigTest, ParsesNestedSections) {
  const json j = {{"account", "U123"},
                  {"base_currency", "EUR"},
                  {"readonly", true},
                  {"venue", {{"mode", "simulated"}, {"request_timeout_ms", 250}}},
                  {"order_queue_max", 5},
                  {"reconnect_max_sec", 10},
                  {"store_path", "/var/lib/pnlsync/ledger.json"},
                  {"ipc", {{"command_endpoint", ""}, {"pub_endpoint", ""}}}};

  const auto config = pnlsync::parseSyncConfig(j);
  EXPECT_EQ(config.account, "U123");
  EXPECT_EQ(config.base_currency, "EUR");
  EXPECT_TRUE(config.readonly);
  EXPECT_EQ(config.venue.mode, "simulated");
  EXPECT_EQ(config.venue.request_timeout_ms, 250);
  EXPECT_EQ(config.order_queue_max, 5u);
  EXPECT_EQ(config.reconnect_min_sec, 3);
  EXPECT_EQ(config.reconnect_max_sec, 10);
  EXPECT_EQ(config.store_path, "/var/lib/pnlsync/ledger.json");
  EXPECT_TRUE(config.ipc.command_endpoint.empty());
}

// -----------------------------------------------------------------------------
// 3. Values that parse but make no sense are refused.
// Why: A zero queue or an inverted backoff range would only show up once
//      the service is running.
// -----------------------------------------------------------------------------
TEST(SyncConfigTest, RejectsInvalidValues) {
  EXPECT_THROW(pnlsync::parseSyncConfig(json::array()), ConfigError);
  EXPECT_THROW(pnlsync::parseSyncConfig({{"order_queue_max", "many"}}), ConfigError);
  EXPECT_THROW(pnlsync::parseSyncConfig({{"order_queue_max", 0}}), ConfigError);
  EXPECT_THROW(pnlsync::parseSyncConfig({{"base_currency", ""}}), ConfigError);
  EXPECT_THROW(pnlsync::parseSyncConfig({{"venue", {{"mode", "fix"}}}}), ConfigError);
  EXPECT_THROW(pnlsync::parseSyncConfig({{"reconnect_min_sec", 30},
                                         {"reconnect_max_sec", 10}}),
               ConfigError);
  EXPECT_THROW(pnlsync::parseSyncConfig({{"tick_ms", 0}}), ConfigError);
  EXPECT_THROW(pnlsync::parseSyncConfig({{"ipc", {{"pub_endpoint", ""}}}}),
               ConfigError);
}

// -----------------------------------------------------------------------------
// 4. Environment overrides win over the file and are revalidated.
// -----------------------------------------------------------------------------
TEST(SyncConfigTest, EnvOverrides) {
  auto config = pnlsync::parseSyncConfig({{"account", "U123"}});

  pnlsync::applyEnvOverrides(
      config, tableLookup({{"PNLSYNC_ACCOUNT", "U999"},
                           {"PNLSYNC_READONLY", "Yes"},
                           {"PNLSYNC_VENUE_MODE", "simulated"},
                           {"PNLSYNC_STORE_PATH", "/tmp/ledger.json"}}));
  EXPECT_EQ(config.account, "U999");
  EXPECT_TRUE(config.readonly);
  EXPECT_EQ(config.venue.mode, "simulated");
  EXPECT_EQ(config.store_path, "/tmp/ledger.json");
  EXPECT_EQ(config.base_currency, "USD");

  pnlsync::applyEnvOverrides(config, tableLookup({{"PNLSYNC_READONLY", "0"}}));
  EXPECT_FALSE(config.readonly);

  EXPECT_THROW(pnlsync::applyEnvOverrides(
                   config, tableLookup({{"PNLSYNC_VENUE_MODE", "paper"}})),
               ConfigError);
}

// -----------------------------------------------------------------------------
// 5. Loading from disk: good file, missing file, malformed file.
// -----------------------------------------------------------------------------
class SyncConfigFileTest : public ::testing::Test {
 protected:
  std::string path;

  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    path = (std::filesystem::temp_directory_path() /
            (std::string("pnlsync-config-") + info->name() + ".json"))
               .string();
    std::filesystem::remove(path);
  }

  void TearDown() override { std::filesystem::remove(path); }

  void write(const std::string& text) {
    std::ofstream out(path);
    out << text;
  }
};

TEST_F(SyncConfigFileTest, LoadsFile) {
  write(R"({"account": "U123", "tick_ms": 250})");
  const auto config = pnlsync::loadSyncConfig(path);
  EXPECT_EQ(config.account, "U123");
  EXPECT_EQ(config.tick_ms, 250);
}

TEST_F(SyncConfigFileTest, MissingFileThrows) {
  EXPECT_THROW(pnlsync::loadSyncConfig(path), ConfigError);
}

TEST_F(SyncConfigFileTest, MalformedFileThrows) {
  write(R"({"account": )");
  EXPECT_THROW(pnlsync::loadSyncConfig(path), ConfigError);
}
