// =============================================================================
// json_state_store_test.cpp
// =============================================================================
// Unit tests for riskguard::JsonStateStore.
//
// Validates:
//   - Tables written by transact() survive a reopen of the directory
//   - A mutator that throws leaves the table untouched
//   - A commit leaves no temp file, and a failed one keeps the old document
//   - The append-only logs keep every record in order
//   - A corrupt state document is reported as PersistenceError
//
// Each test works in its own temporary directory, removed afterwards.
// =============================================================================

#include "riskguard/errors.hpp"
#include "riskguard/persistence/json_state_store.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

class JsonStateStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir = fs::temp_directory_path() /
          ("riskguard_store_" + std::string(info->name()) + "_" +
           std::to_string(std::chrono::steady_clock::now()
                              .time_since_epoch()
                              .count()));
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir, ec);
  }

  fs::path dir;
};

// -----------------------------------------------------------------------------
// 1. A committed table is read back by a fresh store on the same directory.
// Why: Every manager reloads its table at startup; this is the restart path.
// -----------------------------------------------------------------------------
TEST_F(JsonStateStoreTest, TransactSurvivesReopen) {
  {
    riskguard::JsonStateStore store(dir);
    store.transact("lockouts", [](nlohmann::json& table) {
      table["rows"] = nlohmann::json::array({{{"symbol", "ES"}}});
    });
  }

  riskguard::JsonStateStore reopened(dir);
  const nlohmann::json table = reopened.read("lockouts");
  ASSERT_TRUE(table.contains("rows"));
  ASSERT_EQ(table["rows"].size(), 1u);
  EXPECT_EQ(table["rows"][0]["symbol"], "ES");
}

TEST_F(JsonStateStoreTest, MissingTableReadsAsEmptyObject) {
  riskguard::JsonStateStore store(dir);
  const nlohmann::json table = store.read("timers");
  EXPECT_TRUE(table.is_object());
  EXPECT_TRUE(table.empty());
}

// -----------------------------------------------------------------------------
// 2. A mutator that throws must not leave a half-applied table behind.
// -----------------------------------------------------------------------------
TEST_F(JsonStateStoreTest, ThrowingMutatorLeavesTableUntouched) {
  riskguard::JsonStateStore store(dir);
  store.transact("daily_pnl", [](nlohmann::json& t) { t["total"] = -100.0; });

  EXPECT_THROW(store.transact("daily_pnl",
                              [](nlohmann::json& t) {
                                t["total"] = -999.0;
                                throw std::runtime_error("abort");
                              }),
               std::runtime_error);

  EXPECT_DOUBLE_EQ(store.read("daily_pnl")["total"].get<double>(), -100.0);

  riskguard::JsonStateStore reopened(dir);
  EXPECT_DOUBLE_EQ(reopened.read("daily_pnl")["total"].get<double>(), -100.0);
}

TEST_F(JsonStateStoreTest, TablesAreIndependent) {
  riskguard::JsonStateStore store(dir);
  store.transact("timers", [](nlohmann::json& t) { t["a"] = 1; });
  store.transact("lockouts", [](nlohmann::json& t) { t["b"] = 2; });

  EXPECT_FALSE(store.read("timers").contains("b"));
  EXPECT_FALSE(store.read("lockouts").contains("a"));
}

// -----------------------------------------------------------------------------
// 3. A commit goes through the temp file and leaves only state.json, synced
//    and complete, even when a crash left a stale temp file behind.
// -----------------------------------------------------------------------------
TEST_F(JsonStateStoreTest, CommitReplacesStaleTempFile) {
  riskguard::JsonStateStore store(dir);
  {
    std::ofstream stale(dir / "state.json.tmp");
    stale << "{ torn";
  }

  store.transact("lockouts", [](nlohmann::json& t) { t["count"] = 1; });

  EXPECT_FALSE(fs::exists(dir / "state.json.tmp"));
  std::ifstream in(dir / "state.json");
  const nlohmann::json on_disk = nlohmann::json::parse(in);
  EXPECT_EQ(on_disk["lockouts"]["count"], 1);
}

TEST_F(JsonStateStoreTest, FailedCommitKeepsPreviousDocument) {
  riskguard::JsonStateStore store(dir);
  store.transact("timers", [](nlohmann::json& t) { t["armed"] = 1; });

  // A non-empty directory in place of state.json makes the rename fail.
  fs::remove(dir / "state.json");
  fs::create_directories(dir / "state.json" / "blocker");

  EXPECT_THROW(
      store.transact("timers", [](nlohmann::json& t) { t["armed"] = 2; }),
      riskguard::PersistenceError);
  EXPECT_EQ(store.read("timers")["armed"], 1);
}

// -----------------------------------------------------------------------------
// 4. Audit records are appended, never rewritten.
// -----------------------------------------------------------------------------
TEST_F(JsonStateStoreTest, AppendKeepsRecordsInOrder) {
  {
    riskguard::JsonStateStore store(dir);
    store.append("audit_log", {{"action", "close_all"}, {"result", "ok"}});
    store.append("audit_log", {{"action", "lockout_hard"}, {"result", "installed"}});
  }

  riskguard::JsonStateStore reopened(dir);
  reopened.append("audit_log", {{"action", "cancel_all_orders"}});
  const auto records = reopened.readLog("audit_log");
  ASSERT_EQ(records.size(), 3u);
  EXPECT_EQ(records[0]["action"], "close_all");
  EXPECT_EQ(records[1]["result"], "installed");
  EXPECT_EQ(records[2]["action"], "cancel_all_orders");
  EXPECT_TRUE(reopened.readLog("other").empty());
}

TEST_F(JsonStateStoreTest, CorruptDocumentIsPersistenceError) {
  fs::create_directories(dir);
  {
    std::ofstream out(dir / "state.json");
    out << "{ not json";
  }
  EXPECT_THROW(riskguard::JsonStateStore store(dir),
               riskguard::PersistenceError);
}
