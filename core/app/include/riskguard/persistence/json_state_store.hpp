#pragma once

#include "riskguard/persistence/i_state_store.hpp"

#include <filesystem>
#include <mutex>

namespace riskguard {

// -----------------------------------------------------------------------------
// JsonStateStore: file-backed IStateStore
// -----------------------------------------------------------------------------
//
// @brief  Keeps every table in one JSON document, `<dir>/state.json`, and
//         every log in `<dir>/<log>.jsonl` (one JSON record per line).
//
// @details
// Commit protocol for transact():
//   1. Copy the in-memory document and apply the mutator to the copy.
//   2. Write the copy to `state.json.tmp`, close it and fsync it.
//   3. rename() the temp file over `state.json` (atomic on POSIX), then
//      fsync the directory so the rename itself is on disk.
//   4. Replace the in-memory document with the copy.
// A crash before step 3 leaves the previous document intact; a crash after
// it leaves the new one. Either way a restart sees a complete document.
//
// Logs are opened in append mode per record and flushed before append()
// returns. A torn final line (crash mid-write) is skipped with a warning by
// readLog().
//
// Construction creates the directory if needed and loads `state.json`. A
// document that exists but cannot be parsed is a PersistenceError: the
// engine refuses to start on state it cannot read.
//
// Thread-safety: One mutex serializes transact(), append() and the reads.
// -----------------------------------------------------------------------------
class JsonStateStore final : public IStateStore {
 public:
  explicit JsonStateStore(std::filesystem::path directory);

  JsonStateStore(const JsonStateStore&) = delete;
  JsonStateStore& operator=(const JsonStateStore&) = delete;

  nlohmann::json read(const std::string& table) const override;
  void transact(const std::string& table, const Mutator& mutator) override;
  void append(const std::string& log, const nlohmann::json& record) override;
  std::vector<nlohmann::json> readLog(const std::string& log) const override;

  const std::filesystem::path& directory() const { return directory_; }

 private:
  void writeDocument(const nlohmann::json& document) const;
  std::filesystem::path logPath(const std::string& log) const;

  std::filesystem::path directory_;
  std::filesystem::path state_path_;

  mutable std::mutex mutex_;
  nlohmann::json document_;
};

}  // namespace riskguard
