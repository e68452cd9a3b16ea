#include "riskguard/persistence/json_state_store.hpp"
#include "riskguard/errors.hpp"
#include "riskguard/logging/log.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <fstream>
#include <system_error>
#include <utility>

namespace riskguard {

namespace {

constexpr const char* kComponent = "JsonStateStore";

// Opens `path` with `flags` and fsyncs it. Works for files and, with
// O_DIRECTORY, for the directory entry that a rename() changed.
void syncPath(const std::filesystem::path& path, int flags) {
  const int fd = ::open(path.c_str(), flags | O_CLOEXEC);
  if (fd < 0) {
    throw PersistenceError("cannot open " + path.string() + " for sync: " +
                           std::system_category().message(errno));
  }
  const int rc = ::fsync(fd);
  const int err = errno;
  ::close(fd);
  if (rc != 0) {
    throw PersistenceError("fsync failed for " + path.string() + ": " +
                           std::system_category().message(err));
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: create directory, load state.json
// -----------------------------------------------------------------------------
JsonStateStore::JsonStateStore(std::filesystem::path directory)
    : directory_(std::move(directory)),
      state_path_(directory_ / "state.json"),
      document_(nlohmann::json::object()) {
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    throw PersistenceError("cannot create state directory " +
                           directory_.string() + ": " + ec.message());
  }

  if (!std::filesystem::exists(state_path_, ec)) {
    log::info(kComponent, "no state at " + state_path_.string() +
                              ", starting empty");
    return;
  }

  std::ifstream in(state_path_);
  if (!in) {
    throw PersistenceError("cannot open " + state_path_.string());
  }
  try {
    document_ = nlohmann::json::parse(in);
  } catch (const nlohmann::json::exception& e) {
    throw PersistenceError("corrupt state document " + state_path_.string() +
                           ": " + e.what());
  }
  if (!document_.is_object()) {
    throw PersistenceError("state document is not an object: " +
                           state_path_.string());
  }
  log::info(kComponent, "loaded " + std::to_string(document_.size()) +
                            " table(s) from " + state_path_.string());
}

// -----------------------------------------------------------------------------
// read(table)
// -----------------------------------------------------------------------------
nlohmann::json JsonStateStore::read(const std::string& table) const {
  std::lock_guard lock(mutex_);
  auto it = document_.find(table);
  if (it == document_.end()) {
    return nlohmann::json::object();
  }
  return *it;
}

// -----------------------------------------------------------------------------
// transact(table, mutator): copy, mutate, write and sync temp, rename, commit
// -----------------------------------------------------------------------------
void JsonStateStore::transact(const std::string& table,
                              const Mutator& mutator) {
  std::lock_guard lock(mutex_);

  nlohmann::json next = document_;
  nlohmann::json& slot = next[table];
  if (slot.is_null()) {
    slot = nlohmann::json::object();
  }
  mutator(slot);

  writeDocument(next);
  document_ = std::move(next);
}

void JsonStateStore::writeDocument(const nlohmann::json& document) const {
  std::filesystem::path tmp = state_path_;
  tmp += ".tmp";

  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      throw PersistenceError("cannot open " + tmp.string() + " for writing");
    }
    out << document.dump(2);
    out.flush();
    out.close();
    if (!out) {
      throw PersistenceError("write failed for " + tmp.string());
    }
  }
  syncPath(tmp, O_RDONLY);

  std::error_code ec;
  std::filesystem::rename(tmp, state_path_, ec);
  if (ec) {
    throw PersistenceError("cannot commit " + state_path_.string() + ": " +
                           ec.message());
  }
  syncPath(directory_, O_RDONLY | O_DIRECTORY);
}

// -----------------------------------------------------------------------------
// append(log, record)
// -----------------------------------------------------------------------------
void JsonStateStore::append(const std::string& log_name,
                            const nlohmann::json& record) {
  std::lock_guard lock(mutex_);
  const auto path = logPath(log_name);

  std::ofstream out(path, std::ios::app);
  if (!out) {
    throw PersistenceError("cannot open " + path.string() + " for append");
  }
  out << record.dump() << '\n';
  out.flush();
  if (!out) {
    throw PersistenceError("append failed for " + path.string());
  }
}

// -----------------------------------------------------------------------------
// readLog(log)
// -----------------------------------------------------------------------------
std::vector<nlohmann::json> JsonStateStore::readLog(
    const std::string& log_name) const {
  std::lock_guard lock(mutex_);
  std::vector<nlohmann::json> records;

  std::ifstream in(logPath(log_name));
  if (!in) {
    return records;
  }

  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) {
      continue;
    }
    try {
      records.push_back(nlohmann::json::parse(line));
    } catch (const nlohmann::json::exception& e) {
      log::warn(kComponent, "skipping unreadable " + log_name + " line " +
                                std::to_string(line_no) + ": " + e.what());
    }
  }
  return records;
}

std::filesystem::path JsonStateStore::logPath(const std::string& log_name) const {
  return directory_ / (log_name + ".jsonl");
}

}  // namespace riskguard
