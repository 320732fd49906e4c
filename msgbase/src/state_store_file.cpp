#include <algorithm>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "hex_utils.h"
#include "platform_fs.h"
#include "platform_log.h"
#include "platform_time.h"
#include "state_store.h"

namespace bbs::msgbase {

namespace {

constexpr char kBlobSuffix[] = ".blob";
constexpr char kLockSuffix[] = ".lock";
constexpr std::uint32_t kLockPollMs = 5;
// Hex doubles the key; the name plus the AtomicWrite temp suffix must stay
// under NAME_MAX (255).
constexpr std::size_t kMaxKeyBytes = 110;

// <root>/<table>/<hex key>.blob, one file per key; <root>/<table>.lock guards
// the table across processes.
class FileStateStore final : public StateStore {
 public:
  explicit FileStateStore(std::filesystem::path root) : root_(std::move(root)) {}

  ~FileStateStore() override {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& kv : file_locks_) {
      platform::fs::ReleaseFileLock(kv.second);
    }
  }

  bool LoadBlob(const std::string& table, const std::string& key,
                BlobLoadResult& out, std::string& error) override {
    error.clear();
    out = BlobLoadResult{};
    if (!IsValidTableName(table) || key.empty() || key.size() > kMaxKeyBytes) {
      return true;
    }
    const auto path = KeyPath(table, key);
    std::error_code ec;
    if (!platform::fs::Exists(path, ec)) {
      if (ec) {
        error = "stat failed: " + path.string();
        return false;
      }
      return true;
    }
    if (!platform::fs::ReadFile(path, out.data, ec)) {
      error = "read failed: " + path.string();
      return false;
    }
    out.found = true;
    return true;
  }

  bool SaveBlob(const std::string& table, const std::string& key,
                const std::vector<std::uint8_t>& data,
                std::string& error) override {
    error.clear();
    if (!IsValidTableName(table)) {
      error = "invalid table name: " + table;
      return false;
    }
    if (key.empty()) {
      error = "empty key";
      return false;
    }
    if (key.size() > kMaxKeyBytes) {
      error = "key too long: " + std::to_string(key.size()) + " bytes";
      return false;
    }
    std::error_code ec;
    if (!platform::fs::CreateDirectories(root_ / table, ec)) {
      error = "create table dir failed: " + (root_ / table).string();
      return false;
    }
    const auto path = KeyPath(table, key);
    if (!platform::fs::AtomicWrite(path, data.data(), data.size(), ec)) {
      error = "write failed: " + path.string() + ": " + ec.message();
      return false;
    }
    return true;
  }

  bool ListKeys(const std::string& table, std::vector<std::string>& out,
                std::string& error) override {
    error.clear();
    out.clear();
    if (!IsValidTableName(table)) {
      return true;
    }
    const auto dir = root_ / table;
    std::error_code ec;
    if (!platform::fs::Exists(dir, ec)) {
      return true;
    }
    std::vector<std::filesystem::path> entries;
    if (!platform::fs::ListDir(dir, entries, ec)) {
      error = "list failed: " + dir.string();
      return false;
    }
    const std::string suffix(kBlobSuffix);
    for (const auto& entry : entries) {
      const std::string name = entry.filename().string();
      if (name.size() <= suffix.size() ||
          name.compare(name.size() - suffix.size(), suffix.size(), suffix) !=
              0) {
        continue;
      }
      std::string key;
      if (!common::HexToString(name.substr(0, name.size() - suffix.size()),
                               key)) {
        platform::log::Log(platform::log::Level::kWarn, "state_store",
                           "skipping stray file", {{"path", entry.string()}});
        continue;
      }
      out.push_back(std::move(key));
    }
    std::sort(out.begin(), out.end());
    return true;
  }

  bool AcquireLock(const std::string& table,
                   std::chrono::milliseconds timeout,
                   std::string& error) override {
    error.clear();
    if (!IsValidTableName(table)) {
      error = "invalid table name: " + table;
      return false;
    }
    const std::uint64_t deadline =
        platform::NowSteadyMs() + static_cast<std::uint64_t>(timeout.count());
    if (!locks_.Acquire(table, timeout)) {
      error = "table lock busy: " + table;
      return false;
    }

    std::error_code ec;
    if (!platform::fs::CreateDirectories(root_, ec)) {
      locks_.Release(table);
      error = "create store dir failed: " + root_.string();
      return false;
    }
    const auto lock_path = root_ / (table + kLockSuffix);
    platform::fs::FileLock file_lock;
    while (true) {
      const auto status =
          platform::fs::AcquireExclusiveFileLock(lock_path, file_lock);
      if (status == platform::fs::FileLockStatus::kOk) {
        break;
      }
      if (status == platform::fs::FileLockStatus::kFailed) {
        locks_.Release(table);
        error = "open lock file failed: " + lock_path.string();
        return false;
      }
      if (platform::NowSteadyMs() >= deadline) {
        locks_.Release(table);
        error = "table lock busy: " + table;
        return false;
      }
      platform::SleepMs(kLockPollMs);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    file_locks_[table] = file_lock;
    return true;
  }

  void ReleaseLock(const std::string& table) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = file_locks_.find(table);
      if (it == file_locks_.end()) {
        return;
      }
      platform::fs::ReleaseFileLock(it->second);
      file_locks_.erase(it);
    }
    locks_.Release(table);
  }

 private:
  std::filesystem::path KeyPath(const std::string& table,
                                const std::string& key) const {
    return root_ / table / (common::StringToHex(key) + kBlobSuffix);
  }

  std::filesystem::path root_;
  std::mutex mutex_;
  std::unordered_map<std::string, platform::fs::FileLock> file_locks_;
  LocalLockTable locks_;
};

}  // namespace

std::unique_ptr<StateStore> CreateFileStateStore(
    const std::filesystem::path& root, std::string& error) {
  error.clear();
  if (root.empty()) {
    error = "store path empty";
    return nullptr;
  }
  std::error_code ec;
  if (!platform::fs::CreateDirectories(root, ec)) {
    error = "create store dir failed: " + root.string();
    return nullptr;
  }
  return std::make_unique<FileStateStore>(root);
}

}  // namespace bbs::msgbase
