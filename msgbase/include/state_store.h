#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace bbs::msgbase {

struct MySqlConfig;
struct MsgbaseConfig;

struct BlobLoadResult {
  bool found{false};
  std::vector<std::uint8_t> data;
};

// Named tables of string key -> opaque bytes, each lockable on its own.
class StateStore {
 public:
  virtual ~StateStore() = default;

  virtual bool LoadBlob(const std::string& table, const std::string& key,
                        BlobLoadResult& out, std::string& error) = 0;
  virtual bool SaveBlob(const std::string& table, const std::string& key,
                        const std::vector<std::uint8_t>& data,
                        std::string& error) = 0;
  // Keys of `table` in ascending byte order. An unknown table has no keys.
  virtual bool ListKeys(const std::string& table,
                        std::vector<std::string>& out,
                        std::string& error) = 0;
  virtual bool AcquireLock(const std::string& table,
                           std::chrono::milliseconds timeout,
                           std::string& error) = 0;
  virtual void ReleaseLock(const std::string& table) = 0;
};

class StateStoreLock {
 public:
  StateStoreLock(StateStore* store, const std::string& table,
                 std::chrono::milliseconds timeout, std::string& error)
      : store_(store), table_(table), locked_(false) {
    if (store_) {
      locked_ = store_->AcquireLock(table_, timeout, error);
    } else {
      error = "state store missing";
    }
  }

  ~StateStoreLock() {
    if (store_ && locked_) {
      store_->ReleaseLock(table_);
    }
  }

  StateStoreLock(const StateStoreLock&) = delete;
  StateStoreLock& operator=(const StateStoreLock&) = delete;

  bool locked() const { return locked_; }

 private:
  StateStore* store_;
  std::string table_;
  bool locked_;
};

// In-process exclusive locks keyed by table name. Not re-entrant.
class LocalLockTable {
 public:
  bool Acquire(const std::string& table, std::chrono::milliseconds timeout);
  void Release(const std::string& table);

 private:
  std::mutex mutex_;
  std::condition_variable released_;
  std::unordered_set<std::string> held_;
};

bool IsValidTableName(const std::string& table);

std::unique_ptr<StateStore> CreateMemoryStateStore();
std::unique_ptr<StateStore> CreateFileStateStore(
    const std::filesystem::path& root, std::string& error);

// Picks the backend named by `store.backend`.
std::unique_ptr<StateStore> CreateStateStore(const MsgbaseConfig& config,
                                             std::string& error);

}  // namespace bbs::msgbase
