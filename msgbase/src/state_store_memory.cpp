#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "state_store.h"

namespace bbs::msgbase {

namespace {

class MemoryStateStore final : public StateStore {
 public:
  bool LoadBlob(const std::string& table, const std::string& key,
                BlobLoadResult& out, std::string& error) override {
    error.clear();
    out = BlobLoadResult{};
    std::lock_guard<std::mutex> lock(mutex_);
    const auto t_it = tables_.find(table);
    if (t_it == tables_.end()) {
      return true;
    }
    const auto k_it = t_it->second.find(key);
    if (k_it == t_it->second.end()) {
      return true;
    }
    out.found = true;
    out.data = k_it->second;
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
    std::lock_guard<std::mutex> lock(mutex_);
    tables_[table][key] = data;
    return true;
  }

  bool ListKeys(const std::string& table, std::vector<std::string>& out,
                std::string& error) override {
    error.clear();
    out.clear();
    std::lock_guard<std::mutex> lock(mutex_);
    const auto t_it = tables_.find(table);
    if (t_it == tables_.end()) {
      return true;
    }
    out.reserve(t_it->second.size());
    for (const auto& kv : t_it->second) {
      out.push_back(kv.first);
    }
    return true;
  }

  bool AcquireLock(const std::string& table,
                   std::chrono::milliseconds timeout,
                   std::string& error) override {
    error.clear();
    if (!locks_.Acquire(table, timeout)) {
      error = "table lock busy: " + table;
      return false;
    }
    return true;
  }

  void ReleaseLock(const std::string& table) override {
    locks_.Release(table);
  }

 private:
  std::mutex mutex_;
  std::unordered_map<std::string,
                     std::map<std::string, std::vector<std::uint8_t>>>
      tables_;
  LocalLockTable locks_;
};

}  // namespace

std::unique_ptr<StateStore> CreateMemoryStateStore() {
  return std::make_unique<MemoryStateStore>();
}

}  // namespace bbs::msgbase
