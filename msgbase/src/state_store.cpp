#include "state_store.h"

#include <cctype>

#include "config.h"
#include "platform_log.h"
#include "state_store_mysql.h"

namespace bbs::msgbase {

namespace {
constexpr std::size_t kMaxTableNameLen = 64;
}

bool LocalLockTable::Acquire(const std::string& table,
                             std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  const bool free = released_.wait_for(lock, timeout, [&] {
    return held_.find(table) == held_.end();
  });
  if (!free) {
    return false;
  }
  held_.insert(table);
  return true;
}

void LocalLockTable::Release(const std::string& table) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    held_.erase(table);
  }
  released_.notify_all();
}

bool IsValidTableName(const std::string& table) {
  if (table.empty() || table.size() > kMaxTableNameLen) {
    return false;
  }
  if (table.front() == '.') {
    return false;
  }
  for (const char ch : table) {
    const unsigned char uc = static_cast<unsigned char>(ch);
    if (std::isalnum(uc) == 0 && ch != '_' && ch != '-' && ch != '.') {
      return false;
    }
  }
  return true;
}

std::unique_ptr<StateStore> CreateStateStore(const MsgbaseConfig& config,
                                             std::string& error) {
  error.clear();
  switch (config.store.backend) {
    case StoreBackend::kMemory:
      platform::log::Log(platform::log::Level::kWarn, "state_store",
                         "memory backend selected; messages are not persisted");
      return CreateMemoryStateStore();
    case StoreBackend::kFile:
      return CreateFileStateStore(config.system.datapath, error);
    case StoreBackend::kMySQL:
      return CreateMysqlStateStore(config.mysql, error);
  }
  error = "unknown store backend";
  return nullptr;
}

}  // namespace bbs::msgbase
