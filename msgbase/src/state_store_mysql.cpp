#include "state_store_mysql.h"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

#ifdef BBS_MSGBASE_ENABLE_MYSQL
#include <mysql.h>
#endif

#include "platform_log.h"

namespace bbs::msgbase {

namespace {

#ifdef BBS_MSGBASE_ENABLE_MYSQL

constexpr std::size_t kMaxKeyBytes = 191 * 4;

void BindString(MYSQL_BIND& bind, const std::string& value,
                unsigned long& length) {
  length = static_cast<unsigned long>(value.size());
  bind.buffer_type = MYSQL_TYPE_STRING;
  bind.buffer = const_cast<char*>(value.c_str());
  bind.buffer_length = length;
  bind.length = &length;
}

// Owns a prepared statement for the duration of one call.
class Statement {
 public:
  explicit Statement(MYSQL* conn) : stmt_(mysql_stmt_init(conn)) {}
  ~Statement() {
    if (stmt_) {
      mysql_stmt_free_result(stmt_);
      mysql_stmt_close(stmt_);
    }
  }
  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  bool Prepare(const char* query, std::string& error) {
    if (!stmt_) {
      error = "mysql_stmt_init failed";
      return false;
    }
    if (mysql_stmt_prepare(stmt_, query, std::strlen(query)) != 0) {
      error = std::string("mysql_stmt_prepare failed: ") +
              mysql_stmt_error(stmt_);
      return false;
    }
    return true;
  }

  bool Execute(MYSQL_BIND* params, std::string& error) {
    if (params && mysql_stmt_bind_param(stmt_, params) != 0) {
      error = "mysql_stmt_bind_param failed";
      return false;
    }
    if (mysql_stmt_execute(stmt_) != 0) {
      error = std::string("mysql_stmt_execute failed: ") +
              mysql_stmt_error(stmt_);
      return false;
    }
    return true;
  }

  MYSQL_STMT* get() const { return stmt_; }

 private:
  MYSQL_STMT* stmt_;
};

class MysqlStateStore final : public StateStore {
 public:
  explicit MysqlStateStore(MYSQL* conn) : conn_(conn) {}

  ~MysqlStateStore() override {
    if (conn_) {
      mysql_close(conn_);
      conn_ = nullptr;
    }
  }

  bool LoadBlob(const std::string& table, const std::string& key,
                BlobLoadResult& out, std::string& error) override {
    error.clear();
    out = BlobLoadResult{};
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(conn_);
    if (!stmt.Prepare(
            "SELECT payload FROM bbs_msgbase_kv WHERE tbl=? AND key_name=?",
            error)) {
      return false;
    }
    MYSQL_BIND params[2]{};
    unsigned long table_len = 0;
    unsigned long key_len = 0;
    BindString(params[0], table, table_len);
    BindString(params[1], key, key_len);
    if (!stmt.Execute(params, error)) {
      return false;
    }

    MYSQL_BIND result[1]{};
    unsigned long blob_len = 0;
    result[0].buffer_type = MYSQL_TYPE_BLOB;
    result[0].buffer = nullptr;
    result[0].buffer_length = 0;
    result[0].length = &blob_len;
    if (mysql_stmt_bind_result(stmt.get(), result) != 0) {
      error = "mysql_stmt_bind_result failed";
      return false;
    }
    if (mysql_stmt_store_result(stmt.get()) != 0) {
      error = "mysql_stmt_store_result failed";
      return false;
    }
    const int fetch_status = mysql_stmt_fetch(stmt.get());
    if (fetch_status == MYSQL_NO_DATA) {
      return true;
    }
    if (fetch_status != 0 && fetch_status != MYSQL_DATA_TRUNCATED) {
      error = "mysql_stmt_fetch failed";
      return false;
    }
    if (blob_len > 0) {
      out.data.resize(blob_len);
      MYSQL_BIND col{};
      col.buffer_type = MYSQL_TYPE_BLOB;
      col.buffer = out.data.data();
      col.buffer_length = blob_len;
      col.length = &blob_len;
      if (mysql_stmt_fetch_column(stmt.get(), &col, 0, 0) != 0) {
        error = "mysql_stmt_fetch_column failed";
        out.data.clear();
        return false;
      }
      out.data.resize(blob_len);
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
    if (key.size() > kMaxKeyBytes) {
      error = "key too long";
      return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(conn_);
    if (!stmt.Prepare(
            "INSERT INTO bbs_msgbase_kv (tbl, key_name, payload) "
            "VALUES (?, ?, ?) "
            "ON DUPLICATE KEY UPDATE payload=VALUES(payload)",
            error)) {
      return false;
    }
    MYSQL_BIND params[3]{};
    unsigned long table_len = 0;
    unsigned long key_len = 0;
    BindString(params[0], table, table_len);
    BindString(params[1], key, key_len);
    unsigned long payload_len = static_cast<unsigned long>(data.size());
    params[2].buffer_type = MYSQL_TYPE_BLOB;
    params[2].buffer =
        data.empty() ? nullptr : const_cast<std::uint8_t*>(data.data());
    params[2].buffer_length = payload_len;
    params[2].length = &payload_len;
    return stmt.Execute(params, error);
  }

  bool ListKeys(const std::string& table, std::vector<std::string>& out,
                std::string& error) override {
    error.clear();
    out.clear();
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(conn_);
    if (!stmt.Prepare(
            "SELECT key_name FROM bbs_msgbase_kv WHERE tbl=? "
            "ORDER BY key_name",
            error)) {
      return false;
    }
    MYSQL_BIND params[1]{};
    unsigned long table_len = 0;
    BindString(params[0], table, table_len);
    if (!stmt.Execute(params, error)) {
      return false;
    }
    std::vector<char> buffer(kMaxKeyBytes);
    unsigned long key_len = 0;
    MYSQL_BIND result[1]{};
    result[0].buffer_type = MYSQL_TYPE_STRING;
    result[0].buffer = buffer.data();
    result[0].buffer_length = static_cast<unsigned long>(buffer.size());
    result[0].length = &key_len;
    if (mysql_stmt_bind_result(stmt.get(), result) != 0) {
      error = "mysql_stmt_bind_result failed";
      return false;
    }
    if (mysql_stmt_store_result(stmt.get()) != 0) {
      error = "mysql_stmt_store_result failed";
      return false;
    }
    while (true) {
      const int status = mysql_stmt_fetch(stmt.get());
      if (status == MYSQL_NO_DATA) {
        break;
      }
      if (status != 0) {
        error = "mysql_stmt_fetch failed";
        out.clear();
        return false;
      }
      out.emplace_back(buffer.data(),
                       std::min<std::size_t>(key_len, buffer.size()));
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
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string lock_name = "bbs_msgbase:" + table;
    Statement stmt(conn_);
    if (!stmt.Prepare("SELECT GET_LOCK(?, ?)", error)) {
      locks_.Release(table);
      return false;
    }
    const int timeout_sec = static_cast<int>(
        std::max<std::int64_t>(1, timeout.count() / 1000));
    MYSQL_BIND params[2]{};
    unsigned long name_len = 0;
    BindString(params[0], lock_name, name_len);
    params[1].buffer_type = MYSQL_TYPE_LONG;
    params[1].buffer = const_cast<int*>(&timeout_sec);
    params[1].is_unsigned = false;
    if (!stmt.Execute(params, error)) {
      locks_.Release(table);
      return false;
    }
    MYSQL_BIND result[1]{};
    int got = 0;
    result[0].buffer_type = MYSQL_TYPE_LONG;
    result[0].buffer = &got;
    if (mysql_stmt_bind_result(stmt.get(), result) != 0 ||
        mysql_stmt_fetch(stmt.get()) != 0) {
      error = "mysql lock query failed";
      locks_.Release(table);
      return false;
    }
    if (got != 1) {
      error = "table lock busy: " + table;
      locks_.Release(table);
      return false;
    }
    held_locks_.insert(lock_name);
    return true;
  }

  void ReleaseLock(const std::string& table) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      const std::string lock_name = "bbs_msgbase:" + table;
      if (held_locks_.find(lock_name) == held_locks_.end()) {
        return;
      }
      held_locks_.erase(lock_name);
      std::string error;
      Statement stmt(conn_);
      MYSQL_BIND params[1]{};
      unsigned long name_len = 0;
      BindString(params[0], lock_name, name_len);
      if (!stmt.Prepare("SELECT RELEASE_LOCK(?)", error) ||
          !stmt.Execute(params, error)) {
        platform::log::Log(platform::log::Level::kWarn, "state_store",
                           "mysql lock release failed",
                           {{"lock", lock_name}, {"error", error}});
      }
    }
    locks_.Release(table);
  }

 private:
  MYSQL* conn_{nullptr};
  std::mutex mutex_;
  std::unordered_set<std::string> held_locks_;
  LocalLockTable locks_;
};

MYSQL* ConnectMysql(const MySqlConfig& cfg, std::string& error) {
  error.clear();
  constexpr int kMaxAttempts = 2;
  for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
    MYSQL* conn = mysql_init(nullptr);
    if (!conn) {
      error = "mysql_init failed";
      return nullptr;
    }
    unsigned int timeout = 5;
    mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);
    mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &timeout);
    mysql_options(conn, MYSQL_OPT_WRITE_TIMEOUT, &timeout);
    MYSQL* res = mysql_real_connect(conn, cfg.host.c_str(),
                                    cfg.username.c_str(),
                                    cfg.password.c_str(),
                                    cfg.database.c_str(), cfg.port, nullptr, 0);
    if (res) {
      return conn;
    }
    error = std::string("mysql_connect failed: ") + mysql_error(conn);
    mysql_close(conn);
    if (attempt + 1 < kMaxAttempts) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
  }
  return nullptr;
}

bool EnsureSchema(MYSQL* conn, std::string& error) {
  error.clear();
  const char* query =
      "CREATE TABLE IF NOT EXISTS bbs_msgbase_kv ("
      "tbl VARCHAR(64) NOT NULL,"
      "key_name VARCHAR(191) NOT NULL,"
      "payload LONGBLOB NOT NULL,"
      "updated_at TIMESTAMP NOT NULL DEFAULT CURRENT_TIMESTAMP "
      "ON UPDATE CURRENT_TIMESTAMP,"
      "PRIMARY KEY (tbl, key_name)"
      ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_bin";
  if (mysql_query(conn, query) != 0) {
    error = "mysql schema create failed";
    return false;
  }
  return true;
}

#endif  // BBS_MSGBASE_ENABLE_MYSQL

}  // namespace

std::unique_ptr<StateStore> CreateMysqlStateStore(const MySqlConfig& cfg,
                                                  std::string& error) {
#ifdef BBS_MSGBASE_ENABLE_MYSQL
  MYSQL* conn = ConnectMysql(cfg, error);
  if (!conn) {
    return nullptr;
  }
  if (!EnsureSchema(conn, error)) {
    mysql_close(conn);
    return nullptr;
  }
  return std::make_unique<MysqlStateStore>(conn);
#else
  (void)cfg;
  error = "mysql backend disabled";
  return nullptr;
#endif
}

}  // namespace bbs::msgbase
