#ifndef BBS_MSGBASE_CONFIG_H
#define BBS_MSGBASE_CONFIG_H

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "platform_log.h"

namespace bbs::msgbase {

enum class StoreBackend : std::uint8_t { kFile = 0, kMemory = 1, kMySQL = 2 };

struct MySqlConfig {
  std::string host;
  std::uint16_t port{0};
  std::string database;
  std::string username;
  std::string password;
};

struct SystemSection {
  std::string bbsname;
  std::string datapath;
};

struct MsgSection {
  std::optional<std::string> origin_line;
  // False when msg.network_tags is absent: network dispatch is disabled.
  bool network_tags_configured{false};
  std::vector<std::string> network_tags;
  std::vector<std::string> server_tags;
};

// [msgnet_<tag>]
struct NetworkSection {
  std::string trans_db_name;
  std::string queue_db_name;
};

struct StoreSection {
  StoreBackend backend{StoreBackend::kFile};
  std::uint32_t lock_timeout_ms{5000};
};

struct LogSection {
  platform::log::Level level{platform::log::Level::kInfo};
};

struct MsgbaseConfig {
  SystemSection system;
  MsgSection msg;
  StoreSection store;
  MySqlConfig mysql;
  LogSection log;
  std::unordered_map<std::string, NetworkSection> networks;
};

bool LoadConfig(const std::string& path, MsgbaseConfig& out_config,
                std::string& error);

bool ValidateConfig(const MsgbaseConfig& config, std::string& error);

// Comma separated list; entries trimmed, empty entries dropped.
std::vector<std::string> SplitTagList(const std::string& text);

}  // namespace bbs::msgbase

#endif  // BBS_MSGBASE_CONFIG_H
