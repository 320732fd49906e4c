#include "config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

#include "state_store.h"

namespace bbs::msgbase {

namespace {

constexpr char kNetworkSectionPrefix[] = "msgnet_";

std::string Trim(const std::string& input) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  auto begin = std::find_if_not(input.begin(), input.end(), is_space);
  auto end = std::find_if_not(input.rbegin(), input.rend(), is_space).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string StripInlineComment(const std::string& input) {
  for (std::size_t i = 0; i < input.size(); ++i) {
    const char ch = input[i];
    if ((ch == '#' || ch == ';') &&
        (i == 0 ||
         std::isspace(static_cast<unsigned char>(input[i - 1])) != 0)) {
      return Trim(input.substr(0, i));
    }
  }
  return input;
}

bool ParseUint16(const std::string& text, std::uint16_t& out) {
  if (text.empty()) {
    return false;
  }
  char* end_ptr = nullptr;
  const long value = std::strtol(text.c_str(), &end_ptr, 10);
  if (end_ptr == text.c_str() || *end_ptr != '\0' || value < 0 ||
      value > 65535) {
    return false;
  }
  out = static_cast<std::uint16_t>(value);
  return true;
}

bool ParseUint32(const std::string& text, std::uint32_t& out) {
  if (text.empty() || text.front() == '-') {
    return false;
  }
  char* end_ptr = nullptr;
  const unsigned long value = std::strtoul(text.c_str(), &end_ptr, 10);
  if (end_ptr == text.c_str() || *end_ptr != '\0' || value > 0xFFFFFFFFul) {
    return false;
  }
  out = static_cast<std::uint32_t>(value);
  return true;
}

bool ParseBackend(const std::string& text, StoreBackend& out) {
  if (text == "file") {
    out = StoreBackend::kFile;
  } else if (text == "memory") {
    out = StoreBackend::kMemory;
  } else if (text == "mysql") {
    out = StoreBackend::kMySQL;
  } else {
    return false;
  }
  return true;
}

const char* BackendName(StoreBackend backend) {
  switch (backend) {
    case StoreBackend::kFile:
      return "file";
    case StoreBackend::kMemory:
      return "memory";
    case StoreBackend::kMySQL:
      return "mysql";
  }
  return "file";
}

std::string ExpandHome(const std::string& path) {
  if (path.size() < 2 || path[0] != '~' || path[1] != '/') {
    return path;
  }
  const char* home = std::getenv("HOME");
  if (!home || *home == '\0') {
    return path;
  }
  return std::string(home) + path.substr(1);
}

// Free text where '#' is content, e.g. "Quiet Harbor BBS #1".
bool IsVerbatimKey(const std::string& section, const std::string& key) {
  return section == "msg" && key == "origin_line";
}

struct IniState {
  std::string section;
  MsgbaseConfig* cfg{nullptr};
};

bool ApplyKV(IniState& state, const std::string& key, const std::string& value,
             std::string& error) {
  MsgbaseConfig& cfg = *state.cfg;
  if (state.section == "system") {
    if (key == "bbsname") {
      cfg.system.bbsname = value;
    } else if (key == "datapath") {
      cfg.system.datapath = ExpandHome(value);
    }
    return true;
  }
  if (state.section == "msg") {
    if (key == "origin_line") {
      cfg.msg.origin_line = value;
    } else if (key == "network_tags") {
      cfg.msg.network_tags_configured = true;
      cfg.msg.network_tags = SplitTagList(value);
    } else if (key == "server_tags") {
      cfg.msg.server_tags = SplitTagList(value);
    }
    return true;
  }
  if (state.section.rfind(kNetworkSectionPrefix, 0) == 0) {
    const std::string tag =
        state.section.substr(sizeof(kNetworkSectionPrefix) - 1);
    if (tag.empty()) {
      error = "empty network section name";
      return false;
    }
    NetworkSection& net = cfg.networks[tag];
    if (key == "trans_db_name") {
      net.trans_db_name = value;
    } else if (key == "queue_db_name") {
      net.queue_db_name = value;
    }
    return true;
  }
  if (state.section == "store") {
    if (key == "backend") {
      if (!ParseBackend(value, cfg.store.backend)) {
        error = "unknown store backend: " + value;
        return false;
      }
    } else if (key == "lock_timeout_ms") {
      if (!ParseUint32(value, cfg.store.lock_timeout_ms)) {
        error = "invalid store.lock_timeout_ms";
        return false;
      }
    }
    return true;
  }
  if (state.section == "mysql") {
    if (key == "mysql_ip") {
      cfg.mysql.host = value;
    } else if (key == "mysql_port") {
      if (!ParseUint16(value, cfg.mysql.port)) {
        error = "invalid mysql.mysql_port";
        return false;
      }
    } else if (key == "mysql_database") {
      cfg.mysql.database = value;
    } else if (key == "mysql_username") {
      cfg.mysql.username = value;
    } else if (key == "mysql_password") {
      cfg.mysql.password = value;
    }
    return true;
  }
  if (state.section == "log") {
    if (key == "level" && !platform::log::ParseLevel(value, cfg.log.level)) {
      error = "invalid log.level: " + value;
      return false;
    }
    return true;
  }
  return true;
}

bool ParseIni(const std::string& path, MsgbaseConfig& out, std::string& error) {
  std::ifstream file(path);
  if (!file.is_open()) {
    error = "config file not found: " + path;
    return false;
  }

  IniState state;
  state.cfg = &out;

  std::string line;
  std::size_t line_no = 0;
  while (std::getline(file, line)) {
    ++line_no;
    const std::string trimmed = Trim(line);
    if (trimmed.empty() || trimmed.front() == '#' || trimmed.front() == ';') {
      continue;
    }
    if (trimmed.front() == '[') {
      const std::string header = StripInlineComment(trimmed);
      if (header.back() == ']') {
        state.section = Trim(header.substr(1, header.size() - 2));
        continue;
      }
    }
    const auto pos = trimmed.find('=');
    if (pos == std::string::npos) {
      std::ostringstream oss;
      oss << "invalid line " << line_no;
      error = oss.str();
      return false;
    }
    const std::string key = Trim(trimmed.substr(0, pos));
    std::string value = Trim(trimmed.substr(pos + 1));
    if (!IsVerbatimKey(state.section, key)) {
      value = StripInlineComment(value);
    }
    if (!ApplyKV(state, key, value, error)) {
      std::ostringstream oss;
      oss << error << " (line " << line_no << ")";
      error = oss.str();
      return false;
    }
  }
  return true;
}

bool IsServerTag(const MsgSection& msg, const std::string& tag) {
  return std::find(msg.server_tags.begin(), msg.server_tags.end(), tag) !=
         msg.server_tags.end();
}

}  // namespace

std::vector<std::string> SplitTagList(const std::string& text) {
  std::vector<std::string> out;
  std::string current;
  std::istringstream iss(text);
  while (std::getline(iss, current, ',')) {
    std::string tag = Trim(current);
    if (!tag.empty()) {
      out.push_back(std::move(tag));
    }
  }
  return out;
}

bool ValidateConfig(const MsgbaseConfig& config, std::string& error) {
  if (config.store.backend == StoreBackend::kFile &&
      config.system.datapath.empty()) {
    error = "system.datapath missing for file store";
    return false;
  }
  if (config.store.backend == StoreBackend::kMySQL) {
    const bool ok = !config.mysql.host.empty() && config.mysql.port != 0 &&
                    !config.mysql.database.empty() &&
                    !config.mysql.username.empty() &&
                    !config.mysql.password.empty();
    if (!ok) {
      error = "mysql config incomplete";
      return false;
    }
  }
  if (!config.msg.network_tags_configured) {
    return true;
  }
  for (const auto& tag : config.msg.server_tags) {
    const auto it = config.networks.find(tag);
    if (it == config.networks.end() || it->second.trans_db_name.empty()) {
      error = std::string(kNetworkSectionPrefix) + tag +
              ".trans_db_name missing";
      return false;
    }
    if (!IsValidTableName(it->second.trans_db_name)) {
      error = "invalid table name: " + it->second.trans_db_name;
      return false;
    }
  }
  for (const auto& tag : config.msg.network_tags) {
    if (IsServerTag(config.msg, tag)) {
      continue;
    }
    const auto it = config.networks.find(tag);
    if (it == config.networks.end() || it->second.queue_db_name.empty()) {
      error = std::string(kNetworkSectionPrefix) + tag +
              ".queue_db_name missing";
      return false;
    }
    if (!IsValidTableName(it->second.queue_db_name)) {
      error = "invalid table name: " + it->second.queue_db_name;
      return false;
    }
  }
  return true;
}

bool LoadConfig(const std::string& path, MsgbaseConfig& out_config,
                std::string& error) {
  out_config = MsgbaseConfig{};
  if (!ParseIni(path, out_config, error)) {
    return false;
  }
  if (out_config.store.lock_timeout_ms == 0) {
    out_config.store.lock_timeout_ms = 5000;
  }
  if (!ValidateConfig(out_config, error)) {
    return false;
  }
  platform::log::Log(
      platform::log::Level::kDebug, "config", "config loaded",
      {{"path", path},
       {"backend", BackendName(out_config.store.backend)},
       {"networks", out_config.msg.network_tags_configured ? "on" : "off"}});
  return true;
}

}  // namespace bbs::msgbase
