#include "platform_log.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

namespace bbs::platform::log {

namespace {

std::mutex g_log_mutex;
LogCallback g_log_cb = nullptr;
void* g_log_user = nullptr;
Level g_min_level = Level::kInfo;

std::string ToLowerAscii(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

void DefaultLog(Level level,
                std::string_view tag,
                std::string_view message,
                const Field* fields,
                std::size_t field_count) {
  std::string line;
  line.reserve(64 + message.size() + field_count * 16);
  line.append("[bbs_msgbase] ");
  line.append(LevelName(level));
  if (!tag.empty()) {
    line.push_back(' ');
    line.append(tag.data(), tag.size());
  }
  line.append(": ");
  line.append(message.data(), message.size());
  for (std::size_t i = 0; i < field_count; ++i) {
    const auto& field = fields[i];
    if (field.key.empty()) {
      continue;
    }
    line.push_back(' ');
    line.append(field.key.data(), field.key.size());
    line.push_back('=');
    line.append(field.value.data(), field.value.size());
  }
  line.push_back('\n');
  FILE* out = (level == Level::kError || level == Level::kWarn) ? stderr : stdout;
  std::fwrite(line.data(), 1, line.size(), out);
  std::fflush(out);
}

}  // namespace

void SetLogCallback(LogCallback cb, void* user_data) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  g_log_cb = cb;
  g_log_user = user_data;
}

void SetMinLevel(Level level) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  g_min_level = level;
}

Level MinLevel() {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  return g_min_level;
}

bool ParseLevel(std::string_view text, Level& out) {
  const std::string lower = ToLowerAscii(text);
  if (lower == "debug") {
    out = Level::kDebug;
  } else if (lower == "info") {
    out = Level::kInfo;
  } else if (lower == "warn" || lower == "warning") {
    out = Level::kWarn;
  } else if (lower == "error") {
    out = Level::kError;
  } else {
    return false;
  }
  return true;
}

const char* LevelName(Level level) {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
  }
  return "INFO";
}

void Log(Level level, std::string_view tag, std::string_view message) {
  Log(level, tag, message, {});
}

void Log(Level level,
         std::string_view tag,
         std::string_view message,
         std::initializer_list<Field> fields) {
  LogCallback cb = nullptr;
  void* user = nullptr;
  {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (static_cast<std::uint8_t>(level) <
        static_cast<std::uint8_t>(g_min_level)) {
      return;
    }
    cb = g_log_cb;
    user = g_log_user;
  }

  const std::string tag_copy(tag);
  const std::string msg_copy(message);
  std::vector<std::string> redacted_values;
  std::vector<Field> safe_fields;
  redacted_values.reserve(fields.size());
  safe_fields.reserve(fields.size());
  for (const auto& field : fields) {
    redacted_values.push_back(RedactValue(field.key, field.value));
  }
  std::size_t i = 0;
  for (const auto& field : fields) {
    safe_fields.push_back(Field{field.key, redacted_values[i++]});
  }

  if (cb) {
    cb(level, tag_copy.c_str(), msg_copy.c_str(), safe_fields.data(),
       safe_fields.size(), user);
    return;
  }
  DefaultLog(level, tag_copy, msg_copy, safe_fields.data(), safe_fields.size());
}

bool IsSensitiveKey(std::string_view key) {
  if (key.empty()) {
    return false;
  }
  const std::string lower = ToLowerAscii(key);
  return lower.find("password") != std::string::npos ||
         lower.find("token") != std::string::npos ||
         lower.find("secret") != std::string::npos;
}

std::string RedactValue(std::string_view key, std::string_view value) {
  if (IsSensitiveKey(key)) {
    return "***";
  }
  return std::string(value);
}

}  // namespace bbs::platform::log
