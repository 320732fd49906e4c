#ifndef BBS_MSGBASE_ERRORS_H
#define BBS_MSGBASE_ERRORS_H

#include <cstdint>
#include <string>
#include <utility>

namespace bbs::msgbase {

enum class ErrorKind : std::uint8_t {
  kNone = 0,
  kNotFound = 1,
  kStoreUnavailable = 2,
  kCorruptRecord = 3,
  kThreadCycle = 4,
  kConfig = 5,
  kInvalidMessage = 6
};

struct Error {
  ErrorKind kind{ErrorKind::kNone};
  std::string message;

  void Set(ErrorKind k, std::string text) {
    kind = k;
    message = std::move(text);
  }
  void Clear() {
    kind = ErrorKind::kNone;
    message.clear();
  }
};

inline const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone:
      return "none";
    case ErrorKind::kNotFound:
      return "not_found";
    case ErrorKind::kStoreUnavailable:
      return "store_unavailable";
    case ErrorKind::kCorruptRecord:
      return "corrupt_record";
    case ErrorKind::kThreadCycle:
      return "thread_cycle";
    case ErrorKind::kConfig:
      return "config";
    case ErrorKind::kInvalidMessage:
      return "invalid_message";
  }
  return "unknown";
}

}  // namespace bbs::msgbase

#endif  // BBS_MSGBASE_ERRORS_H
