#include "platform_time.h"

#include <ctime>
#include <thread>

namespace bbs::platform {

std::uint64_t NowSteadyMs() {
  static const auto kStart = std::chrono::steady_clock::now();
  const auto now = std::chrono::steady_clock::now();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(now - kStart)
          .count());
}

void SleepMs(std::uint32_t ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

std::int64_t ToUnixMicros(std::chrono::system_clock::time_point tp) {
  return static_cast<std::int64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(
          tp.time_since_epoch())
          .count());
}

std::chrono::system_clock::time_point FromUnixMicros(std::int64_t micros) {
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          std::chrono::microseconds(micros)));
}

std::string FormatTimestamp(std::chrono::system_clock::time_point tp,
                            bool local) {
  const std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm parts{};
  if (local) {
    if (::localtime_r(&t, &parts) == nullptr) {
      return {};
    }
  } else if (::gmtime_r(&t, &parts) == nullptr) {
    return {};
  }
  char buf[32];
  const std::size_t n =
      std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &parts);
  return std::string(buf, n);
}

}  // namespace bbs::platform
