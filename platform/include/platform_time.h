#ifndef BBS_MSGBASE_PLATFORM_TIME_H
#define BBS_MSGBASE_PLATFORM_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

namespace bbs::platform {

std::uint64_t NowSteadyMs();
void SleepMs(std::uint32_t ms);

std::int64_t ToUnixMicros(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point FromUnixMicros(std::int64_t micros);

// "YYYY-MM-DD HH:MM:SS", in UTC or in the local time zone.
std::string FormatTimestamp(std::chrono::system_clock::time_point tp,
                            bool local);

}  // namespace bbs::platform

#endif  // BBS_MSGBASE_PLATFORM_TIME_H
