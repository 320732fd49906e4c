#ifndef BBS_MSGBASE_PLATFORM_FS_H
#define BBS_MSGBASE_PLATFORM_FS_H

#include <cstdint>
#include <filesystem>
#include <system_error>
#include <vector>

namespace bbs::platform::fs {

bool Exists(const std::filesystem::path& path, std::error_code& ec);
bool CreateDirectories(const std::filesystem::path& path,
                       std::error_code& ec);
bool ListDir(const std::filesystem::path& path,
             std::vector<std::filesystem::path>& out,
             std::error_code& ec);
bool ReadFile(const std::filesystem::path& path,
              std::vector<std::uint8_t>& out,
              std::error_code& ec);
// Writes a sibling temp file, fsyncs it and renames it over `path`.
bool AtomicWrite(const std::filesystem::path& path,
                 const std::uint8_t* data,
                 std::size_t len,
                 std::error_code& ec);

enum class FileLockStatus {
  kOk = 0,
  kBusy = 1,
  kFailed = 2,
};

// flock(2) held on an open descriptor; released by ReleaseFileLock.
struct FileLock {
  int fd{-1};
};

FileLockStatus AcquireExclusiveFileLock(const std::filesystem::path& path,
                                        FileLock& out);
void ReleaseFileLock(FileLock& lock);

}  // namespace bbs::platform::fs

#endif  // BBS_MSGBASE_PLATFORM_FS_H
