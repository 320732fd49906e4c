#include "platform_fs.h"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <fstream>
#include <iterator>
#include <string>

namespace bbs::platform::fs {

namespace {

constexpr int kMaxTempAttempts = 16;

std::atomic<unsigned> g_temp_seq{0};

std::error_code LastError() {
  return std::error_code(errno, std::generic_category());
}

// ".<name>.tmp.<pid>.<seq>" next to the target, never ending in the
// target's own extension.
std::filesystem::path TempSibling(const std::filesystem::path& target) {
  std::string name = target.filename().string();
  if (name.empty()) {
    name = "tmp";
  }
  name = "." + name + ".tmp." + std::to_string(::getpid()) + "." +
         std::to_string(g_temp_seq.fetch_add(1));
  return target.has_parent_path() ? target.parent_path() / name
                                  : std::filesystem::path(name);
}

bool WriteFully(int fd, const std::uint8_t* data, std::size_t len,
                std::error_code& ec) {
  while (len > 0) {
    const ssize_t n = ::write(fd, data, len);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      ec = LastError();
      return false;
    }
    data += n;
    len -= static_cast<std::size_t>(n);
  }
  return true;
}

// Fills and syncs `tmp`; the file is removed again on any failure.
bool FillTemp(int fd, const std::filesystem::path& tmp,
              const std::uint8_t* data, std::size_t len,
              std::error_code& ec) {
  bool ok = WriteFully(fd, data, len, ec);
  if (ok && ::fsync(fd) != 0) {
    ec = LastError();
    ok = false;
  }
  if (::close(fd) != 0 && ok) {
    ec = LastError();
    ok = false;
  }
  if (!ok) {
    std::error_code rm_ec;
    std::filesystem::remove(tmp, rm_ec);
  }
  return ok;
}

void SyncDir(const std::filesystem::path& dir) {
  const int fd = ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY);
  if (fd < 0) {
    return;
  }
  (void)::fsync(fd);
  (void)::close(fd);
}

}  // namespace

bool Exists(const std::filesystem::path& path, std::error_code& ec) {
  return std::filesystem::exists(path, ec);
}

bool CreateDirectories(const std::filesystem::path& path,
                       std::error_code& ec) {
  std::filesystem::create_directories(path, ec);
  return !ec;
}

bool ListDir(const std::filesystem::path& path,
             std::vector<std::filesystem::path>& out,
             std::error_code& ec) {
  out.clear();
  for (std::filesystem::directory_iterator it(path, ec), end;
       !ec && it != end; it.increment(ec)) {
    out.push_back(it->path());
  }
  if (ec) {
    out.clear();
    return false;
  }
  return true;
}

bool ReadFile(const std::filesystem::path& path,
              std::vector<std::uint8_t>& out,
              std::error_code& ec) {
  out.clear();
  ec.clear();
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    ec = std::make_error_code(std::errc::no_such_file_or_directory);
    return false;
  }
  out.assign(std::istreambuf_iterator<char>(in),
             std::istreambuf_iterator<char>());
  if (in.bad()) {
    out.clear();
    ec = std::make_error_code(std::errc::io_error);
    return false;
  }
  return true;
}

bool AtomicWrite(const std::filesystem::path& path,
                 const std::uint8_t* data,
                 std::size_t len,
                 std::error_code& ec) {
  ec.clear();
  if (path.empty() || (len > 0 && !data)) {
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }
  for (int attempt = 0; attempt < kMaxTempAttempts; ++attempt) {
    const auto tmp = TempSibling(path);
    const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0600);
    if (fd < 0) {
      if (errno == EEXIST) {
        continue;
      }
      ec = LastError();
      return false;
    }
    if (!FillTemp(fd, tmp, data, len, ec)) {
      return false;
    }
    if (::rename(tmp.c_str(), path.c_str()) != 0) {
      ec = LastError();
      std::error_code rm_ec;
      std::filesystem::remove(tmp, rm_ec);
      return false;
    }
    SyncDir(path.parent_path());
    return true;
  }
  ec = std::make_error_code(std::errc::file_exists);
  return false;
}

FileLockStatus AcquireExclusiveFileLock(const std::filesystem::path& path,
                                        FileLock& out) {
  out.fd = -1;
  if (path.empty()) {
    return FileLockStatus::kFailed;
  }
  const int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
  if (fd < 0) {
    return FileLockStatus::kFailed;
  }
  if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
    const bool busy = errno == EWOULDBLOCK;
    ::close(fd);
    return busy ? FileLockStatus::kBusy : FileLockStatus::kFailed;
  }
  out.fd = fd;
  return FileLockStatus::kOk;
}

void ReleaseFileLock(FileLock& lock) {
  if (lock.fd < 0) {
    return;
  }
  (void)::flock(lock.fd, LOCK_UN);
  (void)::close(lock.fd);
  lock.fd = -1;
}

}  // namespace bbs::platform::fs
