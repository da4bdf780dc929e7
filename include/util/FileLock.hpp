// Sentinel-file advisory lock shared by independent warden instances.
//
// The lock is a file created with O_CREAT|O_EXCL that holds the owner's pid as
// text. A waiter that finds the file present removes it when it is older than
// stale_after, when its pid is no longer alive, or when it stays unreadable;
// otherwise it sleeps retry_interval and tries again, max_retries times, then
// throws LockTimeout. Works on network and container-mounted volumes where
// flock/fcntl locks are unreliable.
#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <sys/types.h>

namespace warden::util {

class LockError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class LockTimeout : public LockError {
public:
  using LockError::LockError;
};

struct FileLockOptions {
  std::chrono::milliseconds stale_after{30000};
  std::chrono::milliseconds retry_interval{100};
  int max_retries{50};
  // Liveness check for the pid recorded in a contended lock. Default: kill(pid, 0).
  std::function<bool(int32_t)> is_alive;
};

class FileLock {
public:
  explicit FileLock(std::filesystem::path path, FileLockOptions opts = {});
  ~FileLock();
  FileLock(const FileLock&) = delete;
  FileLock& operator=(const FileLock&) = delete;

  // Blocks (bounded) until held. Throws LockTimeout or LockError.
  void acquire();
  // No-op if not held.
  void release();
  [[nodiscard]] bool held() const { return held_; }
  [[nodiscard]] const std::filesystem::path& path() const { return path_; }
  [[nodiscard]] const FileLockOptions& options() const { return opts_; }

private:
  bool try_create();
  bool break_if_stale();

  std::filesystem::path path_;
  FileLockOptions opts_;
  bool held_{false};
  ino_t held_ino_{0};
};

// Holds a FileLock for the guard's lifetime.
class FileLockGuard {
public:
  explicit FileLockGuard(FileLock& lock) : lock_(lock) { lock_.acquire(); }
  ~FileLockGuard() { lock_.release(); }
  FileLockGuard(const FileLockGuard&) = delete;
  FileLockGuard& operator=(const FileLockGuard&) = delete;
private:
  FileLock& lock_;
};

// kill(pid, 0) based existence check; EPERM counts as alive.
[[nodiscard]] bool pid_exists(int32_t pid);

} // namespace warden::util
