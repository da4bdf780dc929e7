#include "util/FileLock.hpp"
#include "util/Log.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <charconv>
#include <cstring>
#include <string>
#include <thread>

namespace warden::util {

bool pid_exists(int32_t pid) {
  if (pid <= 0) return false;
  if (::kill(pid, 0) == 0) return true;
  return errno == EPERM;
}

FileLock::FileLock(std::filesystem::path path, FileLockOptions opts)
    : path_(std::move(path)), opts_(std::move(opts)) {
  if (!opts_.is_alive) opts_.is_alive = &pid_exists;
  if (opts_.max_retries < 1) opts_.max_retries = 1;
}

FileLock::~FileLock() { release(); }

bool FileLock::try_create() {
  int fd = ::open(path_.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
  if (fd < 0) {
    if (errno == EEXIST) return false;
    throw LockError("cannot create lock " + path_.string() + ": " + std::strerror(errno));
  }
  std::string pid = std::to_string(::getpid());
  ssize_t n = ::write(fd, pid.data(), pid.size());
  int write_errno = errno;
  struct stat st{};
  if (::fstat(fd, &st) != 0) st.st_ino = 0; // release() then leaves the file alone
  ::close(fd);
  if (n != static_cast<ssize_t>(pid.size())) {
    ::unlink(path_.c_str());
    throw LockError("cannot write lock " + path_.string() + ": " + std::strerror(write_errno));
  }
  held_ino_ = st.st_ino;
  return true;
}

// Returns true when the existing lock was removed (or vanished) and creation
// should be retried immediately.
bool FileLock::break_if_stale() {
  struct stat st{};
  if (::stat(path_.c_str(), &st) != 0) {
    return errno == ENOENT; // released between our open and stat
  }

  auto mtime = std::chrono::system_clock::time_point(
      std::chrono::seconds(st.st_mtim.tv_sec) + std::chrono::nanoseconds(st.st_mtim.tv_nsec));
  auto age = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now() - mtime);

  int32_t owner = 0;
  bool parsed = false;
  {
    char buf[32]{};
    int fd = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd >= 0) {
      ssize_t n = ::read(fd, buf, sizeof(buf) - 1);
      ::close(fd);
      if (n > 0) {
        const char* end = buf + n;
        while (end > buf && (end[-1] == '\n' || end[-1] == ' ')) --end;
        auto [ptr, ec] = std::from_chars(buf, end, owner);
        parsed = (ec == std::errc() && ptr == end && owner > 0);
      }
    }
  }

  const char* why = nullptr;
  if (age > opts_.stale_after) why = "older than stale threshold";
  else if (parsed && !opts_.is_alive(owner)) why = "owner no longer alive";
  // An empty file may be a lock whose owner has not written its pid yet.
  else if (!parsed && age > std::chrono::seconds(1)) why = "unreadable";
  if (!why) return false;

  // Only remove the file we judged; a fresh lock under the same name is left alone.
  struct stat again{};
  if (::stat(path_.c_str(), &again) != 0) return errno == ENOENT;
  if (again.st_ino != st.st_ino) return true;
  if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
    throw LockError("cannot remove stale lock " + path_.string() + ": " + std::strerror(errno));
  }
  log_warn("FileLock", "removed stale lock %s (pid %d, age %lldms, %s)", path_.c_str(), owner,
           static_cast<long long>(age.count()), why);
  return true;
}

void FileLock::acquire() {
  if (held_) return;
  std::error_code ec;
  std::filesystem::create_directories(path_.parent_path(), ec);
  if (ec) throw LockError("cannot create " + path_.parent_path().string() + ": " + ec.message());

  for (int attempt = 0; attempt < opts_.max_retries; ++attempt) {
    if (try_create()) {
      held_ = true;
      return;
    }
    if (break_if_stale()) continue;
    std::this_thread::sleep_for(opts_.retry_interval);
  }
  throw LockTimeout("failed to acquire lock " + path_.string() + " after " +
                    std::to_string(opts_.max_retries) + " attempts");
}

void FileLock::release() {
  if (!held_) return;
  held_ = false;
  struct stat st{};
  if (::stat(path_.c_str(), &st) != 0) {
    log_warn("FileLock", "lock %s vanished while held", path_.c_str());
    return;
  }
  if (st.st_ino != held_ino_) {
    log_warn("FileLock", "lock %s was taken over while held; leaving it", path_.c_str());
    return;
  }
  if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
    log_error("FileLock", "failed to remove %s: %s", path_.c_str(), std::strerror(errno));
  }
}

} // namespace warden::util
