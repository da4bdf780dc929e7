#include "util/AtomicFile.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace warden::util {

static bool fail(std::string* err, const std::string& what, int e) {
  if (err) *err = what + ": " + std::strerror(e);
  return false;
}

bool write_file_atomic(const std::filesystem::path& path, const std::string& content,
                       mode_t mode, std::string* err) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      if (err) *err = "create " + path.parent_path().string() + ": " + ec.message();
      return false;
    }
  }

  auto tmp = path;
  tmp += ".tmp." + std::to_string(::getpid());
  int fd = ::open(tmp.c_str(), O_CREAT | O_TRUNC | O_WRONLY | O_CLOEXEC, mode);
  if (fd < 0) return fail(err, "open " + tmp.string(), errno);
  // open() honours umask; make the requested mode exact
  if (::fchmod(fd, mode) != 0) {
    int e = errno;
    ::close(fd);
    ::unlink(tmp.c_str());
    return fail(err, "chmod " + tmp.string(), e);
  }

  const char* p = content.data();
  size_t left = content.size();
  while (left > 0) {
    ssize_t n = ::write(fd, p, left);
    if (n < 0) {
      if (errno == EINTR) continue;
      int e = errno;
      ::close(fd);
      ::unlink(tmp.c_str());
      return fail(err, "write " + tmp.string(), e);
    }
    p += n;
    left -= static_cast<size_t>(n);
  }
  if (::fsync(fd) != 0) {
    int e = errno;
    ::close(fd);
    ::unlink(tmp.c_str());
    return fail(err, "fsync " + tmp.string(), e);
  }
  if (::close(fd) != 0) {
    int e = errno;
    ::unlink(tmp.c_str());
    return fail(err, "close " + tmp.string(), e);
  }
  if (::rename(tmp.c_str(), path.c_str()) != 0) {
    int e = errno;
    ::unlink(tmp.c_str());
    return fail(err, "rename to " + path.string(), e);
  }
  return true;
}

} // namespace warden::util
