#include "util/misc.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "absl/strings/str_split.h"

namespace util {

char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

std::string ErrnoMessage(const std::string& prefix, int err) {
  static const constexpr size_t kStrErrorBufSize = 2048;
  char buf[kStrErrorBufSize] = {};
  return prefix + ": " + mystrerror(err, buf, kStrErrorBufSize);
}

bool WriteControlFile(const std::string& path, const std::string& value,
                      std::string* error_msg) {
  int fd = open(path.c_str(), O_WRONLY | O_CLOEXEC);
  if (fd == -1) {
    *error_msg = ErrnoMessage("open " + path, errno);
    return false;
  }
  ssize_t written;
  do {
    written = write(fd, value.data(), value.size());
  } while (written == -1 && errno == EINTR);
  if (written != static_cast<ssize_t>(value.size())) {
    *error_msg = ErrnoMessage("write " + path, written == -1 ? errno : EIO);
    close(fd);
    return false;
  }
  if (close(fd) == -1) {
    *error_msg = ErrnoMessage("close " + path, errno);
    return false;
  }
  return true;
}

std::vector<std::string> SplitList(const std::string& list) {
  return absl::StrSplit(list, ',', absl::SkipWhitespace());
}

}  // namespace util
