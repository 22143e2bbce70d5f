#include "sandbox/output_capturer.hpp"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <thread>

#include "util/misc.hpp"

namespace {

void CloseFd(int* fd) {
  if (*fd != -1) {
    close(*fd);
    *fd = -1;
  }
}

}  // namespace

namespace sandbox {

OutputCapturer::~OutputCapturer() {
  CloseFd(&stdout_fds_[0]);
  CloseFd(&stdout_fds_[1]);
  CloseFd(&stderr_fds_[0]);
  CloseFd(&stderr_fds_[1]);
}

bool OutputCapturer::Setup(std::string* error_msg) {
  if (pipe2(stdout_fds_, O_CLOEXEC) == -1 ||
      pipe2(stderr_fds_, O_CLOEXEC) == -1) {
    *error_msg = util::ErrnoMessage("pipe2", errno);
    return false;
  }
  if (fcntl(stdout_fds_[0], F_SETFL, O_NONBLOCK) == -1 ||
      fcntl(stderr_fds_[0], F_SETFL, O_NONBLOCK) == -1) {
    *error_msg = util::ErrnoMessage("fcntl", errno);
    return false;
  }
  return true;
}

void OutputCapturer::CloseWriteEnds() {
  CloseFd(&stdout_fds_[1]);
  CloseFd(&stderr_fds_[1]);
}

bool OutputCapturer::Done() const {
  return limit_exceeded_ || (stdout_fds_[0] == -1 && stderr_fds_[0] == -1);
}

bool OutputCapturer::ReadAvailable(int* fd, std::string* out,
                                   std::string* error_msg) {
  char buf[64 * 1024];
  while (*fd != -1 && !limit_exceeded_) {
    ssize_t n = read(*fd, buf, sizeof(buf));
    if (n == -1) {
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
      *error_msg = util::ErrnoMessage("read", errno);
      return false;
    }
    if (n == 0) {
      CloseFd(fd);
      return true;
    }
    if (limit_bytes_ != 0) {
      int64_t remaining = limit_bytes_ - CapturedBytes();
      if (n > remaining) {
        out->append(buf, remaining);
        limit_exceeded_ = true;
        return true;
      }
    }
    out->append(buf, n);
  }
  return true;
}

bool OutputCapturer::Drain(std::chrono::milliseconds timeout,
                           std::string* error_msg) {
  if (Done()) {
    std::this_thread::sleep_for(timeout);
    return true;
  }
  struct pollfd fds[2];
  nfds_t nfds = 0;
  for (int fd : {stdout_fds_[0], stderr_fds_[0]}) {
    if (fd == -1) continue;
    fds[nfds].fd = fd;
    fds[nfds].events = POLLIN;
    fds[nfds].revents = 0;
    nfds++;
  }
  int ret = poll(fds, nfds, static_cast<int>(timeout.count()));
  if (ret == -1) {
    if (errno == EINTR) return true;
    *error_msg = util::ErrnoMessage("poll", errno);
    return false;
  }
  if (ret == 0) return true;
  if (!ReadAvailable(&stdout_fds_[0], &stdout_, error_msg)) return false;
  return ReadAvailable(&stderr_fds_[0], &stderr_, error_msg);
}

}  // namespace sandbox
