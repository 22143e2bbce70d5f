#include "sandbox/polling_limiter.hpp"

#include <dirent.h>
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "glog/logging.h"

namespace {

// Reads the session id and the resident set size (in pages) of a process
// from /proc/<pid>/stat. Returns false if the process is gone.
bool ReadProcStat(pid_t pid, pid_t* session, long* rss_pages) {  // NOLINT
  char path[64] = {};
  snprintf(path, sizeof(path), "/proc/%d/stat", pid);  // NOLINT
  int fd = open(path, O_RDONLY | O_CLOEXEC);
  if (fd == -1) return false;
  char buf[4096] = {};
  ssize_t num_read = 0;
  do {
    num_read = read(fd, buf, sizeof(buf) - 1);
  } while (num_read == -1 && errno == EINTR);
  close(fd);
  if (num_read <= 0) return false;
  // The command name may contain spaces and parentheses: the fields we need
  // start after the last ')'.
  const char* fields = strrchr(buf, ')');
  if (fields == nullptr) return false;
  int sid = 0;
  if (sscanf(fields + 1,  // NOLINT
             " %*c %*d %*d %d %*d %*d %*u %*u %*u %*u %*u %*u %*u %*d %*d %*d "
             "%*d %*d %*d %*u %*u %ld",
             &sid, rss_pages) != 2) {
    return false;
  }
  *session = sid;
  return true;
}

}  // namespace

namespace sandbox {

bool PollingLimiter::Setup(const ExecutionOptions& options,
                           std::string* /*error_msg*/) {
  memory_limit_bytes_ = options.memory_limit_bytes;
  max_procs_ = options.max_procs > 0 ? options.max_procs : 0;
  return true;
}

bool PollingLimiter::Attach(pid_t pid, std::string* /*error_msg*/) {
  // The child becomes the leader of a new session before running the
  // program, so its pid identifies the whole process tree.
  session_ = pid;
  return true;
}

std::vector<pid_t> PollingLimiter::SessionMembers(int64_t* rss_bytes) const {
  std::vector<pid_t> members;
  *rss_bytes = 0;
  if (session_ == 0) return members;
  DIR* proc = opendir("/proc");
  if (proc == nullptr) {
    PLOG(WARNING) << "opendir /proc";
    return members;
  }
  static const long page_size = sysconf(_SC_PAGESIZE);  // NOLINT
  struct dirent* entry = nullptr;
  while ((entry = readdir(proc)) != nullptr) {
    char* end = nullptr;
    long pid = strtol(entry->d_name, &end, 10);  // NOLINT
    if (*end != '\0' || pid <= 0) continue;
    pid_t session = 0;
    long rss_pages = 0;  // NOLINT
    if (!ReadProcStat(pid, &session, &rss_pages)) continue;
    if (session != session_) continue;
    members.push_back(pid);
    *rss_bytes += static_cast<int64_t>(rss_pages) * page_size;
  }
  closedir(proc);
  return members;
}

bool PollingLimiter::MemoryExceeded() {
  int64_t rss_bytes = 0;
  processes_ = SessionMembers(&rss_bytes).size();
  if (rss_bytes > peak_memory_bytes_) peak_memory_bytes_ = rss_bytes;
  VLOG(1) << "Session " << session_ << " has " << processes_
          << " processes using " << rss_bytes << " bytes";
  return memory_limit_bytes_ != 0 && rss_bytes > memory_limit_bytes_;
}

bool PollingLimiter::KillAll() {
  int64_t rss_bytes = 0;
  for (pid_t pid : SessionMembers(&rss_bytes)) {
    if (kill(pid, SIGKILL) == -1 && errno != ESRCH) {
      PLOG(WARNING) << "kill " << pid;
    }
  }
  return true;
}

int PollingLimiter::Score() {
  return access("/proc/self/stat", R_OK) == 0 ? 1 : -1;
}

namespace {
Limiter::Register<PollingLimiter> r;  // NOLINT
}  // namespace

}  // namespace sandbox
