#include "util/file.hpp"

#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>

#include "glog/logging.h"

namespace {

static const constexpr char* kPathSeparators = "/";

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

thread_local int unreadable_dirs = 0;

// Returns errno, or 0 on success.
int OsRemoveTree(const std::string& path) {
  // First make every directory traversable again: the executed code may have
  // removed the permissions on the directories it created. Directories that
  // could not be read are only fixed after they are visited, so the walk is
  // repeated until none is left.
  const constexpr int kMaxPasses = 16;
  for (int pass = 0; pass < kMaxPasses; pass++) {
    unreadable_dirs = 0;
    if (nftw(path.c_str(),
             [](const char* fpath, const struct stat* /*sb*/, int typeflag,
                struct FTW* /*ftwbuf*/) {
               if (typeflag == FTW_DNR) unreadable_dirs++;
               if (typeflag == FTW_D || typeflag == FTW_DNR) {
                 chmod(fpath, S_IRWXU);
               }
               return 0;
             },
             64, FTW_PHYS | FTW_MOUNT) == -1) {
      return errno;
    }
    if (unreadable_dirs == 0) break;
  }
  if (nftw(path.c_str(),
           [](const char* fpath, const struct stat* /*sb*/, int /*typeflag*/,
              struct FTW* /*ftwbuf*/) { return remove(fpath); },
           64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) == -1) {
    return errno;
  }
  return 0;
}

std::string OsTempDir(const std::string& path) {
  std::string tmp = util::File::JoinPath(path, "XXXXXX");
  std::unique_ptr<char, decltype(&free)> data{strdup(tmp.c_str()), &free};
  if (mkdtemp(data.get()) == nullptr) {
    return "";
  }
  return data.get();
}

// Returns errno, or 0 on success.
int OsRead(const std::string& path, std::string* contents) {
  int fd = open(path.c_str(), O_CLOEXEC | O_RDONLY);
  if (fd == -1) return errno;
  char buf[util::kChunkSize] = {};
  ssize_t amount;
  while ((amount = read(fd, buf, util::kChunkSize)) != 0) {
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) break;
    contents->append(buf, amount);
  }
  if (amount == -1) {
    int error = errno;
    close(fd);
    return error;
  }
  return close(fd) == -1 ? errno : 0;
}

// Returns errno, or 0 on success.
int OsWrite(const std::string& path, const std::string& contents,
            bool overwrite) {
  int flags = O_WRONLY | O_CREAT | O_CLOEXEC | O_NOFOLLOW;
  flags |= overwrite ? O_TRUNC : O_EXCL;
  int fd = open(path.c_str(), flags, S_IRUSR | S_IWUSR);
  if (fd == -1) return errno;
  size_t pos = 0;
  while (pos < contents.size()) {
    ssize_t written = write(fd, contents.data() + pos, contents.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) {
      int error = errno;
      close(fd);
      return error;
    }
    pos += written;
  }
  return close(fd) == -1 ? errno : 0;
}

}  // namespace

namespace util {

std::string File::Read(const std::string& path) {
  std::string contents;
  int err = OsRead(path, &contents);
  if (err == ENOENT) throw file_not_found("Read " + path);
  if (err) throw std::system_error(err, std::system_category(), "Read " + path);
  return contents;
}

void File::Write(const std::string& path, const std::string& contents,
                 bool overwrite) {
  MakeDirs(BaseDir(path));
  int err = OsWrite(path, contents, overwrite);
  if (err == EEXIST) throw file_exists("Write " + path);
  if (err) throw std::system_error(err, std::system_category(), path);
}

void File::MakeDirs(const std::string& path) {
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(),
                              "mkdir " + path.substr(0, pos));
    }
  }
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (!second.empty() && strchr(kPathSeparators, second[0])) return second;
  if (!first.empty() && strchr(kPathSeparators, first.back()))
    return first + second;
  return first + kPathSeparators[0] + second;
}

std::string File::BaseDir(const std::string& path) {
  size_t pos = path.find_last_of(kPathSeparators);
  if (pos == std::string::npos) return ".";
  if (pos == 0) return "/";
  return path.substr(0, pos);
}

bool File::Exists(const std::string& path) {
  struct stat buffer {};
  return lstat(path.c_str(), &buffer) == 0;
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  path_ = OsTempDir(base);
  if (path_.empty())
    throw std::system_error(errno, std::system_category(), "mkdtemp " + base);
}

const std::string& TempDir::Path() const { return path_; }

void TempDir::Remove() {
  if (removed_) return;
  removed_ = true;
  int err = OsRemoveTree(path_);
  if (err != 0 && err != ENOENT) {
    throw std::system_error(err, std::system_category(),
                            "removetree " + path_);
  }
}

TempDir::~TempDir() {
  try {
    Remove();
  } catch (const std::system_error& e) {
    LOG(ERROR) << "Unable to remove " << path_ << ": " << e.what();
  }
}

}  // namespace util
