#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP
#include <cerrno>
#include <cstdint>
#include <string>
#include <system_error>

namespace util {

class file_exists : public std::system_error {
 public:
  explicit file_exists(const std::string& msg)
      : std::system_error(EEXIST, std::system_category(), msg) {}
};

class file_not_found : public std::system_error {
 public:
  explicit file_not_found(const std::string& msg)
      : std::system_error(ENOENT, std::system_category(), msg) {}
};

static const constexpr uint32_t kChunkSize = 32 * 1024;

class File {
 public:
  // Reads the whole file specified by path.
  static std::string Read(const std::string& path);

  // Writes contents to path, creating the missing parent directories.
  static void Write(const std::string& path, const std::string& contents,
                    bool overwrite = false);

  // Creates all the folder that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Returns true if something exists at the given path.
  static bool Exists(const std::string& path);
};

// A uniquely named directory that is removed, with its contents, when the
// object goes out of scope. Directories that were made unreadable or
// unwritable inside it are removed too.
class TempDir {
 public:
  explicit TempDir(const std::string& base);
  const std::string& Path() const;
  // Removes the directory now, reporting failures as exceptions.
  void Remove();
  ~TempDir();

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;
  TempDir(TempDir&&) = delete;
  TempDir& operator=(TempDir&&) = delete;

 private:
  std::string path_;
  bool removed_ = false;
};

}  // namespace util

#endif
