#ifndef UTIL_MISC_HPP
#define UTIL_MISC_HPP
#include <cstddef>
#include <string>
#include <vector>

namespace util {

// strerror_r wrapper that works with both the GNU and the XSI variant. Safe
// to call after fork().
char* mystrerror(int err, char* buf, size_t buf_size);

// Returns "prefix: <description of err>".
std::string ErrnoMessage(const std::string& prefix, int err);

// Writes value to an existing file (such as a cgroup or /proc control file)
// with a single write(2). Returns false and sets error_msg on failure.
bool WriteControlFile(const std::string& path, const std::string& value,
                      std::string* error_msg);

// Splits a comma separated list, dropping empty items.
std::vector<std::string> SplitList(const std::string& list);

}  // namespace util
#endif
