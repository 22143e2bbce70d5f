#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Returns the full path of cmd as found in the directories listed in PATH,
// or an empty string if it cannot be found. Results are cached unless
// use_cache is false.
std::string which(const std::string& cmd, bool use_cache = true);

// Like which, but searches the given colon separated list of directories
// instead of PATH. Results are not cached.
std::string which_in(const std::string& cmd, const std::string& path);

}  // namespace util

#endif
