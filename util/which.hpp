#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which: returns the first executable
// named cmd in the directories of PATH, or an empty string. Throws if PATH is
// not set. Found paths are cached unless use_cache is false; a cached entry is
// returned even if the file has been removed since.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
