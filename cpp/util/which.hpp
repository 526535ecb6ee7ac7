#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which: returns the first executable
// file called cmd in the directories of $PATH, or an empty string. A cmd
// containing a slash is returned as is when it is executable.
// Found commands are cached, unless caching is explicitly disabled.
std::string which(const std::string& cmd, bool use_cache = true);

// Same as which, but searches the directories of search_path (a colon
// separated list) instead of $PATH, without caching.
std::string whichInPath(const std::string& cmd, const std::string& search_path);

}  // namespace util

#endif
