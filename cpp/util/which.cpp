#include "util/which.hpp"
#include <sys/stat.h>
#include <unistd.h>
#include <cstdlib>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "util/file.hpp"
#include "util/misc.hpp"

namespace {
std::mutex cmd_cache_mutex;
std::unordered_map<std::string, std::string> cmd_cache;

bool IsExecutable(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) return false;
  return access(path.c_str(), X_OK) == 0;
}
}  // namespace

namespace util {

std::string which(const std::string& cmd, bool use_cache) {
  if (cmd.find('/') != std::string::npos) {
    return IsExecutable(cmd) ? cmd : "";
  }
  if (use_cache) {
    std::lock_guard<std::mutex> lck(cmd_cache_mutex);
    if (cmd_cache.count(cmd) > 0) return cmd_cache[cmd];
  }

  const char* path = std::getenv("PATH");
  if (path == nullptr) return "";
  std::string fullpath = whichInPath(cmd, path);
  if (!fullpath.empty()) {
    std::lock_guard<std::mutex> lck(cmd_cache_mutex);
    cmd_cache[cmd] = fullpath;
  }
  return fullpath;
}

std::string whichInPath(const std::string& cmd,
                        const std::string& search_path) {
  if (cmd.find('/') != std::string::npos) {
    return IsExecutable(cmd) ? cmd : "";
  }
  for (const std::string& dir : split(search_path, ':')) {
    std::string fullpath = File::JoinPath(dir, cmd);
    if (IsExecutable(fullpath)) return fullpath;
  }
  return "";
}

}  // namespace util
