#include "util/which.hpp"

#include <cstdlib>
#include <stdexcept>
#include <unordered_map>
#include <vector>

#include <unistd.h>

#include "absl/strings/str_split.h"
#include "util/file.hpp"

namespace {
std::unordered_map<std::string, std::string> cmd_cache;

bool is_executable(const std::string& path) {
  return util::File::IsRegularFile(path) && access(path.c_str(), X_OK) == 0;
}
}  // namespace

namespace util {

std::string which(const std::string& cmd, bool use_cache) {
  if (use_cache && cmd_cache.count(cmd) > 0) return cmd_cache[cmd];

  const char* path = std::getenv("PATH");
  if (path == nullptr) throw std::runtime_error("PATH is not set");
  std::vector<std::string> dirs = absl::StrSplit(path, ':', absl::SkipEmpty());

  for (const std::string& dir : dirs) {
    std::string fullpath = util::File::JoinPath(dir, cmd);
    if (is_executable(fullpath)) {
      if (use_cache) cmd_cache[cmd] = fullpath;
      return fullpath;
    }
  }
  return "";
}

}  // namespace util
