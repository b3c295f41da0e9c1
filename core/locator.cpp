#include "core/locator.hpp"

#include "glog/logging.h"
#include "util/file.hpp"

namespace core {

std::string ExtensionOf(const std::string& name) {
  // Leading dots mark hidden files, not extensions.
  size_t start = name.find_first_not_of('.');
  if (start == std::string::npos) return "";
  size_t pos = name.find_last_of('.');
  if (pos == std::string::npos || pos < start) return "";
  return name.substr(pos);
}

absl::optional<SnippetReference> Locate(const std::string& workspace,
                                        const ExtensionRegistry& registry) {
  std::string root = util::File::Absolute(workspace);
  for (const std::string& name : util::File::ListDir(root)) {
    std::string path = util::File::JoinPath(root, name);
    if (!util::File::IsRegularFile(path)) {
      VLOG(1) << "Skipping " << path << ": not a regular file";
      continue;
    }
    std::string extension = ExtensionOf(name);
    if (!registry.Contains(extension)) {
      VLOG(1) << "Skipping " << path << ": unknown extension";
      continue;
    }
    return SnippetReference{path, extension};
  }
  return absl::nullopt;
}

}  // namespace core
