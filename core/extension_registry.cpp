#include "core/extension_registry.hpp"

#include <stdexcept>

#include "absl/strings/str_cat.h"

namespace core {

ExtensionRegistry::ExtensionRegistry(std::map<std::string, Command> commands)
    : commands_(std::move(commands)) {
  for (const auto& entry : commands_) {
    const std::string& extension = entry.first;
    if (extension.empty() || extension[0] != '.') {
      throw std::invalid_argument(
          absl::StrCat("Invalid extension \"", extension, "\""));
    }
    if (entry.second.empty()) {
      throw std::invalid_argument(
          absl::StrCat("Empty command for extension ", extension));
    }
    for (const std::string& token : entry.second) {
      if (token.empty()) {
        throw std::invalid_argument(
            absl::StrCat("Empty token in command for extension ", extension));
      }
    }
  }
}

ExtensionRegistry ExtensionRegistry::Default() {
  return ExtensionRegistry({
      {".py", {"python3"}},
      {".sh", {"bash"}},
  });
}

const ExtensionRegistry::Command* ExtensionRegistry::Find(
    const std::string& extension) const {
  auto it = commands_.find(extension);
  if (it == commands_.end()) return nullptr;
  return &it->second;
}

std::vector<std::string> ExtensionRegistry::Extensions() const {
  std::vector<std::string> extensions;
  for (const auto& entry : commands_) extensions.push_back(entry.first);
  return extensions;
}

}  // namespace core
