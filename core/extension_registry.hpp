#ifndef CORE_EXTENSION_REGISTRY_HPP
#define CORE_EXTENSION_REGISTRY_HPP

#include <map>
#include <string>
#include <vector>

namespace core {

// Maps a file extension (with its leading dot, case-sensitive) to the command
// line of the interpreter that runs files with that extension. The path of
// the file is appended to the command line as its last argument.
class ExtensionRegistry {
 public:
  using Command = std::vector<std::string>;

  // Throws std::invalid_argument if an extension is empty or does not start
  // with '.', or if a command or one of its tokens is empty.
  explicit ExtensionRegistry(std::map<std::string, Command> commands);

  // The interpreters available to snippets: python3 and bash.
  static ExtensionRegistry Default();

  // Returns the command for the extension, or nullptr if it is not
  // registered.
  const Command* Find(const std::string& extension) const;
  bool Contains(const std::string& extension) const {
    return Find(extension) != nullptr;
  }

  // All the registered extensions, in ascending order.
  std::vector<std::string> Extensions() const;

 private:
  std::map<std::string, Command> commands_;
};

}  // namespace core

#endif
