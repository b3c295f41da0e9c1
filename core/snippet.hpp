#ifndef CORE_SNIPPET_HPP
#define CORE_SNIPPET_HPP

#include <string>

namespace core {

// A runnable file found in the workspace.
struct SnippetReference {
  // Absolute path of the file.
  std::string path;
  // Extension of the file, with the leading dot. Always registered.
  std::string extension;
};

}  // namespace core

#endif
