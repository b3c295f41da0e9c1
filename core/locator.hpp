#ifndef CORE_LOCATOR_HPP
#define CORE_LOCATOR_HPP

#include <string>

#include "absl/types/optional.h"
#include "core/extension_registry.hpp"
#include "core/snippet.hpp"

namespace core {

// Returns the extension of a file name: the suffix that starts at the last
// '.', or an empty string if there is none. Leading dots do not count, so
// ".py" has no extension.
std::string ExtensionOf(const std::string& name);

// Returns the first regular file of workspace, in ascending order of name,
// whose extension is registered, or nullopt if there is none. Other entries
// are skipped. Throws std::system_error if the directory cannot be listed.
absl::optional<SnippetReference> Locate(const std::string& workspace,
                                        const ExtensionRegistry& registry);

}  // namespace core

#endif
