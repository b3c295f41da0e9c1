#ifndef EXECUTOR_LOCAL_EXECUTOR_HPP
#define EXECUTOR_LOCAL_EXECUTOR_HPP

#include "core/extension_registry.hpp"
#include "core/limits.hpp"
#include "executor/executor.hpp"

namespace executor {

// Runs snippets as child processes of this one, through the host sandbox,
// with the workspace as working directory.
class LocalExecutor : public Executor {
 public:
  std::vector<std::string> Command(
      const core::SnippetReference& snippet) const override;
  proto::ExecutionResult Execute(
      const core::SnippetReference& snippet) override;

  LocalExecutor(std::string workspace, const core::ExtensionRegistry& registry,
                const core::ExecutionLimits& limits);
  LocalExecutor(const LocalExecutor&) = delete;
  LocalExecutor& operator=(const LocalExecutor&) = delete;
  LocalExecutor(LocalExecutor&&) = delete;
  LocalExecutor& operator=(LocalExecutor&&) = delete;
  ~LocalExecutor() override = default;

 private:
  std::string workspace_;
  const core::ExtensionRegistry& registry_;
  const core::ExecutionLimits limits_;
};

}  // namespace executor

#endif
