#ifndef MANAGER_RUNNER_HPP
#define MANAGER_RUNNER_HPP

#include <ostream>
#include <string>

#include "core/extension_registry.hpp"
#include "core/limits.hpp"
#include "executor/executor.hpp"

namespace manager {

static const constexpr int kNoSnippetExitCode = 1;
static const constexpr int kTimeoutExitCode = 124;

// Process-wide settings, read once at startup.
struct Config {
  std::string workspace = "/workspace";
  std::string output_directory = "output";
  std::string result_file = "result.txt";
  core::ExecutionLimits limits;

  std::string ResultPath() const;

  // Paths from the command-line flags, limits from the environment.
  static Config FromFlagsAndEnvironment();
};

// Finds the snippet in the workspace, runs it and records its result.
class Runner {
 public:
  Runner(const Config& config, const core::ExtensionRegistry& registry,
         executor::Executor* executor)
      : config_(config), registry_(registry), executor_(executor) {}

  // Returns the exit code of the snippet, kNoSnippetExitCode if there is no
  // snippet to run, or kTimeoutExitCode if it timed out. The transcript is
  // written to out and err. Throws if the snippet cannot be started or its
  // result cannot be saved.
  int Run(std::ostream& out, std::ostream& err);

  Runner(const Runner&) = delete;
  Runner& operator=(const Runner&) = delete;
  Runner(Runner&&) = delete;
  Runner& operator=(Runner&&) = delete;
  ~Runner() = default;

 private:
  const Config& config_;
  const core::ExtensionRegistry& registry_;
  executor::Executor* executor_;
};

}  // namespace manager

#endif
