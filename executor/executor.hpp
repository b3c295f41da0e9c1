#ifndef EXECUTOR_EXECUTOR_HPP
#define EXECUTOR_EXECUTOR_HPP

#include <stdint.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "absl/strings/str_cat.h"
#include "core/snippet.hpp"
#include "proto/execution.pb.h"

namespace executor {

// Thrown when a snippet does not terminate within its time limit. The
// snippet has been killed when this is thrown.
class execution_timeout : public std::runtime_error {
 public:
  explicit execution_timeout(int64_t timeout_seconds)
      : std::runtime_error(absl::StrCat("execution timed out after ",
                                        timeout_seconds, " seconds")),
        timeout_seconds_(timeout_seconds) {}
  int64_t TimeoutSeconds() const { return timeout_seconds_; }

 private:
  int64_t timeout_seconds_;
};

class Executor {
 public:
  // The command line that runs the snippet.
  virtual std::vector<std::string> Command(
      const core::SnippetReference& snippet) const = 0;

  // Runs the snippet to completion and returns its result. Throws
  // execution_timeout if it runs for too long, and std::runtime_error if it
  // cannot be started.
  virtual proto::ExecutionResult Execute(
      const core::SnippetReference& snippet) = 0;

  Executor() = default;
  virtual ~Executor() = default;
  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;
  Executor(Executor&&) = delete;
  Executor& operator=(Executor&&) = delete;
};

}  // namespace executor

#endif
