#include "executor/local_executor.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "glog/logging.h"
#include "sandbox/sandbox.hpp"
#include "util/which.hpp"

namespace executor {

LocalExecutor::LocalExecutor(std::string workspace,
                             const core::ExtensionRegistry& registry,
                             const core::ExecutionLimits& limits)
    : workspace_(std::move(workspace)), registry_(registry), limits_(limits) {}

std::vector<std::string> LocalExecutor::Command(
    const core::SnippetReference& snippet) const {
  const core::ExtensionRegistry::Command* interpreter =
      registry_.Find(snippet.extension);
  if (interpreter == nullptr) {
    throw std::logic_error(absl::StrCat("No interpreter registered for \"",
                                        snippet.extension, "\""));
  }
  std::vector<std::string> command = *interpreter;
  command.push_back(snippet.path);
  return command;
}

proto::ExecutionResult LocalExecutor::Execute(
    const core::SnippetReference& snippet) {
  std::vector<std::string> command = Command(snippet);

  // The sandbox does not search PATH.
  std::string executable = command[0];
  if (executable.find('/') == std::string::npos) {
    executable = util::which(command[0]);
    if (executable.empty()) {
      throw std::runtime_error(
          absl::StrCat("Interpreter not found in PATH: ", command[0]));
    }
  }

  sandbox::ExecutionOptions exec_options(workspace_, executable);
  exec_options.args.assign(command.begin() + 1, command.end());
  exec_options.wall_limit_millis = limits_.TimeoutMillis();
  exec_options.max_output_bytes = limits_.MaxOutputBytes();

  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  if (!sb) throw std::runtime_error("No sandbox available");

  LOG(INFO) << "Executing " << absl::StrJoin(command, " ") << " in "
            << workspace_;
  sandbox::ExecutionInfo info;
  std::string error_msg;
  if (!sb->Execute(exec_options, &info, &error_msg)) {
    throw std::runtime_error(error_msg);
  }
  if (info.timed_out) {
    LOG(WARNING) << "Killed " << snippet.path << " after "
                 << info.wall_time_millis << "ms";
    throw execution_timeout(limits_.timeout_seconds);
  }

  proto::ExecutionResult result;
  result.set_signal(info.signal);
  if (info.signal) {
    result.set_status(proto::Status::SIGNAL);
    result.set_exit_code(128 + info.signal);
  } else if (info.status_code) {
    result.set_status(proto::Status::NONZERO);
    result.set_exit_code(info.status_code);
  } else {
    result.set_status(proto::Status::SUCCESS);
    result.set_exit_code(0);
  }

  result.set_stdout_data(std::move(info.stdout_data));
  result.set_stderr_data(std::move(info.stderr_data));
  result.set_stdout_truncated(info.stdout_truncated);
  result.set_stderr_truncated(info.stderr_truncated);
  if (info.stdout_truncated || info.stderr_truncated) {
    LOG(WARNING) << "Output truncated to " << limits_.max_output_kb
                 << "KiB per stream";
  }

  result.set_wall_time_millis(info.wall_time_millis);
  result.set_cpu_time_millis(info.cpu_time_millis);
  result.set_sys_time_millis(info.sys_time_millis);
  LOG(INFO) << "Finished with exit code " << result.exit_code() << " in "
            << info.wall_time_millis << "ms (cpu " << info.cpu_time_millis
            << "ms, sys " << info.sys_time_millis << "ms)";
  return result;
}

}  // namespace executor
