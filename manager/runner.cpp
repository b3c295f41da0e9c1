#include "manager/runner.hpp"

#include "absl/strings/str_join.h"
#include "core/locator.hpp"
#include "glog/logging.h"
#include "manager/result_writer.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace manager {

std::string Config::ResultPath() const {
  return util::File::JoinPath(
      util::File::JoinPath(util::File::Absolute(workspace), output_directory),
      result_file);
}

Config Config::FromFlagsAndEnvironment() {
  Config config;
  config.workspace = FLAGS_workspace;
  config.output_directory = FLAGS_output_directory;
  config.result_file = FLAGS_result_file;
  config.limits = core::ExecutionLimits::FromEnvironment();
  return config;
}

int Runner::Run(std::ostream& out, std::ostream& err) {
  absl::optional<core::SnippetReference> snippet =
      core::Locate(config_.workspace, registry_);
  if (!snippet) {
    LOG(INFO) << "No snippet in " << config_.workspace;
    err << "No runnable code found in " << config_.workspace << std::endl;
    err << "Supported extensions: "
        << absl::StrJoin(registry_.Extensions(), ", ") << std::endl;
    return kNoSnippetExitCode;
  }
  LOG(INFO) << "Found snippet " << snippet->path;

  out << "Running: " << absl::StrJoin(executor_->Command(*snippet), " ")
      << " (timeout=" << config_.limits.timeout_seconds << "s)" << std::endl;

  proto::ExecutionResult result;
  try {
    result = executor_->Execute(*snippet);
  } catch (const executor::execution_timeout& e) {
    err << "Error: " << e.what() << std::endl;
    return kTimeoutExitCode;
  }

  PrintResult(result, out, err);
  std::string result_path = config_.ResultPath();
  WriteResult(result, result_path);

  out << "\nExit code: " << result.exit_code() << std::endl;
  out << "Output saved to: " << result_path << std::endl;
  return result.exit_code();
}

}  // namespace manager
