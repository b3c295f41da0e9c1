#include <exception>
#include <iostream>

#include "core/extension_registry.hpp"
#include "executor/local_executor.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "manager/runner.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

int main(int argc, char** argv) {
  gflags::SetUsageMessage(
      "Runs the snippet found in the workspace and saves its output.\n"
      "TIMEOUT and MAX_OUTPUT_KB set the time and output limits.");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();

  try {
    const manager::Config config = manager::Config::FromFlagsAndEnvironment();
    const core::ExtensionRegistry registry = core::ExtensionRegistry::Default();
    executor::LocalExecutor executor(util::File::Absolute(config.workspace),
                                     registry, config.limits);
    manager::Runner runner(config, registry, &executor);
    return runner.Run(std::cout, std::cerr);
  } catch (const std::exception& e) {
    LOG(ERROR) << e.what();
    return 1;
  }
}
