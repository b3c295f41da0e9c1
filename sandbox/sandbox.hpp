#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <stdint.h>

#include <memory>
#include <string>
#include <vector>

namespace sandbox {

// Settings to execute the program in the sandbox.
struct ExecutionOptions {
  // Optional values. A value of 0 means no limit.
  int64_t wall_limit_millis = 0;
  int64_t max_output_bytes = 0;

  std::vector<std::string> args;

  // Required values
  std::string root = "";
  std::string executable = "";
  ExecutionOptions(std::string root, std::string executable)
      : root(std::move(root)), executable(std::move(executable)) {}
};

// Results of the execution.
struct ExecutionInfo {
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  int32_t status_code = 0;
  int32_t signal = 0;

  // Set when the wall time limit expired before the program terminated and
  // closed its output streams. The program was killed in that case.
  bool timed_out = false;

  // At most max_output_bytes bytes from the start of each stream.
  std::string stdout_data;
  std::string stderr_data;
  bool stdout_truncated = false;
  bool stderr_truncated = false;
};

// Sandbox interface. An instance runs one program at a time.
class Sandbox {
 public:
  // Returns a new instance of the sandbox for the host platform, which is
  // defined in the file that implements it (unix.cpp).
  static std::unique_ptr<Sandbox> Create();

  // Runs the specified command, with stdin connected to /dev/null and stdout
  // and stderr captured. Returns true if the program was started, and sets
  // fields in info. Otherwise, returns false and sets error_msg.
  // Implementations of this function may not be thread safe.
  virtual bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) = 0;

  // Constructor and destructors
  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;
};

}  // namespace sandbox

#endif
