#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP

#include "sandbox/sandbox.hpp"

namespace sandbox {

// Base class for sandboxes for UNIX-like systems.
class Unix : public Sandbox {
 public:
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg) override;
  Unix() = default;
  ~Unix() override;

 protected:
  // Executed before creating the child process. Returns false and sets
  // error_msg if setup fails.
  bool Setup(std::string* error_msg);

  // Creates a child process and saves its PID in child_pid_. The child process
  // should execute Child and must not return.
  bool DoFork(std::string* error_msg);

  // Function that is executed in the child process.
  [[noreturn]] void Child();

  // Collects the output of the child and waits for its termination, killing
  // its process group if it exceeds the provided wall time limit.
  bool Wait(ExecutionInfo* info, std::string* error_msg);

  void CloseFds();

  int pipe_fds_[2] = {-1, -1};
  int stdout_fds_[2] = {-1, -1};
  int stderr_fds_[2] = {-1, -1};
  int child_pid_ = 0;
  const ExecutionOptions* options_ = nullptr;

  // Null-terminated argv for execv, prepared before forking.
  std::vector<std::vector<char>> arg_storage_;
  std::vector<char*> args_;
};

}  // namespace sandbox
#endif
