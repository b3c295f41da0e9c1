#include "sandbox/unix.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <poll.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "glog/logging.h"

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

static const constexpr size_t kReadBufSize = 64 * 1024;

// Reads once from *fd, keeping at most limit bytes in data (no limit if 0).
// Bytes past the limit are consumed and dropped. On EOF *fd is closed and set
// to -1. Returns errno, or 0 on success.
int ReadChunk(int* fd, int64_t limit, std::string* data, bool* truncated) {
  char buf[kReadBufSize];
  ssize_t amount = read(*fd, buf, kReadBufSize);
  if (amount == -1) return errno == EINTR || errno == EAGAIN ? 0 : errno;
  if (amount == 0) {
    close(*fd);
    *fd = -1;
    return 0;
  }
  size_t keep = amount;
  if (limit) {
    size_t room = data->size() < static_cast<size_t>(limit)
                      ? static_cast<size_t>(limit) - data->size()
                      : 0;
    if (keep > room) {
      keep = room;
      *truncated = true;
    }
  }
  data->append(buf, keep);
  return 0;
}

void CloseFd(int* fd) {
  if (*fd != -1) close(*fd);
  *fd = -1;
}
}  // namespace

namespace sandbox {

static const constexpr size_t kStrErrorBufSize = 2048;
static const constexpr int64_t kPollSliceMillis = 10;

Unix::~Unix() { CloseFds(); }

void Unix::CloseFds() {
  for (int* fds : {pipe_fds_, stdout_fds_, stderr_fds_}) {
    CloseFd(&fds[0]);
    CloseFd(&fds[1]);
  }
}

bool Unix::Execute(const ExecutionOptions& options, ExecutionInfo* info,
                   std::string* error_msg) {
  options_ = &options;
  if (!Setup(error_msg) || !DoFork(error_msg)) {
    CloseFds();
    return false;
  }
  return Wait(info, error_msg);
}

bool Unix::Setup(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  for (int* fds : {pipe_fds_, stdout_fds_, stderr_fds_}) {
    if (pipe(fds) == -1) {
      *error_msg = "pipe: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      return false;
    }
    if (fcntl(fds[0], F_SETFD, FD_CLOEXEC) == -1 ||
        fcntl(fds[1], F_SETFD, FD_CLOEXEC) == -1) {
      *error_msg = "fcntl: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      return false;
    }
  }

  // Prepare args here, the child must not allocate.
  arg_storage_.clear();
  args_.clear();
  auto add_arg = [this](const std::string& arg) {
    arg_storage_.emplace_back(arg.begin(), arg.end());
    arg_storage_.back().push_back(0);
  };
  add_arg(options_->executable);
  for (const std::string& arg : options_->args) add_arg(arg);
  for (std::vector<char>& arg : arg_storage_) args_.push_back(arg.data());
  args_.push_back(nullptr);

  return true;
}

bool Unix::DoFork(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  if (fork_result == 0) Child();
  child_pid_ = fork_result;
  return true;
}

void Unix::Child() {
  close(pipe_fds_[0]);
  close(stdout_fds_[0]);
  close(stderr_fds_[0]);
  auto die2 = [this](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 2] = {};
    strncat(buf, prefix, 64);
    strncat(buf, ": ", 2);
    strncat(buf, err, kStrErrorBufSize);
    int len = strlen(buf);
    if (write(pipe_fds_[1], &len, sizeof(len)) == sizeof(len)) {
      (void)!write(pipe_fds_[1], buf, len);
    }
    close(pipe_fds_[1]);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));
  };

  // New session and process group: no Ctrl-Cs from the terminal, and the
  // parent can kill the whole group on timeout.
  if (setsid() == -1) die("setsid", errno);

  int stdin_fd = open("/dev/null", O_RDONLY);
  if (stdin_fd == -1) die("open", errno);

  if (chdir(options_->root.c_str()) == -1) {
    die("chdir", errno);
  }

  // Handle I/O redirection.
  if (dup2(stdin_fd, STDIN_FILENO) == -1) die("redir stdin", errno);
  if (dup2(stdout_fds_[1], STDOUT_FILENO) == -1) die("redir stdout", errno);
  if (dup2(stderr_fds_[1], STDERR_FILENO) == -1) die("redir stderr", errno);
  close(stdin_fd);

  int count = 0;
  do {
    execv(options_->executable.c_str(), args_.data());
    usleep(100);
    // At most 16 attempts, to avoid livelocks.
  } while (errno == ETXTBSY && count++ < 16);
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(1);
}

bool Unix::Wait(ExecutionInfo* info, std::string* error_msg) {
  CloseFd(&pipe_fds_[1]);
  CloseFd(&stdout_fds_[1]);
  CloseFd(&stderr_fds_[1]);
  char buf[kStrErrorBufSize] = {};

  // The error pipe is closed on exec, so this read returns once the child is
  // running or has failed to start.
  int error_len = 0;
  ssize_t len_read = 0;
  while ((len_read = read(pipe_fds_[0], &error_len, sizeof(error_len))) ==
             -1 &&
         errno == EINTR) {
  }
  if (len_read != 0) {
    if (len_read == -1) {
      *error_msg = "read: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      // The child may not have a process group of its own yet.
      kill(child_pid_, SIGKILL);
      kill(-child_pid_, SIGKILL);
    } else {
      char error[PIPE_BUF] = {};
      error_len = std::max(0, std::min(error_len, PIPE_BUF - 1));
      ssize_t msg_read = 0;
      while ((msg_read = read(pipe_fds_[0], error, error_len)) == -1 &&
             errno == EINTR) {
      }
      if (msg_read == -1) {
        *error_msg = "read: ";
        *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      } else {
        *error_msg = error;
      }
    }
    int child_status = 0;
    while (waitpid(child_pid_, &child_status, 0) == -1 && errno == EINTR) {
    }
    CloseFds();
    return false;
  }
  CloseFd(&pipe_fds_[0]);

  auto program_start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - program_start)
        .count();
  };
  const int64_t wall_limit = options_->wall_limit_millis;
  const int64_t max_output = options_->max_output_bytes;

  auto fail = [this, &buf, error_msg](const char* prefix, int err) {
    *error_msg = prefix;
    *error_msg += ": ";
    *error_msg += mystrerror(err, buf, kStrErrorBufSize);
    kill(-child_pid_, SIGKILL);
    int child_status = 0;
    while (waitpid(child_pid_, &child_status, 0) == -1 && errno == EINTR) {
    }
    CloseFds();
    return false;
  };

  // The child may exit before closing its output (e.g. a background
  // descendant still holds the pipes); execution ends when both happened.
  int child_status = 0;
  bool has_exited = false;
  struct rusage rusage {};
  auto finished = [this, &has_exited]() {
    return has_exited && stdout_fds_[0] == -1 && stderr_fds_[0] == -1;
  };
  while (!wall_limit || elapsed_millis() < wall_limit) {
    if (!has_exited) {
      int ret = wait4(child_pid_, &child_status, WNOHANG, &rusage);
      if (ret == -1 && errno != EINTR) return fail("wait4", errno);
      if (ret == child_pid_) has_exited = true;
    }
    if (finished()) break;

    int64_t slice = kPollSliceMillis;
    if (wall_limit) {
      slice = std::max<int64_t>(
          std::min<int64_t>(slice, wall_limit - elapsed_millis()), 0);
    }
    struct pollfd fds[2] = {};
    int nfds = 0;
    for (int fd : {stdout_fds_[0], stderr_fds_[0]}) {
      if (fd == -1) continue;
      fds[nfds].fd = fd;
      fds[nfds].events = POLLIN;
      nfds++;
    }
    if (nfds == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(slice));
      continue;
    }
    int ready = poll(fds, nfds, slice);
    if (ready == -1 && errno != EINTR) return fail("poll", errno);
    for (int i = 0; i < nfds && ready > 0; i++) {
      if (!fds[i].revents) continue;
      int err = 0;
      if (fds[i].fd == stdout_fds_[0]) {
        err = ReadChunk(&stdout_fds_[0], max_output, &info->stdout_data,
                        &info->stdout_truncated);
      } else {
        err = ReadChunk(&stderr_fds_[0], max_output, &info->stderr_data,
                        &info->stderr_truncated);
      }
      if (err) return fail("read", err);
    }
  }

  if (!finished()) {
    info->timed_out = true;
    if (kill(-child_pid_, SIGKILL) == -1 && errno != ESRCH) {
      PLOG(ERROR) << "kill";
    }
    if (!has_exited) {
      int ret = 0;
      while ((ret = wait4(child_pid_, &child_status, 0, &rusage)) == -1 &&
             errno == EINTR) {
      }
      CHECK_EQ(ret, child_pid_) << "wait4 failed on a killed child";
    }
  }
  info->wall_time_millis = elapsed_millis();
  CloseFds();

  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  info->cpu_time_millis =
      (int64_t)rusage.ru_utime.tv_sec * 1000 + rusage.ru_utime.tv_usec / 1000;
  info->sys_time_millis =
      (int64_t)rusage.ru_stime.tv_sec * 1000 + rusage.ru_stime.tv_usec / 1000;

  return true;
}

std::unique_ptr<Sandbox> Sandbox::Create() {
  return std::unique_ptr<Sandbox>(new Unix());
}

}  // namespace sandbox
