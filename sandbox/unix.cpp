#include "sandbox/unix.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <thread>

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/prctl.h>
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

int GetProcessMemoryUsage(pid_t pid, long long* memory_usage_kb) {
  int fd = open(("/proc/" + std::to_string(pid) + "/statm").c_str(),
                O_RDONLY | O_CLOEXEC);
  if (fd == -1) return fd;
  char buf[1024] = {};
  int num_read = 0;
  int cur = 0;
  do {
    cur = read(fd, buf + num_read, sizeof(buf) - 1 - num_read);
    if (cur < 0) {
      close(fd);
      return -1;
    }
    num_read += cur;
  } while (cur > 0 && num_read < static_cast<int>(sizeof(buf)) - 1);
  close(fd);
  if (sscanf(buf, "%lld", memory_usage_kb) != 1) return -1;
  *memory_usage_kb *= sysconf(_SC_PAGESIZE) / 1024;
  return 0;
}

void AddString(const std::string& value, std::vector<std::vector<char>>* out) {
  out->emplace_back(value.begin(), value.end());
  out->back().push_back(0);
}
}  // namespace

namespace sandbox {

static const constexpr size_t kStrErrorBufSize = 2048;
static const constexpr auto kMemoryPollInterval = std::chrono::milliseconds(10);

bool Unix::Setup(const SandboxConfig& config, const std::string& work_dir,
                 std::string* error_msg) {
  if (!util::File::Exists(work_dir)) {
    *error_msg = "missing workspace " + work_dir;
    return false;
  }
  work_dir_ = work_dir;
  return true;
}

void Unix::PrepareEnvironment(
    const std::string& work_dir,
    std::map<std::string, std::string>* environment) const {
  (*environment)["HOME"] = work_dir;
  (*environment)["TMPDIR"] = work_dir;
}

bool Unix::Execute(const ExecutionOptions& options, ExecutionInfo* info,
                   std::string* error_msg) {
  if (kill_requested_) {
    *error_msg = "sandbox killed";
    return false;
  }
  options_ = &options;
  if (!Prepare(error_msg)) return false;
  if (!DoFork(error_msg)) return false;
  if (!Wait(info, error_msg)) return false;
  return true;
}

bool Unix::Prepare(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  if (pipe2(pipe_fds_, O_CLOEXEC) == -1) {
    *error_msg = "pipe2: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }

  // The child must not allocate memory: everything it needs is built here.
  arg_storage_.clear();
  AddString(options_->executable, &arg_storage_);
  for (const std::string& arg : options_->args) AddString(arg, &arg_storage_);
  args_.clear();
  for (std::vector<char>& arg : arg_storage_) args_.push_back(arg.data());
  args_.push_back(nullptr);

  env_storage_.clear();
  for (const auto& var : options_->environment) {
    AddString(var.first + "=" + var.second, &env_storage_);
  }
  env_.clear();
  for (std::vector<char>& var : env_storage_) env_.push_back(var.data());
  env_.push_back(nullptr);
  return true;
}

bool Unix::DoFork(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    close(pipe_fds_[0]);
    close(pipe_fds_[1]);
    return false;
  }
  if (fork_result == 0) Child();
  absl::MutexLock lck(&pid_mutex_);
  child_pid_ = fork_result;
  // A Kill that came before the pid was known.
  if (kill_requested_) {
    if (kill(-child_pid_, SIGKILL) == -1) kill(child_pid_, SIGKILL);
  }
  return true;
}

void Unix::Child() {
  close(pipe_fds_[0]);
  auto die2 = [this](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 2] = {};
    strncat(buf, prefix, 64);
    strncat(buf, ": ", 2);
    strncat(buf, err, kStrErrorBufSize);
    int len = strlen(buf);
    if (write(pipe_fds_[1], &len, sizeof(len)) == sizeof(len)) {
      ssize_t unused = write(pipe_fds_[1], buf, len);
      (void)unused;
    }
    close(pipe_fds_[1]);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));
  };

  // Signals blocked by the parent must not stay blocked in the program.
  sigset_t empty_set;
  sigemptyset(&empty_set);
  if (sigprocmask(SIG_SETMASK, &empty_set, nullptr) == -1) {
    die("sigprocmask", errno);
  }

  // Change process group, so that we do not receive Ctrl-Cs in the terminal
  // and the whole group can be killed at once.
  if (setsid() == -1) die("setsid", errno);

  // Do not outlive the thread that is waiting for us.
  if (prctl(PR_SET_PDEATHSIG, SIGKILL) == -1) die("prctl", errno);

  const char* stdin_file = options_->stdin_file.empty()
                               ? "/dev/null"
                               : options_->stdin_file.c_str();
  int stdin_fd = open(stdin_file, O_RDONLY);
  if (stdin_fd == -1) die("open", errno);
  int stdout_fd = -1;
  int stderr_fd = -1;
  if (options_->stdout_file != "") {
    stdout_fd = open(options_->stdout_file.c_str(),
                     O_WRONLY | O_CREAT | O_TRUNC, S_IRUSR | S_IWUSR);
    if (stdout_fd == -1) die("open stdout", errno);
  }
  if (options_->stderr_file != "") {
    stderr_fd = open(options_->stderr_file.c_str(),
                     O_WRONLY | O_CREAT | O_TRUNC, S_IRUSR | S_IWUSR);
    if (stderr_fd == -1) die("open stderr", errno);
  }

  if (chdir(options_->root.c_str()) == -1) {
    die("chdir", errno);
  }

  // Handle I/O redirection.
#define DUP(field, fd)                          \
  if (field##_fd != -1) {                       \
    int ret = dup2(field##_fd, fd);             \
    if (ret == -1) die("redir " #field, errno); \
  }
  DUP(stdin, STDIN_FILENO);
  DUP(stdout, STDOUT_FILENO);
  DUP(stderr, STDERR_FILENO);
#undef DUP

  // Set resource limits.
  struct rlimit rlim;
#define SET_RLIM(res, value)                    \
  {                                             \
    rlim_t lim = value;                         \
    if (lim) {                                  \
      rlim.rlim_cur = lim;                      \
      rlim.rlim_max = lim;                      \
      if (setrlimit(RLIMIT_##res, &rlim) < 0) { \
        die("setrlim " #res, errno);            \
      }                                         \
    }                                           \
  }

  SET_RLIM(AS, options_->memory_limit_kb * 1024);
  SET_RLIM(CPU, (options_->cpu_limit_millis + 999) / 1000);
  SET_RLIM(FSIZE, options_->max_file_size_kb * 1024);
  SET_RLIM(NOFILE, options_->max_files);
  SET_RLIM(NPROC, options_->max_procs);
#undef SET_RLIM

  if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) == -1) die("prctl", errno);

  char buf[kStrErrorBufSize] = {};
  if (!OnChild(buf, kStrErrorBufSize)) {
    die2("OnChild", buf);
  }
  int count = 0;
  do {
    execve(options_->executable.c_str(), args_.data(), env_.data());
    usleep(100);
    // A freshly written script may still be open for writing elsewhere.
  } while (errno == ETXTBSY && count++ < 16);
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(1);
}

void Unix::Kill() {
  kill_requested_ = true;
  KillChild();
}

void Unix::KillChild() {
  bool running = false;
  {
    absl::MutexLock lck(&pid_mutex_);
    if (child_pid_ > 0) {
      running = true;
      // The child may not have called setsid yet.
      if (kill(-child_pid_, SIGKILL) == -1) kill(child_pid_, SIGKILL);
    }
  }
  if (running) OnKill();
}

bool Unix::Wait(ExecutionInfo* info, std::string* error_msg) {
  pid_t pid = 0;
  {
    absl::MutexLock lck(&pid_mutex_);
    pid = child_pid_;
  }
  close(pipe_fds_[1]);
  int error_len = 0;
  if (read(pipe_fds_[0], &error_len, sizeof(error_len)) == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    if (error_len < 0 || error_len >= PIPE_BUF) error_len = PIPE_BUF - 1;
    ssize_t len = read(pipe_fds_[0], error, error_len);
    close(pipe_fds_[0]);
    absl::MutexLock lck(&pid_mutex_);
    waitpid(child_pid_, nullptr, 0);
    child_pid_ = 0;
    *error_msg = len > 0 ? std::string(error, len) : "child setup failed";
    return false;
  }
  close(pipe_fds_[0]);

  std::atomic<long long> memory_usage{0};
  std::atomic<bool> done{false};
  std::thread memory_watcher([this, &memory_usage, &done, info, pid]() {
    while (!done) {
      long long mem;
      if (GetProcessMemoryUsage(pid, &mem) == 0) {
        if (mem > memory_usage) memory_usage = mem;
        if (options_->memory_limit_kb && mem > options_->memory_limit_kb &&
            !info->memory_exceeded) {
          info->memory_exceeded = true;
          KillChild();
        }
      }
      std::this_thread::sleep_for(kMemoryPollInterval);
    }
  });

  auto program_start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - program_start)
        .count();
  };

  // Waits for the exit without reaping, so that the pid cannot be reused
  // while the process group may still be killed.
  std::future<int> exited = std::async(std::launch::async, [pid]() {
    siginfo_t siginfo;
    while (waitid(P_PID, pid, &siginfo, WEXITED | WNOWAIT) == -1) {
      if (errno != EINTR) return errno;
    }
    return 0;
  });

  if (options_->wall_limit_millis > 0 &&
      exited.wait_for(std::chrono::milliseconds(
          options_->wall_limit_millis)) == std::future_status::timeout) {
    info->timed_out = true;
    VLOG(1) << "Wall limit of " << options_->wall_limit_millis
            << "ms exceeded, killing " << pid;
    KillChild();
  }
  int wait_error = exited.get();

  int child_status = 0;
  struct rusage rusage {};
  {
    absl::MutexLock lck(&pid_mutex_);
    // Leftover processes of the group.
    kill(-pid, SIGKILL);
    if (wait4(pid, &child_status, 0, &rusage) != pid && wait_error == 0) {
      wait_error = errno;
    }
    child_pid_ = 0;
  }
  done = true;
  memory_watcher.join();

  if (wait_error != 0) {
    char buf[kStrErrorBufSize] = {};
    *error_msg = "wait: ";
    *error_msg += mystrerror(wait_error, buf, kStrErrorBufSize);
    return false;
  }

  info->memory_usage_kb = std::max<long long>(memory_usage, rusage.ru_maxrss);
  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  info->wall_time_millis = elapsed_millis();
  info->cpu_time_millis =
      (int64_t)rusage.ru_utime.tv_sec * 1000 + rusage.ru_utime.tv_usec / 1000;
  info->sys_time_millis =
      (int64_t)rusage.ru_stime.tv_sec * 1000 + rusage.ru_stime.tv_usec / 1000;

  OnFinish(info);
  return true;
}

}  // namespace sandbox
