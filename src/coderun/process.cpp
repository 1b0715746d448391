#include "process.h"

#include <poll.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <sys/syscall.h>
#include <cerrno>
#include <cstring>
#include <system_error>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "utils.h"

namespace {

constexpr size_t kReadBufSize = 65536;

class Fd {
  int fd_;
 public:
  Fd() : fd_(-1) {}
  ~Fd() { Close(); }
  Fd(const Fd&) = delete;
  Fd& operator=(const Fd&) = delete;
  int& Get() { return fd_; }
  int Get() const { return fd_; }
  void Close() {
    if (fd_ >= 0) close(fd_);
    fd_ = -1;
  }
};

void Pipe(Fd& rd, Fd& wr) {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) < 0) {
    throw std::system_error(errno, std::generic_category(), "pipe");
  }
  rd.Get() = fds[0];
  wr.Get() = fds[1];
}

// only async-signal-safe calls from here on
[[noreturn]] void ExecChild(char* const* argv, int out_fd, int err_fd, int report_fd) {
  setpgid(0, 0);
  int null_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
  if (null_fd < 0 || dup2(null_fd, 0) < 0 || dup2(out_fd, 1) < 0 || dup2(err_fd, 2) < 0 ||
      dup2(report_fd, 3) < 0 || fcntl(3, F_SETFD, FD_CLOEXEC) < 0 || CloseFrom(4) < 0) {
    int err = errno;
    IGNORE_RETURN(write(report_fd, &err, sizeof(err)));
    _exit(127);
  }
  signal(SIGPIPE, SIG_DFL);
  execvp(argv[0], argv);
  int err = errno;
  IGNORE_RETURN(write(3, &err, sizeof(err)));
  _exit(127);
}

int PidfdOpen(pid_t pid) {
  return syscall(SYS_pidfd_open, pid, 0);
}

[[noreturn]] void KillAndThrow(pid_t pid, int err, const char* what) {
  killpg(pid, SIGKILL);
  waitpid(pid, nullptr, 0);
  throw std::system_error(err, std::generic_category(), what);
}

int DecodeStatus(int wstatus) {
  if (WIFEXITED(wstatus)) return WEXITSTATUS(wstatus);
  if (WIFSIGNALED(wstatus)) return 128 + WTERMSIG(wstatus);
  return 128;
}

} // namespace

ProcessResult RunProcess(const std::vector<std::string>& argv, std::chrono::milliseconds timeout,
                         size_t max_output) {
  using Clock = std::chrono::steady_clock;
  if (argv.empty()) throw std::system_error(EINVAL, std::generic_category(), "empty command");

  std::vector<char*> argv_buf;
  for (auto& i : argv) argv_buf.push_back(const_cast<char*>(i.c_str()));
  argv_buf.push_back(nullptr);

  Fd out_rd, out_wr, err_rd, err_wr, report_rd, report_wr;
  Pipe(out_rd, out_wr);
  Pipe(err_rd, err_wr);
  Pipe(report_rd, report_wr);

  const auto deadline = Clock::now() + timeout;
  pid_t pid = fork();
  if (pid < 0) throw std::system_error(errno, std::generic_category(), "fork");
  if (pid == 0) ExecChild(argv_buf.data(), out_wr.Get(), err_wr.Get(), report_wr.Get());

  // also set from the parent so that killpg cannot race with the child's setpgid
  setpgid(pid, pid);
  spdlog::debug("Spawned pid={} command={}", pid, fmt::format("{}", argv));
  out_wr.Close();
  err_wr.Close();
  report_wr.Close();

  // the report pipe is closed on a successful exec; otherwise it carries errno
  int exec_errno = 0;
  ssize_t n;
  while ((n = read(report_rd.Get(), &exec_errno, sizeof(exec_errno))) < 0 && errno == EINTR);
  if (n > 0) {
    waitpid(pid, nullptr, 0);
    throw std::system_error(exec_errno, std::generic_category(), "exec " + argv[0]);
  }

  ProcessResult ret{0, false, false, "", ""};
  Fd pidfd;
  pidfd.Get() = PidfdOpen(pid);
  if (pidfd.Get() < 0) KillAndThrow(pid, errno, "pidfd_open");

  // out, err, child exit
  struct pollfd fds[3] = {
    {out_rd.Get(), POLLIN, 0}, {err_rd.Get(), POLLIN, 0}, {pidfd.Get(), POLLIN, 0}};
  std::string* bufs[2] = {&ret.out, &ret.err};
  char buf[kReadBufSize];
  int pending = 3;
  while (pending) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    if (remaining.count() <= 0) {
      ret.timed_out = true;
      break;
    }
    int ready = poll(fds, 3, remaining.count() + 1);
    if (ready < 0) {
      if (errno == EINTR) continue;
      KillAndThrow(pid, errno, "poll");
    }
    if (ready == 0) continue; // deadline checked on the next iteration
    if (fds[2].fd >= 0 && fds[2].revents) {
      fds[2].fd = -1; // exited; reaped below
      pending--;
    }
    for (int i = 0; i < 2; i++) {
      if (fds[i].fd < 0 || !fds[i].revents) continue;
      ssize_t len = read(fds[i].fd, buf, sizeof(buf));
      if (len < 0 && errno == EINTR) continue;
      if (len <= 0) {
        fds[i].fd = -1; // ignored by poll from now on
        pending--;
        continue;
      }
      size_t keep = len;
      if (max_output != kNoOutputLimit && bufs[i]->size() + keep > max_output) {
        keep = max_output - bufs[i]->size();
        ret.truncated = true;
      }
      bufs[i]->append(buf, keep);
    }
  }
  if (ret.timed_out) {
    spdlog::debug("Deadline exceeded, killing process group {}", pid);
    if (killpg(pid, SIGKILL) < 0 && errno != ESRCH) {
      spdlog::warn("Failed killing process group {}: {}", pid, strerror(errno));
    }
  }
  if (ret.truncated) {
    spdlog::info("Output of pid={} truncated to {} bytes per stream", pid, max_output);
  }
  // the child has exited or was killed, so this does not block for long
  int wstatus = 0;
  while (waitpid(pid, &wstatus, 0) < 0) {
    if (errno != EINTR) throw std::system_error(errno, std::generic_category(), "waitpid");
  }
  ret.status = DecodeStatus(wstatus);
  return ret;
}
