#include "sandbox.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <sys/resource.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <algorithm>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

namespace {

constexpr int kPollIntervalMs = 50;
// how long pipes may stay open after the main process is reaped
constexpr long kDrainGraceUs = 500'000;

#define ENUM_SPAWN_STAGE_ \
  X(REDIRECT, "redirect") \
  X(CHDIR, "chdir") \
  X(RLIMIT, "setrlimit") \
  X(EXEC, "exec")
enum class SpawnStage : int {
#define X(name, desc) name,
  ENUM_SPAWN_STAGE_
#undef X
};

const char* SpawnStageName(SpawnStage stage) {
  switch (stage) {
#define X(name, desc) case SpawnStage::name: return desc;
    ENUM_SPAWN_STAGE_
#undef X
  }
  return "unknown";
}

struct SpawnReport {
  SpawnStage stage;
  int err;
};

// child side; report why the spawn failed through the close-on-exec pipe
[[noreturn]] void ChildFail(int fd, SpawnStage stage, int err) {
  SpawnReport rep{stage, err};
  IGNORE_RETURN(write(fd, &rep, sizeof(rep)));
  _exit(127);
}

int SetLimit(int resource, rlim_t soft, rlim_t hard) {
  struct rlimit rlim{soft, hard};
  return setrlimit(resource, &rlim) < 0 ? errno : 0;
}

class Pipe { // RAII pipe, both ends close-on-exec
 public:
  int fd[2] = {-1, -1};
  bool Open() { return pipe2(fd, O_CLOEXEC) == 0; }
  void Close(int end) {
    if (fd[end] >= 0) close(fd[end]);
    fd[end] = -1;
  }
  bool IsOpen(int end) const { return fd[end] >= 0; }
  ~Pipe() {
    Close(0);
    Close(1);
  }
};

bool SetNonBlock(int fd) {
  int flags = fcntl(fd, F_GETFL);
  return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) >= 0;
}

inline long ToUs(const struct timeval& v) {
  return (long)v.tv_sec * 1'000'000 + v.tv_usec;
}

inline long ElapsedUs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - start).count();
}

// Captured output of one stream, capped at `limit` UTF-8 code points
struct Capture {
  std::string& buf;
  size_t limit;
  size_t chars = 0;
  bool full = false;
};

// Read one chunk; characters beyond the limit are discarded, and the cut is
// always made before a lead byte. Returns false on EOF or error
bool ReadInto(int fd, Capture& cap) {
  char tmp[65536];
  ssize_t n = read(fd, tmp, sizeof(tmp));
  if (n < 0) return errno == EAGAIN || errno == EINTR;
  if (n == 0) return false;
  if (!cap.limit) {
    cap.buf.append(tmp, n);
    return true;
  }
  ssize_t keep = 0;
  for (; keep < n && !cap.full; keep++) {
    if ((tmp[keep] & 0xC0) == 0x80) continue;
    if (cap.chars == cap.limit) {
      cap.full = true;
      break;
    }
    cap.chars++;
  }
  cap.buf.append(tmp, keep);
  return true;
}

// Returns false once the pipe should be closed (all written or reader gone)
bool WriteFrom(int fd, const std::string& data, size_t& pos) {
  if (pos >= data.size()) return false;
  ssize_t n = write(fd, data.data() + pos, std::min<size_t>(data.size() - pos, 65536));
  if (n < 0) return errno == EAGAIN || errno == EINTR; // EPIPE: program stopped reading
  pos += n;
  return pos < data.size();
}

} // namespace

int ResourceLimits::Apply() const {
  if (int err = SetLimit(RLIMIT_CORE, 0, 0)) return err;
  if (vss > 0) {
    rlim_t bytes = (rlim_t)vss * 1024;
    if (int err = SetLimit(RLIMIT_AS, bytes, bytes)) return err;
  }
  if (cpu_time > 0) {
    // the soft limit delivers SIGXCPU; the hard one SIGKILLs a process ignoring it
    if (int err = SetLimit(RLIMIT_CPU, cpu_time, cpu_time + 1)) return err;
  }
  if (fsize > 0) {
    rlim_t bytes = (rlim_t)fsize * 1024;
    if (int err = SetLimit(RLIMIT_FSIZE, bytes, bytes)) return err;
  }
  if (file_num > 0) {
    if (int err = SetLimit(RLIMIT_NOFILE, file_num, file_num)) return err;
  }
  return 0;
}

bool SandboxResult::Exited() const {
  return !spawn_error && WIFEXITED(status);
}

bool SandboxResult::Signaled() const {
  return !spawn_error && WIFSIGNALED(status);
}

int SandboxResult::ExitCode() const {
  if (Exited()) return WEXITSTATUS(status);
  if (Signaled()) return -WTERMSIG(status);
  return -1;
}

int SandboxResult::Signal() const {
  return Signaled() ? WTERMSIG(status) : 0;
}

bool SandboxResult::CpuLimitExceeded(const ResourceLimits& limits) const {
  if (!Signaled() || timekill || limits.cpu_time <= 0) return false;
  int sig = WTERMSIG(status);
  return sig == SIGXCPU || (sig == SIGKILL && cpu_time >= limits.cpu_time * 1'000'000);
}

SandboxResult SandboxExec(const SandboxOptions& opt) {
  // a program closing its stdin early must not take the server down
  static const bool kSigpipeIgnored = signal(SIGPIPE, SIG_IGN) != SIG_ERR;
  SandboxResult ret;
  auto Fail = [&ret](const char* stage, int err) {
    spdlog::warn("SandboxExec error at {}: errno={} {}", stage, err, strerror(err));
    ret.spawn_error = true;
    ret.spawn_errno = err;
    ret.spawn_stage = stage;
    return ret;
  };
  if (!kSigpipeIgnored) return Fail("signal", errno);
  if (opt.command.empty()) return Fail("command", EINVAL);

  std::vector<char*> argv;
  for (auto& i : opt.command) argv.push_back(const_cast<char*>(i.c_str()));
  argv.push_back(nullptr);

  Pipe in, out, err, report;
  if (!in.Open() || !out.Open() || !err.Open() || !report.Open()) return Fail("pipe", errno);

  spdlog::debug("SandboxExec command: {} workdir={} wall_time={}us",
      fmt::format("{}", opt.command), opt.workdir, opt.wall_time);
  auto start = std::chrono::steady_clock::now();
  pid_t pid = fork();
  if (pid < 0) return Fail("fork", errno);
  if (pid == 0) {
    // child: async-signal-safe calls only
    setpgid(0, 0);
    sigset_t mask;
    sigemptyset(&mask);
    sigprocmask(SIG_SETMASK, &mask, nullptr);
    signal(SIGPIPE, SIG_DFL);
    if (dup2(in.fd[0], 0) < 0 || dup2(out.fd[1], 1) < 0 || dup2(err.fd[1], 2) < 0) {
      ChildFail(report.fd[1], SpawnStage::REDIRECT, errno);
    }
    if (!opt.workdir.empty() && chdir(opt.workdir.c_str()) < 0) {
      ChildFail(report.fd[1], SpawnStage::CHDIR, errno);
    }
    if (int e = opt.limits.Apply()) ChildFail(report.fd[1], SpawnStage::RLIMIT, e);
    execvp(argv[0], argv.data());
    ChildFail(report.fd[1], SpawnStage::EXEC, errno);
  }

  // also from the parent, so kill(-pid) is valid even before the child runs
  setpgid(pid, pid);
  in.Close(0);
  out.Close(1);
  err.Close(1);
  report.Close(1);
  {
    SpawnReport rep{};
    ssize_t n;
    do {
      n = read(report.fd[0], &rep, sizeof(rep));
    } while (n < 0 && errno == EINTR);
    if (n == sizeof(rep)) {
      waitpid(pid, nullptr, 0);
      return Fail(SpawnStageName(rep.stage), rep.err);
    }
  }

  if (!SetNonBlock(in.fd[1]) || !SetNonBlock(out.fd[0]) || !SetNonBlock(err.fd[0])) {
    int saved = errno;
    kill(-pid, SIGKILL);
    waitpid(pid, nullptr, 0);
    return Fail("fcntl", saved);
  }
  size_t input_pos = 0;
  if (opt.input.empty()) in.Close(1);
  Capture out_cap{ret.output, opt.output_limit}, err_cap{ret.error, opt.output_limit};

  int status = 0;
  struct rusage usage{};
  bool reaped = false;
  long drain_deadline = 0;
  while (true) {
    if (!reaped && wait4(pid, &status, WNOHANG, &usage) == pid) {
      reaped = true;
      ret.time = ElapsedUs(start);
      drain_deadline = ret.time + kDrainGraceUs;
      // the program is gone; its descendants go with it
      kill(-pid, SIGKILL);
    }
    if (reaped && !out.IsOpen(0) && !err.IsOpen(0)) break;
    long elapsed = ElapsedUs(start);
    if (reaped && elapsed >= drain_deadline) {
      spdlog::debug("Output pipes of pid {} still open after exit; stop draining", pid);
      break;
    }
    if (!reaped && opt.wall_time > 0 && elapsed >= opt.wall_time) {
      spdlog::debug("Wall time limit exceeded: pid={} elapsed={}us", pid, elapsed);
      ret.timekill = true;
      break;
    }

    struct pollfd fds[3];
    int nfds = 0, out_idx = -1, err_idx = -1, in_idx = -1;
    auto AddFd = [&](int fd, short events) {
      fds[nfds] = {fd, events, 0};
      return nfds++;
    };
    if (out.IsOpen(0)) out_idx = AddFd(out.fd[0], POLLIN);
    if (err.IsOpen(0)) err_idx = AddFd(err.fd[0], POLLIN);
    if (in.IsOpen(1)) in_idx = AddFd(in.fd[1], POLLOUT);
    int timeout = kPollIntervalMs;
    if (!reaped && opt.wall_time > 0) {
      timeout = std::min<long>(timeout, (opt.wall_time - elapsed) / 1000 + 1);
    }
    if (poll(fds, nfds, timeout) < 0) {
      if (errno == EINTR) continue;
      int saved = errno;
      if (!reaped) {
        kill(-pid, SIGKILL);
        waitpid(pid, nullptr, 0);
      }
      return Fail("poll", saved);
    }
    if (out_idx != -1 && fds[out_idx].revents &&
        !ReadInto(out.fd[0], out_cap)) {
      out.Close(0);
    }
    if (err_idx != -1 && fds[err_idx].revents &&
        !ReadInto(err.fd[0], err_cap)) {
      err.Close(0);
    }
    if (in_idx != -1 && fds[in_idx].revents) {
      if ((fds[in_idx].revents & POLLERR) || !WriteFrom(in.fd[1], opt.input, input_pos)) {
        in.Close(1);
      }
    }
  }

  if (!reaped) {
    kill(-pid, SIGKILL);
    while (wait4(pid, &status, 0, &usage) < 0 && errno == EINTR);
    ret.time = ElapsedUs(start);
  }
  ret.status = status;
  ret.cpu_time = ToUs(usage.ru_utime) + ToUs(usage.ru_stime);
  spdlog::debug("SandboxExec finished: pid={} status={} timekill={} time={}us cpu={}us",
      pid, status, ret.timekill, ret.time, ret.cpu_time);
  return ret;
}
