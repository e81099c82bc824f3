#ifndef FLUXFLOW_SANDBOX_H_
#define FLUXFLOW_SANDBOX_H_

#include <string>
#include <vector>

// Resource ceilings of a sandboxed process; 0 means unlimited
struct ResourceLimits {
  long vss; // KiB, address space
  long cpu_time; // seconds
  long fsize; // KiB, largest file the process may write
  int file_num;

  ResourceLimits() : vss(0), cpu_time(0), fsize(0), file_num(0) {}

  // Called in the forked child before exec; only async-signal-safe calls inside.
  // Returns 0 on success, or the errno of the failed setrlimit
  int Apply() const;
};

class SandboxOptions {
 public:
  std::vector<std::string> command; // resolved through PATH
  std::string workdir;
  std::string input; // written to stdin, which is then closed
  ResourceLimits limits;
  long wall_time; // us; 0 for no limit
  size_t output_limit; // UTF-8 characters kept for each of stdout and stderr; 0 for no limit

  SandboxOptions() : wall_time(0), output_limit(0) {}
};

class SandboxResult {
 public:
  int status; // wait status of the child
  bool timekill; // killed because wall_time expired
  // spawn failure; the process never executed untrusted code
  bool spawn_error;
  int spawn_errno;
  std::string spawn_stage;
  std::string output, error;
  long time; // us, wall clock
  long cpu_time; // us, user + sys

  SandboxResult() :
      status(0), timekill(false), spawn_error(false), spawn_errno(0), time(0), cpu_time(0) {}

  bool Exited() const;
  bool Signaled() const;
  int ExitCode() const; // WEXITSTATUS, or -signal number
  int Signal() const;
  // killed by the CPU time ceiling of `limits`
  bool CpuLimitExceeded(const ResourceLimits& limits) const;
};

// Runs opt.command as a new process group with opt.limits applied before exec.
// stdout and stderr are captured independently, each kept up to opt.output_limit
// characters (the rest is drained and discarded). On wall_time expiry, and after the
// main process terminates, the whole process group is SIGKILLed.
SandboxResult SandboxExec(const SandboxOptions&);

#endif  // FLUXFLOW_SANDBOX_H_
