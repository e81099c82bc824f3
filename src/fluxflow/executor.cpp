#include "executor.h"

#include <string.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "utils.h"

SandboxOptions LanguageExecutor::RunOptions(
    const fs::path& workdir, std::vector<std::string>&& command, const std::string& input) const {
  SandboxOptions opt;
  opt.command = std::move(command);
  opt.workdir = workdir;
  opt.input = input;
  opt.wall_time = config_.execution_timeout * 1'000'000;
  opt.output_limit = config_.max_output_size;
  opt.limits.vss = config_.memory;
  opt.limits.cpu_time = config_.cpu_time;
  opt.limits.fsize = config_.file_size;
  opt.limits.file_num = config_.open_files;
  return opt;
}

ExecutionResult LanguageExecutor::InternalError(const std::string& message) const {
  ExecutionResult ret;
  ret.outcome = Outcome::INTERNAL_ERROR;
  ret.language = info_.id;
  ret.stderr_data = message;
  return ret;
}

ExecutionResult LanguageExecutor::ToResult(
    SandboxResult&& res, const SandboxOptions& opt, Phase phase) const {
  if (res.spawn_error) {
    ExecutionResult ret = InternalError(fmt::format("Failed to start {} ({}: {})",
        phase == Phase::COMPILATION ? "compiler" : "program", res.spawn_stage,
        strerror(res.spawn_errno)));
    ret.phase = phase;
    return ret;
  }
  ExecutionResult ret;
  ret.language = info_.id;
  ret.phase = phase;
  bool cpu_exceeded = res.CpuLimitExceeded(opt.limits);
  if (res.timekill || cpu_exceeded) {
    ret.outcome = Outcome::TIMEOUT;
    ret.exit_code = -1;
    ret.time_limit = cpu_exceeded ? opt.limits.cpu_time : opt.wall_time / 1'000'000;
    ret.stderr_data = fmt::format("Execution timeout ({}s limit exceeded)", ret.time_limit);
    spdlog::info("{} {} timeout after {}us (cpu {}us)", info_.id, PhaseName(phase), res.time, res.cpu_time);
    return ret;
  }
  ret.outcome = Outcome::FINISHED;
  ret.exit_code = res.ExitCode();
  ret.success = ret.exit_code == 0;
  ret.stdout_data = std::move(res.output);
  ret.stderr_data = std::move(res.error);
  if (res.Signaled()) {
    if (!ret.stderr_data.empty() && ret.stderr_data.back() != '\n') ret.stderr_data += '\n';
    ret.stderr_data += fmt::format("Process terminated by signal {} ({})\n",
        res.Signal(), strsignal(res.Signal()));
    ret.stderr_data = Truncate(std::move(ret.stderr_data), opt.output_limit);
  }
  return ret;
}

ExecutionResult InterpretedExecutor::Execute(const ExecutionRequest& req) const {
  ScratchDir dir(config_.scratch_root);
  if (!dir.Valid()) return InternalError("Failed to create scratch directory");
  fs::path source = dir / ("main" + info_.extension);
  if (!WriteFile(source, req.source)) return InternalError("Failed to write source file");

  // relative to the working directory so tracebacks do not show the scratch path
  SandboxOptions opt = RunOptions(dir.Path(), {interpreter_, source.filename().string()},
                                  req.stdin_data);
  return ToResult(SandboxExec(opt), opt, Phase::NONE);
}

std::vector<std::string> CompiledExecutor::CompileCommand(
    const fs::path& source, const fs::path& binary) const {
  std::vector<std::string> ret = {compiler_.program};
  ret.insert(ret.end(), compiler_.flags.begin(), compiler_.flags.end());
  ret.insert(ret.end(), {source.string(), "-o", binary.string()});
  ret.insert(ret.end(), compiler_.libs.begin(), compiler_.libs.end());
  return ret;
}

SandboxOptions CompiledExecutor::CompileOptions(
    const fs::path& workdir, std::vector<std::string>&& command) const {
  // the compiler is trusted code: no address space or descriptor ceiling
  SandboxOptions opt;
  opt.command = std::move(command);
  opt.workdir = workdir;
  opt.wall_time = compiler_.timeout * 1'000'000;
  opt.output_limit = config_.max_output_size;
  opt.limits.cpu_time = compiler_.timeout;
  opt.limits.fsize = config_.file_size;
  return opt;
}

ExecutionResult CompiledExecutor::Execute(const ExecutionRequest& req) const {
  ScratchDir dir(config_.scratch_root);
  if (!dir.Valid()) return InternalError("Failed to create scratch directory");
  fs::path source = dir / ("program" + info_.extension);
  fs::path binary = dir / "program";
  if (!WriteFile(source, req.source)) return InternalError("Failed to write source file");

  SandboxOptions copt = CompileOptions(dir.Path(),
      CompileCommand(source.filename(), binary.filename()));
  ExecutionResult compiled = ToResult(SandboxExec(copt), copt, Phase::COMPILATION);
  if (compiled.outcome != Outcome::FINISHED) return compiled;
  if (compiled.exit_code != 0) {
    spdlog::debug("{} compilation failed with exit code {}", info_.id, compiled.exit_code);
    compiled.stdout_data.clear();
    return compiled;
  }

  SandboxOptions opt = RunOptions(dir.Path(), {binary.string()}, req.stdin_data);
  return ToResult(SandboxExec(opt), opt, Phase::EXECUTION);
}
