#ifndef FLUXFLOW_EXECUTOR_H_
#define FLUXFLOW_EXECUTOR_H_

#include <string>
#include <vector>
#include <filesystem>

#include <fluxflow/config.h>
#include <fluxflow/engine.h>
#include <fluxflow/execution.h>
#include "sandbox.h"

// Turns source text + stdin into a captured result for one language.
// Executors are stateless after construction and may be called from any thread.
class LanguageExecutor {
 protected:
  const Config& config_;
  LanguageInfo info_;

  // policy for running untrusted code: ceilings from the configuration
  SandboxOptions RunOptions(const fs::path& workdir, std::vector<std::string>&& command,
                            const std::string& input) const;
  ExecutionResult ToResult(SandboxResult&& res, const SandboxOptions& opt, Phase phase) const;
  ExecutionResult InternalError(const std::string& message) const;

 public:
  LanguageExecutor(const Config& config, LanguageInfo&& info) :
      config_(config), info_(std::move(info)) {}
  virtual ~LanguageExecutor() = default;

  const LanguageInfo& Info() const { return info_; }

  // The request is assumed validated by the engine
  virtual ExecutionResult Execute(const ExecutionRequest&) const = 0;
};

class InterpretedExecutor : public LanguageExecutor {
  std::string interpreter_;
 public:
  InterpretedExecutor(const Config& config, LanguageInfo&& info, const std::string& interpreter) :
      LanguageExecutor(config, std::move(info)), interpreter_(interpreter) {}

  ExecutionResult Execute(const ExecutionRequest&) const override;
};

// Compile -> Run; the binary only runs if compilation exits with 0
class CompiledExecutor : public LanguageExecutor {
  CompilerConfig compiler_;

  std::vector<std::string> CompileCommand(const fs::path& source, const fs::path& binary) const;
  SandboxOptions CompileOptions(const fs::path& workdir, std::vector<std::string>&& command) const;
 public:
  CompiledExecutor(const Config& config, LanguageInfo&& info, const CompilerConfig& compiler) :
      LanguageExecutor(config, std::move(info)), compiler_(compiler) {}

  ExecutionResult Execute(const ExecutionRequest&) const override;
};

#endif  // FLUXFLOW_EXECUTOR_H_
