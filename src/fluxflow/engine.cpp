#include <fluxflow/engine.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "executor.h"
#include "utils.h"

LocalEngine::LocalEngine(const Config& config) : config_(config) {
  auto Add = [this](std::unique_ptr<LanguageExecutor>&& executor) {
    std::string id = executor->Info().id;
    executors_.emplace(std::move(id), std::move(executor));
  };
  Add(std::make_unique<InterpretedExecutor>(
      config, LanguageInfo{"python", "Python 3", ".py"}, config.python_interpreter));
  Add(std::make_unique<CompiledExecutor>(
      config, LanguageInfo{"c", "C (GCC)", ".c"}, config.c_compiler));
  Add(std::make_unique<CompiledExecutor>(
      config, LanguageInfo{"cpp", "C++ (G++)", ".cpp"}, config.cpp_compiler));
}

LocalEngine::~LocalEngine() = default;

bool LocalEngine::Supports(const std::string& language) const {
  return executors_.count(language);
}

std::vector<LanguageInfo> LocalEngine::Languages() const {
  std::vector<LanguageInfo> ret;
  for (auto& [id, executor] : executors_) ret.push_back(executor->Info());
  return ret;
}

ExecutionResult LocalEngine::Run(const ExecutionRequest& req) const {
  if (req.source.empty()) return ExecutionResult::Invalid("No code provided");
  if (Utf8Length(req.source) > config_.max_code_length) {
    return ExecutionResult::Invalid(
        fmt::format("Code too long (max {} chars)", config_.max_code_length));
  }
  auto it = executors_.find(req.language);
  if (it == executors_.end()) {
    return ExecutionResult::Invalid(fmt::format("Unsupported language: {}", req.language));
  }
  spdlog::debug("Local execution: language={} source={}B stdin={}B",
      req.language, req.source.size(), req.stdin_data.size());
  ExecutionResult ret = it->second->Execute(req);
  spdlog::info("Local execution finished: language={} outcome={} phase={} exit_code={}",
      req.language, OutcomeDesc(ret.outcome), PhaseName(ret.phase), ret.exit_code);
  return ret;
}
