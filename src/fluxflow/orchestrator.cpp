#include <fluxflow/orchestrator.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <fluxflow/utils.h>

ExecutionResult FallbackOrchestrator::Run(const ExecutionRequest& req) const {
  if (req.source.empty()) return ExecutionResult::Invalid("No script provided");
  if (Utf8Length(req.source) > config_.max_code_length) {
    return ExecutionResult::Invalid(
        fmt::format("Code too long (max {} chars)", config_.max_code_length));
  }

  if (primary_.Available()) {
    ExecutionResult ret = primary_.Execute(req);
    if (ret.outcome == Outcome::FINISHED && !primary_.IsQuotaExhausted(ret)) {
      spdlog::info("Remote execution by {}: language={} exit_code={}",
          primary_.Name(), req.language, ret.exit_code);
      return ret;
    }
    if (ret.outcome == Outcome::FINISHED) {
      spdlog::warn("{} quota exhausted, falling back to {}", primary_.Name(), secondary_.Name());
    } else {
      spdlog::warn("{} failed ({}: {}), falling back to {}", primary_.Name(),
          OutcomeDesc(ret.outcome), ret.stderr_data, secondary_.Name());
    }
  } else {
    spdlog::debug("{} not configured, using {}", primary_.Name(), secondary_.Name());
  }

  ExecutionResult ret = secondary_.Execute(req);
  spdlog::info("Remote execution by {}: language={} outcome={} exit_code={}",
      secondary_.Name(), req.language, OutcomeDesc(ret.outcome), ret.exit_code);
  return ret;
}
