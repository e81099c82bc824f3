#ifndef INCLUDE_FLUXFLOW_EXECUTION_H_
#define INCLUDE_FLUXFLOW_EXECUTION_H_

#include <string>

// how an execution call ended; HTTP status is derived from this in the API layer only
#define ENUM_OUTCOME_ \
  X(FINISHED, "Finished") \
  X(TIMEOUT, "Timeout") \
  X(INVALID_REQUEST, "Invalid request") \
  X(BACKEND_ERROR, "Backend error") \
  X(NETWORK_ERROR, "Network error") \
  X(INTERNAL_ERROR, "Internal error")
enum class Outcome {
#define X(name, desc) name,
  ENUM_OUTCOME_
#undef X
};

#define ENUM_PHASE_ \
  X(NONE, "") \
  X(COMPILATION, "compilation") \
  X(EXECUTION, "execution")
enum class Phase {
#define X(name, str) name,
  ENUM_PHASE_
#undef X
};

struct ExecutionRequest {
  std::string source;
  std::string language; // canonical lowercase id, e.g. "python", "cpp"
  std::string stdin_data;
};

class ExecutionResult {
 public:
  bool success;
  std::string stdout_data, stderr_data; // each truncated independently
  int exit_code; // -1 if the process never terminated by itself
  Phase phase;
  std::string backend; // empty for local execution
  std::string language;
  Outcome outcome;
  long time_limit; // seconds; the ceiling that expired if outcome == TIMEOUT

  ExecutionResult() :
      success(false),
      exit_code(-1),
      phase(Phase::NONE),
      outcome(Outcome::INTERNAL_ERROR),
      time_limit(0) {}

  static ExecutionResult Invalid(const std::string& message) {
    ExecutionResult ret;
    ret.outcome = Outcome::INVALID_REQUEST;
    ret.stderr_data = message;
    return ret;
  }
};

#endif  // INCLUDE_FLUXFLOW_EXECUTION_H_
