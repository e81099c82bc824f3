#ifndef INCLUDE_FLUXFLOW_ENGINE_H_
#define INCLUDE_FLUXFLOW_ENGINE_H_

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "config.h"
#include "execution.h"

struct LanguageInfo {
  std::string id; // e.g. "cpp"
  std::string name; // e.g. "C++ (G++)"
  std::string extension; // e.g. ".cpp"
};

class LanguageExecutor;

// Synchronous, locally sandboxed execution path.
// The Config must outlive the engine.
class LocalEngine {
  const Config& config_;
  // capability table: only languages present here are accepted
  std::map<std::string, std::unique_ptr<LanguageExecutor>> executors_;

 public:
  explicit LocalEngine(const Config&);
  ~LocalEngine();
  LocalEngine(const LocalEngine&) = delete;
  LocalEngine& operator=(const LocalEngine&) = delete;

  // Validation errors are returned as Outcome::INVALID_REQUEST before
  // anything is written to disk or spawned
  ExecutionResult Run(const ExecutionRequest&) const;

  bool Supports(const std::string& language) const;
  std::vector<LanguageInfo> Languages() const;
};

#endif  // INCLUDE_FLUXFLOW_ENGINE_H_
