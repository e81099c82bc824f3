#ifndef INCLUDE_FLUXFLOW_ORCHESTRATOR_H_
#define INCLUDE_FLUXFLOW_ORCHESTRATOR_H_

#include "config.h"
#include "execution.h"
#include "remote.h"

// Primary -> secondary remote execution.
// The primary is skipped when unavailable, and its result is discarded on any
// outcome other than FINISHED or when it reports quota exhaustion. The
// secondary's result is always final. Exactly one backend's result is returned.
class FallbackOrchestrator {
  const Config& config_;
  const RemoteClient& primary_;
  const RemoteClient& secondary_;

 public:
  FallbackOrchestrator(const Config& config, const RemoteClient& primary,
                       const RemoteClient& secondary) :
      config_(config), primary_(primary), secondary_(secondary) {}

  ExecutionResult Run(const ExecutionRequest&) const;
};

#endif  // INCLUDE_FLUXFLOW_ORCHESTRATOR_H_
