#ifndef SERVER_API_SERVER_H_
#define SERVER_API_SERVER_H_

#include <string>
#include <utility>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include <fluxflow/config.h>
#include <fluxflow/engine.h>
#include <fluxflow/orchestrator.h>

extern const char kVersion[];

// HTTP status and body for an execution result; the only place outcomes
// are mapped to status codes
std::pair<int, nlohmann::json> RunResponse(const ExecutionResult&);
std::pair<int, nlohmann::json> RunCodeResponse(const ExecutionResult&);

// Routes: GET /, /health, /languages; POST /run (local), /run-code (remote)
class ApiServer {
  const Config& config_;
  const LocalEngine& engine_;
  const FallbackOrchestrator& orchestrator_;
  httplib::Server server_;

  void Route_();
 public:
  ApiServer(const Config&, const LocalEngine&, const FallbackOrchestrator&);
  ApiServer(const ApiServer&) = delete;
  ApiServer& operator=(const ApiServer&) = delete;

  // blocks until Stop()
  bool Listen();
  // for tests: bind to an ephemeral port, then ListenAfterBind() on another thread
  int BindToAnyPort(const std::string& host);
  bool ListenAfterBind();
  bool IsRunning() const;
  void Stop();
};

#endif  // SERVER_API_SERVER_H_
