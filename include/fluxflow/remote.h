#ifndef INCLUDE_FLUXFLOW_REMOTE_H_
#define INCLUDE_FLUXFLOW_REMOTE_H_

#include <string>
#include <nlohmann/json_fwd.hpp>

#include "config.h"
#include "execution.h"

// One third-party execution service. Execute() issues exactly one HTTP call
// and never throws; the backend's response shape is fully hidden behind Normalize().
// The BackendConfig must outlive the client.
class RemoteClient {
 protected:
  const BackendConfig& config_;
  size_t max_output_size_;

  virtual nlohmann::json BuildPayload(const ExecutionRequest&) const = 0;
  // body is the parsed response; may throw nlohmann::json::exception
  virtual ExecutionResult Normalize(int status, const nlohmann::json& body) const = 0;

  ExecutionResult Failure(Outcome outcome, const std::string& message) const;

 public:
  RemoteClient(const BackendConfig& config, size_t max_output_size) :
      config_(config), max_output_size_(max_output_size) {}
  virtual ~RemoteClient() = default;

  const std::string& Name() const { return config_.name; }
  const BackendConfig& Backend() const { return config_; }

  // whether the client can be called at all (e.g. credentials are configured)
  virtual bool Available() const { return true; }
  // backend-specific marker that the usage quota of the current window is used up
  virtual bool IsQuotaExhausted(const ExecutionResult&) const { return false; }

  virtual ExecutionResult Execute(const ExecutionRequest&) const;
};

class JDoodleClient : public RemoteClient {
 protected:
  nlohmann::json BuildPayload(const ExecutionRequest&) const override;
  ExecutionResult Normalize(int status, const nlohmann::json& body) const override;
 public:
  using RemoteClient::RemoteClient;

  bool Available() const override { return config_.HasCredentials(); }
  bool IsQuotaExhausted(const ExecutionResult&) const override;
};

class PistonClient : public RemoteClient {
 protected:
  nlohmann::json BuildPayload(const ExecutionRequest&) const override;
  ExecutionResult Normalize(int status, const nlohmann::json& body) const override;
 public:
  using RemoteClient::RemoteClient;
};

#endif  // INCLUDE_FLUXFLOW_REMOTE_H_
