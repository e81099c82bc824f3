#include "api_server.h"

#include <set>
#include <chrono>
#include <optional>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <fluxflow/utils.h>

using nlohmann::json;

const char kVersion[] = "1.0.0";

namespace {

constexpr size_t kMaxPayload = 1 << 20;
const char kNoBody[] = "No JSON body provided";
const char kServerError[] = "Internal server error";

void SetJson(httplib::Response& res, int status, const json& body) {
  res.status = status;
  res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
}

// false if the field is present but not a string
bool ReadString(const json& body, const char* key, std::string& out) {
  auto it = body.find(key);
  if (it == body.end() || it->is_null()) return true;
  if (!it->is_string()) return false;
  out = it->get<std::string>();
  return true;
}

// {source_key, "language", stdin_key} -> ExecutionRequest; language defaults to python
std::optional<ExecutionRequest> ParseRequest(
    const std::string& raw, const char* source_key, const char* stdin_key, std::string& error) {
  json body = json::parse(raw, nullptr, false);
  if (body.is_discarded() || !body.is_object()) {
    error = kNoBody;
    return std::nullopt;
  }
  ExecutionRequest req;
  req.language = "python";
  const std::pair<const char*, std::string*> fields[] = {
    {source_key, &req.source}, {"language", &req.language}, {stdin_key, &req.stdin_data},
  };
  for (auto& [key, field] : fields) {
    if (!ReadString(body, key, *field)) {
      error = fmt::format("Field '{}' must be a string", key);
      return std::nullopt;
    }
  }
  req.language = ToLower(std::move(req.language));
  return req;
}

// exceptions never leave a handler
template <class Func>
void Guard(httplib::Response& res, const char* route, Func&& func) {
  try {
    func();
  } catch (std::exception& e) {
    spdlog::error("Unhandled exception in {}: {}", route, e.what());
    SetJson(res, 500, {{"success", false}, {"error", kServerError}});
  }
}

} // namespace

std::pair<int, json> RunResponse(const ExecutionResult& res) {
  switch (res.outcome) {
    case Outcome::INVALID_REQUEST:
      return {400, {{"error", res.stderr_data}}};
    case Outcome::TIMEOUT:
      return {408, {
        {"success", false},
        {"output", ""},
        {"error", res.stderr_data},
        {"exit_code", -1},
      }};
    case Outcome::FINISHED: {
      json body = {
        {"success", res.success},
        {"output", res.stdout_data},
        {"error", res.stderr_data},
        {"exit_code", res.exit_code},
        {"language", res.language},
      };
      if (res.phase != Phase::NONE) body["phase"] = PhaseName(res.phase);
      return {200, body};
    }
    case Outcome::BACKEND_ERROR:
    case Outcome::NETWORK_ERROR:
    case Outcome::INTERNAL_ERROR:
      return {500, {{"success", false}, {"error", res.stderr_data}}};
  }
  __builtin_unreachable();
}

std::pair<int, json> RunCodeResponse(const ExecutionResult& res) {
  switch (res.outcome) {
    case Outcome::INVALID_REQUEST:
      return {400, {{"error", res.stderr_data}, {"success", false}}};
    case Outcome::TIMEOUT:
      return {408, {{"error", "Execution timeout"}, {"success", false}}};
    case Outcome::BACKEND_ERROR:
      return {200, {
        {"success", false},
        {"output", ""},
        {"error", res.stderr_data},
        {"source", res.backend},
        {"language", res.language},
      }};
    case Outcome::FINISHED: {
      std::string output = res.stdout_data + res.stderr_data;
      return {200, {
        {"success", res.success},
        {"output", output.empty() ? "(No output)" : output},
        {"error", res.success ? "" : res.stderr_data},
        {"source", res.backend},
        {"language", res.language},
      }};
    }
    case Outcome::NETWORK_ERROR:
    case Outcome::INTERNAL_ERROR:
      return {500, {{"error", "Server error: " + res.stderr_data}, {"success", false}}};
  }
  __builtin_unreachable();
}

ApiServer::ApiServer(
    const Config& config, const LocalEngine& engine, const FallbackOrchestrator& orchestrator) :
    config_(config), engine_(engine), orchestrator_(orchestrator) {
  server_.new_task_queue = [parallel = config_.parallel] {
    return new httplib::ThreadPool(parallel);
  };
  server_.set_payload_max_length(kMaxPayload);
  server_.set_logger([](const httplib::Request& req, const httplib::Response& res) {
    spdlog::info("{} {} {} {}", req.remote_addr, req.method, req.path, res.status);
  });
  Route_();
}

void ApiServer::Route_() {
  using httplib::Request;
  using httplib::Response;

  server_.Get("/", [](const Request&, Response& res) {
    SetJson(res, 200, {
      {"name", "FluxFlow Backend API"},
      {"version", kVersion},
      {"endpoints", {
        {"/health", "Health check"},
        {"/run", "Execute code locally (POST)"},
        {"/run-code", "Execute code on a remote backend (POST)"},
        {"/languages", "Supported languages (GET)"},
      }},
    });
  });

  server_.Get("/health", [](const Request&, Response& res) {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    SetJson(res, 200, {
      {"status", "healthy"},
      {"version", kVersion},
      {"timestamp", std::chrono::duration<double>(now).count()},
    });
  });

  server_.Get("/languages", [this](const Request&, Response& res) {
    json languages = json::array();
    for (auto& info : engine_.Languages()) {
      languages.push_back({{"id", info.id}, {"name", info.name}, {"extension", info.extension}});
    }
    std::set<std::string> remote;
    for (auto& [id, backend_id] : config_.primary.languages) remote.insert(id);
    for (auto& [id, backend_id] : config_.secondary.languages) remote.insert(id);
    SetJson(res, 200, {{"languages", languages}, {"remote_languages", remote}});
  });

  server_.Post("/run", [this](const Request& req, Response& res) {
    Guard(res, "/run", [&]() {
      std::string error;
      auto request = ParseRequest(req.body, "code", "input", error);
      if (!request) return SetJson(res, 400, {{"error", error}});
      auto [status, body] = RunResponse(engine_.Run(*request));
      SetJson(res, status, body);
    });
  });

  server_.Post("/run-code", [this](const Request& req, Response& res) {
    Guard(res, "/run-code", [&]() {
      std::string error;
      auto request = ParseRequest(req.body, "script", "stdin", error);
      if (!request) return SetJson(res, 400, {{"error", error}, {"success", false}});
      auto [status, body] = RunCodeResponse(orchestrator_.Run(*request));
      SetJson(res, status, body);
    });
  });
}

bool ApiServer::Listen() {
  spdlog::warn("Listening on {}:{} with {} workers", config_.host, config_.port, config_.parallel);
  if (!server_.listen(config_.host, config_.port)) {
    spdlog::error("Failed to listen on {}:{}", config_.host, config_.port);
    return false;
  }
  return true;
}

int ApiServer::BindToAnyPort(const std::string& host) {
  return server_.bind_to_any_port(host);
}

bool ApiServer::ListenAfterBind() {
  return server_.listen_after_bind();
}

bool ApiServer::IsRunning() const {
  return server_.is_running();
}

void ApiServer::Stop() {
  server_.stop();
}
