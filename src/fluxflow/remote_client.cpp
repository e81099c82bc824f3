#include <fluxflow/remote.h>

#include <chrono>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "http_utils.h"
#include "utils.h"

using nlohmann::json;

namespace {

const std::string kQuotaMarker = "Daily Limit Reached";

// missing or non-string fields read as empty
std::string StringField(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) return "";
  return it->get<std::string>();
}

// stdout, stderr and exit code of a Piston stage; -1 when it was killed
void ReadStage(const json& stage, ExecutionResult& ret) {
  ret.stdout_data = StringField(stage, "stdout");
  ret.stderr_data = StringField(stage, "stderr");
  auto code = stage.find("code");
  if (code != stage.end() && code->is_number_integer()) {
    ret.exit_code = code->get<int>();
    return;
  }
  ret.exit_code = -1;
  std::string signal = StringField(stage, "signal");
  if (signal.size()) {
    if (ret.stderr_data.size() && ret.stderr_data.back() != '\n') ret.stderr_data += '\n';
    ret.stderr_data += fmt::format("Process terminated by signal {}\n", signal);
  }
}

} // namespace

ExecutionResult RemoteClient::Failure(Outcome outcome, const std::string& message) const {
  ExecutionResult ret;
  ret.outcome = outcome;
  ret.stderr_data = message;
  return ret;
}

ExecutionResult RemoteClient::Execute(const ExecutionRequest& req) const {
  ExecutionResult ret = [&]() {
    std::string origin, path;
    if (!http_utils::SplitUrl(config_.url, origin, path)) {
      spdlog::error("{}: invalid endpoint {}", Name(), config_.url);
      return Failure(Outcome::INTERNAL_ERROR, fmt::format("{} endpoint is misconfigured", Name()));
    }
    httplib::Client cli(origin);
    cli.set_connection_timeout(config_.timeout, 0);
    cli.set_read_timeout(config_.timeout, 0);
    cli.set_write_timeout(config_.timeout, 0);

    std::string body = BuildPayload(req).dump(-1, ' ', false, json::error_handler_t::replace);
    auto start = std::chrono::steady_clock::now();
    httplib::Result res = HTTPRequest<HTTPPost>(cli, path, body, "application/json");
    if (!res) {
      auto elapsed = std::chrono::steady_clock::now() - start;
      bool timeout = elapsed >= std::chrono::seconds(config_.timeout);
      spdlog::warn("{}: request failed after {}ms: {}", Name(),
          std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(),
          httplib::to_string(res.error()));
      return Failure(timeout ? Outcome::TIMEOUT : Outcome::NETWORK_ERROR,
                     fmt::format("{} request failed: {}", Name(), httplib::to_string(res.error())));
    }
    spdlog::debug("{}: HTTP {} with {} bytes", Name(), res->status, res->body.size());

    json data = json::parse(res->body, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
      return Failure(Outcome::BACKEND_ERROR,
                     fmt::format("{} Error: malformed response (HTTP {})", Name(), res->status));
    }
    try {
      return Normalize(res->status, data);
    } catch (json::exception& e) {
      spdlog::warn("{}: unexpected response shape: {}", Name(), e.what());
      return Failure(Outcome::BACKEND_ERROR,
                     fmt::format("{} Error: malformed response (HTTP {})", Name(), res->status));
    }
  }();
  ret.backend = Name();
  ret.language = req.language;
  ret.stdout_data = Truncate(std::move(ret.stdout_data), max_output_size_);
  ret.stderr_data = Truncate(std::move(ret.stderr_data), max_output_size_);
  return ret;
}

/// JDoodle

json JDoodleClient::BuildPayload(const ExecutionRequest& req) const {
  return {
    {"clientId", config_.client_id},
    {"clientSecret", config_.client_secret},
    {"script", req.source},
    {"language", config_.MapLanguage(req.language)},
    {"versionIndex", "0"},
    {"stdin", req.stdin_data},
  };
}

// {"output": "...", "statusCode": 200, "memory": "...", "cpuTime": "..."}
// or {"error": "...", "statusCode": 4xx}
ExecutionResult JDoodleClient::Normalize(int status, const json& body) const {
  if (status == 200 && body.contains("output")) {
    ExecutionResult ret;
    ret.outcome = Outcome::FINISHED;
    // stdout and stderr arrive merged; no exit status is reported
    ret.stdout_data = StringField(body, "output");
    ret.exit_code = 0;
    ret.success = true;
    return ret;
  }
  std::string error = StringField(body, "error");
  if (error.empty()) error = fmt::format("missing output (HTTP {})", status);
  return Failure(Outcome::BACKEND_ERROR, "JDoodle Error: " + error);
}

bool JDoodleClient::IsQuotaExhausted(const ExecutionResult& res) const {
  return res.stdout_data.find(kQuotaMarker) != std::string::npos ||
         res.stderr_data.find(kQuotaMarker) != std::string::npos;
}

/// Piston

json PistonClient::BuildPayload(const ExecutionRequest& req) const {
  return {
    {"language", config_.MapLanguage(req.language)},
    {"version", "*"},
    {"files", json::array({{{"content", req.source}}})},
    {"stdin", req.stdin_data},
  };
}

// {"language": ..., "version": ..., "compile"?: stage, "run": stage}
// stage = {"stdout", "stderr", "output", "code": int|null, "signal": str|null}
// or {"message": "..."} on errors
ExecutionResult PistonClient::Normalize(int status, const json& body) const {
  ExecutionResult ret;
  ret.outcome = Outcome::FINISHED;
  // a failed compile stage may come without a run stage
  auto compile = body.find("compile");
  if (compile != body.end() && compile->is_object()) {
    const json& stage = *compile;
    auto code = stage.find("code");
    bool failed = code != stage.end() && code->is_number_integer() ?
        code->get<int>() != 0 : !StringField(stage, "signal").empty();
    if (failed) {
      ReadStage(stage, ret);
      ret.phase = Phase::COMPILATION;
      ret.stdout_data.clear();
      if (ret.stderr_data.empty()) ret.stderr_data = StringField(stage, "output");
      ret.success = false;
      return ret;
    }
    ret.phase = Phase::EXECUTION;
  }

  auto run = body.find("run");
  if (run == body.end() || !run->is_object()) {
    std::string message = StringField(body, "message");
    if (message.empty()) message = "Unknown error from Piston";
    return Failure(Outcome::BACKEND_ERROR, "Piston Error: " + message);
  }
  ReadStage(*run, ret);
  ret.success = ret.exit_code == 0;
  return ret;
}
