#include <algorithm>
#include <chrono>
#include <thread>

#include <gtest/gtest.h>
#include <fluxflow/remote.h>

#include "api_server.h"
#include "test_utils.h"

using nlohmann::json;

class ApiServerTest : public testing::Test {
 protected:
  Config config = TestConfig();
  std::unique_ptr<FakeBackend> piston;
  std::unique_ptr<LocalEngine> engine;
  std::unique_ptr<JDoodleClient> primary;
  std::unique_ptr<PistonClient> secondary;
  std::unique_ptr<FallbackOrchestrator> orchestrator;
  std::unique_ptr<ApiServer> server;
  std::thread thread;
  int port;

  void SetUp() override {
    piston = std::make_unique<FakeBackend>([](const json& req, httplib::Response& res) {
      std::string script = req.value("files", json::array()).at(0).value("content", "");
      if (script == "timeout") {
        std::this_thread::sleep_for(std::chrono::milliseconds(1500));
        return;
      }
      if (script == "empty") {
        return ReplyJson(res, 200, {{"run", {{"stdout", ""}, {"stderr", ""}, {"code", 0}}}});
      }
      if (script == "fail") {
        return ReplyJson(res, 200, {{"run", {{"stdout", "a"}, {"stderr", "b"}, {"code", 2}}}});
      }
      if (script == "bad-language") {
        return ReplyJson(res, 400, {{"message", "runtime is unknown"}});
      }
      ReplyJson(res, 200, {{"run", {{"stdout", "out:" + req.value("stdin", "")},
                                    {"stderr", ""}, {"code", 0}}}});
    });
    config.primary.url = UnreachableUrl();
    config.primary.client_id = "id";
    config.primary.client_secret = "secret";
    config.secondary.url = piston->Url();
    config.secondary.timeout = 1;
    engine = std::make_unique<LocalEngine>(config);
    primary = std::make_unique<JDoodleClient>(config.primary, config.max_output_size);
    secondary = std::make_unique<PistonClient>(config.secondary, config.max_output_size);
    orchestrator = std::make_unique<FallbackOrchestrator>(config, *primary, *secondary);
    server = std::make_unique<ApiServer>(config, *engine, *orchestrator);
    port = server->BindToAnyPort("127.0.0.1");
    ASSERT_GT(port, 0);
    thread = std::thread([this]() { server->ListenAfterBind(); });
    for (int i = 0; i < 1000 && !server->IsRunning(); i++) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  }

  void TearDown() override {
    server->Stop();
    thread.join();
  }

  std::pair<int, json> Post(const std::string& path, const std::string& body) {
    httplib::Client cli("127.0.0.1", port);
    cli.set_read_timeout(30, 0);
    auto res = cli.Post(path.c_str(), body, "application/json");
    if (!res) return {-1, nullptr};
    return {res->status, json::parse(res->body)};
  }
  std::pair<int, json> Post(const std::string& path, const json& body) {
    return Post(path, body.dump());
  }
  std::pair<int, json> Get(const std::string& path) {
    httplib::Client cli("127.0.0.1", port);
    auto res = cli.Get(path.c_str());
    if (!res) return {-1, nullptr};
    return {res->status, json::parse(res->body)};
  }
};

TEST_F(ApiServerTest, RunHelloWorld) {
  auto [status, body] = Post("/run", json{{"code", "print('Hello World')"}, {"language", "python"}});
  EXPECT_EQ(status, 200);
  EXPECT_EQ(body["success"], true);
  EXPECT_EQ(body["output"], "Hello World\n");
  EXPECT_EQ(body["error"], "");
  EXPECT_EQ(body["exit_code"], 0);
  EXPECT_EQ(body["language"], "python");
  EXPECT_FALSE(body.contains("phase"));
}

TEST_F(ApiServerTest, RunC) {
  auto [status, body] = Post("/run", json{
      {"code", "#include <stdio.h>\nint main(){printf(\"hi\");return 0;}"}, {"language", "c"}});
  EXPECT_EQ(status, 200);
  EXPECT_EQ(body["success"], true);
  EXPECT_EQ(body["phase"], "execution");
  EXPECT_EQ(body["exit_code"], 0);
  EXPECT_EQ(body["output"], "hi");
}

TEST_F(ApiServerTest, RunCompileError) {
  auto [status, body] = Post("/run", json{{"code", "int main() { return"}, {"language", "cpp"}});
  EXPECT_EQ(status, 200);
  EXPECT_EQ(body["success"], false);
  EXPECT_EQ(body["phase"], "compilation");
  EXPECT_NE(body["exit_code"], 0);
  EXPECT_EQ(body["output"], "");
  EXPECT_NE(body["error"], "");
}

TEST_F(ApiServerTest, RunTimeout) {
  auto [status, body] = Post("/run", json{{"code", "import time\ntime.sleep(10)"},
                                          {"language", "python"}});
  EXPECT_EQ(status, 408);
  EXPECT_EQ(body["success"], false);
  EXPECT_EQ(body["exit_code"], -1);
  EXPECT_EQ(body["output"], "");
  EXPECT_NE(body["error"].get<std::string>().find("timeout"), std::string::npos);
  EXPECT_EQ(CountEntries(config.scratch_root), 0u);
}

TEST_F(ApiServerTest, RunValidation) {
  auto [status, body] = Post("/run", json{{"code", ""}, {"language", "python"}});
  EXPECT_EQ(status, 400);
  EXPECT_EQ(body, json({{"error", "No code provided"}}));

  std::tie(status, body) = Post("/run", json{{"code", "x"}, {"language", "java"}});
  EXPECT_EQ(status, 400);
  EXPECT_EQ(body["error"], "Unsupported language: java");

  std::tie(status, body) = Post("/run", json{{"code", std::string(10001, 'x')}});
  EXPECT_EQ(status, 400);
  EXPECT_EQ(body["error"], "Code too long (max 10000 chars)");

  std::tie(status, body) = Post("/run", std::string("{not json"));
  EXPECT_EQ(status, 400);
  EXPECT_EQ(body["error"], "No JSON body provided");

  std::tie(status, body) = Post("/run", json{{"code", 12}});
  EXPECT_EQ(status, 400);
}

TEST_F(ApiServerTest, RunDefaultsAndInput) {
  auto [status, body] = Post("/run", json{
      {"code", "print(input()[::-1])"}, {"language", "PYTHON"}, {"input", "abc\n"}});
  EXPECT_EQ(status, 200);
  EXPECT_EQ(body["output"], "cba\n");
  EXPECT_EQ(body["language"], "python");

  std::tie(status, body) = Post("/run", json{{"code", "print(2)"}});
  EXPECT_EQ(status, 200);
  EXPECT_EQ(body["output"], "2\n");
}

TEST_F(ApiServerTest, RunCodeFallback) {
  auto [status, body] = Post("/run-code", json{
      {"script", "print(1)"}, {"language", "python"}, {"stdin", "x"}});
  EXPECT_EQ(status, 200);
  EXPECT_EQ(body["success"], true);
  EXPECT_EQ(body["source"], "Piston");
  EXPECT_EQ(body["output"], "out:x");
  EXPECT_EQ(body["error"], "");
  EXPECT_EQ(body["language"], "python");
}

TEST_F(ApiServerTest, RunCodeNoOutput) {
  auto [status, body] = Post("/run-code", json{{"script", "empty"}});
  EXPECT_EQ(status, 200);
  EXPECT_EQ(body["output"], "(No output)");
  EXPECT_EQ(body["language"], "python");
}

TEST_F(ApiServerTest, RunCodeFailure) {
  auto [status, body] = Post("/run-code", json{{"script", "fail"}, {"language", "Go"}});
  EXPECT_EQ(status, 200);
  EXPECT_EQ(body["success"], false);
  EXPECT_EQ(body["output"], "ab");
  EXPECT_EQ(body["error"], "b");
  EXPECT_EQ(body["language"], "go");
}

TEST_F(ApiServerTest, RunCodeBackendError) {
  auto [status, body] = Post("/run-code", json{{"script", "bad-language"}});
  EXPECT_EQ(status, 200);
  EXPECT_EQ(body["success"], false);
  EXPECT_EQ(body["error"], "Piston Error: runtime is unknown");
  EXPECT_EQ(body["source"], "Piston");
}

TEST_F(ApiServerTest, RunCodeTimeout) {
  auto [status, body] = Post("/run-code", json{{"script", "timeout"}});
  EXPECT_EQ(status, 408);
  EXPECT_EQ(body, json({{"error", "Execution timeout"}, {"success", false}}));
}

TEST_F(ApiServerTest, RunCodeValidation) {
  auto [status, body] = Post("/run-code", json{{"language", "python"}});
  EXPECT_EQ(status, 400);
  EXPECT_EQ(body, json({{"error", "No script provided"}, {"success", false}}));

  std::tie(status, body) = Post("/run-code", std::string(""));
  EXPECT_EQ(status, 400);
  EXPECT_EQ(body, json({{"error", "No JSON body provided"}, {"success", false}}));
}

TEST_F(ApiServerTest, Informational) {
  auto [status, body] = Get("/");
  EXPECT_EQ(status, 200);
  EXPECT_EQ(body["name"], "FluxFlow Backend API");
  EXPECT_TRUE(body["endpoints"].contains("/run-code"));

  std::tie(status, body) = Get("/health");
  EXPECT_EQ(status, 200);
  EXPECT_EQ(body["status"], "healthy");
  EXPECT_EQ(body["version"], kVersion);
  EXPECT_GT(body["timestamp"].get<double>(), 0);

  std::tie(status, body) = Get("/languages");
  EXPECT_EQ(status, 200);
  ASSERT_EQ(body["languages"].size(), 3u);
  EXPECT_EQ(body["languages"][0], json({{"id", "c"}, {"name", "C (GCC)"}, {"extension", ".c"}}));
  auto remote = body["remote_languages"].get<std::vector<std::string>>();
  EXPECT_NE(std::find(remote.begin(), remote.end(), "kotlin"), remote.end());
}

TEST(ResponseTest, RunStatusCodes) {
  ExecutionResult res;
  res.outcome = Outcome::INTERNAL_ERROR;
  res.stderr_data = "Failed to create scratch directory";
  auto [status, body] = RunResponse(res);
  EXPECT_EQ(status, 500);
  EXPECT_EQ(body, json({{"success", false}, {"error", "Failed to create scratch directory"}}));

  res.outcome = Outcome::TIMEOUT;
  res.stderr_data = "Execution timeout (5s limit exceeded)";
  std::tie(status, body) = RunResponse(res);
  EXPECT_EQ(status, 408);
  EXPECT_EQ(body["error"], "Execution timeout (5s limit exceeded)");
}

TEST(ResponseTest, RunCodeStatusCodes) {
  ExecutionResult res;
  res.outcome = Outcome::NETWORK_ERROR;
  res.stderr_data = "Piston request failed: Connection";
  auto [status, body] = RunCodeResponse(res);
  EXPECT_EQ(status, 500);
  EXPECT_EQ(body["error"], "Server error: Piston request failed: Connection");

  res.outcome = Outcome::FINISHED;
  res.success = true;
  res.exit_code = 0;
  res.stdout_data = "1";
  res.stderr_data = "warning";
  res.backend = "JDoodle";
  std::tie(status, body) = RunCodeResponse(res);
  EXPECT_EQ(status, 200);
  EXPECT_EQ(body["output"], "1warning");
  EXPECT_EQ(body["error"], "");
  EXPECT_EQ(body["source"], "JDoodle");
}

TEST(ResponseTest, InvalidUtf8) {
  ExecutionResult res;
  res.outcome = Outcome::FINISHED;
  res.stdout_data = "ok\xff\xfe";
  auto [status, body] = RunResponse(res);
  EXPECT_EQ(status, 200);
  EXPECT_NO_THROW(body.dump(-1, ' ', false, json::error_handler_t::replace));
}
