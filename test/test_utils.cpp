#include "test_utils.h"

#include <chrono>

fs::path kTestScratchRoot;

Config TestConfig() {
  Config config;
  config.scratch_root = kTestScratchRoot;
  config.execution_timeout = 2;
  config.cpu_time = 2;
  return config;
}

size_t CountEntries(const fs::path& path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) return 0;
  return std::distance(fs::directory_iterator(path), fs::directory_iterator());
}

void ReplyJson(httplib::Response& res, int status, const nlohmann::json& body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

FakeBackend::FakeBackend(Handler&& handler) : hits_(0) {
  server_.Post("/execute", [this, handler = std::move(handler)](
      const httplib::Request& req, httplib::Response& res) {
    hits_++;
    nlohmann::json body = nlohmann::json::parse(req.body, nullptr, false);
    {
      std::lock_guard lck(mtx_);
      last_request_ = body;
    }
    handler(body, res);
  });
  port_ = server_.bind_to_any_port("127.0.0.1");
  thread_ = std::thread([this]() { server_.listen_after_bind(); });
  using namespace std::chrono_literals;
  for (int i = 0; i < 1000 && !server_.is_running(); i++) std::this_thread::sleep_for(1ms);
}

FakeBackend::~FakeBackend() {
  server_.stop();
  thread_.join();
}

std::string FakeBackend::Url() const {
  return "http://127.0.0.1:" + std::to_string(port_) + "/execute";
}

nlohmann::json FakeBackend::LastRequest() const {
  std::lock_guard lck(mtx_);
  return last_request_;
}

std::string UnreachableUrl() {
  return "http://127.0.0.1:1/execute";
}
