#ifndef TEST_TEST_UTILS_H_
#define TEST_TEST_UTILS_H_

#include <mutex>
#include <atomic>
#include <thread>
#include <string>
#include <functional>
#include <filesystem>

#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <fluxflow/config.h>

namespace fs = std::filesystem;

// shared by every test; removed by the global environment
extern fs::path kTestScratchRoot;

// defaults with a private scratch root and a short wall clock limit
Config TestConfig();
size_t CountEntries(const fs::path&);

void ReplyJson(httplib::Response& res, int status, const nlohmann::json& body);

// Local HTTP server standing in for a remote execution service.
// Every POST to /execute is counted and handed to the handler.
class FakeBackend {
 public:
  using Handler = std::function<void(const nlohmann::json& request, httplib::Response&)>;

 private:
  httplib::Server server_;
  std::thread thread_;
  int port_;
  std::atomic<int> hits_;
  mutable std::mutex mtx_;
  nlohmann::json last_request_;

 public:
  explicit FakeBackend(Handler&& handler);
  ~FakeBackend();

  std::string Url() const;
  int Hits() const { return hits_; }
  nlohmann::json LastRequest() const;
};

// accepts nothing: connections are refused
std::string UnreachableUrl();

#endif  // TEST_TEST_UTILS_H_
