#ifndef FLUXFLOW_HTTP_UTILS_H_
#define FLUXFLOW_HTTP_UTILS_H_

/// Log outgoing HTTP requests

#include <string>
#include <httplib.h>
#include <spdlog/spdlog.h>

namespace http_utils {

// bodies carry credentials and user code: only their size is logged
std::string FormatOneParam(const char*);
std::string FormatOneParam(const std::string&);
template <class T>
std::string FormatOneParam(const T&) { return "(unknown)"; }

std::string FormatParam();
template <class T, class... U>
std::string FormatParam(T&& head, U&&... tail) {
  return FormatOneParam(std::forward<T>(head)) + ' ' + FormatParam(std::forward<U>(tail)...);
}

// "https://host:port/a/b" -> ("https://host:port", "/a/b")
bool SplitUrl(const std::string& url, std::string& origin, std::string& path);

} // namespace http_utils

struct HTTPPost {
  constexpr static char method_name[] = "POST";
  template <class... T>
  auto operator()(httplib::Client& cli, const std::string& endpoint, T&&... params) {
    return cli.Post(endpoint.c_str(), std::forward<T>(params)...);
  }
};

template <class Method, class... T>
httplib::Result HTTPRequest(httplib::Client& cli, const std::string& endpoint, T&&... params) {
  spdlog::debug("{} {} params {}", Method::method_name, endpoint, http_utils::FormatParam(params...));
  return Method()(cli, endpoint, std::forward<T>(params)...);
}

#endif  // FLUXFLOW_HTTP_UTILS_H_
