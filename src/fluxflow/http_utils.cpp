#include "http_utils.h"

#include <fmt/format.h>

namespace http_utils {

std::string FormatOneParam(const char* str) {
  return str;
}
std::string FormatOneParam(const std::string& str) {
  return fmt::format("<{} bytes>", str.size());
}

std::string FormatParam() {
  return "(none)";
}

bool SplitUrl(const std::string& url, std::string& origin, std::string& path) {
  size_t scheme = url.find("://");
  if (scheme == std::string::npos || scheme == 0) return false;
  size_t slash = url.find('/', scheme + 3);
  if (slash == scheme + 3) return false;
  if (slash == std::string::npos) {
    origin = url;
    path = "/";
  } else {
    origin = url.substr(0, slash);
    path = url.substr(slash);
  }
  return true;
}

} // namespace http_utils
