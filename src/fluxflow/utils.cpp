#include "utils.h"

#include <unistd.h>
#include <cctype>
#include <cstring>
#include <fstream>
#include <algorithm>

#include <spdlog/spdlog.h>

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;

#define X(...) X_RETURN_ARG2(Outcome, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* OutcomeDesc, Outcome, ENUM_OUTCOME_)
#undef X

#define X(...) X_RETURN_ARG2(Phase, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* PhaseName, Phase, ENUM_PHASE_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG2

std::string Truncate(std::string&& str, size_t max_size) {
  if (!max_size || str.size() <= max_size) return std::move(str);
  size_t chars = 0;
  for (size_t i = 0; i < str.size(); i++) {
    if ((str[i] & 0xC0) == 0x80) continue;
    if (chars++ == max_size) {
      str.resize(i);
      break;
    }
  }
  return std::move(str);
}

std::string ToLower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return str;
}

size_t Utf8Length(const std::string& str) {
  size_t ret = 0;
  for (unsigned char c : str) ret += (c & 0xC0) != 0x80;
  return ret;
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool WriteFile(const fs::path& path, const std::string& content) {
  std::ofstream fout(path, std::ios::binary);
  if (!fout) {
    spdlog::warn("Failed opening {} for writing", path.c_str());
    return false;
  }
  fout << content;
  fout.close();
  if (!fout) {
    spdlog::warn("Failed writing {}", path.c_str());
    return false;
  }
  return true;
}

ScratchDir::ScratchDir(const fs::path& root) {
  if (!CreateDirs(root)) return;
  std::string tmpl = (root / "run.XXXXXX").string();
  if (char* res = mkdtemp(tmpl.data())) {
    path_ = res;
    spdlog::debug("Created scratch directory {}", path_.c_str());
  } else {
    spdlog::warn("Failed creating scratch directory under {}: {}", root.c_str(), strerror(errno));
  }
}

ScratchDir::~ScratchDir() {
  if (!path_.empty()) RemoveAll(path_);
}
