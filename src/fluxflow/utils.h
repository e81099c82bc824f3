#ifndef FLUXFLOW_UTILS_H_
#define FLUXFLOW_UTILS_H_

#include <string>
#include <filesystem>

#include <fluxflow/utils.h>

namespace fs = std::filesystem;

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
bool WriteFile(const fs::path&, const std::string& content);

// RAII scratch directory owned by a single execution;
// the directory and everything under it are removed on destruction
class ScratchDir {
  fs::path path_;
 public:
  explicit ScratchDir(const fs::path& root);
  ~ScratchDir();
  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;

  bool Valid() const { return !path_.empty(); }
  const fs::path& Path() const { return path_; }
  fs::path operator/(const fs::path& name) const { return path_ / name; }
};

#endif  // FLUXFLOW_UTILS_H_
