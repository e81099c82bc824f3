#ifndef INCLUDE_FLUXFLOW_CONFIG_H_
#define INCLUDE_FLUXFLOW_CONFIG_H_

#include <iosfwd>
#include <map>
#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

struct BackendConfig {
  std::string name;
  std::string url; // full endpoint, e.g. https://api.jdoodle.com/v1/execute
  std::string client_id, client_secret; // empty if the backend needs no credentials
  // canonical language id -> backend language id; unmapped ids are passed through
  std::map<std::string, std::string> languages;
  long timeout; // seconds

  BackendConfig() : timeout(30) {}

  bool HasCredentials() const { return !client_id.empty() && !client_secret.empty(); }
  std::string MapLanguage(const std::string& lang) const;
};

struct CompilerConfig {
  std::string program;
  std::vector<std::string> flags; // placed before the source file
  std::vector<std::string> libs; // placed after the source file
  long timeout; // seconds
};

class Config {
 public:
  // server
  std::string host;
  int port;
  int parallel;

  // limits
  size_t max_code_length; // characters
  size_t max_output_size; // UTF-8 characters per stream
  long execution_timeout; // seconds, wall clock
  long cpu_time; // seconds
  long memory; // KiB of address space
  long file_size; // KiB
  int open_files;
  fs::path scratch_root;

  // local toolchain
  std::string python_interpreter;
  CompilerConfig c_compiler, cpp_compiler;

  // remote backends
  BackendConfig primary, secondary;

  Config();
};

// Overrides the members found in the INI stream; returns false on a malformed value
bool LoadConfig(std::istream&, Config&);
// JDOODLE_CLIENT_ID, JDOODLE_CLIENT_SECRET and PORT
void LoadEnvironment(Config&);

// "c:c,cpp:cpp17" -> {{"c", "c"}, {"cpp", "cpp17"}}
bool ParseLanguageMap(const std::string&, std::map<std::string, std::string>&);

#endif  // INCLUDE_FLUXFLOW_CONFIG_H_
