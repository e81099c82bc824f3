#include <fluxflow/config.h>

#include <cstdlib>
#include <sstream>

#include <tortellini.hh>
#include <spdlog/spdlog.h>

namespace {

std::string Trim(const std::string& str) {
  size_t l = str.find_first_not_of(" \t");
  if (l == std::string::npos) return "";
  size_t r = str.find_last_not_of(" \t");
  return str.substr(l, r - l + 1);
}

std::vector<std::string> SplitWords(const std::string& str) {
  std::vector<std::string> ret;
  std::istringstream sin(str);
  for (std::string word; sin >> word;) ret.push_back(word);
  return ret;
}

void LoadCompiler(tortellini::ini& ini, const std::string& section, CompilerConfig& compiler) {
  auto sec = ini[section];
  compiler.program = sec["compiler"] | compiler.program;
  compiler.timeout = sec["compile_timeout"] | compiler.timeout;
  std::string flags = sec["flags"] | "";
  std::string libs = sec["libs"] | "";
  if (flags.size()) compiler.flags = SplitWords(flags);
  if (libs.size()) compiler.libs = SplitWords(libs);
}

bool LoadBackend(tortellini::ini& ini, const std::string& section, BackendConfig& backend) {
  auto sec = ini[section];
  backend.name = sec["name"] | backend.name;
  backend.url = sec["url"] | backend.url;
  backend.timeout = sec["timeout"] | backend.timeout;
  std::string languages = sec["languages"] | "";
  if (languages.empty()) return true;
  std::map<std::string, std::string> parsed;
  if (!ParseLanguageMap(languages, parsed)) {
    spdlog::error("Malformed language map in section [{}]: {}", section, languages);
    return false;
  }
  backend.languages = std::move(parsed);
  return true;
}

} // namespace

std::string BackendConfig::MapLanguage(const std::string& lang) const {
  auto it = languages.find(lang);
  return it == languages.end() ? lang : it->second;
}

Config::Config() :
    host("0.0.0.0"),
    port(10000),
    parallel(8),
    max_code_length(10000),
    max_output_size(50000),
    execution_timeout(5),
    cpu_time(5),
    memory(50 * 1024),
    file_size(16 * 1024),
    open_files(64),
    scratch_root("/tmp/fluxflow"),
    python_interpreter("python3"),
    c_compiler{"gcc", {}, {"-lm"}, 10},
    cpp_compiler{"g++", {"-std=c++17"}, {}, 15} {
  primary.name = "JDoodle";
  primary.url = "https://api.jdoodle.com/v1/execute";
  primary.languages = {
    {"c", "c"}, {"cpp", "cpp17"}, {"python", "python3"}, {"java", "java"},
    {"js", "nodejs"}, {"csharp", "csharp"}, {"go", "go"}, {"kotlin", "kotlin"},
    {"swift", "swift"}, {"dart", "dart"},
  };
  secondary.name = "Piston";
  secondary.url = "https://emkc.org/api/v2/piston/execute";
  secondary.languages = {
    {"c", "c"}, {"cpp", "c++"}, {"python", "python"}, {"java", "java"},
    {"js", "javascript"}, {"csharp", "csharp"}, {"go", "go"}, {"kotlin", "kotlin"},
    {"swift", "swift"}, {"dart", "dart"},
  };
}

bool ParseLanguageMap(const std::string& str, std::map<std::string, std::string>& ret) {
  std::istringstream sin(str);
  for (std::string item; std::getline(sin, item, ',');) {
    item = Trim(item);
    if (item.empty()) continue;
    size_t pos = item.find(':');
    if (pos == std::string::npos) return false;
    std::string key = Trim(item.substr(0, pos)), value = Trim(item.substr(pos + 1));
    if (key.empty() || value.empty()) return false;
    ret[key] = value;
  }
  return true;
}

bool LoadConfig(std::istream& fin, Config& config) {
  tortellini::ini ini;
  fin >> ini;

  auto server = ini["server"];
  config.host = server["host"] | config.host;
  config.port = server["port"] | config.port;
  config.parallel = server["parallel"] | config.parallel;

  auto limits = ini["limits"];
  long max_code_length = limits["max_code_length"] | (long)config.max_code_length;
  long max_output_size = limits["max_output_size"] | (long)config.max_output_size;
  if (max_code_length <= 0 || max_output_size <= 0) {
    spdlog::error("max_code_length and max_output_size must be positive");
    return false;
  }
  config.max_code_length = max_code_length;
  config.max_output_size = max_output_size;
  config.execution_timeout = limits["execution_timeout"] | config.execution_timeout;
  config.cpu_time = limits["cpu_time"] | config.cpu_time;
  config.memory = (limits["memory_mb"] | (config.memory / 1024)) * 1024;
  config.file_size = (limits["file_size_mb"] | (config.file_size / 1024)) * 1024;
  config.open_files = limits["open_files"] | config.open_files;
  std::string scratch_root = limits["scratch_root"] | "";
  if (scratch_root.size()) config.scratch_root = scratch_root;

  config.python_interpreter = ini["python"]["interpreter"] | config.python_interpreter;
  LoadCompiler(ini, "c", config.c_compiler);
  LoadCompiler(ini, "cpp", config.cpp_compiler);

  if (!LoadBackend(ini, "jdoodle", config.primary)) return false;
  if (!LoadBackend(ini, "piston", config.secondary)) return false;

  if (config.parallel <= 0 || config.execution_timeout <= 0 || config.port <= 0) {
    spdlog::error("parallel, port and execution_timeout must be positive");
    return false;
  }
  return true;
}

void LoadEnvironment(Config& config) {
  if (const char* id = getenv("JDOODLE_CLIENT_ID")) config.primary.client_id = id;
  if (const char* secret = getenv("JDOODLE_CLIENT_SECRET")) config.primary.client_secret = secret;
  if (const char* port = getenv("PORT")) {
    char* end = nullptr;
    long val = strtol(port, &end, 10);
    if (end != port && *end == '\0' && val > 0 && val < 65536) {
      config.port = val;
    } else {
      spdlog::warn("Ignoring invalid PORT={}", port);
    }
  }
}
