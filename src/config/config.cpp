#include "tracescope/config/config.hpp"

#include "tracescope/common/fs.hpp"
#include "tracescope/common/toml.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace tracescope::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".tracescope";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr std::size_t MAX_WORKERS = 16;
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("TRACESCOPE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
#if defined(_WIN32)
  _putenv_s(name.c_str(), value.c_str());
#else
  setenv(name.c_str(), value.c_str(), 0);
#endif
}

// Only TRACESCOPE_* variables are taken from a .env file.
void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }

    const std::string key = common::trim(trimmed.substr(0, eq));
    if (!common::starts_with(key, "TRACESCOPE_")) {
      continue;
    }
    set_env_if_missing(key, strip_env_quotes(trimmed.substr(eq + 1)));
  }
}

void load_dotenv_files() {
  if (auto dir = config_dir(); dir.ok()) {
    load_dotenv_file(dir.value() / ".env");
  }
}

bool parse_size(const std::string &raw, std::size_t &out) {
  const std::string value = common::trim(raw);
  const auto *first = value.data();
  const auto *last = first + value.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last && first != last;
}

bool is_known_backend(const std::string &backend) {
  const std::string normalized = common::to_lower(common::trim(backend));
  if (normalized.empty()) {
    return false;
  }
  for (const auto &part : common::split(normalized, ',')) {
    const std::string name = common::trim(part);
    if (name != "none" && name != "noop" && name != "log" && name != "stats") {
      return false;
    }
  }
  return true;
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

std::string expand_config_path(const std::string &path) { return common::expand_path(path); }

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const char *dirs = std::getenv("TRACESCOPE_TRANSCRIPT_DIRS"); dirs != nullptr && *dirs) {
    std::vector<std::string> directories;
    for (const auto &part : common::split(dirs, ':')) {
      const std::string trimmed = common::trim(part);
      if (!trimmed.empty()) {
        directories.push_back(expand_config_path(trimmed));
      }
    }
    if (!directories.empty()) {
      config.transcripts.directories = std::move(directories);
    }
  }

  if (const char *workers = std::getenv("TRACESCOPE_WORKERS"); workers != nullptr && *workers) {
    std::size_t parsed = 0;
    if (parse_size(workers, parsed)) {
      config.parser.workers = parsed;
    }
  }

  if (const char *backend = std::getenv("TRACESCOPE_OBSERVABILITY");
      backend != nullptr && *backend) {
    config.observability.backend = backend;
  }
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }

  const auto &doc = parsed.value();
  Config config;

  config.transcripts.directories =
      doc.get_string_array("transcripts.directories", config.transcripts.directories);
  config.transcripts.extension =
      doc.get_string("transcripts.extension", config.transcripts.extension);
  config.transcripts.max_scan_depth =
      doc.get_size("transcripts.max_scan_depth", config.transcripts.max_scan_depth);

  config.parser.streaming_threshold_bytes =
      doc.get_size("parser.streaming_threshold_bytes", config.parser.streaming_threshold_bytes);
  config.parser.tool_result_max_chars =
      doc.get_size("parser.tool_result_max_chars", config.parser.tool_result_max_chars);
  config.parser.workers = doc.get_size("parser.workers", config.parser.workers);
  config.parser.memoize = doc.get_bool("parser.memoize", config.parser.memoize);

  config.search.max_results = doc.get_size("search.max_results", config.search.max_results);
  config.search.case_sensitive =
      doc.get_bool("search.case_sensitive", config.search.case_sensitive);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  for (auto &directory : config.transcripts.directories) {
    directory = expand_config_path(directory);
  }

  return common::Result<Config>::success(std::move(config));
}

Config default_config() {
  Config config;
  for (auto &directory : config.transcripts.directories) {
    directory = expand_config_path(directory);
  }
  return config;
}

common::Result<Config> load_config_file(const std::filesystem::path &path) {
  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  auto parsed = parse_config(content.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }
  return parsed;
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  Config config;
  if (!std::filesystem::exists(path, ec)) {
    config = default_config();
  } else {
    auto loaded = load_config_file(path);
    if (!loaded.ok()) {
      return loaded;
    }
    config = std::move(loaded.value());
  }

  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

std::string render_config(const Config &config) {
  std::ostringstream out;
  out << "[transcripts]\n";
  out << "directories = " << common::toml_string_array(config.transcripts.directories) << "\n";
  out << "extension = " << common::quote_toml_string(config.transcripts.extension) << "\n";
  out << "max_scan_depth = " << config.transcripts.max_scan_depth << "\n";

  out << "\n[parser]\n";
  out << "streaming_threshold_bytes = " << config.parser.streaming_threshold_bytes << "\n";
  out << "tool_result_max_chars = " << config.parser.tool_result_max_chars << "\n";
  out << "workers = " << config.parser.workers << "\n";
  out << "memoize = " << bool_to_toml(config.parser.memoize) << "\n";

  out << "\n[search]\n";
  out << "max_results = " << config.search.max_results << "\n";
  out << "case_sensitive = " << bool_to_toml(config.search.case_sensitive) << "\n";

  out << "\n[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  return out.str();
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    std::error_code ensure_ec;
    std::filesystem::create_directories(path.parent_path(), ensure_ec);
    if (ensure_ec) {
      return common::Status::error("Failed to create config directory: " + ensure_ec.message());
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error("Unable to write temporary config file");
  }

  file << render_config(config);
  file.close();
  if (!file) {
    return common::Status::error("Failed writing temporary config file");
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return common::Status::error("Failed to atomically replace config: " + ec.message());
  }

  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (config.parser.workers == 0 || config.parser.workers > MAX_WORKERS) {
    return common::Result<std::vector<std::string>>::failure(
        "parser.workers must be between 1 and " + std::to_string(MAX_WORKERS));
  }

  if (config.parser.streaming_threshold_bytes == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "parser.streaming_threshold_bytes must be greater than 0");
  }

  if (config.parser.tool_result_max_chars == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "parser.tool_result_max_chars must be greater than 0");
  }

  if (common::trim(config.transcripts.extension).empty()) {
    return common::Result<std::vector<std::string>>::failure(
        "transcripts.extension must not be empty");
  }

  if (!is_known_backend(config.observability.backend)) {
    return common::Result<std::vector<std::string>>::failure("Invalid observability.backend: " +
                                                              config.observability.backend);
  }

  if (config.transcripts.directories.empty()) {
    warnings.push_back("transcripts.directories is empty; nothing will be loaded");
  }
  for (const auto &directory : config.transcripts.directories) {
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
      warnings.push_back("transcript directory does not exist: " + directory);
    }
  }

  if (config.transcripts.max_scan_depth == 0) {
    warnings.push_back("transcripts.max_scan_depth is 0; only top-level files are scanned");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace tracescope::config
