#include "test_framework.hpp"

#include "tracescope/config/config.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace {

void write_file(const std::filesystem::path &path, const std::string &content) {
  std::error_code ec;
  if (!path.parent_path().empty()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  out << content;
}

} // namespace

void register_config_tests(std::vector<tracescope::tests::TestCase> &tests) {
  using tracescope::tests::require;
  using tracescope::testing::ConfigOverrideGuard;
  using tracescope::testing::EnvGuard;
  using tracescope::testing::TempWorkspace;
  namespace cfg = tracescope::config;

  tests.push_back({"config_dir_defaults_under_home", [] {
                     TempWorkspace home;
                     const EnvGuard env_home("HOME", home.path().string());
                     const EnvGuard env_path("TRACESCOPE_CONFIG_PATH", std::nullopt);
                     const ConfigOverrideGuard cfg_override;
                     const auto dir = cfg::config_dir();
                     require(dir.ok(), dir.error());
                     require(dir.value() == home.path() / ".tracescope", "config dir mismatch");
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value().filename() == "config.toml", "config file name mismatch");
                     require(!cfg::config_exists(), "config should not exist yet");
                   }});

  tests.push_back({"load_config_missing_file_returns_defaults", [] {
                     TempWorkspace home;
                     const EnvGuard env_home("HOME", home.path().string());
                     const EnvGuard env_dirs("TRACESCOPE_TRANSCRIPT_DIRS", std::nullopt);
                     const EnvGuard env_workers("TRACESCOPE_WORKERS", std::nullopt);
                     const EnvGuard env_obs("TRACESCOPE_OBSERVABILITY", std::nullopt);
                     const ConfigOverrideGuard cfg_override;

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.transcripts.directories.size() == 1, "one default directory");
                     require(config.transcripts.directories[0] ==
                                 (home.path() / ".claude/projects").string(),
                             "default directory should expand ~: " +
                                 config.transcripts.directories[0]);
                     require(config.transcripts.extension == ".jsonl", "default extension");
                     require(config.parser.tool_result_max_chars == 10'000, "default cap");
                     require(config.parser.streaming_threshold_bytes == 5 * 1024 * 1024,
                             "default streaming threshold");
                     require(config.observability.backend == "log", "default backend");
                   }});

  tests.push_back({"load_config_valid_toml", [] {
                     TempWorkspace home;
                     const EnvGuard env_home("HOME", home.path().string());
                     const EnvGuard env_dirs("TRACESCOPE_TRANSCRIPT_DIRS", std::nullopt);
                     const EnvGuard env_workers("TRACESCOPE_WORKERS", std::nullopt);
                     const ConfigOverrideGuard cfg_override(home.path() / "custom.toml");

                     write_file(home.path() / "custom.toml", R"(
[transcripts]
directories = ["~/logs", "/srv/transcripts"]
extension = ".log"
max_scan_depth = 3

[parser]
tool_result_max_chars = 500
workers = 4
memoize = false

[search]
max_results = 25
case_sensitive = true
)");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.transcripts.directories.size() == 2, "two directories");
                     require(config.transcripts.directories[0] == (home.path() / "logs").string(),
                             "tilde should expand");
                     require(config.transcripts.extension == ".log", "extension mismatch");
                     require(config.transcripts.max_scan_depth == 3, "depth mismatch");
                     require(config.parser.tool_result_max_chars == 500, "cap mismatch");
                     require(config.parser.workers == 4, "workers mismatch");
                     require(!config.parser.memoize, "memoize mismatch");
                     require(config.search.max_results == 25, "max results mismatch");
                     require(config.search.case_sensitive, "case sensitivity mismatch");
                   }});

  tests.push_back({"load_config_reports_parse_errors", [] {
                     TempWorkspace home;
                     const EnvGuard env_home("HOME", home.path().string());
                     const ConfigOverrideGuard cfg_override(home.path() / "bad.toml");
                     write_file(home.path() / "bad.toml", "[parser]\nworkers\n");
                     const auto loaded = cfg::load_config();
                     require(!loaded.ok(), "malformed config should fail");
                     require(loaded.error().find("bad.toml") != std::string::npos,
                             "error should name the file");
                   }});

  tests.push_back({"env_overrides_take_precedence", [] {
                     TempWorkspace home;
                     const EnvGuard env_home("HOME", home.path().string());
                     const EnvGuard env_dirs("TRACESCOPE_TRANSCRIPT_DIRS",
                                             std::optional<std::string>("/one: /two"));
                     const EnvGuard env_workers("TRACESCOPE_WORKERS",
                                                std::optional<std::string>("8"));
                     const EnvGuard env_obs("TRACESCOPE_OBSERVABILITY",
                                            std::optional<std::string>("none"));
                     const ConfigOverrideGuard cfg_override;

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.transcripts.directories.size() == 2, "env dirs should split");
                     require(config.transcripts.directories[1] == "/two", "env dirs trimmed");
                     require(config.parser.workers == 8, "env workers override");
                     require(config.observability.backend == "none", "env backend override");
                   }});

  tests.push_back({"dotenv_only_sets_prefixed_missing_keys", [] {
                     TempWorkspace home;
                     const EnvGuard env_home("HOME", home.path().string());
                     const EnvGuard env_workers("TRACESCOPE_WORKERS", std::nullopt);
                     const ConfigOverrideGuard cfg_override;
                     write_file(home.path() / ".tracescope" / ".env",
                                "# comment\nexport TRACESCOPE_WORKERS=\"3\"\nOTHER_KEY=1\n");

                     cfg::Config config;
                     cfg::apply_env_overrides(config);
                     require(config.parser.workers == 3, "dotenv workers should apply");
                     require(std::getenv("OTHER_KEY") == nullptr ||
                                 std::string(std::getenv("OTHER_KEY")) != "1",
                             "non-prefixed key must be ignored");
                   }});

  tests.push_back({"save_config_round_trip", [] {
                     TempWorkspace home;
                     const EnvGuard env_home("HOME", home.path().string());
                     const EnvGuard env_dirs("TRACESCOPE_TRANSCRIPT_DIRS", std::nullopt);
                     const EnvGuard env_workers("TRACESCOPE_WORKERS", std::nullopt);
                     const EnvGuard env_obs("TRACESCOPE_OBSERVABILITY", std::nullopt);
                     const ConfigOverrideGuard cfg_override(home.path() / "cfg" / "config.toml");

                     cfg::Config config;
                     config.transcripts.directories = {"/data/a", "/data/b"};
                     config.parser.workers = 6;
                     config.search.case_sensitive = true;
                     config.observability.backend = "none";
                     const auto saved = cfg::save_config(config);
                     require(saved.ok(), saved.error());
                     require(cfg::config_exists(), "config should exist after save");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().transcripts.directories == config.transcripts.directories,
                             "directories should round trip");
                     require(loaded.value().parser.workers == 6, "workers should round trip");
                     require(loaded.value().search.case_sensitive, "flag should round trip");
                     require(loaded.value().observability.backend == "none",
                             "backend should round trip");
                   }});

  tests.push_back({"render_config_reads_back_through_load_config_file", [] {
                     TempWorkspace workspace;
                     cfg::Config config;
                     config.transcripts.directories = {"/logs/with \"quotes\""};
                     config.transcripts.max_scan_depth = 2;
                     config.parser.memoize = false;
                     config.search.max_results = 25;
                     config.observability.backend = "log,stats";
                     const auto text = cfg::render_config(config);
                     require(text.find("[observability]\nbackend = \"log,stats\"") !=
                                 std::string::npos,
                             "rendered backend: " + text);

                     const auto path = workspace.create_file("rendered.toml", text);
                     const auto loaded = cfg::load_config_file(path);
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().transcripts.directories == config.transcripts.directories,
                             "quoted directory should survive");
                     require(loaded.value().transcripts.max_scan_depth == 2, "depth read back");
                     require(!loaded.value().parser.memoize, "memoize read back");
                     require(loaded.value().search.max_results == 25, "max results read back");

                     const auto missing = cfg::load_config_file(workspace.path() / "absent.toml");
                     require(!missing.ok(), "missing explicit file is an error");
                   }});

  tests.push_back({"validate_config_rejects_bad_values", [] {
                     cfg::Config config;
                     config.parser.workers = 0;
                     require(!cfg::validate_config(config).ok(), "zero workers invalid");
                     config.parser.workers = 17;
                     require(!cfg::validate_config(config).ok(), "too many workers invalid");
                     config.parser.workers = 2;
                     config.parser.tool_result_max_chars = 0;
                     require(!cfg::validate_config(config).ok(), "zero cap invalid");
                     config.parser.tool_result_max_chars = 100;
                     config.observability.backend = "prometheus";
                     const auto bad_backend = cfg::validate_config(config);
                     require(!bad_backend.ok(), "unknown backend invalid");
                     require(bad_backend.error().find("prometheus") != std::string::npos,
                             "error should name the backend");
                   }});

  tests.push_back({"validate_config_warns_on_missing_directories", [] {
                     TempWorkspace workspace;
                     cfg::Config config;
                     config.transcripts.directories = {workspace.path().string(),
                                                       (workspace.path() / "missing").string()};
                     config.observability.backend = "log, none";
                     const auto result = cfg::validate_config(config);
                     require(result.ok(), result.error());
                     require(result.value().size() == 1, "one warning expected");
                     require(result.value()[0].find("missing") != std::string::npos,
                             "warning should name the missing directory");
                   }});
}
