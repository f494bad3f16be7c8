#include "tracescope/cli/commands.hpp"

#include "tracescope/common/fs.hpp"
#include "tracescope/common/time.hpp"
#include "tracescope/config/config.hpp"
#include "tracescope/conversation/tree.hpp"
#include "tracescope/observability/factory.hpp"
#include "tracescope/observability/global.hpp"
#include "tracescope/sessions/cache.hpp"
#include "tracescope/sessions/catalog.hpp"
#include "tracescope/sessions/discovery.hpp"
#include "tracescope/sessions/loader.hpp"
#include "tracescope/transcript/text_heuristics.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace tracescope::cli {

namespace heuristics = transcript::heuristics;

namespace {

constexpr std::size_t PREVIEW_CHARS = 80;
constexpr std::size_t CONTEXT_CHARS = 160;
constexpr std::size_t MAX_TREE_DEPTH = 256;

std::string version_string() {
#ifdef TRACESCOPE_VERSION
  return std::string("tracescope ") + TRACESCOPE_VERSION;
#else
  return "tracescope 0.1.0";
#endif
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

bool parse_size(const std::string &raw, std::size_t &out) {
  const char *begin = raw.data();
  const char *end = raw.data() + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, out);
  return ec == std::errc() && ptr == end && !raw.empty();
}

std::string format_duration(const double seconds) {
  const auto total = static_cast<long long>(std::llround(std::max(0.0, seconds)));
  const long long hours = total / 3600;
  const long long minutes = (total % 3600) / 60;
  const long long secs = total % 60;
  std::ostringstream out;
  if (hours > 0) {
    out << hours << "h " << minutes << "m";
  } else if (minutes > 0) {
    out << minutes << "m " << secs << "s";
  } else {
    out << secs << "s";
  }
  return out.str();
}

std::string format_tokens(const transcript::TokenUsage &tokens) {
  std::ostringstream out;
  out << tokens.total_tokens << " tokens (in " << tokens.input_tokens << ", out "
      << tokens.output_tokens << ", cache " << tokens.cache_creation_input_tokens << "/"
      << tokens.cache_read_input_tokens << ")";
  return out.str();
}

void print_help(std::ostream &out) {
  out << version_string() << "\n\n";
  out << "Usage: tracescope [--config PATH] [--verbose] <command> [options]\n\n";
  out << "Commands:\n";
  out << "  sessions                      List sessions, most recent first\n";
  out << "  search [options] <query...>   Search user, assistant and thinking text\n";
  out << "      --regex                   Treat the query as a regular expression\n";
  out << "      --case-sensitive          Match literal terms case-sensitively\n";
  out << "      --thinking-only           Search thinking blocks only\n";
  out << "      --max N                   Stop after N results\n";
  out << "  daily                         Per-day statistics\n";
  out << "  projects                      Per-project statistics\n";
  out << "  show <session-id> [--tree]    Show one session's conversations\n";
  out << "  config                        Print the effective configuration\n";
  out << "  config-path                   Print the config file location\n";
  out << "  version                       Print the version\n";
  out << "  help                          Show this help\n\n";
  out << "Literal queries accept alternatives: \"timeout OR crash\".\n";
}

struct Environment {
  config::Config config;
  sessions::SessionCache cache;
};

bool prepare(Environment &env, const bool verbose, std::ostream &err) {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    err << loaded.error() << "\n";
    return false;
  }
  env.config = loaded.value();

  auto validation = config::validate_config(env.config);
  if (!validation.ok()) {
    err << "invalid config: " << validation.error() << "\n";
    return false;
  }
  for (const auto &warning : validation.value()) {
    err << "warning: " << warning << "\n";
  }

  observability::set_global_observer(observability::create_observer(env.config, verbose));
  return true;
}

sessions::SessionCatalog load_catalog(Environment &env) {
  const auto files = sessions::discover_transcripts(sessions::discovery_options(env.config));
  const sessions::SessionLoader loader(sessions::load_options(env.config), &env.cache);
  auto report = loader.load(files);
  return sessions::SessionCatalog(std::move(report.sessions));
}

int run_sessions(Environment &env, std::ostream &out) {
  const auto catalog = load_catalog(env);
  if (catalog.session_count() == 0) {
    out << "No sessions found\n";
    return 0;
  }
  for (const auto &session : catalog.sessions()) {
    out << session->session_id << "  " << common::format_local(session->metrics.last_activity)
        << "  " << session->project_name << "  " << session->metrics.conversation_count
        << " conv  " << session->metrics.total_tools << " tools  "
        << format_duration(session->metrics.duration_seconds) << "  "
        << heuristics::sanitize_for_display(session->summary.short_text, PREVIEW_CHARS) << "\n";
  }
  const auto totals = catalog.totals();
  out << "\n" << totals.sessions << " sessions, " << totals.conversations << " conversations, "
      << totals.tools << " tools\n";
  return 0;
}

int run_search(Environment &env, std::vector<std::string> args, std::ostream &out,
               std::ostream &err) {
  search::SearchOptions options;
  options.max_results = env.config.search.max_results;
  options.case_sensitive = env.config.search.case_sensitive;

  std::string max_raw;
  if (take_option(args, "--max", "-n", max_raw) && !parse_size(max_raw, options.max_results)) {
    err << "invalid --max value: " << max_raw << "\n";
    return 1;
  }
  options.regex = take_flag(args, "--regex");
  if (take_flag(args, "--case-sensitive")) {
    options.case_sensitive = true;
  }
  options.thinking_only = take_flag(args, "--thinking-only");

  const std::string query = common::join(args, " ");
  if (common::trim(query).empty()) {
    err << "search requires a query\n";
    return 1;
  }

  const auto catalog = load_catalog(env);
  const auto results = catalog.search(query, options);
  if (results.empty()) {
    out << "No results for \"" << query << "\"\n";
    return 0;
  }
  for (const auto &result : results) {
    out << "[" << search::match_type_name(result.match_type) << "] " << result.session_id
        << " #" << (result.conversation_index + 1) << "  " << result.project_name << "  "
        << common::format_local(result.user_time) << "\n";
    out << "    " << heuristics::sanitize_for_display(result.match_context, CONTEXT_CHARS)
        << "\n";
  }
  out << "\n" << results.size() << " results\n";
  return 0;
}

int run_daily(Environment &env, std::ostream &out) {
  const auto stats = load_catalog(env).daily_statistics();
  if (stats.days.empty()) {
    out << "No sessions found\n";
    return 0;
  }
  for (const auto &day : stats.days) {
    out << day.date << "  " << std::setw(4) << day.totals.session_count() << " sessions  "
        << std::setw(5) << day.totals.conversation_count << " conv  " << std::setw(5)
        << day.totals.tool_count << " tools  " << format_duration(day.totals.duration_seconds)
        << "\n";
  }
  out << "\nTotal sessions: " << stats.total_sessions << "\n";
  return 0;
}

int run_projects(Environment &env, std::ostream &out) {
  const auto stats = load_catalog(env).project_statistics();
  if (stats.empty()) {
    out << "No sessions found\n";
    return 0;
  }
  for (const auto &project : stats) {
    out << project.project << "  " << project.totals.session_count() << " sessions  "
        << project.totals.conversation_count << " conv  " << project.totals.tool_count
        << " tools  " << format_duration(project.totals.duration_seconds) << "  "
        << format_tokens(project.totals.tokens) << "\n";
  }
  return 0;
}

void print_tree_node(const conversation::ConversationTree &tree, const std::string &id,
                     const std::size_t depth, std::ostream &out) {
  const auto *node = tree.find(id);
  if (node == nullptr || depth > MAX_TREE_DEPTH) {
    return;
  }
  out << std::string(depth * 2, ' ')
      << (node->kind == conversation::NodeKind::User ? "user " : "assistant ")
      << common::format_local(node->timestamp) << "  "
      << heuristics::sanitize_for_display(node->content, PREVIEW_CHARS);
  if (node->is_sidechain) {
    out << "  (sidechain)";
  }
  out << "\n";
  for (const auto &child : tree.children(id)) {
    print_tree_node(tree, child, depth + 1, out);
  }
}

int run_show(Environment &env, std::vector<std::string> args, std::ostream &out,
             std::ostream &err) {
  const bool tree_view = take_flag(args, "--tree");
  if (args.empty()) {
    err << "show requires a session id\n";
    return 1;
  }

  const auto catalog = load_catalog(env);
  const auto session = catalog.find(args[0]);
  if (!session) {
    err << "Session not found: " << args[0] << "\n";
    return 1;
  }

  const auto &metrics = session->metrics;
  out << "Session: " << session->full_session_id << " (" << session->session_id << ")\n";
  out << "Project: " << session->project_name << "  " << session->project_path << "\n";
  out << "File: " << session->file_path.string() << "\n";
  out << "Conversations: " << metrics.conversation_count << "  Tools: " << metrics.total_tools
      << "  Thinking: " << metrics.thinking_chars << " chars\n";
  out << "Duration: " << format_duration(metrics.duration_seconds) << " (wall clock "
      << format_duration(metrics.actual_duration_seconds) << ", avg response "
      << std::fixed << std::setprecision(1) << metrics.avg_response_seconds << "s)\n";
  out << "Tokens: " << format_tokens(metrics.tokens) << "\n";
  out << "Summary: " << session->summary.short_text << "\n\n";

  if (tree_view) {
    const auto tree = conversation::ConversationTree::build(session->pairs);
    for (const auto &root : tree.roots()) {
      print_tree_node(tree, root, 0, out);
    }
    return 0;
  }

  for (std::size_t i = 0; i < session->pairs.size(); ++i) {
    const auto &pair = session->pairs[i];
    out << "#" << (i + 1) << "  " << common::format_local(pair.user_time) << "  "
        << format_duration(pair.response_time_seconds);
    if (pair.compact_continuation) {
      out << "  (continued)";
    }
    out << "\n";
    out << "  > " << heuristics::sanitize_for_display(pair.user_content, PREVIEW_CHARS) << "\n";
    out << "  < " << pair.assistant_preview << "\n";
    if (!pair.tool_uses.empty()) {
      std::vector<std::string> names;
      for (const auto &tool : pair.tool_uses) {
        names.push_back(tool.is_error ? tool.tool_name + "!" : tool.tool_name);
      }
      out << "  tools: " << common::join(names, ", ") << "\n";
    }
    for (const auto &thread : pair.sub_agent_threads) {
      out << "  task: " << heuristics::sanitize_for_display(thread.command, PREVIEW_CHARS) << " ("
          << thread.responses.size() << " responses" << (thread.complete ? ", complete" : "")
          << ")\n";
    }
  }
  return 0;
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return run_cli(std::move(args), std::cout, std::cerr);
}

int run_cli(std::vector<std::string> args, std::ostream &out, std::ostream &err) {
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    err << global_error << "\n";
    return 1;
  }
  const bool verbose = take_flag(args, "--verbose") || take_flag(args, "-v");

  if (args.empty()) {
    print_help(out);
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help(out);
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    out << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      err << path_result.error() << "\n";
      return 1;
    }
    out << path_result.value().string() << "\n";
    return 0;
  }

  if (subcommand == "config") {
    const auto loaded = config::load_config();
    if (!loaded.ok()) {
      err << loaded.error() << "\n";
      return 1;
    }
    out << config::render_config(loaded.value());
    return 0;
  }

  if (subcommand != "sessions" && subcommand != "search" && subcommand != "daily" &&
      subcommand != "projects" && subcommand != "show") {
    err << "Unknown command: " << subcommand << "\n";
    print_help(err);
    return 1;
  }

  Environment env;
  if (!prepare(env, verbose, err)) {
    return 1;
  }

  int code = 0;
  if (subcommand == "sessions") {
    code = run_sessions(env, out);
  } else if (subcommand == "search") {
    code = run_search(env, std::move(args), out, err);
  } else if (subcommand == "daily") {
    code = run_daily(env, out);
  } else if (subcommand == "projects") {
    code = run_projects(env, out);
  } else {
    code = run_show(env, std::move(args), out, err);
  }

  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  return code;
}

} // namespace tracescope::cli
