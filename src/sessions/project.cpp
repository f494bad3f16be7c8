#include "tracescope/sessions/project.hpp"

#include "tracescope/common/fs.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <cstdio>
#include <regex>

namespace tracescope::sessions {

namespace {

constexpr std::array<const char *, 8> SKIP_DIRECTORIES = {
    "transcripts", "logs", "claude", "config", "Documents", "workspace", "Users", "home"};

// Components that can follow `workspace` or `Documents` in a mangled name without being the
// project itself.
constexpr std::array<const char *, 3> SYSTEM_DIRECTORIES = {"Users", "Documents", "workspace"};

constexpr std::size_t LONG_MANGLED_STEM = 30;

bool listed(const auto &names, const std::string &value) {
  return std::any_of(names.begin(), names.end(),
                     [&value](const char *name) { return value == name; });
}

std::vector<std::string> path_parts(const std::filesystem::path &file_path) {
  return common::split(file_path.generic_string(), '/');
}

std::string file_stem(const std::vector<std::string> &parts, const std::string &extension) {
  if (parts.empty()) {
    return "";
  }
  std::string name = parts.back();
  if (const auto pos = name.find(extension); !extension.empty() && pos != std::string::npos) {
    name.erase(pos, extension.size());
  }
  return name;
}

bool is_hex_like(const std::string &value) {
  return !value.empty() && std::all_of(value.begin(), value.end(), [](char ch) {
    return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f') || ch == '-';
  });
}

std::optional<std::string> name_from_entries(const std::vector<transcript::Entry> &entries) {
  for (const auto &entry : entries) {
    if (!entry.project_name.empty()) {
      return entry.project_name;
    }
    if (!entry.cwd.empty()) {
      auto parts = common::split(entry.cwd, '/');
      parts.erase(std::remove(parts.begin(), parts.end(), std::string()), parts.end());
      if (!parts.empty()) {
        return parts.back();
      }
    }
  }
  return std::nullopt;
}

std::optional<std::string> name_from_mangled_stem(const std::string &stem) {
  const auto parts = common::split(stem, '-');
  for (std::size_t i = 0; i + 1 < parts.size(); ++i) {
    if (parts[i] != "workspace" && parts[i] != "Documents") {
      continue;
    }
    const std::string &next = parts[i + 1];
    if (!next.empty() && !listed(SYSTEM_DIRECTORIES, next)) {
      return next;
    }
  }
  return std::nullopt;
}

std::optional<std::string> name_from_path(const std::vector<std::string> &parts,
                                          const std::string &stem, const std::string &extension) {
  if (stem.find('-') != std::string::npos &&
      (common::starts_with(stem, "-Users-") || common::starts_with(stem, "Users-"))) {
    return name_from_mangled_stem(stem);
  }

  const auto projects = std::find(parts.begin(), parts.end(), "projects");
  if (projects != parts.end() && projects + 1 != parts.end()) {
    const std::string &candidate = *(projects + 1);
    if (!candidate.empty() && candidate.find(extension) == std::string::npos) {
      return candidate;
    }
  }

  for (std::size_t i = parts.size(); i-- > 1;) {
    if (is_valid_project_name(parts[i - 1])) {
      return parts[i - 1];
    }
  }
  return std::nullopt;
}

std::string fallback_name(const std::vector<std::string> &parts, const std::string &stem) {
  if (is_hex_like(stem)) {
    if (parts.size() >= 2 && is_valid_project_name(parts[parts.size() - 2])) {
      return parts[parts.size() - 2];
    }
    return UNKNOWN_PROJECT;
  }
  if (stem.find('-') != std::string::npos && common::utf8_length(stem) > LONG_MANGLED_STEM) {
    return UNKNOWN_PROJECT;
  }
  return stem.empty() ? "unknown" : stem;
}

std::string unmangle(const std::string &name) {
  std::string out = name;
  if (!out.empty() && out.front() == '-') {
    out.erase(0, 1);
  }
  std::replace(out.begin(), out.end(), '-', '/');
  return "/" + out;
}

std::optional<std::string> path_after_marker(const std::string &path, const std::string &marker,
                                             const std::string &excluded) {
  const auto pos = path.find(marker);
  if (pos == std::string::npos) {
    return std::nullopt;
  }
  const std::size_t start = pos + marker.size();
  const std::size_t end = path.find('/', start);
  const std::string dir = path.substr(start, end == std::string::npos ? end : end - start);
  if (dir.empty() || dir == excluded) {
    return std::nullopt;
  }
  return path.substr(0, start + dir.size());
}

} // namespace

std::string rolling_hash_hex(const std::string &text) {
  std::uint32_t hash = 0;
  for (const char ch : text) {
    hash = hash * 31U + static_cast<unsigned char>(ch);
  }
  const auto signed_hash = static_cast<std::int64_t>(static_cast<std::int32_t>(hash));
  const auto magnitude = static_cast<unsigned long long>(std::llabs(signed_hash));
  std::array<char, 17> buffer{};
  std::snprintf(buffer.data(), buffer.size(), "%08llx", magnitude);
  return std::string(buffer.data());
}

std::string extract_session_id(const std::vector<transcript::Entry> &entries,
                               const std::vector<std::string> &head_lines) {
  for (const auto &entry : entries) {
    if (!entry.session_id.empty()) {
      return entry.session_id;
    }
  }
  return rolling_hash_hex(common::join(head_lines, "\n")).substr(0, 8);
}

std::string extract_full_session_id(const std::filesystem::path &file_path,
                                    const std::string &fallback) {
  static const std::regex uuid_pattern(
      "[a-f0-9]{8}-[a-f0-9]{4}-[a-f0-9]{4}-[a-f0-9]{4}-[a-f0-9]{12}", std::regex::icase);
  static const std::regex hex_pattern("[a-f0-9]{32,}", std::regex::icase);

  const std::string filename = file_path.filename().string();
  std::smatch match;
  if (std::regex_search(filename, match, uuid_pattern)) {
    return match.str(0);
  }
  if (std::regex_search(filename, match, hex_pattern)) {
    return match.str(0);
  }
  return fallback;
}

bool is_valid_project_name(const std::string &name) {
  if (name.size() <= 2 || listed(SKIP_DIRECTORIES, name)) {
    return false;
  }
  const bool allowed = std::all_of(name.begin(), name.end(), [](unsigned char ch) {
    return std::isalnum(ch) != 0 || ch == '-' || ch == '_';
  });
  const bool digits_only = std::all_of(name.begin(), name.end(),
                                       [](unsigned char ch) { return std::isdigit(ch) != 0; });
  return allowed && !digits_only;
}

std::string extract_project_name(const std::vector<transcript::Entry> &entries,
                                 const std::filesystem::path &file_path,
                                 const std::string &extension) {
  if (auto name = name_from_entries(entries); name.has_value()) {
    return *name;
  }
  const auto parts = path_parts(file_path);
  const std::string stem = file_stem(parts, extension);
  if (auto name = name_from_path(parts, stem, extension); name.has_value()) {
    return *name;
  }
  return fallback_name(parts, stem);
}

std::string extract_project_path(const std::optional<transcript::Entry> &first_entry,
                                 const std::filesystem::path &file_path,
                                 const std::string &project_name) {
  if (first_entry.has_value() && !first_entry->cwd.empty()) {
    return first_entry->cwd;
  }

  const std::string path = file_path.generic_string();
  const auto parts = path_parts(file_path);

  if (path.find("/.claude/projects/") != std::string::npos) {
    const std::string stem = file_path.stem().string();
    if (common::starts_with(stem, "-") || stem.find("-Users-") != std::string::npos) {
      return unmangle(stem);
    }
    const auto projects = std::find(parts.begin(), parts.end(), "projects");
    if (projects != parts.end() && projects + 2 < parts.end() &&
        common::starts_with(*(projects + 1), "-")) {
      return unmangle(*(projects + 1));
    }
  }

  if (!project_name.empty()) {
    for (std::size_t i = 0; i + 1 < parts.size(); ++i) {
      if (parts[i] == project_name) {
        return common::join(std::vector<std::string>(parts.begin(), parts.begin() + i + 1), "/");
      }
    }
  }

  if (auto found = path_after_marker(path, "/workspace/", ""); found.has_value()) {
    return *found;
  }
  if (auto found = path_after_marker(path, "/Documents/", "workspace"); found.has_value()) {
    return *found;
  }

  if (auto home = common::home_dir(); home.ok()) {
    return home.value().string();
  }
  return "/";
}

} // namespace tracescope::sessions
