#include "tracescope/sessions/discovery.hpp"

#include "tracescope/common/fs.hpp"

#include <algorithm>
#include <set>

namespace tracescope::sessions {

DiscoveryOptions discovery_options(const config::Config &config) {
  return DiscoveryOptions{.directories = config.transcripts.directories,
                          .extension = config.transcripts.extension,
                          .max_depth = config.transcripts.max_scan_depth};
}

bool is_skipped_directory(const std::string &name) {
  return common::starts_with(name, ".") || name == "node_modules" || name == "venv" ||
         name == "__pycache__";
}

std::vector<std::filesystem::path> discover_transcripts(const DiscoveryOptions &options) {
  namespace fs = std::filesystem;
  std::set<fs::path> found;

  for (const auto &directory : options.directories) {
    const fs::path root(common::expand_path(directory));
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
      continue;
    }

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    const fs::recursive_directory_iterator end;
    while (!ec && it != end) {
      const fs::directory_entry &entry = *it;
      const std::string name = entry.path().filename().string();
      std::error_code type_ec;
      if (entry.is_directory(type_ec)) {
        if (is_skipped_directory(name) ||
            static_cast<std::size_t>(it.depth()) + 1 >= options.max_depth) {
          it.disable_recursion_pending();
        }
      } else if (entry.is_regular_file(type_ec) && !common::starts_with(name, ".") &&
                 common::ends_with(name, options.extension)) {
        found.insert(entry.path());
      }
      it.increment(ec);
    }
  }

  return std::vector<fs::path>(found.begin(), found.end());
}

} // namespace tracescope::sessions
