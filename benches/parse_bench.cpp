#include "bench_common.hpp"

#include "tracescope/conversation/reconstructor.hpp"
#include "tracescope/sessions/cache.hpp"
#include "tracescope/sessions/loader.hpp"
#include "tracescope/transcript/ingestor.hpp"

#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <vector>

namespace {

std::filesystem::path make_temp_dir() {
  static std::mt19937_64 rng{std::random_device{}()};
  const auto base = std::filesystem::temp_directory_path() /
                    ("tracescope-parse-bench-" + std::to_string(rng()));
  std::filesystem::create_directories(base);
  return base;
}

} // namespace

void run_parse_benchmarks() {
  std::cout << "\n=== Parse Benchmarks ===\n";

  const std::string transcript = tracescope::bench::synthetic_transcript(200);
  const tracescope::transcript::Ingestor ingestor;

  tracescope::bench::run_bench("ingest_text_200_turns", 50, [&] {
    (void)ingestor.decode_text(transcript);
  });

  tracescope::bench::run_bench("ingest_stream_200_turns", 50, [&] {
    std::istringstream input(transcript);
    (void)ingestor.decode_stream(input);
  });

  const auto decoded = ingestor.decode_text(transcript);
  tracescope::bench::run_bench("reconstruct_200_turns", 100, [&] {
    (void)tracescope::conversation::ConversationReconstructor::reconstruct(decoded.entries);
  });

  // Worker pool over a directory of identical files
  {
    const auto dir = make_temp_dir();
    std::vector<std::filesystem::path> files;
    for (int i = 0; i < 16; ++i) {
      const auto path = dir / ("session-" + std::to_string(i) + ".jsonl");
      std::ofstream out(path, std::ios::binary);
      out << transcript;
      files.push_back(path);
    }

    for (const std::size_t workers : {1U, 2U, 4U}) {
      tracescope::sessions::LoadOptions options;
      options.workers = workers;
      options.memoize = false;
      const tracescope::sessions::SessionLoader loader(options);
      tracescope::bench::run_bench("load_16_files_workers_" + std::to_string(workers), 5,
                                   [&] { (void)loader.load(files); });
    }

    tracescope::sessions::SessionCache cache;
    const tracescope::sessions::SessionLoader memoized({}, &cache);
    (void)memoized.load(files);
    tracescope::bench::run_bench("load_16_files_memoized", 20, [&] { (void)memoized.load(files); });

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
  }
}
