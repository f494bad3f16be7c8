#pragma once

#include <chrono>
#include <functional>
#include <iostream>
#include <string>

namespace tracescope::bench {

inline void run_bench(const std::string &name, int iterations,
                      const std::function<void()> &fn) {
  const auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < iterations; ++i) {
    fn();
  }
  const auto end = std::chrono::steady_clock::now();
  const auto total =
      std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
  const double avg = static_cast<double>(total) / static_cast<double>(iterations);
  std::cout << name << ": iterations=" << iterations << " total_us=" << total
            << " avg_us=" << avg << "\n";
}

/// Synthetic transcript of `turns` user/assistant exchanges, each with one tool round trip.
inline std::string synthetic_transcript(int turns) {
  std::string out;
  for (int i = 0; i < turns; ++i) {
    const std::string n = std::to_string(i);
    const std::string minute = (i % 60 < 10 ? "0" : "") + std::to_string(i % 60);
    const std::string ts = "2025-01-01T10:" + minute + ":00Z";
    out += R"({"type":"user","timestamp":")" + ts + R"(","uuid":"u)" + n +
           R"(","sessionId":"bench","message":{"role":"user","content":"fix issue )" + n +
           " in parser.cpp\"}}\n";
    out += R"({"type":"assistant","timestamp":")" + ts + R"(","uuid":"a)" + n +
           R"(","parentUuid":"u)" + n +
           R"(","message":{"role":"assistant","content":[{"type":"thinking","thinking":"look at the reader"},)"
           R"({"type":"tool_use","name":"Read","id":"t)" + n +
           R"(","input":{"file_path":"parser.cpp"}}],"usage":{"input_tokens":12,"output_tokens":40}}})"
           "\n";
    out += R"({"type":"user","timestamp":")" + ts + R"(","message":{"role":"user","content":[)"
           R"({"type":"tool_result","tool_use_id":"t)" + n +
           R"(","content":"int main() { return 0; }"}]}})" "\n";
    out += R"({"type":"assistant","timestamp":")" + ts +
           R"(","message":{"role":"assistant","content":[{"type":"text","text":"Fixed a timeout in the reader"}]}})"
           "\n";
  }
  return out;
}

} // namespace tracescope::bench
