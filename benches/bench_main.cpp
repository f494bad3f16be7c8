#include <iostream>

void run_config_benchmark();
void run_parse_benchmarks();
void run_search_benchmarks();

int main() {
  std::cout << "tracescope benchmarks\n";
  run_config_benchmark();
  run_parse_benchmarks();
  run_search_benchmarks();
  return 0;
}
