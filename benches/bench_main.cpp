#include <iostream>

void run_config_benchmark();
void run_trigger_benchmarks();
void run_store_benchmarks();

int main() {
  std::cout << "tasktide Benchmarks\n";
  run_config_benchmark();
  run_trigger_benchmarks();
  run_store_benchmarks();
  return 0;
}
