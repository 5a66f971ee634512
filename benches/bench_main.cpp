#include <iostream>

void run_scanner_benchmark();
void run_rate_limiter_benchmark();
void run_manager_benchmark();

int main() {
  std::cout << "mcpguard Benchmarks\n";
  run_scanner_benchmark();
  run_rate_limiter_benchmark();
  run_manager_benchmark();
  return 0;
}
