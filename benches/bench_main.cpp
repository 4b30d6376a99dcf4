#include <iostream>

void run_detector_benchmark();
void run_vault_benchmark();
void run_scanner_benchmark();
void run_config_benchmark();

int main() {
  std::cout << "Veilguard Benchmarks\n";
  run_detector_benchmark();
  run_vault_benchmark();
  run_scanner_benchmark();
  run_config_benchmark();
  return 0;
}
