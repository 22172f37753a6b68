#include <iostream>

void run_kdf_benchmark();
void run_codec_benchmark();
void run_store_benchmark();

int main() {
  std::cout << "paramvault benchmarks\n";
  run_kdf_benchmark();
  run_codec_benchmark();
  run_store_benchmark();
  return 0;
}
