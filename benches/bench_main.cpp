#include "distill/observability/global.hpp"

#include <iostream>

void run_similarity_benchmark();
void run_scoring_benchmark();
void run_pipeline_benchmark();

int main() {
  distill::observability::set_global_observer(nullptr);
  std::cout << "distill benchmarks\n";
  run_similarity_benchmark();
  run_scoring_benchmark();
  run_pipeline_benchmark();
  return 0;
}
