#include "bench_common.hpp"

#include "distill/scoring/scoring_engine.hpp"

#include <vector>

void run_scoring_benchmark() {
  const distill::scoring::ScoringEngine engine(distill::config::ScoringConfig{});

  std::vector<distill::scoring::ScoringInput> inputs;
  for (int i = 0; i < 1000; ++i) {
    distill::scoring::ScoringInput input;
    input.id = "item-" + std::to_string(i);
    input.alignments = {{"semiconductors", 0.5 + (i % 50) / 100.0}, {"energy", 0.3}};
    input.published_at = "2024-06-01T08:00:00Z";
    input.trend_text = "An emerging and rising market for chips";
    inputs.push_back(std::move(input));
  }

  distill::bench::run_bench("score_single", 10000, [&] { (void)engine.score(inputs.front()); });

  distill::bench::run_bench("score_batch_1000", 20, [&] { (void)engine.score_batch(inputs); });
}
