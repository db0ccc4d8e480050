#include "bench_common.hpp"

#include "distill/providers/embedder_local.hpp"
#include "distill/similarity/similarity_matrix.hpp"
#include "distill/similarity/vector_store.hpp"

void run_similarity_benchmark() {
  distill::providers::LocalEmbedder embedder(256);
  distill::similarity::VectorStore vectors(embedder.dimensions());
  for (int i = 0; i < 300; ++i) {
    auto embedded = embedder.embed("Report " + std::to_string(i % 40) + " on supply chains and " +
                                   std::to_string(i) + " shipping routes");
    if (!embedded.ok() || !vectors.put("item-" + std::to_string(i), embedded.value()).ok()) {
      return;
    }
  }

  distill::bench::run_bench("local_embed", 1000, [&] {
    static int i = 0;
    (void)embedder.embed("benchmark text number " + std::to_string(i++));
  });

  distill::bench::run_bench("similarity_matrix_300_seq", 5, [&] {
    (void)distill::similarity::SimilarityMatrix::compute(vectors, 1);
  });

  distill::bench::run_bench("similarity_matrix_300_par", 5, [&] {
    (void)distill::similarity::SimilarityMatrix::compute(vectors, 0);
  });
}
