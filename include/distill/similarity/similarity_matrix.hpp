#pragma once

#include "distill/common/result.hpp"
#include "distill/similarity/vector_store.hpp"

#include <optional>
#include <string>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>

namespace distill::similarity {

/// Cosine similarity floored at 0. Zero-magnitude or mismatched vectors score 0.
[[nodiscard]] double cosine_similarity(const std::vector<float> &a, const std::vector<float> &b);

struct Neighbor {
  std::string id;
  double score = 0.0;
};

/// Dense symmetric pairwise similarity over every vector of a VectorStore.
/// Each unordered pair is computed once; the diagonal is exactly 1.0.
class SimilarityMatrix {
public:
  SimilarityMatrix() = default;

  /// `workers` > 1 partitions rows across async tasks. Results are merged
  /// only after every task has finished.
  [[nodiscard]] static SimilarityMatrix compute(const VectorStore &store, std::size_t workers = 0);

  /// Builds a matrix from explicit pair scores. Pairs not listed score 0.
  [[nodiscard]] static common::Result<SimilarityMatrix>
  from_pairs(const std::vector<std::string> &ids,
             const std::vector<std::tuple<std::string, std::string, double>> &pairs);

  [[nodiscard]] std::optional<double> get(const std::string &a, const std::string &b) const;
  [[nodiscard]] std::vector<Neighbor> neighbors(const std::string &id, double min_threshold) const;

  [[nodiscard]] std::optional<std::size_t> index_of(const std::string &id) const;
  [[nodiscard]] double at(std::size_t i, std::size_t j) const { return scores_[i * ids_.size() + j]; }
  [[nodiscard]] const std::vector<std::string> &ids() const { return ids_; }
  [[nodiscard]] std::size_t size() const { return ids_.size(); }

private:
  explicit SimilarityMatrix(std::vector<std::string> ids);
  void set(std::size_t i, std::size_t j, double score);

  std::vector<std::string> ids_;
  std::unordered_map<std::string, std::size_t> index_;
  std::vector<double> scores_;
};

} // namespace distill::similarity
