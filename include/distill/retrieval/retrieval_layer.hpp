#pragma once

#include "distill/common/result.hpp"
#include "distill/config/schema.hpp"
#include "distill/retrieval/record.hpp"
#include "distill/store/record_store.hpp"

#include <optional>
#include <string>
#include <vector>

namespace distill::retrieval {

/// Every supplied filter must hold. With a query vector, results are ranked
/// by similarity; without one, by composite score.
struct RetrievalQuery {
  std::optional<std::vector<float>> query_vector;
  /// Similarity floor in similarity-ranked mode.
  double min_relevance_score = 0.0;
  std::vector<std::string> batch_ids;
  /// A record qualifies when it carries at least one of these tags.
  std::vector<std::string> tags;
  std::optional<double> min_extraction_confidence;
  bool high_quality_only = false;
  std::optional<double> min_composite_score;
  std::optional<scoring::RelevanceDecision> decision;
  std::optional<RecordKind> kind;
  std::optional<std::size_t> number_of_results;
};

struct RetrievalHit {
  OutputRecord record;
  /// Set in similarity-ranked mode.
  std::optional<double> similarity;
};

/// Read-only ranking over finalized output records.
class RetrievalLayer {
public:
  explicit RetrievalLayer(config::RetrievalConfig config, std::vector<OutputRecord> records = {});

  /// Loads the `records` namespace, optionally limited to the given batches.
  [[nodiscard]] static common::Result<RetrievalLayer>
  from_store(store::IRecordStore &store, config::RetrievalConfig config,
             const std::vector<std::string> &batch_ids = {});

  [[nodiscard]] std::vector<RetrievalHit> retrieve(const RetrievalQuery &query) const;
  [[nodiscard]] bool matches(const OutputRecord &record, const RetrievalQuery &query) const;

  [[nodiscard]] const std::vector<OutputRecord> &records() const { return records_; }
  [[nodiscard]] std::size_t size() const { return records_.size(); }

private:
  config::RetrievalConfig config_;
  std::vector<OutputRecord> records_;
};

} // namespace distill::retrieval
