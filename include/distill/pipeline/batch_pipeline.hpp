#pragma once

#include "distill/common/error.hpp"
#include "distill/common/result.hpp"
#include "distill/config/schema.hpp"
#include "distill/content/item.hpp"
#include "distill/pipeline/throttle.hpp"
#include "distill/providers/embedder.hpp"
#include "distill/providers/generator.hpp"
#include "distill/retrieval/record.hpp"
#include "distill/scoring/scoring_engine.hpp"
#include "distill/store/record_store.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace distill::pipeline {

/// Outcome of one batch. Counts are reported even when items were skipped or
/// collaborators failed.
struct BatchReport {
  std::string batch_id;
  std::size_t items_received = 0;
  std::size_t items_skipped = 0;
  std::size_t items_unembedded = 0;
  std::size_t degraded_defaults = 0;
  std::size_t included = 0;
  std::size_t excluded = 0;
  std::size_t manual_review = 0;
  std::size_t unique_items = 0;
  std::size_t splits = 0;
  std::size_t merges = 0;
  std::vector<content::ContentCluster> clusters;
  std::vector<common::Warning> warnings;
  /// Finalized clusters and unique items, in input order of their lead item.
  std::vector<retrieval::OutputRecord> records;
  std::chrono::milliseconds duration{0};

  [[nodiscard]] std::string summary_json() const;
};

/// Runs validate, embed, similarity, clustering, summarization, signal
/// extraction, scoring and persistence for one batch. Provider calls are
/// sequential and throttled; similarity and scoring fan out across workers.
class BatchPipeline {
public:
  BatchPipeline(config::Config config, std::shared_ptr<providers::IEmbedder> embedder,
                std::shared_ptr<providers::ITextGenerator> generator,
                std::shared_ptr<store::IRecordStore> store = nullptr);

  /// Fails only on structural problems: invalid weights or thresholds, or a
  /// record store that rejects a write.
  [[nodiscard]] common::Result<BatchReport>
  process(const std::string &batch_id, std::vector<content::ContentItem> items,
          const scoring::ScoringOptions &options = {});

private:
  config::Config config_;
  std::shared_ptr<ProviderThrottle> throttle_;
  std::shared_ptr<providers::IEmbedder> embedder_;
  std::shared_ptr<providers::ITextGenerator> generator_;
  std::shared_ptr<store::IRecordStore> store_;
};

} // namespace distill::pipeline
