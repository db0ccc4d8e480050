#pragma once

#include "distill/common/result.hpp"
#include "distill/content/item.hpp"
#include "distill/scoring/relevance.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace distill::retrieval {

enum class RecordKind {
  Item,
  Cluster,
};

[[nodiscard]] std::string_view record_kind_to_string(RecordKind kind);
[[nodiscard]] std::optional<RecordKind> record_kind_from_string(std::string_view value);

/// One entry of a batch's output: a unique item or a finalized cluster
/// speaking through its representative. Immutable once written.
struct OutputRecord {
  std::string id;
  RecordKind kind = RecordKind::Item;
  std::string batch_id;
  std::string title;
  std::string summary;
  std::string source_url;
  std::string domain;
  std::vector<std::string> tags;
  double extraction_confidence = 0.0;
  std::optional<std::string> published_at;

  // Cluster records only.
  std::vector<std::string> member_ids;
  std::string representative_id;
  double cluster_confidence = 0.0;
  double cohesion = 0.0;
  std::optional<content::SimilarityTier> tier;
  content::ClusterMetrics metrics;

  std::vector<float> embedding;
  scoring::RelevanceScore score;
  scoring::RelevanceDecision decision = scoring::RelevanceDecision::Exclude;
  std::vector<std::string> degraded;
};

[[nodiscard]] OutputRecord record_for_item(const content::ContentItem &item,
                                           const scoring::ScoredItem &scored);

/// `representative` supplies title, URL, vector and timestamp; tags are the
/// union over `members` in member order.
[[nodiscard]] OutputRecord record_for_cluster(const content::ContentCluster &cluster,
                                              const content::ContentItem &representative,
                                              const std::vector<const content::ContentItem *> &members,
                                              const scoring::ScoredItem &scored);

/// Flat JSON object; scores, batch and kind are top-level members so the
/// record store can filter on them.
[[nodiscard]] std::string record_to_json(const OutputRecord &record, bool include_embedding = true);
[[nodiscard]] common::Result<OutputRecord> record_from_json(const std::string &json);

} // namespace distill::retrieval
