#pragma once

#include "distill/common/result.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace distill::content {

/// Structured metadata read by the pipeline. `extra` carries any other
/// upstream fields verbatim for round-tripping and is never inspected.
struct ItemMetadata {
  std::string batch_id;
  std::vector<std::string> tags;
  std::unordered_map<std::string, std::string> extra;
};

struct ContentItem {
  std::string id;
  std::string title;
  std::string body;
  std::string summary;
  std::string source_url;
  std::string domain;
  std::size_t word_count = 0;
  double extraction_confidence = 0.0;
  std::optional<std::string> published_at;
  ItemMetadata metadata;

  // Assigned while the batch is processed.
  std::optional<std::vector<float>> embedding;
  std::optional<std::string> cluster_id;
  std::optional<std::string> parent_id;
  bool is_representative = false;
  std::size_t absorbed_count = 0;

  [[nodiscard]] bool is_clustered() const { return cluster_id.has_value(); }
};

enum class SimilarityTier {
  ExactDuplicate,
  SameStory,
  RelatedContent,
  UniqueContent,
};

[[nodiscard]] std::string_view tier_to_string(SimilarityTier tier);
[[nodiscard]] std::optional<SimilarityTier> tier_from_string(std::string_view value);

struct ClusterMetrics {
  std::size_t total_word_count = 0;
  double avg_extraction_confidence = 0.0;
  std::size_t distinct_domains = 0;
};

/// Two or more mutually similar items. Members are kept in input order.
struct ContentCluster {
  std::string id;
  std::vector<std::string> member_ids;
  std::string representative_id;
  std::optional<std::string> summary;
  double confidence = 0.0;
  double cohesion = 0.0;
  double average_similarity = 0.0;
  SimilarityTier tier = SimilarityTier::UniqueContent;
  ClusterMetrics metrics;
  bool from_split = false;
  bool from_merge = false;

  [[nodiscard]] std::size_t size() const { return member_ids.size(); }
};

/// Fails with MalformedItem when a required field is missing or out of range.
[[nodiscard]] common::Status validate_item(const ContentItem &item);

/// Derives the domain from the source URL and the word count from the body
/// when the upstream stage left them empty.
void fill_derived_fields(ContentItem &item);

/// Text handed to the embedding provider for an item.
[[nodiscard]] std::string embedding_text(const ContentItem &item);

[[nodiscard]] ClusterMetrics compute_cluster_metrics(const std::vector<const ContentItem *> &members);

} // namespace distill::content
