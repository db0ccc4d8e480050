#include "distill/content/item.hpp"

#include "distill/common/fs.hpp"
#include "distill/common/text.hpp"

#include <unordered_set>

namespace distill::content {

namespace {

common::Status malformed(const ContentItem &item, const std::string &message) {
  const std::string subject = item.id.empty() ? std::string("<no id>") : item.id;
  return common::Status::error(common::DistillError{
      .kind = common::ErrorKind::MalformedItem, .message = subject + ": " + message});
}

} // namespace

std::string_view tier_to_string(const SimilarityTier tier) {
  switch (tier) {
  case SimilarityTier::ExactDuplicate:
    return "exact_duplicate";
  case SimilarityTier::SameStory:
    return "same_story";
  case SimilarityTier::RelatedContent:
    return "related_content";
  case SimilarityTier::UniqueContent:
    return "unique_content";
  }
  return "unique_content";
}

std::optional<SimilarityTier> tier_from_string(const std::string_view value) {
  for (const auto tier : {SimilarityTier::ExactDuplicate, SimilarityTier::SameStory,
                          SimilarityTier::RelatedContent, SimilarityTier::UniqueContent}) {
    if (tier_to_string(tier) == value) {
      return tier;
    }
  }
  return std::nullopt;
}

common::Status validate_item(const ContentItem &item) {
  if (common::trim(item.id).empty()) {
    return malformed(item, "missing id");
  }
  if (common::trim(item.title).empty()) {
    return malformed(item, "missing title");
  }
  if (common::trim(item.body).empty()) {
    return malformed(item, "missing body");
  }
  if (common::trim(item.source_url).empty()) {
    return malformed(item, "missing source_url");
  }
  if (!common::starts_with(item.source_url, "http://") &&
      !common::starts_with(item.source_url, "https://")) {
    return malformed(item, "source_url must be an http(s) URL");
  }
  if (!(item.extraction_confidence >= 0.0 && item.extraction_confidence <= 1.0)) {
    return malformed(item, "extraction_confidence must be within [0, 1]");
  }
  return common::Status::success();
}

void fill_derived_fields(ContentItem &item) {
  if (common::trim(item.domain).empty()) {
    item.domain = common::url_host(item.source_url);
  }
  if (item.word_count == 0) {
    item.word_count = common::count_words(item.body);
  }
}

std::string embedding_text(const ContentItem &item) {
  const std::string &lead = item.summary.empty() ? item.body : item.summary;
  return common::normalize_whitespace(item.title + "\n" + lead);
}

ClusterMetrics compute_cluster_metrics(const std::vector<const ContentItem *> &members) {
  ClusterMetrics metrics;
  if (members.empty()) {
    return metrics;
  }

  std::unordered_set<std::string> domains;
  double confidence_sum = 0.0;
  for (const auto *item : members) {
    metrics.total_word_count += item->word_count;
    confidence_sum += item->extraction_confidence;
    if (!item->domain.empty()) {
      domains.insert(common::to_lower(item->domain));
    }
  }
  metrics.avg_extraction_confidence = confidence_sum / static_cast<double>(members.size());
  metrics.distinct_domains = domains.size();
  return metrics;
}

} // namespace distill::content
