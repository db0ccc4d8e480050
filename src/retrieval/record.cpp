#include "distill/retrieval/record.hpp"

#include "distill/common/json_util.hpp"

#include <iomanip>
#include <sstream>
#include <unordered_set>

namespace distill::retrieval {

namespace {

std::string number(const double value, const int precision = 10) {
  std::ostringstream out;
  out << std::setprecision(precision) << value;
  return out.str();
}

std::string float_array(const std::vector<float> &values) {
  std::ostringstream out;
  out << std::setprecision(9) << "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << values[i];
  }
  out << "]";
  return out.str();
}

common::Result<OutputRecord> malformed(const std::string &message) {
  return common::Result<OutputRecord>::failure(
      common::DistillError{.kind = common::ErrorKind::Storage, .message = message});
}

} // namespace

std::string_view record_kind_to_string(const RecordKind kind) {
  return kind == RecordKind::Cluster ? "cluster" : "item";
}

std::optional<RecordKind> record_kind_from_string(const std::string_view value) {
  if (value == "item") {
    return RecordKind::Item;
  }
  if (value == "cluster") {
    return RecordKind::Cluster;
  }
  return std::nullopt;
}

OutputRecord record_for_item(const content::ContentItem &item, const scoring::ScoredItem &scored) {
  OutputRecord record;
  record.id = item.id;
  record.kind = RecordKind::Item;
  record.batch_id = item.metadata.batch_id;
  record.title = item.title;
  record.summary = item.summary;
  record.source_url = item.source_url;
  record.domain = item.domain;
  record.tags = item.metadata.tags;
  record.extraction_confidence = item.extraction_confidence;
  record.published_at = item.published_at;
  record.embedding = item.embedding.value_or(std::vector<float>{});
  record.score = scored.score;
  record.decision = scored.decision;
  record.degraded = scored.degraded;
  return record;
}

OutputRecord record_for_cluster(const content::ContentCluster &cluster,
                                const content::ContentItem &representative,
                                const std::vector<const content::ContentItem *> &members,
                                const scoring::ScoredItem &scored) {
  OutputRecord record = record_for_item(representative, scored);
  record.id = cluster.id;
  record.kind = RecordKind::Cluster;
  record.summary = cluster.summary.value_or(representative.summary);
  record.extraction_confidence = cluster.metrics.avg_extraction_confidence;
  record.member_ids = cluster.member_ids;
  record.representative_id = cluster.representative_id;
  record.cluster_confidence = cluster.confidence;
  record.cohesion = cluster.cohesion;
  record.tier = cluster.tier;
  record.metrics = cluster.metrics;

  std::unordered_set<std::string> seen;
  record.tags.clear();
  for (const auto *member : members) {
    for (const auto &tag : member->metadata.tags) {
      if (seen.insert(tag).second) {
        record.tags.push_back(tag);
      }
    }
  }
  return record;
}

std::string record_to_json(const OutputRecord &record, const bool include_embedding) {
  const auto &score = record.score;
  const auto &weights = score.weights();

  std::ostringstream out;
  out << "{";
  out << "\"id\":\"" << common::json_escape(record.id) << "\",";
  out << "\"kind\":\"" << record_kind_to_string(record.kind) << "\",";
  out << "\"batch_id\":\"" << common::json_escape(record.batch_id) << "\",";
  out << "\"title\":\"" << common::json_escape(record.title) << "\",";
  out << "\"summary\":\"" << common::json_escape(record.summary) << "\",";
  out << "\"source_url\":\"" << common::json_escape(record.source_url) << "\",";
  out << "\"domain\":\"" << common::json_escape(record.domain) << "\",";
  out << "\"tags\":" << common::json_string_array(record.tags) << ",";
  out << "\"extraction_confidence\":" << number(record.extraction_confidence) << ",";
  if (record.published_at.has_value()) {
    out << "\"published_at\":\"" << common::json_escape(*record.published_at) << "\",";
  } else {
    out << "\"published_at\":null,";
  }
  if (record.kind == RecordKind::Cluster) {
    out << "\"member_ids\":" << common::json_string_array(record.member_ids) << ",";
    out << "\"representative_id\":\"" << common::json_escape(record.representative_id) << "\",";
    out << "\"cluster_confidence\":" << number(record.cluster_confidence) << ",";
    out << "\"cohesion\":" << number(record.cohesion) << ",";
    out << "\"tier\":\""
        << content::tier_to_string(record.tier.value_or(content::SimilarityTier::UniqueContent))
        << "\",";
    out << "\"total_word_count\":" << record.metrics.total_word_count << ",";
    out << "\"distinct_domains\":" << record.metrics.distinct_domains << ",";
  }
  out << "\"topical_score\":" << number(score.topical()) << ",";
  out << "\"strategic_score\":" << number(score.strategic()) << ",";
  out << "\"quality_score\":" << number(score.quality()) << ",";
  out << "\"temporal_score\":" << number(score.temporal()) << ",";
  out << "\"composite_score\":" << number(score.composite()) << ",";
  out << "\"weights\":{\"topical\":" << number(weights.topical)
      << ",\"strategic\":" << number(weights.strategic)
      << ",\"quality\":" << number(weights.quality)
      << ",\"temporal\":" << number(weights.temporal) << "},";
  out << "\"decision\":\"" << scoring::decision_to_string(record.decision) << "\",";
  out << "\"degraded\":" << common::json_string_array(record.degraded);
  if (include_embedding && !record.embedding.empty()) {
    out << ",\"embedding\":" << float_array(record.embedding);
  }
  out << "}";
  return out.str();
}

common::Result<OutputRecord> record_from_json(const std::string &json) {
  const auto fields = common::json_parse_flat(json);
  OutputRecord record;
  record.id = common::json_field_string(fields, "id");
  if (record.id.empty()) {
    return malformed("stored record has no id");
  }

  const auto kind = record_kind_from_string(common::json_field_string(fields, "kind", "item"));
  if (!kind.has_value()) {
    return malformed(record.id + ": unknown record kind");
  }
  record.kind = *kind;
  record.batch_id = common::json_field_string(fields, "batch_id");
  record.title = common::json_field_string(fields, "title");
  record.summary = common::json_field_string(fields, "summary");
  record.source_url = common::json_field_string(fields, "source_url");
  record.domain = common::json_field_string(fields, "domain");
  record.tags = common::json_array_strings(common::json_field_string(fields, "tags", "[]"));
  record.extraction_confidence = common::json_field_double(fields, "extraction_confidence", 0.0);
  if (const auto published = common::json_field_string(fields, "published_at");
      !published.empty()) {
    record.published_at = published;
  }

  if (record.kind == RecordKind::Cluster) {
    record.member_ids =
        common::json_array_strings(common::json_field_string(fields, "member_ids", "[]"));
    record.representative_id = common::json_field_string(fields, "representative_id");
    record.cluster_confidence = common::json_field_double(fields, "cluster_confidence", 0.0);
    record.cohesion = common::json_field_double(fields, "cohesion", 0.0);
    record.tier = content::tier_from_string(common::json_field_string(fields, "tier"));
    record.metrics.total_word_count = common::json_field_count(fields, "total_word_count");
    record.metrics.distinct_domains = common::json_field_count(fields, "distinct_domains");
    record.metrics.avg_extraction_confidence = record.extraction_confidence;
  }

  const auto weight_fields =
      common::json_parse_flat(common::json_field_string(fields, "weights", "{}"));
  const scoring::ScoreWeights defaults;
  const scoring::ScoreWeights weights{
      .topical = common::json_field_double(weight_fields, "topical", defaults.topical),
      .strategic = common::json_field_double(weight_fields, "strategic", defaults.strategic),
      .quality = common::json_field_double(weight_fields, "quality", defaults.quality),
      .temporal = common::json_field_double(weight_fields, "temporal", defaults.temporal)};
  const scoring::SubScores subs{
      .topical = common::json_field_double(fields, "topical_score", 0.0),
      .strategic = common::json_field_double(fields, "strategic_score", 0.0),
      .quality = common::json_field_double(fields, "quality_score", 0.0),
      .temporal = common::json_field_double(fields, "temporal_score", 0.0)};
  auto score = scoring::RelevanceScore::create(subs, weights);
  if (!score.ok()) {
    return malformed(record.id + ": " + score.error());
  }
  record.score = score.value();

  const auto decision =
      scoring::decision_from_string(common::json_field_string(fields, "decision", "exclude"));
  if (!decision.has_value()) {
    return malformed(record.id + ": unknown decision");
  }
  record.decision = *decision;
  record.degraded =
      common::json_array_strings(common::json_field_string(fields, "degraded", "[]"));

  if (const auto it = fields.find("embedding"); it != fields.end()) {
    if (const auto numbers = common::json_array_numbers(it->second)) {
      record.embedding.reserve(numbers->size());
      for (const double v : *numbers) {
        record.embedding.push_back(static_cast<float>(v));
      }
    }
  }
  return common::Result<OutputRecord>::success(std::move(record));
}

} // namespace distill::retrieval
