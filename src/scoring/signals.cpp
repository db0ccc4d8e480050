#include "distill/scoring/signals.hpp"

#include "distill/similarity/similarity_matrix.hpp"

#include <array>

namespace distill::scoring {

namespace {

std::optional<double> field_number(const common::JsonFlatMap &fields, const std::string &key) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    return std::nullopt;
  }
  return common::json_number(it->second);
}

} // namespace

providers::GenerationRequest build_signal_request(const content::ContentItem &item,
                                                  const std::vector<std::string> &topics) {
  providers::GenerationRequest request;
  request.task = providers::GenerationTask::ExtractSignals;
  request.instructions = "Rate the content quality and classify it against the topics.";
  request.content = item.body;
  request.topics = topics;
  request.attributes["title"] = item.title;
  request.attributes["domain"] = item.domain;
  request.attributes["source_url"] = item.source_url;
  request.attributes["word_count"] = std::to_string(item.word_count);
  if (item.published_at.has_value()) {
    request.attributes["published_at"] = *item.published_at;
  }
  if (!item.summary.empty()) {
    request.attributes["summary"] = item.summary;
  }
  return request;
}

std::optional<StrategicSignals> strategic_from_fields(const common::JsonFlatMap &fields) {
  StrategicSignals signals;
  bool present = false;

  if (const auto it = fields.find("classifications"); it != fields.end()) {
    present = true;
    for (const auto &object : common::json_split_top_level_objects(it->second)) {
      const auto entry = common::json_parse_flat(object);
      const std::string topic = common::json_field_string(entry, "topic");
      const auto confidence = field_number(entry, "confidence");
      if (topic.empty() || !confidence.has_value()) {
        continue;
      }
      signals.classifications.push_back(
          TopicClassification{.topic = topic, .confidence = *confidence});
    }
  }

  signals.actionability = field_number(fields, "actionability");
  present = present || signals.actionability.has_value();
  if (const auto risk = field_number(fields, "risk")) {
    signals.risk = *risk;
    present = true;
  }
  if (const auto stakeholder = field_number(fields, "stakeholder_relevance")) {
    signals.stakeholder_relevance = *stakeholder;
    present = true;
  }

  if (!present) {
    return std::nullopt;
  }
  return signals;
}

std::optional<QualityMetrics> quality_from_fields(const common::JsonFlatMap &fields) {
  QualityMetrics metrics;
  const std::array<std::pair<const char *, double *>, 5> slots = {{
      {"factual_density", &metrics.factual_density},
      {"source_authority", &metrics.source_authority},
      {"clarity", &metrics.clarity},
      {"completeness", &metrics.completeness},
      {"verification_level", &metrics.verification_level},
  }};

  bool present = false;
  for (const auto &[key, target] : slots) {
    if (const auto value = field_number(fields, key)) {
      *target = *value;
      present = true;
    }
  }
  if (!present) {
    return std::nullopt;
  }
  return metrics;
}

std::vector<AlignmentAssessment> topic_alignments(const std::vector<float> &item_vector,
                                                  const std::vector<TopicVector> &topics) {
  std::vector<AlignmentAssessment> out;
  if (item_vector.empty()) {
    return out;
  }
  out.reserve(topics.size());
  for (const auto &[topic, vector] : topics) {
    out.push_back(AlignmentAssessment{
        .topic = topic, .alignment = similarity::cosine_similarity(item_vector, vector)});
  }
  return out;
}

std::string trend_text(const content::ContentItem &item) {
  return item.title + "\n" + item.summary + "\n" + item.body;
}

} // namespace distill::scoring
