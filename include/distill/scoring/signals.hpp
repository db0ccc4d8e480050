#pragma once

#include "distill/common/json_util.hpp"
#include "distill/content/item.hpp"
#include "distill/providers/generator.hpp"
#include "distill/scoring/relevance.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace distill::scoring {

using TopicVector = std::pair<std::string, std::vector<float>>;

/// Signal-extraction request for one item against the configured topics.
[[nodiscard]] providers::GenerationRequest build_signal_request(const content::ContentItem &item,
                                                                const std::vector<std::string> &topics);

/// nullopt when the fields carry neither classifications nor any modifier.
[[nodiscard]] std::optional<StrategicSignals> strategic_from_fields(const common::JsonFlatMap &fields);

/// nullopt when no quality metric is present; individual gaps take the neutral 0.5.
[[nodiscard]] std::optional<QualityMetrics> quality_from_fields(const common::JsonFlatMap &fields);

/// One assessment per topic: clamped cosine similarity of the item and topic vectors.
[[nodiscard]] std::vector<AlignmentAssessment>
topic_alignments(const std::vector<float> &item_vector, const std::vector<TopicVector> &topics);

/// Title, summary and body joined for trend-term detection.
[[nodiscard]] std::string trend_text(const content::ContentItem &item);

} // namespace distill::scoring
