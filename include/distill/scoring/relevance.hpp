#pragma once

#include "distill/common/result.hpp"
#include "distill/config/schema.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace distill::scoring {

struct AlignmentAssessment {
  std::string topic;
  double alignment = 0.0;
};

struct TopicClassification {
  std::string topic;
  double confidence = 0.0;
};

struct StrategicSignals {
  std::vector<TopicClassification> classifications;
  /// Unset when the provider gave no actionability estimate.
  std::optional<double> actionability;
  double risk = 0.0;
  double stakeholder_relevance = 0.0;
};

struct QualityMetrics {
  double factual_density = 0.5;
  double source_authority = 0.5;
  double clarity = 0.5;
  double completeness = 0.5;
  double verification_level = 0.5;
};

/// Everything the engine needs to score one item or cluster representative.
struct ScoringInput {
  std::string id;
  std::vector<AlignmentAssessment> alignments;
  std::optional<StrategicSignals> strategic;
  std::optional<QualityMetrics> quality;
  std::optional<std::string> published_at;
  /// Text searched for trend-indicating terms.
  std::string trend_text;
};

struct ScoreWeights {
  double topical = 0.4;
  double strategic = 0.3;
  double quality = 0.2;
  double temporal = 0.1;

  /// InvalidWeights when a weight is negative or the sum is not 1 within 1e-6.
  [[nodiscard]] common::Status validate() const;
  [[nodiscard]] static ScoreWeights from_config(const config::ScoringConfig &config);
};

struct SubScores {
  double topical = 0.0;
  double strategic = 0.0;
  double quality = 0.0;
  double temporal = 0.0;
};

/// Four sub-scores and the weights they were combined with. The composite is
/// always derived from these and cannot be assigned.
class RelevanceScore {
public:
  RelevanceScore() = default;

  /// Sub-scores are clamped to [0,1]; fails when the weights are invalid.
  [[nodiscard]] static common::Result<RelevanceScore> create(const SubScores &scores,
                                                             const ScoreWeights &weights);

  [[nodiscard]] double topical() const { return scores_.topical; }
  [[nodiscard]] double strategic() const { return scores_.strategic; }
  [[nodiscard]] double quality() const { return scores_.quality; }
  [[nodiscard]] double temporal() const { return scores_.temporal; }
  [[nodiscard]] const SubScores &sub_scores() const { return scores_; }
  [[nodiscard]] const ScoreWeights &weights() const { return weights_; }
  [[nodiscard]] double composite() const;

private:
  RelevanceScore(const SubScores &scores, const ScoreWeights &weights)
      : scores_(scores), weights_(weights) {}

  SubScores scores_;
  ScoreWeights weights_;
};

enum class RelevanceDecision {
  Include,
  ManualReview,
  Exclude,
};

[[nodiscard]] std::string_view decision_to_string(RelevanceDecision decision);
[[nodiscard]] std::optional<RelevanceDecision> decision_from_string(std::string_view value);

struct ScoredItem {
  std::string id;
  RelevanceScore score;
  RelevanceDecision decision = RelevanceDecision::Exclude;
  /// Sub-scores that fell back to their documented default.
  std::vector<std::string> degraded;
};

} // namespace distill::scoring
