#include "distill/scoring/relevance.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace distill::scoring {

namespace {

constexpr double kWeightTolerance = 1e-6;

common::Status invalid_weights(const std::string &message) {
  return common::Status::error(
      common::DistillError{.kind = common::ErrorKind::InvalidWeights, .message = message});
}

} // namespace

common::Status ScoreWeights::validate() const {
  for (const double weight : {topical, strategic, quality, temporal}) {
    if (!std::isfinite(weight) || weight < 0.0) {
      return invalid_weights("weights must be finite and non-negative");
    }
  }
  const double sum = topical + strategic + quality + temporal;
  if (std::fabs(sum - 1.0) > kWeightTolerance) {
    std::ostringstream out;
    out << "weights sum to " << sum << ", expected 1.0";
    return invalid_weights(out.str());
  }
  return common::Status::success();
}

ScoreWeights ScoreWeights::from_config(const config::ScoringConfig &config) {
  return ScoreWeights{.topical = config.topical_weight,
                      .strategic = config.strategic_weight,
                      .quality = config.quality_weight,
                      .temporal = config.temporal_weight};
}

common::Result<RelevanceScore> RelevanceScore::create(const SubScores &scores,
                                                      const ScoreWeights &weights) {
  if (auto status = weights.validate(); !status.ok()) {
    return common::Result<RelevanceScore>::failure(status);
  }
  const auto clamp_unit = [](const double value) {
    return std::isfinite(value) ? std::clamp(value, 0.0, 1.0) : 0.0;
  };
  const SubScores clamped{.topical = clamp_unit(scores.topical),
                          .strategic = clamp_unit(scores.strategic),
                          .quality = clamp_unit(scores.quality),
                          .temporal = clamp_unit(scores.temporal)};
  return common::Result<RelevanceScore>::success(RelevanceScore(clamped, weights));
}

double RelevanceScore::composite() const {
  const double value = weights_.topical * scores_.topical + weights_.strategic * scores_.strategic +
                       weights_.quality * scores_.quality + weights_.temporal * scores_.temporal;
  return std::clamp(value, 0.0, 1.0);
}

std::string_view decision_to_string(const RelevanceDecision decision) {
  switch (decision) {
  case RelevanceDecision::Include:
    return "include";
  case RelevanceDecision::ManualReview:
    return "manual_review";
  case RelevanceDecision::Exclude:
    return "exclude";
  }
  return "exclude";
}

std::optional<RelevanceDecision> decision_from_string(const std::string_view value) {
  for (const auto decision : {RelevanceDecision::Include, RelevanceDecision::ManualReview,
                              RelevanceDecision::Exclude}) {
    if (decision_to_string(decision) == value) {
      return decision;
    }
  }
  return std::nullopt;
}

} // namespace distill::scoring
