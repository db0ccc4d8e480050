#pragma once

#include "distill/common/result.hpp"
#include "distill/common/time.hpp"
#include "distill/config/schema.hpp"
#include "distill/scoring/relevance.hpp"

#include <optional>
#include <string>
#include <vector>

namespace distill::scoring {

struct ScoringOptions {
  /// Overrides the configured weights for this request.
  std::optional<ScoreWeights> weights;
  /// Reference time for recency; defaults to the current time.
  std::optional<common::TimePoint> now;
  /// 0 or 1 scores strictly sequentially.
  std::size_t workers = 0;
};

/// Computes the four sub-scores, their weighted composite and the decision.
/// Missing inputs degrade a sub-score to its default; only invalid weights or
/// thresholds fail.
class ScoringEngine {
public:
  static constexpr double kQualityDefault = 0.5;
  static constexpr double kStrategicDefault = 0.5;
  static constexpr double kTemporalDefault = 0.5;

  explicit ScoringEngine(config::ScoringConfig config);

  /// Top three alignments weighted 0.5/0.3/0.2, renormalised over those present.
  [[nodiscard]] static double topical_score(const std::vector<AlignmentAssessment> &alignments);
  [[nodiscard]] static double strategic_score(const StrategicSignals &signals);
  [[nodiscard]] static double quality_score(const QualityMetrics &metrics);
  [[nodiscard]] static double recency_score(double age_days);

  /// 0.1 per distinct trend term found, capped at 0.3.
  [[nodiscard]] double trend_momentum(const std::string &text) const;
  /// nullopt when the timestamp is missing or unparseable.
  [[nodiscard]] std::optional<double> temporal_score(const std::optional<std::string> &published_at,
                                                     const std::string &trend_text,
                                                     common::TimePoint now) const;

  [[nodiscard]] RelevanceDecision decide(double composite, std::size_t alignment_count,
                                         std::optional<double> actionability) const;

  [[nodiscard]] common::Result<ScoredItem> score(const ScoringInput &input,
                                                 const ScoringOptions &options = {}) const;
  [[nodiscard]] common::Result<std::vector<ScoredItem>>
  score_batch(const std::vector<ScoringInput> &inputs, const ScoringOptions &options = {}) const;

  /// InvalidWeights for thresholds outside [0,1] or include below review.
  [[nodiscard]] common::Status validate_thresholds() const;

  [[nodiscard]] const config::ScoringConfig &config() const { return config_; }

private:
  [[nodiscard]] ScoredItem score_unchecked(const ScoringInput &input, const ScoreWeights &weights,
                                           common::TimePoint now) const;

  config::ScoringConfig config_;
};

} // namespace distill::scoring
