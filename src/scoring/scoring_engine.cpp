#include "distill/scoring/scoring_engine.hpp"

#include "distill/common/text.hpp"

#include <algorithm>
#include <array>
#include <functional>
#include <future>
#include <iterator>

namespace distill::scoring {

namespace {

constexpr std::array<double, 3> kAlignmentSlotWeights = {0.5, 0.3, 0.2};

double unit(const double value) { return std::clamp(value, 0.0, 1.0); }

} // namespace

ScoringEngine::ScoringEngine(config::ScoringConfig config) : config_(std::move(config)) {}

double ScoringEngine::topical_score(const std::vector<AlignmentAssessment> &alignments) {
  if (alignments.empty()) {
    return 0.0;
  }
  std::vector<double> values;
  values.reserve(alignments.size());
  for (const auto &assessment : alignments) {
    values.push_back(unit(assessment.alignment));
  }
  std::sort(values.begin(), values.end(), std::greater<>());

  const std::size_t slots = std::min(values.size(), kAlignmentSlotWeights.size());
  double weighted = 0.0;
  double weight_sum = 0.0;
  for (std::size_t i = 0; i < slots; ++i) {
    weighted += kAlignmentSlotWeights[i] * values[i];
    weight_sum += kAlignmentSlotWeights[i];
  }
  return unit(weighted / weight_sum);
}

double ScoringEngine::strategic_score(const StrategicSignals &signals) {
  double base = 0.0;
  for (const auto &classification : signals.classifications) {
    base = std::max(base, unit(classification.confidence));
  }
  const double multiplier = 1.0 + 0.3 * unit(signals.actionability.value_or(0.0)) +
                            0.2 * unit(signals.risk) + 0.2 * unit(signals.stakeholder_relevance);
  return unit(base * multiplier);
}

double ScoringEngine::quality_score(const QualityMetrics &metrics) {
  return unit(0.25 * unit(metrics.factual_density) + 0.25 * unit(metrics.source_authority) +
              0.20 * unit(metrics.clarity) + 0.20 * unit(metrics.completeness) +
              0.10 * unit(metrics.verification_level));
}

double ScoringEngine::recency_score(const double age_days) {
  if (age_days <= 1.0) {
    return 1.0;
  }
  if (age_days <= 7.0) {
    return 0.9;
  }
  if (age_days <= 30.0) {
    return 0.7;
  }
  if (age_days <= 90.0) {
    return 0.5;
  }
  if (age_days <= 180.0) {
    return 0.3;
  }
  return 0.1;
}

double ScoringEngine::trend_momentum(const std::string &text) const {
  const auto hits = common::count_term_hits(text, config_.trend_terms);
  return std::min(0.3, 0.1 * static_cast<double>(hits));
}

std::optional<double> ScoringEngine::temporal_score(const std::optional<std::string> &published_at,
                                                    const std::string &trend_text,
                                                    const common::TimePoint now) const {
  if (!published_at.has_value()) {
    return std::nullopt;
  }
  const auto published = common::parse_rfc3339(*published_at);
  if (!published.has_value()) {
    return std::nullopt;
  }
  const double recency = recency_score(common::age_in_days(*published, now));
  return unit(0.8 * recency + 0.2 * trend_momentum(trend_text));
}

RelevanceDecision ScoringEngine::decide(const double composite, const std::size_t alignment_count,
                                        const std::optional<double> actionability) const {
  if (config_.require_topical_evidence && alignment_count == 0) {
    return RelevanceDecision::Exclude;
  }

  RelevanceDecision decision = RelevanceDecision::Exclude;
  if (composite >= config_.include_threshold) {
    decision = RelevanceDecision::Include;
  } else if (composite >= config_.review_threshold) {
    decision = RelevanceDecision::ManualReview;
  }

  if (decision == RelevanceDecision::Include && actionability.has_value() &&
      *actionability < config_.min_actionability) {
    decision = RelevanceDecision::ManualReview;
  }
  return decision;
}

common::Status ScoringEngine::validate_thresholds() const {
  const auto invalid = [](const std::string &message) {
    return common::Status::error(
        common::DistillError{.kind = common::ErrorKind::InvalidWeights, .message = message});
  };
  if (config_.include_threshold < 0.0 || config_.include_threshold > 1.0 ||
      config_.review_threshold < 0.0 || config_.review_threshold > 1.0) {
    return invalid("decision thresholds must lie within [0, 1]");
  }
  if (config_.include_threshold < config_.review_threshold) {
    return invalid("include_threshold must not be below review_threshold");
  }
  return common::Status::success();
}

ScoredItem ScoringEngine::score_unchecked(const ScoringInput &input, const ScoreWeights &weights,
                                          const common::TimePoint now) const {
  ScoredItem scored;
  scored.id = input.id;

  SubScores subs;
  subs.topical = topical_score(input.alignments);
  if (input.alignments.empty()) {
    scored.degraded.emplace_back("topical");
  }

  if (input.strategic.has_value()) {
    subs.strategic = strategic_score(*input.strategic);
  } else {
    subs.strategic = kStrategicDefault;
    scored.degraded.emplace_back("strategic");
  }

  if (input.quality.has_value()) {
    subs.quality = quality_score(*input.quality);
  } else {
    subs.quality = kQualityDefault;
    scored.degraded.emplace_back("quality");
  }

  if (const auto temporal = temporal_score(input.published_at, input.trend_text, now)) {
    subs.temporal = *temporal;
  } else {
    subs.temporal = kTemporalDefault;
    scored.degraded.emplace_back("temporal");
  }

  // Weights were validated by the caller.
  auto score = RelevanceScore::create(subs, weights);
  scored.score = score.value();

  const std::optional<double> actionability =
      input.strategic.has_value() ? input.strategic->actionability : std::nullopt;
  scored.decision = decide(scored.score.composite(), input.alignments.size(), actionability);
  return scored;
}

common::Result<ScoredItem> ScoringEngine::score(const ScoringInput &input,
                                                const ScoringOptions &options) const {
  const ScoreWeights weights = options.weights.value_or(ScoreWeights::from_config(config_));
  if (auto status = weights.validate(); !status.ok()) {
    return common::Result<ScoredItem>::failure(status);
  }
  if (auto status = validate_thresholds(); !status.ok()) {
    return common::Result<ScoredItem>::failure(status);
  }
  const auto now = options.now.value_or(std::chrono::system_clock::now());
  return common::Result<ScoredItem>::success(score_unchecked(input, weights, now));
}

common::Result<std::vector<ScoredItem>>
ScoringEngine::score_batch(const std::vector<ScoringInput> &inputs,
                           const ScoringOptions &options) const {
  const ScoreWeights weights = options.weights.value_or(ScoreWeights::from_config(config_));
  if (auto status = weights.validate(); !status.ok()) {
    return common::Result<std::vector<ScoredItem>>::failure(status);
  }
  if (auto status = validate_thresholds(); !status.ok()) {
    return common::Result<std::vector<ScoredItem>>::failure(status);
  }
  const auto now = options.now.value_or(std::chrono::system_clock::now());

  std::vector<ScoredItem> out;
  out.reserve(inputs.size());
  if (options.workers <= 1 || inputs.size() < 2) {
    for (const auto &input : inputs) {
      out.push_back(score_unchecked(input, weights, now));
    }
    return common::Result<std::vector<ScoredItem>>::success(std::move(out));
  }

  // Contiguous slices so concatenating the task results keeps input order.
  const std::size_t task_count = std::min(options.workers, inputs.size());
  const std::size_t slice = (inputs.size() + task_count - 1) / task_count;
  std::vector<std::future<std::vector<ScoredItem>>> futures;
  futures.reserve(task_count);
  for (std::size_t begin = 0; begin < inputs.size(); begin += slice) {
    const std::size_t end = std::min(inputs.size(), begin + slice);
    futures.push_back(std::async(std::launch::async, [this, &inputs, &weights, now, begin, end]() {
      std::vector<ScoredItem> part;
      part.reserve(end - begin);
      for (std::size_t i = begin; i < end; ++i) {
        part.push_back(score_unchecked(inputs[i], weights, now));
      }
      return part;
    }));
  }

  for (auto &future : futures) {
    auto part = future.get();
    std::move(part.begin(), part.end(), std::back_inserter(out));
  }
  return common::Result<std::vector<ScoredItem>>::success(std::move(out));
}

} // namespace distill::scoring
