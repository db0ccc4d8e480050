#pragma once

#include "distill/providers/generator.hpp"

namespace distill::providers {

/// Deterministic local generator. Summaries are lead sentences of the input;
/// signals come from text heuristics and keyword overlap with the topics.
class ExtractiveGenerator final : public ITextGenerator {
public:
  ExtractiveGenerator() = default;

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<GenerationResult>
  generate(const GenerationRequest &request) override;

private:
  [[nodiscard]] GenerationResult summarize(const GenerationRequest &request) const;
  [[nodiscard]] GenerationResult extract_signals(const GenerationRequest &request) const;
};

} // namespace distill::providers
