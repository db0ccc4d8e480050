#pragma once

#include "distill/providers/embedder.hpp"
#include "distill/providers/generator.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace distill::providers {

/// Retries the primary with exponential backoff, then each fallback in order.
class ReliableGenerator final : public ITextGenerator {
public:
  ReliableGenerator(std::shared_ptr<ITextGenerator> primary,
                    std::vector<std::shared_ptr<ITextGenerator>> fallbacks,
                    std::uint32_t max_retries, std::uint64_t backoff_ms);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<GenerationResult>
  generate(const GenerationRequest &request) override;

private:
  [[nodiscard]] common::Result<GenerationResult>
  execute_with_provider(const std::shared_ptr<ITextGenerator> &provider,
                        const GenerationRequest &request) const;

  std::shared_ptr<ITextGenerator> primary_;
  std::vector<std::shared_ptr<ITextGenerator>> fallbacks_;
  std::uint32_t max_retries_;
  std::uint64_t backoff_ms_;
};

/// Retries a single embedder with exponential backoff. Dimension mismatches
/// are not retried.
class ReliableEmbedder final : public IEmbedder {
public:
  ReliableEmbedder(std::unique_ptr<IEmbedder> inner, std::uint32_t max_retries,
                   std::uint64_t backoff_ms);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] std::size_t dimensions() const override;

private:
  std::unique_ptr<IEmbedder> inner_;
  std::uint32_t max_retries_;
  std::uint64_t backoff_ms_;
};

} // namespace distill::providers
