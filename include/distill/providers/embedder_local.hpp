#pragma once

#include "distill/providers/embedder.hpp"

namespace distill::providers {

/// Offline embedder: hashes words and character trigrams into a fixed number
/// of buckets and L2-normalises the result. Identical text yields identical
/// vectors; texts sharing vocabulary land close together.
class LocalEmbedder final : public IEmbedder {
public:
  explicit LocalEmbedder(std::size_t dimensions = 1536);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] std::size_t dimensions() const override;

private:
  std::size_t dimensions_;
};

} // namespace distill::providers
