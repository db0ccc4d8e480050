#pragma once

#include "distill/providers/embedder.hpp"
#include "distill/providers/generator.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

namespace distill::pipeline {

/// Enforces a minimum delay between consecutive provider calls.
class ProviderThrottle {
public:
  explicit ProviderThrottle(std::uint64_t min_interval_ms);

  /// Blocks until at least the minimum interval has passed since the previous call.
  void acquire();

  [[nodiscard]] std::uint64_t min_interval_ms() const { return min_interval_ms_; }

private:
  std::uint64_t min_interval_ms_;
  std::optional<std::chrono::steady_clock::time_point> last_call_;
  std::mutex mutex_;
};

class ThrottledEmbedder final : public providers::IEmbedder {
public:
  ThrottledEmbedder(std::shared_ptr<providers::IEmbedder> inner,
                    std::shared_ptr<ProviderThrottle> throttle);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] std::size_t dimensions() const override;

private:
  std::shared_ptr<providers::IEmbedder> inner_;
  std::shared_ptr<ProviderThrottle> throttle_;
};

class ThrottledGenerator final : public providers::ITextGenerator {
public:
  ThrottledGenerator(std::shared_ptr<providers::ITextGenerator> inner,
                     std::shared_ptr<ProviderThrottle> throttle);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<providers::GenerationResult>
  generate(const providers::GenerationRequest &request) override;

private:
  std::shared_ptr<providers::ITextGenerator> inner_;
  std::shared_ptr<ProviderThrottle> throttle_;
};

} // namespace distill::pipeline
