#include "distill/providers/reliable.hpp"

#include "distill/observability/global.hpp"

#include <chrono>
#include <thread>

namespace distill::providers {

ReliableGenerator::ReliableGenerator(std::shared_ptr<ITextGenerator> primary,
                                     std::vector<std::shared_ptr<ITextGenerator>> fallbacks,
                                     const std::uint32_t max_retries, const std::uint64_t backoff_ms)
    : primary_(std::move(primary)), fallbacks_(std::move(fallbacks)), max_retries_(max_retries),
      backoff_ms_(backoff_ms) {}

std::string_view ReliableGenerator::name() const { return primary_->name(); }

common::Result<GenerationResult>
ReliableGenerator::execute_with_provider(const std::shared_ptr<ITextGenerator> &provider,
                                         const GenerationRequest &request) const {
  auto result = provider->generate(request);
  for (std::uint32_t attempt = 0; attempt < max_retries_ && !result.ok(); ++attempt) {
    const std::uint64_t delay = backoff_ms_ * (1ULL << attempt);
    std::this_thread::sleep_for(std::chrono::milliseconds(delay));
    result = provider->generate(request);
  }

  if (result.ok() || result.kind() == common::ErrorKind::GenerationUnavailable) {
    return result;
  }
  return common::Result<GenerationResult>::failure(
      generation_unavailable(provider->name(), result.error()));
}

common::Result<GenerationResult> ReliableGenerator::generate(const GenerationRequest &request) {
  auto result = execute_with_provider(primary_, request);
  if (result.ok()) {
    return result;
  }

  for (const auto &fallback : fallbacks_) {
    observability::record_warning("generation", std::string(primary_->name()) +
                                                    " failed, trying " +
                                                    std::string(fallback->name()));
    result = execute_with_provider(fallback, request);
    if (result.ok()) {
      return result;
    }
  }
  return result;
}

ReliableEmbedder::ReliableEmbedder(std::unique_ptr<IEmbedder> inner,
                                   const std::uint32_t max_retries, const std::uint64_t backoff_ms)
    : inner_(std::move(inner)), max_retries_(max_retries), backoff_ms_(backoff_ms) {}

std::string_view ReliableEmbedder::name() const { return inner_->name(); }

std::size_t ReliableEmbedder::dimensions() const { return inner_->dimensions(); }

common::Result<std::vector<float>> ReliableEmbedder::embed(const std::string_view text) {
  auto result = inner_->embed(text);
  for (std::uint32_t attempt = 0; attempt < max_retries_ && !result.ok(); ++attempt) {
    if (result.kind() == common::ErrorKind::DimensionMismatch) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms_ * (1ULL << attempt)));
    result = inner_->embed(text);
  }
  return result;
}

} // namespace distill::providers
