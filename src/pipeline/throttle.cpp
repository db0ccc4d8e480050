#include "distill/pipeline/throttle.hpp"

#include <thread>

namespace distill::pipeline {

ProviderThrottle::ProviderThrottle(const std::uint64_t min_interval_ms)
    : min_interval_ms_(min_interval_ms) {}

void ProviderThrottle::acquire() {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = std::chrono::steady_clock::now();
  if (min_interval_ms_ > 0 && last_call_.has_value()) {
    const auto ready_at = *last_call_ + std::chrono::milliseconds(min_interval_ms_);
    if (ready_at > now) {
      std::this_thread::sleep_until(ready_at);
    }
  }
  last_call_ = std::chrono::steady_clock::now();
}

ThrottledEmbedder::ThrottledEmbedder(std::shared_ptr<providers::IEmbedder> inner,
                                     std::shared_ptr<ProviderThrottle> throttle)
    : inner_(std::move(inner)), throttle_(std::move(throttle)) {}

std::string_view ThrottledEmbedder::name() const { return inner_->name(); }

common::Result<std::vector<float>> ThrottledEmbedder::embed(const std::string_view text) {
  throttle_->acquire();
  return inner_->embed(text);
}

std::size_t ThrottledEmbedder::dimensions() const { return inner_->dimensions(); }

ThrottledGenerator::ThrottledGenerator(std::shared_ptr<providers::ITextGenerator> inner,
                                       std::shared_ptr<ProviderThrottle> throttle)
    : inner_(std::move(inner)), throttle_(std::move(throttle)) {}

std::string_view ThrottledGenerator::name() const { return inner_->name(); }

common::Result<providers::GenerationResult>
ThrottledGenerator::generate(const providers::GenerationRequest &request) {
  throttle_->acquire();
  return inner_->generate(request);
}

} // namespace distill::pipeline
