#pragma once

#include "distill/providers/generator.hpp"

namespace distill::providers {

/// Chat-completions backed generator. The model is asked for a JSON object;
/// its `summary` member becomes the text and every member becomes a field.
class OpenAiGenerator final : public ITextGenerator {
public:
  OpenAiGenerator(std::string api_key, std::string model, double temperature,
                  std::string base_url, std::shared_ptr<HttpClient> http_client,
                  std::uint64_t timeout_ms = 30'000);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<GenerationResult>
  generate(const GenerationRequest &request) override;

  [[nodiscard]] std::string build_request_body(const GenerationRequest &request) const;

private:
  std::string api_key_;
  std::string model_;
  double temperature_;
  std::string base_url_;
  std::shared_ptr<HttpClient> http_client_;
  std::uint64_t timeout_ms_;
};

} // namespace distill::providers
