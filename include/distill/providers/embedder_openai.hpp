#pragma once

#include "distill/providers/embedder.hpp"

namespace distill::providers {

class OpenAiEmbedder final : public IEmbedder {
public:
  OpenAiEmbedder(std::string api_key, std::string model, std::size_t dimensions,
                 std::string base_url, std::shared_ptr<HttpClient> http_client,
                 std::uint64_t timeout_ms = 30'000);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] std::size_t dimensions() const override;

private:
  std::string api_key_;
  std::string model_;
  std::size_t dimensions_;
  std::string base_url_;
  std::shared_ptr<HttpClient> http_client_;
  std::uint64_t timeout_ms_;
};

} // namespace distill::providers
