#pragma once

#include "distill/common/result.hpp"
#include "distill/config/schema.hpp"
#include "distill/providers/http.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace distill::providers {

/// Produces fixed-length vectors for text. Failures carry the
/// EmbeddingUnavailable kind.
class IEmbedder {
public:
  virtual ~IEmbedder() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Result<std::vector<float>> embed(std::string_view text) = 0;
  [[nodiscard]] virtual common::Result<std::vector<std::vector<float>>>
  embed_batch(const std::vector<std::string> &texts);
  [[nodiscard]] virtual std::size_t dimensions() const = 0;
};

[[nodiscard]] common::Status embedding_unavailable(std::string_view provider,
                                                   const std::string &detail);

/// `http` is used by network-backed embedders; a curl client is created when null.
[[nodiscard]] std::unique_ptr<IEmbedder>
create_embedder(const config::Config &config, std::shared_ptr<HttpClient> http = nullptr);

} // namespace distill::providers
