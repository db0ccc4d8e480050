#include "distill/providers/embedder.hpp"

#include "distill/common/fs.hpp"
#include "distill/observability/global.hpp"
#include "distill/providers/embedder_cached.hpp"
#include "distill/providers/embedder_local.hpp"
#include "distill/providers/embedder_openai.hpp"
#include "distill/providers/reliable.hpp"

namespace distill::providers {

common::Result<std::vector<std::vector<float>>>
IEmbedder::embed_batch(const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> out;
  out.reserve(texts.size());
  for (const auto &text : texts) {
    auto emb = embed(text);
    if (!emb.ok()) {
      return common::Result<std::vector<std::vector<float>>>::failure(emb.status());
    }
    out.push_back(std::move(emb.value()));
  }
  return common::Result<std::vector<std::vector<float>>>::success(std::move(out));
}

common::Status embedding_unavailable(const std::string_view provider, const std::string &detail) {
  return common::Status::error(
      common::DistillError{.kind = common::ErrorKind::EmbeddingUnavailable,
                           .message = std::string(provider) + ": " + detail});
}

std::unique_ptr<IEmbedder> create_embedder(const config::Config &config,
                                           std::shared_ptr<HttpClient> http) {
  const std::string provider = common::to_lower(config.embedding.provider);
  std::unique_ptr<IEmbedder> embedder;

  if (provider == "openai") {
    const std::string key = config.api_key.value_or("");
    if (key.empty()) {
      observability::record_warning("embedding",
                                    "no API key configured, using the local embedder");
    } else {
      if (!http) {
        http = std::make_shared<CurlHttpClient>();
      }
      embedder = std::make_unique<ReliableEmbedder>(
          std::make_unique<OpenAiEmbedder>(key, config.embedding.model,
                                           config.embedding.dimensions, config.embedding.base_url,
                                           std::move(http), config.pipeline.provider_timeout_ms),
          config.pipeline.provider_retries, config.pipeline.provider_backoff_ms);
    }
  }

  if (!embedder) {
    embedder = std::make_unique<LocalEmbedder>(config.embedding.dimensions);
  }

  if (config.embedding.cache_size == 0 || common::trim(config.embedding.cache_path).empty()) {
    return embedder;
  }
  return std::make_unique<CachedEmbedder>(std::move(embedder),
                                          common::expand_path(config.embedding.cache_path),
                                          config.embedding.cache_size);
}

} // namespace distill::providers
