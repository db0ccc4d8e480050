#include "distill/providers/generator.hpp"

#include "distill/common/fs.hpp"
#include "distill/observability/global.hpp"
#include "distill/providers/generator_extractive.hpp"
#include "distill/providers/generator_openai.hpp"
#include "distill/providers/reliable.hpp"

namespace distill::providers {

std::string_view generation_task_name(const GenerationTask task) {
  switch (task) {
  case GenerationTask::SummarizeCluster:
    return "summarize_cluster";
  case GenerationTask::ExtractSignals:
    return "extract_signals";
  }
  return "summarize_cluster";
}

common::Status generation_unavailable(const std::string_view provider, const std::string &detail) {
  return common::Status::error(
      common::DistillError{.kind = common::ErrorKind::GenerationUnavailable,
                           .message = std::string(provider) + ": " + detail});
}

std::shared_ptr<ITextGenerator> create_single_generator(const std::string &provider,
                                                        const config::Config &config,
                                                        const std::shared_ptr<HttpClient> &http) {
  const std::string normalized = common::to_lower(common::trim(provider));
  if (normalized == "extractive" || normalized == "local") {
    return std::make_shared<ExtractiveGenerator>();
  }
  if (normalized == "openai") {
    const std::string key = config.api_key.value_or("");
    if (key.empty()) {
      return nullptr;
    }
    return std::make_shared<OpenAiGenerator>(key, config.generation.model,
                                             config.generation.temperature,
                                             config.generation.base_url, http,
                                             config.pipeline.provider_timeout_ms);
  }
  return nullptr;
}

std::shared_ptr<ITextGenerator> create_generator(const config::Config &config,
                                                 std::shared_ptr<HttpClient> http) {
  if (!http) {
    http = std::make_shared<CurlHttpClient>();
  }

  auto primary = create_single_generator(config.generation.provider, config, http);
  if (!primary) {
    observability::record_warning("generation", "provider '" + config.generation.provider +
                                                    "' unavailable, using extractive");
    primary = std::make_shared<ExtractiveGenerator>();
  }

  std::vector<std::shared_ptr<ITextGenerator>> fallbacks;
  for (const auto &name : config.generation.fallback_providers) {
    if (auto fallback = create_single_generator(name, config, http)) {
      fallbacks.push_back(std::move(fallback));
    } else {
      observability::record_warning("generation", "skipping unavailable fallback '" + name + "'");
    }
  }

  return std::make_shared<ReliableGenerator>(std::move(primary), std::move(fallbacks),
                                             config.pipeline.provider_retries,
                                             config.pipeline.provider_backoff_ms);
}

} // namespace distill::providers
