#pragma once

#include "distill/common/json_util.hpp"
#include "distill/common/result.hpp"
#include "distill/config/schema.hpp"
#include "distill/providers/http.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace distill::providers {

enum class GenerationTask {
  SummarizeCluster,
  ExtractSignals,
};

[[nodiscard]] std::string_view generation_task_name(GenerationTask task);

struct GenerationRequest {
  GenerationTask task = GenerationTask::SummarizeCluster;
  std::string instructions;
  std::string content;
  std::vector<std::string> topics;
  /// Structured facts about the subject (title, domain, word_count, published_at, ...).
  common::JsonFlatMap attributes;
  std::size_t max_length = 500;
};

/// Free text plus any fields the provider populated. Absent fields are left
/// for the caller to default.
struct GenerationResult {
  std::string text;
  common::JsonFlatMap fields;
};

class ITextGenerator {
public:
  virtual ~ITextGenerator() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Result<GenerationResult>
  generate(const GenerationRequest &request) = 0;
};

[[nodiscard]] common::Status generation_unavailable(std::string_view provider,
                                                    const std::string &detail);

/// Single generator by provider name; nullptr for an unknown name or an
/// `openai` provider without an API key.
[[nodiscard]] std::shared_ptr<ITextGenerator>
create_single_generator(const std::string &provider, const config::Config &config,
                        const std::shared_ptr<HttpClient> &http);

/// Configured provider wrapped with retries and the fallback list.
[[nodiscard]] std::shared_ptr<ITextGenerator>
create_generator(const config::Config &config, std::shared_ptr<HttpClient> http = nullptr);

} // namespace distill::providers
