#include "distill/providers/generator_openai.hpp"

#include "distill/common/fs.hpp"
#include "distill/observability/global.hpp"

#include <chrono>
#include <sstream>

namespace distill::providers {

namespace {

constexpr const char *kSummarizePrompt =
    "You consolidate near-duplicate news coverage. Reply with a JSON object "
    "{\"summary\": string} holding one neutral paragraph that merges the facts of "
    "every source.";

constexpr const char *kSignalsPrompt =
    "You assess content for a strategic intelligence team. Reply with a JSON object "
    "holding numbers in [0,1] for factual_density, source_authority, clarity, "
    "completeness, verification_level, actionability, risk and stakeholder_relevance, "
    "plus \"classifications\": an array of {\"topic\": string, \"confidence\": number} "
    "using only the listed topics.";

std::string user_message(const GenerationRequest &request) {
  std::ostringstream out;
  if (!request.instructions.empty()) {
    out << request.instructions << "\n\n";
  }
  if (!request.topics.empty()) {
    out << "Topics:";
    for (const auto &topic : request.topics) {
      out << "\n- " << topic;
    }
    out << "\n\n";
  }
  for (const auto &[key, value] : request.attributes) {
    out << key << ": " << value << "\n";
  }
  if (request.task == GenerationTask::SummarizeCluster) {
    out << "Keep the summary under " << request.max_length << " characters.\n";
  }
  out << "\n" << request.content;
  return out.str();
}

} // namespace

OpenAiGenerator::OpenAiGenerator(std::string api_key, std::string model, const double temperature,
                                 std::string base_url, std::shared_ptr<HttpClient> http_client,
                                 const std::uint64_t timeout_ms)
    : api_key_(std::move(api_key)), model_(std::move(model)), temperature_(temperature),
      base_url_(std::move(base_url)), http_client_(std::move(http_client)),
      timeout_ms_(timeout_ms) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::string_view OpenAiGenerator::name() const { return "openai"; }

std::string OpenAiGenerator::build_request_body(const GenerationRequest &request) const {
  const char *system_prompt =
      request.task == GenerationTask::SummarizeCluster ? kSummarizePrompt : kSignalsPrompt;

  std::ostringstream body;
  body << "{";
  body << "\"model\":\"" << common::json_escape(model_) << "\",";
  body << "\"temperature\":" << temperature_ << ",";
  body << "\"response_format\":{\"type\":\"json_object\"},";
  body << "\"messages\":[";
  body << "{\"role\":\"system\",\"content\":\"" << common::json_escape(system_prompt) << "\"},";
  body << "{\"role\":\"user\",\"content\":\"" << common::json_escape(user_message(request))
       << "\"}";
  body << "]}";
  return body.str();
}

common::Result<GenerationResult> OpenAiGenerator::generate(const GenerationRequest &request) {
  if (api_key_.empty()) {
    return common::Result<GenerationResult>::failure(
        generation_unavailable(name(), "missing API key"));
  }

  const std::unordered_map<std::string, std::string> headers = {
      {"Content-Type", "application/json"},
      {"Authorization", "Bearer " + api_key_},
  };

  const auto started = std::chrono::steady_clock::now();
  const auto response = http_client_->post_json(base_url_ + "/chat/completions", headers,
                                                build_request_body(request), timeout_ms_);
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  const std::string operation(generation_task_name(request.task));

  if (const auto failure = describe_http_failure(response); !failure.empty()) {
    observability::record_provider_call("openai", operation, elapsed, false);
    return common::Result<GenerationResult>::failure(generation_unavailable(name(), failure));
  }

  const auto outer = common::json_parse_flat(response.body);
  const auto choices = common::json_split_top_level_objects(
      common::json_field_string(outer, "choices", "[]"));
  if (choices.empty()) {
    observability::record_provider_call("openai", operation, elapsed, false);
    return common::Result<GenerationResult>::failure(
        generation_unavailable(name(), "response has no choices"));
  }
  const auto choice = common::json_parse_flat(choices.front());
  const auto message = common::json_parse_flat(common::json_field_string(choice, "message", "{}"));
  const std::string content = common::trim(common::json_field_string(message, "content"));

  GenerationResult result;
  if (!content.empty() && content.front() == '{') {
    result.fields = common::json_parse_flat(content);
    result.text = common::json_field_string(result.fields, "summary");
  } else if (request.task == GenerationTask::SummarizeCluster) {
    result.text = content;
  }

  if (request.task == GenerationTask::SummarizeCluster && common::trim(result.text).empty()) {
    observability::record_provider_call("openai", operation, elapsed, false);
    return common::Result<GenerationResult>::failure(
        generation_unavailable(name(), "empty summary"));
  }
  if (request.task == GenerationTask::ExtractSignals && result.fields.empty()) {
    observability::record_provider_call("openai", operation, elapsed, false);
    return common::Result<GenerationResult>::failure(
        generation_unavailable(name(), "signal response is not a JSON object"));
  }

  observability::record_provider_call("openai", operation, elapsed, true);
  return common::Result<GenerationResult>::success(std::move(result));
}

} // namespace distill::providers
