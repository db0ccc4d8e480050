#include "distill/providers/embedder_openai.hpp"

#include "distill/common/json_util.hpp"
#include "distill/observability/global.hpp"

#include <chrono>
#include <sstream>

namespace distill::providers {

namespace {

common::Result<std::vector<float>> parse_embedding_response(const std::string &body) {
  const auto outer = common::json_parse_flat(body);
  const auto data = outer.find("data");
  if (data == outer.end()) {
    return common::Result<std::vector<float>>::failure("response has no data array");
  }
  const auto objects = common::json_split_top_level_objects(data->second);
  if (objects.empty()) {
    return common::Result<std::vector<float>>::failure("response data array is empty");
  }
  const auto first = common::json_parse_flat(objects.front());
  const auto embedding = first.find("embedding");
  if (embedding == first.end()) {
    return common::Result<std::vector<float>>::failure("embedding field missing");
  }
  const auto numbers = common::json_array_numbers(embedding->second);
  if (!numbers.has_value() || numbers->empty()) {
    return common::Result<std::vector<float>>::failure("embedding array parse failed");
  }

  std::vector<float> values;
  values.reserve(numbers->size());
  for (const double v : *numbers) {
    values.push_back(static_cast<float>(v));
  }
  return common::Result<std::vector<float>>::success(std::move(values));
}

} // namespace

OpenAiEmbedder::OpenAiEmbedder(std::string api_key, std::string model, const std::size_t dimensions,
                               std::string base_url, std::shared_ptr<HttpClient> http_client,
                               const std::uint64_t timeout_ms)
    : api_key_(std::move(api_key)), model_(std::move(model)), dimensions_(dimensions),
      base_url_(std::move(base_url)), http_client_(std::move(http_client)),
      timeout_ms_(timeout_ms) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::string_view OpenAiEmbedder::name() const { return "openai"; }

common::Result<std::vector<float>> OpenAiEmbedder::embed(const std::string_view text) {
  if (api_key_.empty()) {
    return common::Result<std::vector<float>>::failure(
        embedding_unavailable(name(), "missing API key"));
  }

  std::ostringstream body;
  body << "{";
  body << "\"model\":\"" << common::json_escape(model_) << "\",";
  body << "\"input\":\"" << common::json_escape(std::string(text)) << "\",";
  body << "\"dimensions\":" << dimensions_;
  body << "}";

  const std::unordered_map<std::string, std::string> headers = {
      {"Content-Type", "application/json"},
      {"Authorization", "Bearer " + api_key_},
  };

  const auto started = std::chrono::steady_clock::now();
  const auto response =
      http_client_->post_json(base_url_ + "/embeddings", headers, body.str(), timeout_ms_);
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  if (const auto failure = describe_http_failure(response); !failure.empty()) {
    observability::record_provider_call("openai", "embed", elapsed, false);
    return common::Result<std::vector<float>>::failure(embedding_unavailable(name(), failure));
  }

  auto parsed = parse_embedding_response(response.body);
  observability::record_provider_call("openai", "embed", elapsed, parsed.ok());
  if (!parsed.ok()) {
    return common::Result<std::vector<float>>::failure(
        embedding_unavailable(name(), parsed.error()));
  }
  if (parsed.value().size() != dimensions_) {
    return common::Result<std::vector<float>>::failure(common::DistillError{
        .kind = common::ErrorKind::DimensionMismatch,
        .message = "openai returned " + std::to_string(parsed.value().size()) +
                   " components, expected " + std::to_string(dimensions_)});
  }
  return parsed;
}

std::size_t OpenAiEmbedder::dimensions() const { return dimensions_; }

} // namespace distill::providers
