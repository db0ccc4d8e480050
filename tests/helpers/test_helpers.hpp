#pragma once

#include "distill/config/schema.hpp"
#include "distill/content/item.hpp"
#include "distill/observability/observer.hpp"
#include "distill/providers/embedder.hpp"
#include "distill/providers/generator.hpp"
#include "distill/providers/http.hpp"

#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace distill::testing {

/// Defaults with every outward-facing collaborator switched to its offline form.
config::Config mock_config();

content::ContentItem make_item(const std::string &id, const std::string &title,
                               const std::string &body, const std::string &source_url,
                               double extraction_confidence = 0.8);

/// Returns the vector registered for the first marker contained in the text.
/// Unmatched text gets the fallback vector, or fails when none is set.
class FixedEmbedder final : public providers::IEmbedder {
public:
  explicit FixedEmbedder(std::size_t dimensions);

  void add(std::string marker, std::vector<float> values);
  void set_fallback(std::vector<float> values);
  void fail_on(std::string marker);

  [[nodiscard]] std::string_view name() const override { return "fixed"; }
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] std::size_t dimensions() const override { return dimensions_; }

  [[nodiscard]] std::size_t calls() const { return calls_; }

private:
  std::size_t dimensions_;
  std::vector<std::pair<std::string, std::vector<float>>> vectors_;
  std::optional<std::vector<float>> fallback_;
  std::vector<std::string> failing_;
  std::size_t calls_ = 0;
};

/// Answers every request from fixed fields, or fails per task.
class ScriptedGenerator final : public providers::ITextGenerator {
public:
  ScriptedGenerator() = default;

  void set_summary(std::string summary);
  void set_signal_fields(common::JsonFlatMap fields);
  void fail_task(providers::GenerationTask task);
  void fail_after(std::size_t successful_calls);

  [[nodiscard]] std::string_view name() const override { return "scripted"; }
  [[nodiscard]] common::Result<providers::GenerationResult>
  generate(const providers::GenerationRequest &request) override;

  [[nodiscard]] std::size_t calls() const { return calls_; }
  [[nodiscard]] const std::vector<providers::GenerationRequest> &requests() const {
    return requests_;
  }

private:
  std::string summary_ = "Consolidated summary.";
  common::JsonFlatMap signal_fields_;
  std::vector<providers::GenerationTask> failing_tasks_;
  std::optional<std::size_t> fail_after_;
  std::size_t calls_ = 0;
  std::vector<providers::GenerationRequest> requests_;
};

/// Replays queued responses in order and remembers the last request.
class MockHttpClient final : public providers::HttpClient {
public:
  void push(providers::HttpResponse response);

  [[nodiscard]] providers::HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) override;

  std::string last_url;
  std::unordered_map<std::string, std::string> last_headers;
  std::string last_body;
  std::size_t calls = 0;

private:
  std::deque<providers::HttpResponse> responses_;
};

/// Captures every event for later inspection.
class RecordingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

  [[nodiscard]] std::vector<observability::ObserverEvent> events() const;
  [[nodiscard]] std::vector<observability::ObserverMetric> metrics() const;

private:
  mutable std::mutex mutex_;
  std::vector<observability::ObserverEvent> events_;
  std::vector<observability::ObserverMetric> metrics_;
};

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

/// mock_config() with the record store and embedding cache placed in the workspace.
config::Config temp_config(const TempWorkspace &workspace);

} // namespace distill::testing
