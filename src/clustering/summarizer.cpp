#include "distill/clustering/summarizer.hpp"

#include "distill/common/fs.hpp"
#include "distill/common/text.hpp"
#include "distill/observability/global.hpp"

#include <unordered_map>

namespace distill::clustering {

ClusterSummarizer::ClusterSummarizer(std::shared_ptr<providers::ITextGenerator> generator,
                                     const std::size_t max_length)
    : generator_(std::move(generator)), max_length_(max_length) {}

std::string ClusterSummarizer::cluster_content(const content::ContentCluster &cluster,
                                               const std::vector<content::ContentItem> &items) {
  std::unordered_map<std::string, const content::ContentItem *> by_id;
  for (const auto &item : items) {
    by_id.emplace(item.id, &item);
  }

  std::vector<std::string> ordered{cluster.representative_id};
  for (const auto &id : cluster.member_ids) {
    if (id != cluster.representative_id) {
      ordered.push_back(id);
    }
  }

  std::string content;
  for (const auto &id : ordered) {
    const auto it = by_id.find(id);
    if (it == by_id.end()) {
      continue;
    }
    const auto &item = *it->second;
    const std::string text = common::trim(item.summary.empty() ? item.body : item.summary);
    if (text.empty()) {
      continue;
    }
    if (!content.empty()) {
      content += "\n\n";
    }
    content += text;
  }
  return content;
}

std::vector<common::Warning>
ClusterSummarizer::summarize(std::vector<content::ContentCluster> &clusters,
                             const std::vector<content::ContentItem> &items) const {
  std::vector<common::Warning> warnings;
  for (auto &cluster : clusters) {
    if (!generator_) {
      warnings.push_back(common::Warning{.kind = common::ErrorKind::GenerationUnavailable,
                                         .subject_id = cluster.id,
                                         .message = "no text generator configured"});
      continue;
    }

    providers::GenerationRequest request;
    request.task = providers::GenerationTask::SummarizeCluster;
    request.instructions = "Consolidate these " + std::to_string(cluster.size()) +
                           " reports of the same story into one summary.";
    request.content = cluster_content(cluster, items);
    request.max_length = max_length_;

    auto result = generator_->generate(request);
    if (!result.ok()) {
      observability::record_warning("summarizer", cluster.id + ": " + result.error());
      warnings.push_back(common::Warning{.kind = common::ErrorKind::GenerationUnavailable,
                                         .subject_id = cluster.id,
                                         .message = result.error()});
      continue;
    }
    std::string summary = common::trim(result.value().text);
    if (summary.size() > max_length_) {
      summary = common::summarize_text(summary, max_length_);
    }
    if (summary.empty()) {
      warnings.push_back(common::Warning{.kind = common::ErrorKind::GenerationUnavailable,
                                         .subject_id = cluster.id,
                                         .message = "generator returned an empty summary"});
      continue;
    }
    cluster.summary = std::move(summary);
  }
  return warnings;
}

} // namespace distill::clustering
