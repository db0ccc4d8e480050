#pragma once

#include "distill/common/error.hpp"
#include "distill/content/item.hpp"
#include "distill/providers/generator.hpp"

#include <memory>
#include <vector>

namespace distill::clustering {

/// Requests one consolidated summary per cluster from a text generator. A
/// failed request leaves the cluster summary unset and yields a warning.
class ClusterSummarizer {
public:
  ClusterSummarizer(std::shared_ptr<providers::ITextGenerator> generator, std::size_t max_length);

  [[nodiscard]] std::vector<common::Warning>
  summarize(std::vector<content::ContentCluster> &clusters,
            const std::vector<content::ContentItem> &items) const;

  /// Member summaries (body when a summary is missing), representative first.
  [[nodiscard]] static std::string cluster_content(const content::ContentCluster &cluster,
                                                   const std::vector<content::ContentItem> &items);

private:
  std::shared_ptr<providers::ITextGenerator> generator_;
  std::size_t max_length_;
};

} // namespace distill::clustering
