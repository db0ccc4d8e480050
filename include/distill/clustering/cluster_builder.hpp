#pragma once

#include "distill/config/schema.hpp"
#include "distill/content/item.hpp"
#include "distill/similarity/similarity_matrix.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace distill::clustering {

/// Mean and population standard deviation over the valid member pairs.
struct PairStats {
  double mean = 0.0;
  double stddev = 0.0;
  std::size_t pairs = 0;
};

struct ClusteringResult {
  std::vector<content::ContentCluster> clusters;
  /// Items left outside every cluster, in input order.
  std::vector<std::string> unique_ids;
  std::size_t splits = 0;
  std::size_t merges = 0;
};

/// Groups a batch into connected components of the same-story similarity
/// graph, then splits oversized components and greedily merges near-identical
/// clusters in a single ordered pass.
///
/// The merge pass never produces a cluster above max_cluster_size: a pair
/// whose combined size would exceed the cap is skipped and the scan moves on
/// to the next partner, so near-identical clusters may stay apart.
class ClusterBuilder {
public:
  explicit ClusterBuilder(config::ClusteringConfig config);

  [[nodiscard]] ClusteringResult build(const std::vector<content::ContentItem> &items,
                                       const similarity::SimilarityMatrix &matrix) const;

  /// Components as ascending input indices, ordered by their first member.
  /// Items unknown to the matrix never gain an edge.
  [[nodiscard]] std::vector<std::vector<std::size_t>>
  discover_components(const std::vector<content::ContentItem> &items,
                      const similarity::SimilarityMatrix &matrix) const;

  [[nodiscard]] content::SimilarityTier classify(double similarity) const;

  [[nodiscard]] const config::ClusteringConfig &config() const { return config_; }

private:
  config::ClusteringConfig config_;
};

/// All zeros when no member pair is known to the matrix.
[[nodiscard]] PairStats cluster_stats(const std::vector<content::ContentItem> &items,
                                      const std::vector<std::size_t> &members,
                                      const similarity::SimilarityMatrix &matrix);

/// Mean similarity over every cross pair of two member sets; nullopt when no
/// pair is known to the matrix.
[[nodiscard]] std::optional<double>
inter_cluster_similarity(const std::vector<content::ContentItem> &items,
                         const std::vector<std::size_t> &a, const std::vector<std::size_t> &b,
                         const similarity::SimilarityMatrix &matrix);

/// "cluster_" followed by 16 hex characters of the SHA-256 of the sorted member ids.
[[nodiscard]] std::string cluster_id_for(std::vector<std::string> member_ids);

/// Highest extraction confidence, then largest word count, then earliest position.
[[nodiscard]] std::size_t pick_representative(const std::vector<content::ContentItem> &items,
                                              const std::vector<std::size_t> &members);

/// Writes cluster_id, parent_id, is_representative and absorbed_count back
/// onto the items. Items outside every cluster are reset to unique.
void assign_membership(std::vector<content::ContentItem> &items, const ClusteringResult &result);

} // namespace distill::clustering
