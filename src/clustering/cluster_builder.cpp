#include "distill/clustering/cluster_builder.hpp"

#include "distill/common/hash.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace distill::clustering {

namespace {

struct Draft {
  std::vector<std::size_t> members;
  double confidence = 0.0;
  double cohesion = 0.0;
  double average = 0.0;
  bool from_split = false;
  bool from_merge = false;
};

Draft draft_from_stats(std::vector<std::size_t> members, const PairStats &stats) {
  Draft draft;
  draft.members = std::move(members);
  if (stats.pairs == 0) {
    return draft;
  }
  draft.average = stats.mean;
  draft.confidence = std::clamp(stats.mean, 0.0, 1.0);
  draft.cohesion = std::clamp(stats.mean - stats.stddev, 0.0, 1.0);
  return draft;
}

} // namespace

ClusterBuilder::ClusterBuilder(config::ClusteringConfig config) : config_(std::move(config)) {}

content::SimilarityTier ClusterBuilder::classify(const double similarity) const {
  if (similarity >= config_.exact_duplicate_threshold) {
    return content::SimilarityTier::ExactDuplicate;
  }
  if (similarity >= config_.same_story_threshold) {
    return content::SimilarityTier::SameStory;
  }
  if (similarity >= config_.related_content_threshold) {
    return content::SimilarityTier::RelatedContent;
  }
  return content::SimilarityTier::UniqueContent;
}

std::vector<std::vector<std::size_t>>
ClusterBuilder::discover_components(const std::vector<content::ContentItem> &items,
                                    const similarity::SimilarityMatrix &matrix) const {
  const std::size_t n = items.size();
  std::vector<std::optional<std::size_t>> slots(n);
  for (std::size_t i = 0; i < n; ++i) {
    slots[i] = matrix.index_of(items[i].id);
  }

  std::vector<bool> visited(n, false);
  std::vector<std::vector<std::size_t>> components;
  for (std::size_t start = 0; start < n; ++start) {
    if (visited[start]) {
      continue;
    }
    std::vector<std::size_t> component;
    std::vector<std::size_t> stack{start};
    visited[start] = true;
    while (!stack.empty()) {
      const std::size_t current = stack.back();
      stack.pop_back();
      component.push_back(current);
      if (!slots[current].has_value()) {
        continue;
      }
      for (std::size_t next = 0; next < n; ++next) {
        if (visited[next] || !slots[next].has_value()) {
          continue;
        }
        if (matrix.at(*slots[current], *slots[next]) >= config_.same_story_threshold) {
          visited[next] = true;
          stack.push_back(next);
        }
      }
    }
    std::sort(component.begin(), component.end());
    components.push_back(std::move(component));
  }
  return components;
}

ClusteringResult ClusterBuilder::build(const std::vector<content::ContentItem> &items,
                                       const similarity::SimilarityMatrix &matrix) const {
  ClusteringResult result;
  std::vector<bool> clustered(items.size(), false);
  std::vector<Draft> drafts;

  const std::size_t min_size = std::max<std::size_t>(config_.min_cluster_size, 2);
  const std::size_t max_size = std::max(config_.max_cluster_size, min_size);

  for (auto &component : discover_components(items, matrix)) {
    if (component.size() < min_size) {
      continue;
    }
    const PairStats stats = cluster_stats(items, component, matrix);
    Draft parent = draft_from_stats(std::move(component), stats);
    if (parent.members.size() <= max_size) {
      drafts.push_back(std::move(parent));
      continue;
    }

    ++result.splits;
    std::vector<std::size_t> ordered = parent.members;
    std::sort(ordered.begin(), ordered.end(), [&items](const std::size_t a, const std::size_t b) {
      if (items[a].source_url != items[b].source_url) {
        return items[a].source_url < items[b].source_url;
      }
      return items[a].id < items[b].id;
    });

    for (std::size_t offset = 0; offset < ordered.size(); offset += max_size) {
      const std::size_t end = std::min(ordered.size(), offset + max_size);
      std::vector<std::size_t> chunk(ordered.begin() + static_cast<std::ptrdiff_t>(offset),
                                     ordered.begin() + static_cast<std::ptrdiff_t>(end));
      if (chunk.size() < min_size) {
        continue;
      }
      std::sort(chunk.begin(), chunk.end());
      const PairStats chunk_stats = cluster_stats(items, chunk, matrix);
      Draft child;
      child.members = std::move(chunk);
      child.confidence = parent.confidence * config_.split_confidence_discount;
      child.cohesion = parent.cohesion * config_.split_confidence_discount;
      child.average = chunk_stats.pairs == 0 ? 0.0 : chunk_stats.mean;
      child.from_split = true;
      drafts.push_back(std::move(child));
    }
  }

  // Single ordered pass: the first qualifying partner wins and each draft
  // takes part in at most one merge.
  std::vector<bool> used(drafts.size(), false);
  std::vector<Draft> merged;
  for (std::size_t i = 0; i < drafts.size(); ++i) {
    if (used[i]) {
      continue;
    }
    for (std::size_t j = i + 1; j < drafts.size(); ++j) {
      if (used[j]) {
        continue;
      }
      if (drafts[i].members.size() + drafts[j].members.size() > max_size) {
        continue;
      }
      const auto inter = inter_cluster_similarity(items, drafts[i].members, drafts[j].members, matrix);
      if (!inter.has_value() || *inter <= config_.merge_threshold) {
        continue;
      }

      const double size_a = static_cast<double>(drafts[i].members.size());
      const double size_b = static_cast<double>(drafts[j].members.size());
      std::vector<std::size_t> members = drafts[i].members;
      members.insert(members.end(), drafts[j].members.begin(), drafts[j].members.end());
      std::sort(members.begin(), members.end());

      const PairStats stats = cluster_stats(items, members, matrix);
      Draft combined;
      combined.members = std::move(members);
      combined.confidence =
          (size_a * drafts[i].confidence + size_b * drafts[j].confidence) / (size_a + size_b);
      combined.cohesion =
          stats.pairs == 0 ? 0.0 : std::clamp(combined.confidence - stats.stddev, 0.0, 1.0);
      combined.average = stats.pairs == 0 ? 0.0 : stats.mean;
      combined.from_merge = true;
      combined.from_split = drafts[i].from_split || drafts[j].from_split;

      used[i] = true;
      used[j] = true;
      ++result.merges;
      merged.push_back(std::move(combined));
      break;
    }
    if (!used[i]) {
      merged.push_back(std::move(drafts[i]));
    }
  }

  for (auto &draft : merged) {
    content::ContentCluster cluster;
    std::vector<const content::ContentItem *> member_items;
    for (const std::size_t index : draft.members) {
      cluster.member_ids.push_back(items[index].id);
      member_items.push_back(&items[index]);
      clustered[index] = true;
    }
    cluster.id = cluster_id_for(cluster.member_ids);
    cluster.representative_id = items[pick_representative(items, draft.members)].id;
    cluster.metrics = content::compute_cluster_metrics(member_items);
    cluster.from_split = draft.from_split;
    cluster.from_merge = draft.from_merge;
    cluster.confidence = std::clamp(draft.confidence, 0.0, 1.0);
    cluster.cohesion = std::clamp(draft.cohesion, 0.0, 1.0);
    cluster.average_similarity = draft.average;
    cluster.tier = classify(cluster.average_similarity);
    result.clusters.push_back(std::move(cluster));
  }

  for (std::size_t i = 0; i < items.size(); ++i) {
    if (!clustered[i]) {
      result.unique_ids.push_back(items[i].id);
    }
  }
  return result;
}

PairStats cluster_stats(const std::vector<content::ContentItem> &items,
                        const std::vector<std::size_t> &members,
                        const similarity::SimilarityMatrix &matrix) {
  std::vector<double> scores;
  for (std::size_t a = 0; a < members.size(); ++a) {
    for (std::size_t b = a + 1; b < members.size(); ++b) {
      if (const auto score = matrix.get(items[members[a]].id, items[members[b]].id)) {
        scores.push_back(*score);
      }
    }
  }

  PairStats stats;
  stats.pairs = scores.size();
  if (scores.empty()) {
    return stats;
  }
  double sum = 0.0;
  for (const double score : scores) {
    sum += score;
  }
  stats.mean = sum / static_cast<double>(scores.size());
  double variance = 0.0;
  for (const double score : scores) {
    variance += (score - stats.mean) * (score - stats.mean);
  }
  stats.stddev = std::sqrt(variance / static_cast<double>(scores.size()));
  return stats;
}

std::optional<double> inter_cluster_similarity(const std::vector<content::ContentItem> &items,
                                               const std::vector<std::size_t> &a,
                                               const std::vector<std::size_t> &b,
                                               const similarity::SimilarityMatrix &matrix) {
  double sum = 0.0;
  std::size_t count = 0;
  for (const std::size_t left : a) {
    for (const std::size_t right : b) {
      if (const auto score = matrix.get(items[left].id, items[right].id)) {
        sum += *score;
        ++count;
      }
    }
  }
  if (count == 0) {
    return std::nullopt;
  }
  return sum / static_cast<double>(count);
}

std::string cluster_id_for(std::vector<std::string> member_ids) {
  std::sort(member_ids.begin(), member_ids.end());
  std::string joined;
  for (std::size_t i = 0; i < member_ids.size(); ++i) {
    if (i > 0) {
      joined += '\n';
    }
    joined += member_ids[i];
  }
  return "cluster_" + common::sha256_hex(joined).substr(0, 16);
}

std::size_t pick_representative(const std::vector<content::ContentItem> &items,
                                const std::vector<std::size_t> &members) {
  std::size_t best = members.front();
  for (const std::size_t candidate : members) {
    const auto &lhs = items[candidate];
    const auto &rhs = items[best];
    if (lhs.extraction_confidence > rhs.extraction_confidence ||
        (lhs.extraction_confidence == rhs.extraction_confidence &&
         (lhs.word_count > rhs.word_count ||
          (lhs.word_count == rhs.word_count && candidate < best)))) {
      best = candidate;
    }
  }
  return best;
}

void assign_membership(std::vector<content::ContentItem> &items, const ClusteringResult &result) {
  std::unordered_map<std::string, std::size_t> by_id;
  for (std::size_t i = 0; i < items.size(); ++i) {
    auto &item = items[i];
    item.cluster_id.reset();
    item.parent_id.reset();
    item.is_representative = false;
    item.absorbed_count = 0;
    by_id.emplace(item.id, i);
  }

  for (const auto &cluster : result.clusters) {
    for (const auto &member_id : cluster.member_ids) {
      const auto it = by_id.find(member_id);
      if (it == by_id.end()) {
        continue;
      }
      auto &item = items[it->second];
      item.cluster_id = cluster.id;
      if (member_id == cluster.representative_id) {
        item.is_representative = true;
        item.absorbed_count = cluster.member_ids.size() - 1;
      } else {
        item.parent_id = cluster.representative_id;
      }
    }
  }
}

} // namespace distill::clustering
