#include "test_framework.hpp"

#include "distill/clustering/cluster_builder.hpp"
#include "distill/clustering/summarizer.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <set>

namespace {

namespace cl = distill::clustering;
namespace ct = distill::content;
namespace s = distill::similarity;

using PairList = std::vector<std::tuple<std::string, std::string, double>>;

std::vector<ct::ContentItem> items_for(const std::vector<std::string> &ids) {
  std::vector<ct::ContentItem> items;
  for (const auto &id : ids) {
    auto item = distill::testing::make_item(id, "Title " + id, "Body of " + id + ".",
                                            "https://site-" + id + ".example.com/story");
    ct::fill_derived_fields(item);
    items.push_back(std::move(item));
  }
  return items;
}

std::vector<std::string> ids_of(const std::vector<ct::ContentItem> &items) {
  std::vector<std::string> ids;
  for (const auto &item : items) {
    ids.push_back(item.id);
  }
  return ids;
}

s::SimilarityMatrix matrix_for(const std::vector<ct::ContentItem> &items, const PairList &pairs) {
  auto matrix = s::SimilarityMatrix::from_pairs(ids_of(items), pairs);
  distill::tests::require(matrix.ok(), matrix.error());
  return matrix.value();
}

/// Every pair of the given ids at one score.
PairList uniform_pairs(const std::vector<std::string> &ids, const double score) {
  PairList pairs;
  for (std::size_t i = 0; i < ids.size(); ++i) {
    for (std::size_t j = i + 1; j < ids.size(); ++j) {
      pairs.emplace_back(ids[i], ids[j], score);
    }
  }
  return pairs;
}

} // namespace

void register_clustering_tests(std::vector<distill::tests::TestCase> &tests) {
  using distill::tests::near;
  using distill::tests::require;

  tests.push_back({"cluster_near_duplicates_pair", [] {
                     const auto items = items_for({"a", "b", "c"});
                     const auto matrix = matrix_for(items, {{"a", "b", 0.97}, {"a", "c", 0.2}});
                     const cl::ClusterBuilder builder(distill::config::ClusteringConfig{});
                     const auto result = builder.build(items, matrix);
                     require(result.clusters.size() == 1, "expected one cluster");
                     const auto &cluster = result.clusters.front();
                     require(cluster.size() == 2, "cluster size");
                     require(cluster.member_ids == std::vector<std::string>({"a", "b"}), "members");
                     require(cluster.tier == ct::SimilarityTier::ExactDuplicate, "tier");
                     require(near(cluster.confidence, 0.97), "confidence is the pair mean");
                     require(near(cluster.cohesion, 0.97), "single pair has no spread");
                     require(result.unique_ids == std::vector<std::string>({"c"}), "unique");
                   }});

  tests.push_back({"cluster_membership_is_transitive", [] {
                     const auto items = items_for({"a", "b", "c"});
                     const auto matrix =
                         matrix_for(items, {{"a", "b", 0.9}, {"b", "c", 0.9}, {"a", "c", 0.4}});
                     const cl::ClusterBuilder builder(distill::config::ClusteringConfig{});
                     const auto result = builder.build(items, matrix);
                     require(result.clusters.size() == 1, "chain should form one cluster");
                     const auto &cluster = result.clusters.front();
                     require(cluster.size() == 3, "cluster size");
                     require(near(cluster.average_similarity, (0.9 + 0.9 + 0.4) / 3.0),
                             "average over all member pairs");
                     require(cluster.tier == ct::SimilarityTier::RelatedContent,
                             "tier follows the average");
                     require(cluster.cohesion < cluster.confidence, "spread lowers cohesion");
                     require(result.unique_ids.empty(), "no unique items");
                   }});

  tests.push_back({"cluster_oversized_component_splits", [] {
                     std::vector<std::string> ids;
                     for (int i = 0; i < 15; ++i) {
                       ids.push_back("item" + std::string(i < 10 ? "0" : "") + std::to_string(i));
                     }
                     const auto items = items_for(ids);
                     const auto matrix = matrix_for(items, uniform_pairs(ids, 0.9));
                     const cl::ClusterBuilder builder(distill::config::ClusteringConfig{});
                     const auto result = builder.build(items, matrix);
                     require(result.splits == 1, "one split");
                     require(result.merges == 0, "chunks exceed the size cap together");
                     require(result.clusters.size() == 2, "two sub-clusters");
                     std::multiset<std::size_t> sizes;
                     for (const auto &cluster : result.clusters) {
                       sizes.insert(cluster.size());
                       require(cluster.from_split, "marked as split");
                       require(near(cluster.confidence, 0.9 * 0.9), "discounted confidence");
                       require(cluster.size() <= 10, "size cap");
                     }
                     require(sizes == std::multiset<std::size_t>({5, 10}), "sizes 10 and 5");
                   }});

  tests.push_back({"cluster_split_drops_undersized_tail", [] {
                     std::vector<std::string> ids = {"a", "b", "c", "d", "e"};
                     const auto items = items_for(ids);
                     const auto matrix = matrix_for(items, uniform_pairs(ids, 0.92));
                     distill::config::ClusteringConfig config;
                     config.max_cluster_size = 2;
                     const cl::ClusterBuilder builder(config);
                     const auto result = builder.build(items, matrix);
                     require(result.clusters.size() == 2, "a single leftover item cannot cluster");
                     require(result.unique_ids.size() == 1, "leftover stays unique");
                     for (const auto &cluster : result.clusters) {
                       require(cluster.size() == 2, "chunk size");
                     }
                   }});

  tests.push_back({"cluster_merge_single_pass", [] {
                     const auto items = items_for({"a", "b", "c", "d"});
                     const auto matrix = matrix_for(
                         items, {{"a", "b", 0.95}, {"c", "d", 0.95}, {"a", "c", 0.8},
                                 {"a", "d", 0.8}, {"b", "c", 0.8}, {"b", "d", 0.8}});
                     distill::config::ClusteringConfig config;
                     config.merge_threshold = 0.75;
                     const auto result = cl::ClusterBuilder(config).build(items, matrix);
                     require(result.merges == 1, "one merge");
                     require(result.clusters.size() == 1, "merged into one");
                     const auto &cluster = result.clusters.front();
                     require(cluster.from_merge, "marked as merged");
                     require(cluster.size() == 4, "size");
                     require(near(cluster.confidence, 0.95), "size-weighted confidence");
                     require(cluster.cohesion < cluster.confidence, "cohesion uses merged spread");
                   }});

  tests.push_back({"cluster_merge_threshold_is_strict", [] {
                     const auto items = items_for({"a", "b", "c", "d"});
                     const auto matrix = matrix_for(
                         items, {{"a", "b", 0.95}, {"c", "d", 0.95}, {"a", "c", 0.5},
                                 {"a", "d", 0.5}, {"b", "c", 0.5}, {"b", "d", 0.5}});
                     distill::config::ClusteringConfig config;
                     config.merge_threshold = 0.5;
                     const auto result = cl::ClusterBuilder(config).build(items, matrix);
                     require(result.merges == 0, "equal to threshold must not merge");
                     require(result.clusters.size() == 2, "two clusters");
                   }});

  tests.push_back({"cluster_merge_respects_size_cap", [] {
                     const auto items = items_for({"a", "b", "c", "d"});
                     const auto matrix = matrix_for(
                         items, {{"a", "b", 0.95}, {"c", "d", 0.95}, {"a", "c", 0.8},
                                 {"a", "d", 0.8}, {"b", "c", 0.8}, {"b", "d", 0.8}});
                     distill::config::ClusteringConfig config;
                     config.merge_threshold = 0.75;
                     config.max_cluster_size = 3;
                     const auto result = cl::ClusterBuilder(config).build(items, matrix);
                     require(result.merges == 0, "merge would exceed the cap");
                     require(result.clusters.size() == 2, "two clusters");
                   }});

  tests.push_back({"cluster_merge_skips_oversized_partner", [] {
                     const std::vector<std::string> ids = {"a", "b", "c", "d", "e", "f", "g"};
                     const auto items = items_for(ids);
                     PairList pairs = uniform_pairs(ids, 0.8);
                     for (auto &[left, right, score] : pairs) {
                       const bool abc = left < "d" && right < "d";
                       const bool de = (left == "d" && right == "e");
                       const bool fg = (left == "f" && right == "g");
                       if (abc || de || fg) {
                         score = 0.95;
                       }
                     }
                     distill::config::ClusteringConfig config;
                     config.merge_threshold = 0.75;
                     config.max_cluster_size = 4;
                     const auto result = cl::ClusterBuilder(config).build(items, matrix_for(items, pairs));
                     require(result.merges == 1, "the later pair still merges");
                     require(result.clusters.size() == 2, "two clusters");
                     require(result.clusters[0].member_ids ==
                                 std::vector<std::string>({"a", "b", "c"}),
                             "oversized combinations leave the first cluster alone");
                     require(result.clusters[1].member_ids ==
                                 std::vector<std::string>({"d", "e", "f", "g"}),
                             "next partners merge within the cap");
                     for (const auto &cluster : result.clusters) {
                       require(cluster.size() <= 4, "size cap");
                     }
                   }});

  tests.push_back({"cluster_min_size_filters_components", [] {
                     const auto items = items_for({"a", "b", "c", "d", "e"});
                     const auto matrix = matrix_for(
                         items, {{"a", "b", 0.9}, {"c", "d", 0.9}, {"d", "e", 0.9}, {"c", "e", 0.9}});
                     distill::config::ClusteringConfig config;
                     config.min_cluster_size = 3;
                     const auto result = cl::ClusterBuilder(config).build(items, matrix);
                     require(result.clusters.size() == 1, "pair is below the minimum");
                     require(result.clusters.front().member_ids ==
                                 std::vector<std::string>({"c", "d", "e"}),
                             "triple kept");
                     require(result.unique_ids == std::vector<std::string>({"a", "b"}), "unique");
                   }});

  tests.push_back({"cluster_unknown_item_stays_unique", [] {
                     const auto items = items_for({"a", "b", "ghost"});
                     auto matrix = s::SimilarityMatrix::from_pairs({"a", "b"}, {{"a", "b", 0.99}});
                     require(matrix.ok(), matrix.error());
                     const auto result =
                         cl::ClusterBuilder(distill::config::ClusteringConfig{}).build(items,
                                                                                       matrix.value());
                     require(result.clusters.size() == 1, "known pair clusters");
                     require(result.unique_ids == std::vector<std::string>({"ghost"}),
                             "item without a vector stays unique");
                   }});

  tests.push_back({"cluster_stats_without_known_pairs_are_zero", [] {
                     const auto items = items_for({"a", "b", "ghost", "phantom"});
                     auto matrix = s::SimilarityMatrix::from_pairs({"a", "b"}, {{"a", "b", 0.99}});
                     require(matrix.ok(), matrix.error());

                     const auto none = cl::cluster_stats(items, {2, 3}, matrix.value());
                     require(none.pairs == 0, "no pair is known");
                     require(near(none.mean, 0.0) && near(none.stddev, 0.0), "zeroed stats");

                     const auto single = cl::cluster_stats(items, {0}, matrix.value());
                     require(single.pairs == 0 && near(single.mean, 0.0), "singleton has no pairs");

                     const auto mixed = cl::cluster_stats(items, {0, 1, 2}, matrix.value());
                     require(mixed.pairs == 1, "only the known pair counts");
                     require(near(mixed.mean, 0.99), "mean over the known pair");

                     require(!cl::inter_cluster_similarity(items, {2}, {3}, matrix.value()).has_value(),
                             "unknown members have no cross similarity");
                     require(!cl::inter_cluster_similarity(items, {0}, {}, matrix.value()).has_value(),
                             "empty side has no cross similarity");
                   }});

  tests.push_back({"cluster_output_is_order_independent", [] {
                     const PairList pairs = {{"a", "b", 0.9}, {"b", "c", 0.88}, {"d", "e", 0.96},
                                             {"a", "e", 0.3}};
                     const auto forward = items_for({"a", "b", "c", "d", "e"});
                     const auto reversed = items_for({"e", "d", "c", "b", "a"});
                     const cl::ClusterBuilder builder(distill::config::ClusteringConfig{});
                     const auto first = builder.build(forward, matrix_for(forward, pairs));
                     const auto second = builder.build(reversed, matrix_for(reversed, pairs));
                     require(first.clusters.size() == second.clusters.size(), "cluster count");

                     std::set<std::string> first_ids;
                     std::set<std::string> second_ids;
                     for (const auto &cluster : first.clusters) {
                       first_ids.insert(cluster.id);
                     }
                     for (const auto &cluster : second.clusters) {
                       second_ids.insert(cluster.id);
                     }
                     require(first_ids == second_ids, "cluster ids depend on membership only");

                     const auto again = builder.build(forward, matrix_for(forward, pairs));
                     for (std::size_t i = 0; i < first.clusters.size(); ++i) {
                       require(first.clusters[i].id == again.clusters[i].id &&
                                   first.clusters[i].member_ids == again.clusters[i].member_ids,
                               "repeat run differs");
                     }
                   }});

  tests.push_back({"cluster_id_format", [] {
                     const auto id = cl::cluster_id_for({"b", "a"});
                     require(id.size() == std::string("cluster_").size() + 16, "length");
                     require(id.rfind("cluster_", 0) == 0, "prefix");
                     require(id == cl::cluster_id_for({"a", "b"}), "member order ignored");
                     require(id != cl::cluster_id_for({"a", "c"}), "membership matters");
                   }});

  tests.push_back({"cluster_representative_tiebreaks", [] {
                     auto items = items_for({"a", "b", "c"});
                     items[0].extraction_confidence = 0.7;
                     items[1].extraction_confidence = 0.9;
                     items[2].extraction_confidence = 0.9;
                     items[1].word_count = 100;
                     items[2].word_count = 300;
                     require(cl::pick_representative(items, {0, 1, 2}) == 2, "word count tiebreak");
                     items[2].word_count = 100;
                     require(cl::pick_representative(items, {0, 1, 2}) == 1, "earliest wins");
                     items[0].extraction_confidence = 0.95;
                     require(cl::pick_representative(items, {0, 1, 2}) == 0, "confidence first");
                   }});

  tests.push_back({"cluster_assign_membership_fields", [] {
                     auto items = items_for({"a", "b", "c", "d"});
                     items[1].extraction_confidence = 0.99;
                     const auto matrix =
                         matrix_for(items, {{"a", "b", 0.9}, {"a", "c", 0.9}, {"b", "c", 0.9}});
                     const auto result =
                         cl::ClusterBuilder(distill::config::ClusteringConfig{}).build(items, matrix);
                     items[3].cluster_id = "stale";
                     cl::assign_membership(items, result);

                     const auto &cluster = result.clusters.front();
                     require(cluster.representative_id == "b", "representative");
                     require(items[1].is_representative && items[1].absorbed_count == 2,
                             "representative fields");
                     require(!items[1].parent_id.has_value(), "representative has no parent");
                     require(items[0].parent_id == std::optional<std::string>("b") &&
                                 items[2].parent_id == std::optional<std::string>("b"),
                             "members point at the representative");
                     require(items[0].cluster_id == std::optional<std::string>(cluster.id),
                             "cluster id");
                     require(!items[3].is_clustered(), "unique item reset");

                     std::size_t representatives = 0;
                     for (const auto &item : items) {
                       representatives += item.is_representative ? 1 : 0;
                     }
                     require(representatives == 1, "exactly one representative");
                   }});

  tests.push_back({"cluster_metrics_populated", [] {
                     auto items = items_for({"a", "b"});
                     items[0].word_count = 40;
                     items[1].word_count = 60;
                     const auto matrix = matrix_for(items, {{"a", "b", 0.9}});
                     const auto result =
                         cl::ClusterBuilder(distill::config::ClusteringConfig{}).build(items, matrix);
                     const auto &metrics = result.clusters.front().metrics;
                     require(metrics.total_word_count == 100, "word count");
                     require(metrics.distinct_domains == 2, "domains");
                   }});

  tests.push_back({"summarizer_sets_summary", [] {
                     auto items = items_for({"a", "b"});
                     items[0].summary = "Summary of a.";
                     auto generator = std::make_shared<distill::testing::ScriptedGenerator>();
                     generator->set_summary("Both outlets report the same launch.");
                     auto result = cl::ClusterBuilder(distill::config::ClusteringConfig{})
                                       .build(items, matrix_for(items, {{"a", "b", 0.9}}));
                     const cl::ClusterSummarizer summarizer(generator, 500);
                     const auto warnings = summarizer.summarize(result.clusters, items);
                     require(warnings.empty(), "no warnings expected");
                     require(result.clusters.front().summary ==
                                 std::optional<std::string>("Both outlets report the same launch."),
                             "summary");
                     const auto &request = generator->requests().front();
                     require(request.task == distill::providers::GenerationTask::SummarizeCluster,
                             "task");
                     require(request.content.find("Summary of a.") != std::string::npos &&
                                 request.content.find("Body of b.") != std::string::npos,
                             "content uses summary then body");
                   }});

  tests.push_back({"summarizer_failure_leaves_summary_unset", [] {
                     auto items = items_for({"a", "b"});
                     auto generator = std::make_shared<distill::testing::ScriptedGenerator>();
                     generator->fail_task(distill::providers::GenerationTask::SummarizeCluster);
                     auto result = cl::ClusterBuilder(distill::config::ClusteringConfig{})
                                       .build(items, matrix_for(items, {{"a", "b", 0.9}}));
                     const auto warnings =
                         cl::ClusterSummarizer(generator, 500).summarize(result.clusters, items);
                     require(warnings.size() == 1, "one warning");
                     require(warnings.front().kind ==
                                 distill::common::ErrorKind::GenerationUnavailable,
                             "kind");
                     require(!result.clusters.front().summary.has_value(), "summary must stay unset");
                     require(result.clusters.size() == 1, "cluster is still finalized");
                   }});

  tests.push_back({"summarizer_truncates_long_output", [] {
                     auto items = items_for({"a", "b"});
                     auto generator = std::make_shared<distill::testing::ScriptedGenerator>();
                     generator->set_summary("One sentence here. Another sentence there. A third "
                                            "sentence closes it out.");
                     auto result = cl::ClusterBuilder(distill::config::ClusteringConfig{})
                                       .build(items, matrix_for(items, {{"a", "b", 0.9}}));
                     (void)cl::ClusterSummarizer(generator, 30).summarize(result.clusters, items);
                     require(result.clusters.front().summary.has_value(), "summary set");
                     require(result.clusters.front().summary->size() <= 30, "summary capped");
                   }});

  tests.push_back({"summarizer_content_representative_first", [] {
                     auto items = items_for({"a", "b", "c"});
                     ct::ContentCluster cluster;
                     cluster.member_ids = {"a", "b", "c"};
                     cluster.representative_id = "c";
                     const auto content = cl::ClusterSummarizer::cluster_content(cluster, items);
                     require(content.rfind("Body of c.", 0) == 0, "representative leads");
                     require(content.find("Body of a.") < content.find("Body of b."),
                             "others keep member order");
                   }});
}
