#include "test_framework.hpp"

#include "distill/retrieval/record.hpp"
#include "distill/retrieval/retrieval_layer.hpp"
#include "distill/store/memory_store.hpp"
#include "tests/helpers/test_helpers.hpp"

namespace {

namespace r = distill::retrieval;
namespace sc = distill::scoring;

r::OutputRecord make_record(const std::string &id, const std::string &batch_id,
                            const double topical, const double quality,
                            std::vector<std::string> tags = {}, std::vector<float> embedding = {}) {
  r::OutputRecord record;
  record.id = id;
  record.batch_id = batch_id;
  record.title = "Title " + id;
  record.source_url = "https://example.com/" + id;
  record.domain = "example.com";
  record.tags = std::move(tags);
  record.extraction_confidence = 0.8;
  record.embedding = std::move(embedding);
  record.score = sc::RelevanceScore::create(
                     sc::SubScores{.topical = topical, .strategic = 0.5, .quality = quality,
                                   .temporal = 0.5},
                     sc::ScoreWeights{})
                     .value();
  record.decision = record.score.composite() >= 0.65 ? sc::RelevanceDecision::Include
                                                     : sc::RelevanceDecision::Exclude;
  return record;
}

std::vector<std::string> hit_ids(const std::vector<r::RetrievalHit> &hits) {
  std::vector<std::string> ids;
  for (const auto &hit : hits) {
    ids.push_back(hit.record.id);
  }
  return ids;
}

} // namespace

void register_retrieval_tests(std::vector<distill::tests::TestCase> &tests) {
  using distill::tests::near;
  using distill::tests::require;

  tests.push_back({"retrieve_orders_by_composite", [] {
                     const r::RetrievalLayer layer(
                         distill::config::RetrievalConfig{},
                         {make_record("low", "b1", 0.1, 0.5), make_record("high", "b1", 0.9, 0.5),
                          make_record("mid", "b1", 0.5, 0.5)});
                     const auto hits = layer.retrieve(r::RetrievalQuery{});
                     require(hit_ids(hits) == std::vector<std::string>({"high", "mid", "low"}),
                             "composite order");
                     require(!hits.front().similarity.has_value(), "no similarity without vector");
                   }});

  tests.push_back({"retrieve_ties_break_by_id", [] {
                     const r::RetrievalLayer layer(distill::config::RetrievalConfig{},
                                                   {make_record("b", "x", 0.5, 0.5),
                                                    make_record("a", "x", 0.5, 0.5)});
                     require(hit_ids(layer.retrieve(r::RetrievalQuery{})) ==
                                 std::vector<std::string>({"a", "b"}),
                             "tie order");
                   }});

  tests.push_back({"retrieve_by_similarity", [] {
                     const r::RetrievalLayer layer(
                         distill::config::RetrievalConfig{},
                         {make_record("east", "b", 0.9, 0.5, {}, {1.0F, 0.0F}),
                          make_record("north", "b", 0.1, 0.5, {}, {0.0F, 1.0F}),
                          make_record("diag", "b", 0.5, 0.5, {}, {1.0F, 1.0F}),
                          make_record("flat", "b", 0.9, 0.5, {}, {1.0F, 0.0F, 0.0F}),
                          make_record("none", "b", 0.9, 0.5)});
                     r::RetrievalQuery query;
                     query.query_vector = std::vector<float>{0.0F, 1.0F};
                     query.min_relevance_score = 0.5;
                     const auto hits = layer.retrieve(query);
                     require(hit_ids(hits) == std::vector<std::string>({"north", "diag"}),
                             "similarity order and floor");
                     require(hits[0].similarity.has_value() && near(*hits[0].similarity, 1.0),
                             "similarity reported");
                   }});

  tests.push_back({"retrieve_filters_combine", [] {
                     auto tagged = make_record("tagged", "b1", 0.9, 0.9, {"ai", "chips"});
                     auto other_batch = make_record("other", "b2", 0.9, 0.9, {"ai"});
                     auto low_quality = make_record("lowq", "b1", 0.9, 0.2, {"ai"});
                     auto untagged = make_record("plain", "b1", 0.9, 0.9);
                     auto unsure = make_record("unsure", "b1", 0.9, 0.9, {"chips"});
                     unsure.extraction_confidence = 0.3;
                     const r::RetrievalLayer layer(
                         distill::config::RetrievalConfig{},
                         {tagged, other_batch, low_quality, untagged, unsure});

                     r::RetrievalQuery query;
                     query.batch_ids = {"b1"};
                     query.tags = {"ai", "chips"};
                     query.high_quality_only = true;
                     query.min_extraction_confidence = 0.5;
                     require(hit_ids(layer.retrieve(query)) == std::vector<std::string>({"tagged"}),
                             "every filter must hold");

                     r::RetrievalQuery by_tag;
                     by_tag.tags = {"chips"};
                     require(layer.retrieve(by_tag).size() == 2, "any-of tag match");
                   }});

  tests.push_back({"retrieve_score_decision_and_kind_filters", [] {
                     auto cluster = make_record("c1", "b", 0.9, 0.9);
                     cluster.kind = r::RecordKind::Cluster;
                     const r::RetrievalLayer layer(distill::config::RetrievalConfig{},
                                                   {cluster, make_record("i1", "b", 0.9, 0.9),
                                                    make_record("i2", "b", 0.0, 0.0)});

                     r::RetrievalQuery min_score;
                     min_score.min_composite_score = 0.6;
                     require(layer.retrieve(min_score).size() == 2, "composite floor");

                     r::RetrievalQuery excluded;
                     excluded.decision = sc::RelevanceDecision::Exclude;
                     require(hit_ids(layer.retrieve(excluded)) == std::vector<std::string>({"i2"}),
                             "decision filter");

                     r::RetrievalQuery clusters;
                     clusters.kind = r::RecordKind::Cluster;
                     require(hit_ids(layer.retrieve(clusters)) == std::vector<std::string>({"c1"}),
                             "kind filter");
                   }});

  tests.push_back({"retrieve_limits_results", [] {
                     std::vector<r::OutputRecord> records;
                     for (int i = 0; i < 30; ++i) {
                       records.push_back(make_record("r" + std::to_string(i), "b", i / 30.0, 0.5));
                     }
                     const r::RetrievalLayer layer(distill::config::RetrievalConfig{}, records);
                     require(layer.retrieve(r::RetrievalQuery{}).size() == 20, "configured default");
                     r::RetrievalQuery query;
                     query.number_of_results = 5;
                     const auto hits = layer.retrieve(query);
                     require(hits.size() == 5, "explicit limit");
                     require(hits.front().record.id == "r29", "best first");
                   }});

  tests.push_back({"record_json_round_trip_keeps_scores", [] {
                     auto record = make_record("c", "batch-7", 0.8, 0.6, {"a\"b"}, {0.25F, -1.0F});
                     record.kind = r::RecordKind::Cluster;
                     record.member_ids = {"m1", "m2"};
                     record.representative_id = "m2";
                     record.cluster_confidence = 0.91;
                     record.cohesion = 0.85;
                     record.tier = distill::content::SimilarityTier::SameStory;
                     record.metrics.total_word_count = 900;
                     record.metrics.distinct_domains = 2;
                     record.published_at = "2024-05-01T00:00:00Z";
                     record.degraded = {"temporal"};

                     auto decoded = r::record_from_json(r::record_to_json(record));
                     require(decoded.ok(), decoded.error());
                     const auto &back = decoded.value();
                     require(back.kind == r::RecordKind::Cluster, "kind");
                     require(back.batch_id == "batch-7", "batch");
                     require(back.tags == record.tags, "escaped tag");
                     require(back.member_ids == record.member_ids, "members");
                     require(back.tier == record.tier, "tier");
                     require(back.metrics.total_word_count == 900, "metrics");
                     require(near(back.score.composite(), record.score.composite(), 1e-8),
                             "composite recomputed");
                     require(back.decision == record.decision, "decision");
                     require(back.embedding == record.embedding, "embedding");
                     require(back.published_at == record.published_at, "timestamp");
                     require(back.degraded == record.degraded, "degraded");

                     const auto without = r::record_to_json(record, false);
                     require(without.find("\"embedding\"") == std::string::npos,
                             "embedding omitted on request");
                   }});

  tests.push_back({"record_json_rejects_garbage", [] {
                     auto missing_id = r::record_from_json(R"({"kind":"item"})");
                     require(!missing_id.ok(), "record without id");
                     require(missing_id.kind() == distill::common::ErrorKind::Storage, "kind");
                     require(!r::record_from_json(R"({"id":"x","kind":"blob"})").ok(),
                             "unknown kind");
                   }});

  tests.push_back({"record_for_cluster_merges_members", [] {
                     auto rep = distill::testing::make_item("rep", "Rep", "Rep body.",
                                                            "https://a.com/rep", 0.9);
                     rep.metadata.tags = {"ai"};
                     rep.metadata.batch_id = "b";
                     rep.embedding = std::vector<float>{1.0F, 0.0F};
                     auto other = distill::testing::make_item("o", "Other", "Other body.",
                                                              "https://b.com/o", 0.5);
                     other.metadata.tags = {"chips", "ai"};

                     distill::content::ContentCluster cluster;
                     cluster.id = "cluster_x";
                     cluster.member_ids = {"rep", "o"};
                     cluster.representative_id = "rep";
                     cluster.summary = "Joint summary.";
                     cluster.metrics = distill::content::compute_cluster_metrics({&rep, &other});

                     sc::ScoredItem scored;
                     scored.id = cluster.id;
                     const auto record = r::record_for_cluster(cluster, rep, {&rep, &other}, scored);
                     require(record.id == "cluster_x" && record.kind == r::RecordKind::Cluster,
                             "identity");
                     require(record.summary == "Joint summary.", "cluster summary");
                     require(record.title == "Rep", "representative title");
                     require(record.tags == std::vector<std::string>({"ai", "chips"}), "tag union");
                     require(near(record.extraction_confidence, 0.7), "average confidence");
                     require(record.embedding == *rep.embedding, "representative vector");
                   }});

  tests.push_back({"retrieval_from_store_by_batch", [] {
                     distill::store::MemoryRecordStore store;
                     for (const auto &record :
                          {make_record("a", "b1", 0.9, 0.5), make_record("b", "b2", 0.5, 0.5),
                           make_record("c", "b3", 0.1, 0.5)}) {
                       require(store
                                   .put("records", record.batch_id + "/" + record.id,
                                        r::record_to_json(record))
                                   .ok(),
                               "put");
                     }
                     auto all = r::RetrievalLayer::from_store(store, distill::config::RetrievalConfig{});
                     require(all.ok(), all.error());
                     require(all.value().size() == 3, "all batches");

                     auto some = r::RetrievalLayer::from_store(store, distill::config::RetrievalConfig{},
                                                               {"b1", "b3"});
                     require(some.ok(), some.error());
                     require(hit_ids(some.value().retrieve(r::RetrievalQuery{})) ==
                                 std::vector<std::string>({"a", "c"}),
                             "batch filter");

                     require(store.put("records", "bad", R"({"kind":"item"})").ok(), "put");
                     auto broken =
                         r::RetrievalLayer::from_store(store, distill::config::RetrievalConfig{});
                     require(!broken.ok(), "undecodable record should fail");
                   }});
}
