#include "distill/pipeline/batch_pipeline.hpp"

#include "distill/clustering/cluster_builder.hpp"
#include "distill/clustering/summarizer.hpp"
#include "distill/common/fs.hpp"
#include "distill/common/json_util.hpp"
#include "distill/observability/global.hpp"
#include "distill/scoring/signals.hpp"
#include "distill/similarity/similarity_matrix.hpp"
#include "distill/similarity/vector_store.hpp"

#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace distill::pipeline {

namespace {

void warn(BatchReport &report, common::ErrorKind kind, const std::string &subject,
          const std::string &message) {
  common::Warning warning{.kind = kind, .subject_id = subject, .message = message};
  observability::record_warning("pipeline", warning.to_string());
  report.warnings.push_back(std::move(warning));
}

struct Subject {
  std::size_t item_index = 0;
  const content::ContentCluster *cluster = nullptr;
};

} // namespace

std::string BatchReport::summary_json() const {
  std::vector<std::string> warning_lines;
  warning_lines.reserve(warnings.size());
  for (const auto &warning : warnings) {
    warning_lines.push_back(warning.to_string());
  }
  std::vector<std::string> cluster_ids;
  cluster_ids.reserve(clusters.size());
  for (const auto &cluster : clusters) {
    cluster_ids.push_back(cluster.id);
  }

  std::ostringstream out;
  out << "{";
  out << "\"batch_id\":\"" << common::json_escape(batch_id) << "\",";
  out << "\"items_received\":" << items_received << ",";
  out << "\"items_skipped\":" << items_skipped << ",";
  out << "\"items_unembedded\":" << items_unembedded << ",";
  out << "\"degraded_defaults\":" << degraded_defaults << ",";
  out << "\"included\":" << included << ",";
  out << "\"excluded\":" << excluded << ",";
  out << "\"manual_review\":" << manual_review << ",";
  out << "\"clusters\":" << clusters.size() << ",";
  out << "\"cluster_ids\":" << common::json_string_array(cluster_ids) << ",";
  out << "\"unique_items\":" << unique_items << ",";
  out << "\"splits\":" << splits << ",";
  out << "\"merges\":" << merges << ",";
  out << "\"records\":" << records.size() << ",";
  out << "\"duration_ms\":" << duration.count() << ",";
  out << "\"warnings\":" << common::json_string_array(warning_lines);
  out << "}";
  return out.str();
}

BatchPipeline::BatchPipeline(config::Config config, std::shared_ptr<providers::IEmbedder> embedder,
                             std::shared_ptr<providers::ITextGenerator> generator,
                             std::shared_ptr<store::IRecordStore> store)
    : config_(std::move(config)),
      throttle_(std::make_shared<ProviderThrottle>(config_.pipeline.provider_min_interval_ms)),
      embedder_(std::make_shared<ThrottledEmbedder>(std::move(embedder), throttle_)),
      generator_(generator ? std::make_shared<ThrottledGenerator>(std::move(generator), throttle_)
                           : nullptr),
      store_(std::move(store)) {}

common::Result<BatchReport> BatchPipeline::process(const std::string &batch_id,
                                                   std::vector<content::ContentItem> items,
                                                   const scoring::ScoringOptions &options) {
  const auto started = std::chrono::steady_clock::now();
  BatchReport report;
  report.batch_id = batch_id;
  report.items_received = items.size();
  observability::record_batch_start(batch_id, items.size());

  const scoring::ScoringEngine engine(config_.scoring);
  scoring::ScoringOptions scoring_options = options;
  if (scoring_options.workers == 0) {
    scoring_options.workers = config_.pipeline.workers;
  }
  // Structural problems abort before any provider is called.
  const auto weights =
      scoring_options.weights.value_or(scoring::ScoreWeights::from_config(config_.scoring));
  if (auto status = weights.validate(); !status.ok()) {
    observability::record_error("pipeline", status.error());
    return common::Result<BatchReport>::failure(status);
  }
  if (auto status = engine.validate_thresholds(); !status.ok()) {
    observability::record_error("pipeline", status.error());
    return common::Result<BatchReport>::failure(status);
  }

  std::vector<content::ContentItem> valid;
  {
    observability::StageTimer timer("validate");
    std::unordered_set<std::string> seen;
    for (auto &item : items) {
      content::fill_derived_fields(item);
      if (auto status = content::validate_item(item); !status.ok()) {
        ++report.items_skipped;
        warn(report, common::ErrorKind::MalformedItem, item.id, status.error());
        continue;
      }
      if (!seen.insert(item.id).second) {
        ++report.items_skipped;
        warn(report, common::ErrorKind::MalformedItem, item.id, "duplicate id in batch");
        continue;
      }
      item.metadata.batch_id = batch_id;
      item.cluster_id.reset();
      item.parent_id.reset();
      item.is_representative = false;
      item.absorbed_count = 0;
      valid.push_back(std::move(item));
    }
  }

  similarity::VectorStore vectors(embedder_->dimensions());
  {
    observability::StageTimer timer("embed");
    for (auto &item : valid) {
      if (!item.embedding.has_value() || item.embedding->size() != embedder_->dimensions()) {
        auto embedded = embedder_->embed(content::embedding_text(item));
        if (!embedded.ok()) {
          item.embedding.reset();
          ++report.items_unembedded;
          warn(report, embedded.kind().value_or(common::ErrorKind::EmbeddingUnavailable), item.id,
               embedded.error());
          continue;
        }
        item.embedding = std::move(embedded.value());
      }
      if (auto status = vectors.put(item.id, *item.embedding); !status.ok()) {
        item.embedding.reset();
        ++report.items_unembedded;
        warn(report, common::ErrorKind::DimensionMismatch, item.id, status.error());
      }
    }
  }

  similarity::SimilarityMatrix matrix;
  {
    observability::StageTimer timer("similarity");
    matrix = similarity::SimilarityMatrix::compute(vectors, config_.pipeline.workers);
  }

  clustering::ClusteringResult clusters;
  {
    observability::StageTimer timer("cluster");
    const clustering::ClusterBuilder builder(config_.clustering);
    clusters = builder.build(valid, matrix);
    clustering::assign_membership(valid, clusters);
    report.splits = clusters.splits;
    report.merges = clusters.merges;
    report.unique_items = clusters.unique_ids.size();
    observability::record_metric(observability::ClusterCountMetric{.count = clusters.clusters.size()});
  }

  {
    observability::StageTimer timer("summarize");
    const clustering::ClusterSummarizer summarizer(generator_,
                                                   config_.generation.summary_max_length);
    for (auto &warning : summarizer.summarize(clusters.clusters, valid)) {
      report.warnings.push_back(std::move(warning));
    }
  }

  std::vector<scoring::TopicVector> topic_vectors;
  if (!config_.topics.names.empty()) {
    observability::StageTimer timer("topics");
    for (const auto &topic : config_.topics.names) {
      auto embedded = embedder_->embed(topic);
      if (!embedded.ok()) {
        warn(report, common::ErrorKind::EmbeddingUnavailable, topic, embedded.error());
        continue;
      }
      topic_vectors.emplace_back(topic, std::move(embedded.value()));
    }
  }

  // One scoring subject per unique item and per cluster, ordered by the
  // input position of the item that speaks for it.
  std::unordered_map<std::string, const content::ContentCluster *> cluster_by_rep;
  for (const auto &cluster : clusters.clusters) {
    cluster_by_rep.emplace(cluster.representative_id, &cluster);
  }
  std::vector<Subject> subjects;
  for (std::size_t i = 0; i < valid.size(); ++i) {
    const auto &item = valid[i];
    if (!item.is_clustered()) {
      subjects.push_back(Subject{.item_index = i, .cluster = nullptr});
    } else if (const auto it = cluster_by_rep.find(item.id); it != cluster_by_rep.end()) {
      subjects.push_back(Subject{.item_index = i, .cluster = it->second});
    }
  }

  std::vector<scoring::ScoringInput> inputs;
  inputs.reserve(subjects.size());
  {
    observability::StageTimer timer("signals");
    for (const auto &subject : subjects) {
      const auto &item = valid[subject.item_index];
      scoring::ScoringInput input;
      input.id = subject.cluster != nullptr ? subject.cluster->id : item.id;
      input.published_at = item.published_at;
      input.trend_text = scoring::trend_text(item);
      if (subject.cluster != nullptr && subject.cluster->summary.has_value()) {
        input.trend_text += "\n" + *subject.cluster->summary;
      }
      if (item.embedding.has_value()) {
        input.alignments = scoring::topic_alignments(*item.embedding, topic_vectors);
      }

      if (!generator_) {
        warn(report, common::ErrorKind::GenerationUnavailable, input.id,
             "no text generator configured");
      } else {
        auto request = scoring::build_signal_request(item, config_.topics.names);
        if (subject.cluster != nullptr && subject.cluster->summary.has_value()) {
          request.attributes["cluster_summary"] = *subject.cluster->summary;
        }
        auto generated = generator_->generate(request);
        if (generated.ok()) {
          input.strategic = scoring::strategic_from_fields(generated.value().fields);
          input.quality = scoring::quality_from_fields(generated.value().fields);
        } else {
          warn(report, common::ErrorKind::GenerationUnavailable, input.id, generated.error());
        }
      }
      inputs.push_back(std::move(input));
    }
  }

  std::vector<scoring::ScoredItem> scored;
  {
    observability::StageTimer timer("score");
    auto result = engine.score_batch(inputs, scoring_options);
    if (!result.ok()) {
      observability::record_error("pipeline", result.error());
      return common::Result<BatchReport>::failure(result.status());
    }
    scored = std::move(result.value());
  }

  for (std::size_t i = 0; i < subjects.size(); ++i) {
    const auto &subject = subjects[i];
    const auto &item = valid[subject.item_index];
    const auto &outcome = scored[i];
    report.degraded_defaults += outcome.degraded.size();
    switch (outcome.decision) {
    case scoring::RelevanceDecision::Include:
      ++report.included;
      break;
    case scoring::RelevanceDecision::ManualReview:
      ++report.manual_review;
      break;
    case scoring::RelevanceDecision::Exclude:
      ++report.excluded;
      break;
    }

    if (subject.cluster == nullptr) {
      report.records.push_back(retrieval::record_for_item(item, outcome));
      continue;
    }
    std::vector<const content::ContentItem *> members;
    for (const auto &candidate : valid) {
      if (candidate.cluster_id == subject.cluster->id) {
        members.push_back(&candidate);
      }
    }
    report.records.push_back(
        retrieval::record_for_cluster(*subject.cluster, item, members, outcome));
  }
  report.clusters = std::move(clusters.clusters);
  observability::record_metric(observability::ItemsProcessedMetric{.count = valid.size()});

  report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  if (store_) {
    observability::StageTimer timer("persist");
    // A re-processed batch replaces its previous records.
    auto existing = store_->query("records", {});
    if (!existing.ok()) {
      observability::record_error("store", existing.error());
      return common::Result<BatchReport>::failure(existing.status());
    }
    const std::string prefix = batch_id + "/";
    for (const auto &stored : existing.value()) {
      if (!common::starts_with(stored.key, prefix)) {
        continue;
      }
      if (auto removed = store_->remove("records", stored.key); !removed.ok()) {
        observability::record_error("store", removed.error());
        return common::Result<BatchReport>::failure(removed.status());
      }
    }
    for (const auto &record : report.records) {
      if (auto status = store_->put("records", batch_id + "/" + record.id,
                                    retrieval::record_to_json(record));
          !status.ok()) {
        observability::record_error("store", status.error());
        return common::Result<BatchReport>::failure(status);
      }
    }
    if (auto status = store_->put("batches", batch_id, report.summary_json()); !status.ok()) {
      observability::record_error("store", status.error());
      return common::Result<BatchReport>::failure(status);
    }
  }

  observability::record_event(observability::BatchEndEvent{
      .batch_id = batch_id,
      .duration = report.duration,
      .included = report.included,
      .excluded = report.excluded,
      .manual_review = report.manual_review,
      .skipped = report.items_skipped,
      .degraded = report.degraded_defaults});
  return common::Result<BatchReport>::success(std::move(report));
}

} // namespace distill::pipeline
