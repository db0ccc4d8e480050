#include "distill/retrieval/retrieval_layer.hpp"

#include "distill/similarity/similarity_matrix.hpp"

#include <algorithm>

namespace distill::retrieval {

RetrievalLayer::RetrievalLayer(config::RetrievalConfig config, std::vector<OutputRecord> records)
    : config_(std::move(config)), records_(std::move(records)) {}

common::Result<RetrievalLayer> RetrievalLayer::from_store(store::IRecordStore &store,
                                                          config::RetrievalConfig config,
                                                          const std::vector<std::string> &batch_ids) {
  std::vector<std::vector<store::RecordFilter>> queries;
  if (batch_ids.empty()) {
    queries.emplace_back();
  }
  for (const auto &batch_id : batch_ids) {
    queries.push_back({store::RecordFilter{
        .field = "batch_id", .op = store::FilterOp::Eq, .value = batch_id}});
  }

  std::vector<OutputRecord> records;
  for (const auto &filters : queries) {
    auto stored = store.query("records", filters);
    if (!stored.ok()) {
      return common::Result<RetrievalLayer>::failure(stored.status());
    }
    for (const auto &entry : stored.value()) {
      auto record = record_from_json(entry.json);
      if (!record.ok()) {
        return common::Result<RetrievalLayer>::failure(
            common::Status::error(entry.key + ": " + record.error(), record.kind()));
      }
      records.push_back(std::move(record.value()));
    }
  }
  return common::Result<RetrievalLayer>::success(RetrievalLayer(std::move(config), std::move(records)));
}

bool RetrievalLayer::matches(const OutputRecord &record, const RetrievalQuery &query) const {
  if (!query.batch_ids.empty() &&
      std::find(query.batch_ids.begin(), query.batch_ids.end(), record.batch_id) ==
          query.batch_ids.end()) {
    return false;
  }
  if (!query.tags.empty()) {
    const bool tagged = std::any_of(query.tags.begin(), query.tags.end(), [&record](const auto &tag) {
      return std::find(record.tags.begin(), record.tags.end(), tag) != record.tags.end();
    });
    if (!tagged) {
      return false;
    }
  }
  if (query.min_extraction_confidence.has_value() &&
      record.extraction_confidence < *query.min_extraction_confidence) {
    return false;
  }
  if (query.high_quality_only && record.score.quality() < config_.high_quality_threshold) {
    return false;
  }
  if (query.min_composite_score.has_value() &&
      record.score.composite() < *query.min_composite_score) {
    return false;
  }
  if (query.decision.has_value() && record.decision != *query.decision) {
    return false;
  }
  if (query.kind.has_value() && record.kind != *query.kind) {
    return false;
  }
  return true;
}

std::vector<RetrievalHit> RetrievalLayer::retrieve(const RetrievalQuery &query) const {
  std::vector<RetrievalHit> hits;
  for (const auto &record : records_) {
    if (!matches(record, query)) {
      continue;
    }
    if (!query.query_vector.has_value()) {
      hits.push_back(RetrievalHit{.record = record, .similarity = std::nullopt});
      continue;
    }
    if (record.embedding.size() != query.query_vector->size()) {
      continue;
    }
    const double score = similarity::cosine_similarity(*query.query_vector, record.embedding);
    if (score < query.min_relevance_score) {
      continue;
    }
    hits.push_back(RetrievalHit{.record = record, .similarity = score});
  }

  std::sort(hits.begin(), hits.end(), [](const RetrievalHit &a, const RetrievalHit &b) {
    const double left = a.similarity.value_or(a.record.score.composite());
    const double right = b.similarity.value_or(b.record.score.composite());
    if (left != right) {
      return left > right;
    }
    return a.record.id < b.record.id;
  });

  const std::size_t limit = query.number_of_results.value_or(config_.number_of_results);
  if (hits.size() > limit) {
    hits.resize(limit);
  }
  return hits;
}

} // namespace distill::retrieval
