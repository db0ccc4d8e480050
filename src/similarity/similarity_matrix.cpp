#include "distill/similarity/similarity_matrix.hpp"

#include <algorithm>
#include <cmath>
#include <future>

namespace distill::similarity {

namespace {

using Triple = std::tuple<std::size_t, std::size_t, double>;

std::vector<Triple> compute_rows(const std::vector<VectorEntry> &entries, const std::size_t begin,
                                 const std::size_t end) {
  std::vector<Triple> out;
  for (std::size_t i = begin; i < end; ++i) {
    for (std::size_t j = i + 1; j < entries.size(); ++j) {
      out.emplace_back(i, j, cosine_similarity(entries[i].values, entries[j].values));
    }
  }
  return out;
}

} // namespace

double cosine_similarity(const std::vector<float> &a, const std::vector<float> &b) {
  if (a.empty() || b.empty() || a.size() != b.size()) {
    return 0.0;
  }

  double dot = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
    norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
  }

  if (norm_a < 1e-12 || norm_b < 1e-12) {
    return 0.0;
  }

  const double cosine = dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
  return std::clamp(cosine, 0.0, 1.0);
}

SimilarityMatrix::SimilarityMatrix(std::vector<std::string> ids)
    : ids_(std::move(ids)), scores_(ids_.size() * ids_.size(), 0.0) {
  for (std::size_t i = 0; i < ids_.size(); ++i) {
    index_.emplace(ids_[i], i);
    scores_[i * ids_.size() + i] = 1.0;
  }
}

void SimilarityMatrix::set(const std::size_t i, const std::size_t j, const double score) {
  scores_[i * ids_.size() + j] = score;
  scores_[j * ids_.size() + i] = score;
}

SimilarityMatrix SimilarityMatrix::compute(const VectorStore &store, const std::size_t workers) {
  const auto &entries = store.all();
  std::vector<std::string> ids;
  ids.reserve(entries.size());
  for (const auto &entry : entries) {
    ids.push_back(entry.id);
  }
  SimilarityMatrix matrix(std::move(ids));

  const std::size_t n = entries.size();
  if (workers <= 1 || n < 2) {
    for (const auto &[i, j, score] : compute_rows(entries, 0, n)) {
      matrix.set(i, j, score);
    }
    return matrix;
  }

  // Row i holds n - i - 1 pairs, so interleave rows to keep task sizes even.
  const std::size_t task_count = std::min(workers, n);
  std::vector<std::future<std::vector<Triple>>> futures;
  futures.reserve(task_count);
  for (std::size_t t = 0; t < task_count; ++t) {
    futures.push_back(std::async(std::launch::async, [&entries, n, t, task_count]() {
      std::vector<Triple> rows;
      for (std::size_t i = t; i < n; i += task_count) {
        auto row = compute_rows(entries, i, i + 1);
        rows.insert(rows.end(), row.begin(), row.end());
      }
      return rows;
    }));
  }

  for (auto &future : futures) {
    for (const auto &[i, j, score] : future.get()) {
      matrix.set(i, j, score);
    }
  }
  return matrix;
}

common::Result<SimilarityMatrix>
SimilarityMatrix::from_pairs(const std::vector<std::string> &ids,
                             const std::vector<std::tuple<std::string, std::string, double>> &pairs) {
  SimilarityMatrix matrix(ids);
  if (matrix.index_.size() != ids.size()) {
    return common::Result<SimilarityMatrix>::failure("duplicate id in similarity matrix");
  }
  for (const auto &[a, b, score] : pairs) {
    const auto i = matrix.index_of(a);
    const auto j = matrix.index_of(b);
    if (!i.has_value() || !j.has_value()) {
      return common::Result<SimilarityMatrix>::failure("unknown id in pair " + a + "/" + b);
    }
    if (*i == *j) {
      continue;
    }
    matrix.set(*i, *j, std::clamp(score, 0.0, 1.0));
  }
  return common::Result<SimilarityMatrix>::success(std::move(matrix));
}

std::optional<std::size_t> SimilarityMatrix::index_of(const std::string &id) const {
  const auto it = index_.find(id);
  if (it == index_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<double> SimilarityMatrix::get(const std::string &a, const std::string &b) const {
  const auto i = index_of(a);
  const auto j = index_of(b);
  if (!i.has_value() || !j.has_value()) {
    return std::nullopt;
  }
  return at(*i, *j);
}

std::vector<Neighbor> SimilarityMatrix::neighbors(const std::string &id,
                                                  const double min_threshold) const {
  std::vector<Neighbor> out;
  const auto i = index_of(id);
  if (!i.has_value()) {
    return out;
  }
  for (std::size_t j = 0; j < ids_.size(); ++j) {
    if (j == *i) {
      continue;
    }
    const double score = at(*i, j);
    if (score >= min_threshold) {
      out.push_back(Neighbor{.id = ids_[j], .score = score});
    }
  }
  std::sort(out.begin(), out.end(), [](const Neighbor &a, const Neighbor &b) {
    if (a.score != b.score) {
      return a.score > b.score;
    }
    return a.id < b.id;
  });
  return out;
}

} // namespace distill::similarity
