#include "distill/providers/embedder_local.hpp"

#include "distill/common/text.hpp"

#include <cmath>
#include <functional>
#include <limits>

namespace distill::providers {

namespace {

float hash_to_unit(const std::size_t hash) {
  constexpr double max = static_cast<double>(std::numeric_limits<std::size_t>::max());
  const double normalized = static_cast<double>(hash) / max;
  return static_cast<float>(normalized * 2.0 - 1.0);
}

void normalize(std::vector<float> &values) {
  double norm = 0.0;
  for (const float v : values) {
    norm += static_cast<double>(v) * static_cast<double>(v);
  }
  norm = std::sqrt(norm);
  if (norm < 1e-9) {
    return;
  }
  for (float &v : values) {
    v = static_cast<float>(static_cast<double>(v) / norm);
  }
}

} // namespace

LocalEmbedder::LocalEmbedder(const std::size_t dimensions)
    : dimensions_(dimensions == 0 ? 1 : dimensions) {}

std::string_view LocalEmbedder::name() const { return "local"; }

common::Result<std::vector<float>> LocalEmbedder::embed(const std::string_view text) {
  std::vector<float> values(dimensions_, 0.0F);
  std::hash<std::string> hasher;

  // Whole words carry most of the weight; trigrams smooth over inflections.
  for (const auto &word : common::word_tokens(std::string(text))) {
    const auto hash = hasher("w:" + word);
    values[hash % dimensions_] += 2.0F * (hash_to_unit(hash) >= 0.0F ? 1.0F : -1.0F);

    const std::string padded = " " + word + " ";
    for (std::size_t i = 0; i + 3 <= padded.size(); ++i) {
      const auto gram = hasher("g:" + padded.substr(i, 3));
      values[gram % dimensions_] += hash_to_unit(gram) >= 0.0F ? 0.5F : -0.5F;
    }
  }

  normalize(values);
  return common::Result<std::vector<float>>::success(std::move(values));
}

std::size_t LocalEmbedder::dimensions() const { return dimensions_; }

} // namespace distill::providers
