#pragma once

#include "distill/common/result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace distill::similarity {

struct VectorEntry {
  std::string id;
  std::vector<float> values;
};

/// One fixed-length vector per item id. Iteration follows first-insertion
/// order so downstream computation is reproducible.
class VectorStore {
public:
  VectorStore() = default;
  explicit VectorStore(std::size_t dimensions);

  /// Rejects vectors whose length differs from the store's dimensionality
  /// (fixed at construction or by the first insert). Re-putting an id
  /// replaces its vector and keeps its position.
  [[nodiscard]] common::Status put(const std::string &id, std::vector<float> values);
  [[nodiscard]] std::optional<std::vector<float>> get(const std::string &id) const;
  [[nodiscard]] const std::vector<float> *find(const std::string &id) const;

  [[nodiscard]] const std::vector<VectorEntry> &all() const { return entries_; }
  [[nodiscard]] std::size_t size() const { return entries_.size(); }
  [[nodiscard]] bool empty() const { return entries_.empty(); }
  [[nodiscard]] bool contains(const std::string &id) const { return index_.contains(id); }
  [[nodiscard]] std::optional<std::size_t> dimensions() const { return dimensions_; }

  [[nodiscard]] common::Status save(const std::filesystem::path &path) const;
  [[nodiscard]] common::Status load(const std::filesystem::path &path);

private:
  std::optional<std::size_t> dimensions_;
  std::vector<VectorEntry> entries_;
  std::unordered_map<std::string, std::size_t> index_;
};

} // namespace distill::similarity
