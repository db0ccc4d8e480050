#pragma once

#include "distill/providers/embedder.hpp"

#include <filesystem>
#include <mutex>

struct sqlite3;

namespace distill::providers {

struct EmbeddingCacheStats {
  std::size_t hits = 0;
  std::size_t misses = 0;
  std::size_t entries = 0;
};

/// Wraps another embedder with an SQLite-backed cache keyed by the SHA-256 of
/// the inner embedder's name, dimensionality and the text. Holds at most
/// `capacity` rows; the oldest rows are evicted first. A cache that cannot be
/// opened degrades to a pass-through.
class CachedEmbedder final : public IEmbedder {
public:
  CachedEmbedder(std::unique_ptr<IEmbedder> inner, const std::filesystem::path &db_path,
                 std::size_t capacity);
  ~CachedEmbedder() override;

  CachedEmbedder(const CachedEmbedder &) = delete;
  CachedEmbedder &operator=(const CachedEmbedder &) = delete;

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] std::size_t dimensions() const override;

  [[nodiscard]] EmbeddingCacheStats stats() const;
  [[nodiscard]] bool persistent() const { return db_ != nullptr; }

private:
  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Result<std::optional<std::vector<float>>> lookup(const std::string &key);
  [[nodiscard]] common::Status insert(const std::string &key, const std::vector<float> &values);

  std::unique_ptr<IEmbedder> inner_;
  sqlite3 *db_ = nullptr;
  std::size_t capacity_;
  EmbeddingCacheStats stats_;
  mutable std::mutex mutex_;
};

} // namespace distill::providers
