#include "distill/providers/embedder_cached.hpp"

#include "distill/common/hash.hpp"
#include "distill/observability/global.hpp"

#include <sqlite3.h>

#include <cstring>
#include <sstream>

namespace distill::providers {

namespace {

std::vector<unsigned char> vector_to_blob(const std::vector<float> &values) {
  std::vector<unsigned char> blob(values.size() * sizeof(float));
  std::memcpy(blob.data(), values.data(), blob.size());
  return blob;
}

std::vector<float> blob_to_vector(const void *blob, const int bytes) {
  if (blob == nullptr || bytes <= 0 || (bytes % static_cast<int>(sizeof(float)) != 0)) {
    return {};
  }
  const std::size_t length = static_cast<std::size_t>(bytes) / sizeof(float);
  std::vector<float> values(length);
  std::memcpy(values.data(), blob, static_cast<std::size_t>(bytes));
  return values;
}

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(msg);
  }
  return common::Status::success();
}

} // namespace

CachedEmbedder::CachedEmbedder(std::unique_ptr<IEmbedder> inner,
                               const std::filesystem::path &db_path, const std::size_t capacity)
    : inner_(std::move(inner)), capacity_(capacity) {
  std::error_code ec;
  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path(), ec);
  }

  if (sqlite3_open(db_path.string().c_str(), &db_) != SQLITE_OK) {
    observability::record_warning("embedding_cache",
                                  "cannot open " + db_path.string() + ", caching disabled");
    sqlite3_close(db_);
    db_ = nullptr;
    return;
  }

  if (const auto status = init_schema(); !status.ok()) {
    observability::record_warning("embedding_cache", status.error());
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

CachedEmbedder::~CachedEmbedder() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status CachedEmbedder::init_schema() {
  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS embedding_cache (
  text_hash TEXT PRIMARY KEY,
  embedding BLOB NOT NULL,
  created_at INTEGER NOT NULL
);
)");
}

std::string_view CachedEmbedder::name() const { return inner_->name(); }

std::size_t CachedEmbedder::dimensions() const { return inner_->dimensions(); }

EmbeddingCacheStats CachedEmbedder::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

common::Result<std::optional<std::vector<float>>> CachedEmbedder::lookup(const std::string &key) {
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT embedding FROM embedding_cache WHERE text_hash = ?1";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::optional<std::vector<float>>>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

  if (sqlite3_step(stmt) == SQLITE_ROW) {
    auto values = blob_to_vector(sqlite3_column_blob(stmt, 0), sqlite3_column_bytes(stmt, 0));
    sqlite3_finalize(stmt);
    if (values.size() == inner_->dimensions()) {
      return common::Result<std::optional<std::vector<float>>>::success(std::move(values));
    }
    return common::Result<std::optional<std::vector<float>>>::success(std::nullopt);
  }

  sqlite3_finalize(stmt);
  return common::Result<std::optional<std::vector<float>>>::success(std::nullopt);
}

common::Status CachedEmbedder::insert(const std::string &key, const std::vector<float> &values) {
  const auto blob = vector_to_blob(values);

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "INSERT OR REPLACE INTO embedding_cache(text_hash, embedding, created_at) "
                    "VALUES(?1, ?2, COALESCE((SELECT MAX(created_at) FROM embedding_cache), 0) + 1)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_blob(stmt, 2, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }

  sqlite3_stmt *count_stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM embedding_cache", -1, &count_stmt, nullptr) ==
      SQLITE_OK) {
    if (sqlite3_step(count_stmt) == SQLITE_ROW) {
      stats_.entries = static_cast<std::size_t>(sqlite3_column_int64(count_stmt, 0));
    }
    sqlite3_finalize(count_stmt);
  }

  if (stats_.entries > capacity_) {
    const std::size_t overflow = stats_.entries - capacity_;
    std::ostringstream trim_sql;
    trim_sql << "DELETE FROM embedding_cache WHERE text_hash IN ("
             << "SELECT text_hash FROM embedding_cache ORDER BY created_at ASC LIMIT " << overflow
             << ")";
    if (auto status = exec_sql(db_, trim_sql.str()); !status.ok()) {
      return status;
    }
    stats_.entries = capacity_;
  }
  return common::Status::success();
}

common::Result<std::vector<float>> CachedEmbedder::embed(const std::string_view text) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return inner_->embed(text);
  }

  const std::string key = common::sha256_hex(std::string(inner_->name()) + ":" +
                                             std::to_string(inner_->dimensions()) + ":" +
                                             std::string(text));
  auto cached = lookup(key);
  if (!cached.ok()) {
    observability::record_warning("embedding_cache", cached.error());
  } else if (cached.value().has_value()) {
    ++stats_.hits;
    return common::Result<std::vector<float>>::success(std::move(*cached.value()));
  }

  ++stats_.misses;
  auto embedded = inner_->embed(text);
  if (!embedded.ok()) {
    return embedded;
  }
  if (auto status = insert(key, embedded.value()); !status.ok()) {
    observability::record_warning("embedding_cache", status.error());
  }
  return embedded;
}

} // namespace distill::providers
