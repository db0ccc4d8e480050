#pragma once

#include "distill/store/record_store.hpp"

#include <filesystem>
#include <mutex>

struct sqlite3;

namespace distill::store {

class SqliteRecordStore final : public IRecordStore {
public:
  explicit SqliteRecordStore(std::filesystem::path db_path);
  ~SqliteRecordStore() override;

  SqliteRecordStore(const SqliteRecordStore &) = delete;
  SqliteRecordStore &operator=(const SqliteRecordStore &) = delete;

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Status put(const std::string &ns, const std::string &key,
                                   const std::string &json) override;
  [[nodiscard]] common::Result<std::optional<std::string>> get(const std::string &ns,
                                                               const std::string &key) override;
  [[nodiscard]] common::Result<std::vector<StoredRecord>>
  query(const std::string &ns, const std::vector<RecordFilter> &filters) override;
  [[nodiscard]] common::Result<bool> remove(const std::string &ns, const std::string &key) override;

  [[nodiscard]] bool is_open() const { return db_ != nullptr; }

private:
  [[nodiscard]] common::Status init_schema();

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
};

} // namespace distill::store
