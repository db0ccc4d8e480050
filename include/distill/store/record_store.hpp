#pragma once

#include "distill/common/result.hpp"
#include "distill/config/schema.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace distill::store {

enum class FilterOp {
  Eq,
  Gte,
  Lte,
};

/// Predicate on a top-level member of a JSON record. String members compare
/// as exact text; other members compare numerically when both sides are
/// numbers and lexicographically otherwise.
struct RecordFilter {
  std::string field;
  FilterOp op = FilterOp::Eq;
  std::string value;
};

struct StoredRecord {
  std::string key;
  std::string json;
};

/// Namespaced key-value store of opaque JSON records.
class IRecordStore {
public:
  virtual ~IRecordStore() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Status put(const std::string &ns, const std::string &key,
                                           const std::string &json) = 0;
  [[nodiscard]] virtual common::Result<std::optional<std::string>> get(const std::string &ns,
                                                                       const std::string &key) = 0;
  /// Records of the namespace matching every filter, ordered by key.
  [[nodiscard]] virtual common::Result<std::vector<StoredRecord>>
  query(const std::string &ns, const std::vector<RecordFilter> &filters) = 0;
  [[nodiscard]] virtual common::Result<bool> remove(const std::string &ns,
                                                    const std::string &key) = 0;
};

[[nodiscard]] bool record_matches(const std::string &json, const std::vector<RecordFilter> &filters);

[[nodiscard]] common::Status storage_error(const std::string &detail);

[[nodiscard]] std::unique_ptr<IRecordStore> create_record_store(const config::Config &config);

} // namespace distill::store
