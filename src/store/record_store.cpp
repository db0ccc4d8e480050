#include "distill/store/record_store.hpp"

#include "distill/common/fs.hpp"
#include "distill/common/json_util.hpp"
#include "distill/observability/global.hpp"
#include "distill/store/memory_store.hpp"
#include "distill/store/sqlite_store.hpp"

#include <unordered_set>

namespace distill::store {

namespace {

bool compare_text(const std::string &actual, const FilterOp op, const std::string &expected) {
  switch (op) {
  case FilterOp::Eq:
    return actual == expected;
  case FilterOp::Gte:
    return actual >= expected;
  case FilterOp::Lte:
    return actual <= expected;
  }
  return false;
}

bool compare(const std::string &actual, const FilterOp op, const std::string &expected) {
  const auto actual_number = common::json_number(actual);
  const auto expected_number = common::json_number(expected);
  if (actual_number.has_value() && expected_number.has_value()) {
    switch (op) {
    case FilterOp::Eq:
      return *actual_number == *expected_number;
    case FilterOp::Gte:
      return *actual_number >= *expected_number;
    case FilterOp::Lte:
      return *actual_number <= *expected_number;
    }
  }
  return compare_text(actual, op, expected);
}

} // namespace

bool record_matches(const std::string &json, const std::vector<RecordFilter> &filters) {
  if (filters.empty()) {
    return true;
  }
  std::unordered_set<std::string> string_members;
  const auto fields = common::json_parse_flat(json, &string_members);
  for (const auto &filter : filters) {
    const auto it = fields.find(filter.field);
    if (it == fields.end()) {
      return false;
    }
    const bool is_string = string_members.count(filter.field) > 0;
    if (!is_string && it->second == "null") {
      return false;
    }
    const bool matched = is_string ? compare_text(it->second, filter.op, filter.value)
                                   : compare(it->second, filter.op, filter.value);
    if (!matched) {
      return false;
    }
  }
  return true;
}

common::Status storage_error(const std::string &detail) {
  return common::Status::error(
      common::DistillError{.kind = common::ErrorKind::Storage, .message = detail});
}

std::unique_ptr<IRecordStore> create_record_store(const config::Config &config) {
  const std::string backend = common::to_lower(config.store.backend);
  if (backend == "memory") {
    return std::make_unique<MemoryRecordStore>();
  }
  if (backend != "sqlite") {
    observability::record_warning("store", "unknown backend '" + config.store.backend +
                                               "', using sqlite");
  }
  return std::make_unique<SqliteRecordStore>(common::expand_path(config.store.path));
}

} // namespace distill::store
