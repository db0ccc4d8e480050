#include "distill/store/memory_store.hpp"

namespace distill::store {

std::string_view MemoryRecordStore::name() const { return "memory"; }

common::Status MemoryRecordStore::put(const std::string &ns, const std::string &key,
                                      const std::string &json) {
  if (key.empty()) {
    return storage_error("record key must not be empty");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  namespaces_[ns][key] = json;
  return common::Status::success();
}

common::Result<std::optional<std::string>> MemoryRecordStore::get(const std::string &ns,
                                                                  const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto space = namespaces_.find(ns);
  if (space == namespaces_.end()) {
    return common::Result<std::optional<std::string>>::success(std::nullopt);
  }
  const auto it = space->second.find(key);
  if (it == space->second.end()) {
    return common::Result<std::optional<std::string>>::success(std::nullopt);
  }
  return common::Result<std::optional<std::string>>::success(it->second);
}

common::Result<std::vector<StoredRecord>>
MemoryRecordStore::query(const std::string &ns, const std::vector<RecordFilter> &filters) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<StoredRecord> out;
  const auto space = namespaces_.find(ns);
  if (space != namespaces_.end()) {
    for (const auto &[key, json] : space->second) {
      if (record_matches(json, filters)) {
        out.push_back(StoredRecord{.key = key, .json = json});
      }
    }
  }
  return common::Result<std::vector<StoredRecord>>::success(std::move(out));
}

common::Result<bool> MemoryRecordStore::remove(const std::string &ns, const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto space = namespaces_.find(ns);
  if (space == namespaces_.end()) {
    return common::Result<bool>::success(false);
  }
  return common::Result<bool>::success(space->second.erase(key) > 0);
}

} // namespace distill::store
