#pragma once

#include "distill/store/record_store.hpp"

#include <map>
#include <mutex>

namespace distill::store {

class MemoryRecordStore final : public IRecordStore {
public:
  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Status put(const std::string &ns, const std::string &key,
                                   const std::string &json) override;
  [[nodiscard]] common::Result<std::optional<std::string>> get(const std::string &ns,
                                                               const std::string &key) override;
  [[nodiscard]] common::Result<std::vector<StoredRecord>>
  query(const std::string &ns, const std::vector<RecordFilter> &filters) override;
  [[nodiscard]] common::Result<bool> remove(const std::string &ns, const std::string &key) override;

private:
  std::map<std::string, std::map<std::string, std::string>> namespaces_;
  std::mutex mutex_;
};

} // namespace distill::store
