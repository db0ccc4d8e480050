#include "distill/similarity/vector_store.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <system_error>

namespace distill::similarity {

namespace {

constexpr std::uint32_t kSnapshotMagic = 0x44535653; // "DSVS"

common::Status dimension_mismatch(const std::string &id, std::size_t expected, std::size_t got) {
  return common::Status::error(common::DistillError{
      .kind = common::ErrorKind::DimensionMismatch,
      .message = id + ": expected " + std::to_string(expected) + " components, got " +
                 std::to_string(got)});
}

} // namespace

VectorStore::VectorStore(const std::size_t dimensions) : dimensions_(dimensions) {}

common::Status VectorStore::put(const std::string &id, std::vector<float> values) {
  if (values.empty()) {
    return common::Status::error(common::DistillError{
        .kind = common::ErrorKind::DimensionMismatch, .message = id + ": empty vector"});
  }
  if (dimensions_.has_value() && values.size() != *dimensions_) {
    return dimension_mismatch(id, *dimensions_, values.size());
  }
  for (const float v : values) {
    if (!std::isfinite(v)) {
      return common::Status::error(common::DistillError{
          .kind = common::ErrorKind::DimensionMismatch,
          .message = id + ": vector contains a non-finite component"});
    }
  }

  if (!dimensions_.has_value()) {
    dimensions_ = values.size();
  }

  if (const auto it = index_.find(id); it != index_.end()) {
    entries_[it->second].values = std::move(values);
    return common::Status::success();
  }
  index_.emplace(id, entries_.size());
  entries_.push_back(VectorEntry{.id = id, .values = std::move(values)});
  return common::Status::success();
}

std::optional<std::vector<float>> VectorStore::get(const std::string &id) const {
  if (const auto *values = find(id); values != nullptr) {
    return *values;
  }
  return std::nullopt;
}

const std::vector<float> *VectorStore::find(const std::string &id) const {
  const auto it = index_.find(id);
  if (it == index_.end()) {
    return nullptr;
  }
  return &entries_[it->second].values;
}

common::Status VectorStore::save(const std::filesystem::path &path) const {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return common::Status::error("failed to open vector store snapshot for write");
  }

  const std::uint32_t magic = kSnapshotMagic;
  const std::uint64_t dims = dimensions_.value_or(0);
  const std::uint64_t count = entries_.size();
  out.write(reinterpret_cast<const char *>(&magic), sizeof(magic));
  out.write(reinterpret_cast<const char *>(&dims), sizeof(dims));
  out.write(reinterpret_cast<const char *>(&count), sizeof(count));

  for (const auto &entry : entries_) {
    const std::uint64_t id_size = entry.id.size();
    out.write(reinterpret_cast<const char *>(&id_size), sizeof(id_size));
    out.write(entry.id.data(), static_cast<std::streamsize>(entry.id.size()));
    out.write(reinterpret_cast<const char *>(entry.values.data()),
              static_cast<std::streamsize>(entry.values.size() * sizeof(float)));
  }

  return out ? common::Status::success()
             : common::Status::error("failed to write vector store snapshot");
}

common::Status VectorStore::load(const std::filesystem::path &path) {
  std::error_code ec;
  const auto file_size = std::filesystem::file_size(path, ec);
  std::ifstream in(path, std::ios::binary);
  if (ec || !in) {
    return common::Status::error("failed to open vector store snapshot: " + path.string());
  }

  std::uint32_t magic = 0;
  std::uint64_t dims = 0;
  std::uint64_t count = 0;
  in.read(reinterpret_cast<char *>(&magic), sizeof(magic));
  in.read(reinterpret_cast<char *>(&dims), sizeof(dims));
  in.read(reinterpret_cast<char *>(&count), sizeof(count));
  if (!in || magic != kSnapshotMagic) {
    return common::Status::error("invalid vector store snapshot header");
  }
  if (dimensions_.has_value() && dims != 0 && dims != *dimensions_) {
    return dimension_mismatch(path.string(), *dimensions_, static_cast<std::size_t>(dims));
  }

  // Every length field is checked against the bytes left in the file before
  // anything is allocated.
  std::uint64_t remaining = file_size - (sizeof(magic) + sizeof(dims) + sizeof(count));
  if (dims == 0 && count > 0) {
    return common::Status::error("vector store snapshot has entries but no dimensions");
  }
  if (dims > remaining / sizeof(float)) {
    return common::Status::error("vector store snapshot dimensions exceed file size");
  }
  const std::uint64_t min_entry = sizeof(std::uint64_t) + dims * sizeof(float);
  if (count > remaining / min_entry) {
    return common::Status::error("vector store snapshot entry count exceeds file size");
  }

  std::vector<VectorEntry> entries;
  std::unordered_map<std::string, std::size_t> index;
  entries.reserve(static_cast<std::size_t>(count));
  for (std::uint64_t i = 0; i < count; ++i) {
    std::uint64_t id_size = 0;
    in.read(reinterpret_cast<char *>(&id_size), sizeof(id_size));
    if (!in) {
      return common::Status::error("failed to read snapshot id size");
    }
    remaining -= sizeof(id_size);
    if (id_size > remaining || dims * sizeof(float) > remaining - id_size) {
      return common::Status::error("vector store snapshot entry exceeds file size");
    }
    std::string id(static_cast<std::size_t>(id_size), '\0');
    in.read(id.data(), static_cast<std::streamsize>(id_size));
    std::vector<float> values(static_cast<std::size_t>(dims));
    in.read(reinterpret_cast<char *>(values.data()),
            static_cast<std::streamsize>(values.size() * sizeof(float)));
    if (!in) {
      return common::Status::error("failed to read snapshot vector payload");
    }
    remaining -= id_size + dims * sizeof(float);
    if (!index.emplace(id, entries.size()).second) {
      return common::Status::error("duplicate id in vector store snapshot: " + id);
    }
    entries.push_back(VectorEntry{.id = std::move(id), .values = std::move(values)});
  }
  if (remaining != 0) {
    return common::Status::error("trailing bytes after vector store snapshot");
  }

  if (dims != 0) {
    dimensions_ = static_cast<std::size_t>(dims);
  }
  entries_ = std::move(entries);
  index_ = std::move(index);
  return common::Status::success();
}

} // namespace distill::similarity
