#include "distill/common/error.hpp"

#include <array>
#include <utility>

namespace distill::common {

namespace {

constexpr std::array<std::pair<ErrorKind, std::string_view>, 8> kKindNames = {{
    {ErrorKind::DimensionMismatch, "dimension_mismatch"},
    {ErrorKind::MalformedItem, "malformed_item"},
    {ErrorKind::EmbeddingUnavailable, "embedding_unavailable"},
    {ErrorKind::GenerationUnavailable, "generation_unavailable"},
    {ErrorKind::InvalidWeights, "invalid_weights"},
    {ErrorKind::ClusterDegenerate, "cluster_degenerate"},
    {ErrorKind::Storage, "storage"},
    {ErrorKind::Config, "config"},
}};

} // namespace

std::string_view error_kind_name(const ErrorKind kind) {
  for (const auto &[candidate, name] : kKindNames) {
    if (candidate == kind) {
      return name;
    }
  }
  return "unknown";
}

std::optional<ErrorKind> error_kind_from_name(const std::string_view name) {
  for (const auto &[kind, candidate] : kKindNames) {
    if (candidate == name) {
      return kind;
    }
  }
  return std::nullopt;
}

std::optional<ErrorKind> error_kind_of(const std::string &text) {
  if (text.size() < 3 || text.front() != '[') {
    return std::nullopt;
  }
  const auto close = text.find(']');
  if (close == std::string::npos) {
    return std::nullopt;
  }
  return error_kind_from_name(std::string_view(text).substr(1, close - 1));
}

std::string DistillError::to_string() const {
  std::string out = "[";
  out += error_kind_name(kind);
  out += "]";
  if (!message.empty()) {
    out += " " + message;
  }
  return out;
}

std::string Warning::to_string() const {
  std::string out = DistillError{.kind = kind, .message = message}.to_string();
  if (!subject_id.empty()) {
    out += " (" + subject_id + ")";
  }
  return out;
}

} // namespace distill::common
