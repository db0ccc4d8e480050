#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace distill::common {

enum class ErrorKind {
  DimensionMismatch,
  MalformedItem,
  EmbeddingUnavailable,
  GenerationUnavailable,
  InvalidWeights,
  ClusterDegenerate,
  Storage,
  Config,
};

struct DistillError {
  ErrorKind kind = ErrorKind::MalformedItem;
  std::string message;

  [[nodiscard]] std::string to_string() const;
};

[[nodiscard]] std::string_view error_kind_name(ErrorKind kind);
[[nodiscard]] std::optional<ErrorKind> error_kind_from_name(std::string_view name);

/// Recover the kind from text produced by DistillError::to_string().
[[nodiscard]] std::optional<ErrorKind> error_kind_of(const std::string &text);

/// A per-item problem that was recovered locally and reported with the batch.
struct Warning {
  ErrorKind kind = ErrorKind::MalformedItem;
  std::string subject_id;
  std::string message;

  [[nodiscard]] std::string to_string() const;
};

} // namespace distill::common
