#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace distill::common {

using TimePoint = std::chrono::system_clock::time_point;

[[nodiscard]] std::string now_rfc3339();
[[nodiscard]] std::string format_rfc3339(TimePoint point);

/// Accepts `YYYY-MM-DD`, `YYYY-MM-DDTHH:MM:SS` with optional fractional
/// seconds and a `Z` or `+HH:MM` / `-HH:MM` suffix.
[[nodiscard]] std::optional<TimePoint> parse_rfc3339(const std::string &text);

/// Days elapsed from `then` to `now`; negative when `then` lies in the future.
[[nodiscard]] double age_in_days(TimePoint then, TimePoint now);

} // namespace distill::common
