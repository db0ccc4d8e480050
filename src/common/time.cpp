#include "distill/common/time.hpp"

#include "distill/common/fs.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace distill::common {

namespace {

std::time_t to_utc_time(std::tm &tm) {
#ifdef _WIN32
  return _mkgmtime(&tm);
#else
  return timegm(&tm);
#endif
}

// Parses the part after the seconds field: fraction, then Z or an offset.
// Returns the offset in seconds east of UTC.
std::optional<long> parse_zone_suffix(std::string rest) {
  std::size_t pos = 0;
  if (pos < rest.size() && rest[pos] == '.') {
    ++pos;
    while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos])) != 0) {
      ++pos;
    }
  }
  rest = rest.substr(pos);
  if (rest.empty() || rest == "Z" || rest == "z") {
    return 0L;
  }
  if (rest.size() != 6 || (rest[0] != '+' && rest[0] != '-') || rest[3] != ':') {
    return std::nullopt;
  }
  for (const std::size_t idx : {1U, 2U, 4U, 5U}) {
    if (std::isdigit(static_cast<unsigned char>(rest[idx])) == 0) {
      return std::nullopt;
    }
  }
  const long hours = std::stol(rest.substr(1, 2));
  const long minutes = std::stol(rest.substr(4, 2));
  const long offset = hours * 3600 + minutes * 60;
  return rest[0] == '-' ? -offset : offset;
}

} // namespace

std::string format_rfc3339(const TimePoint point) {
  const auto t = std::chrono::system_clock::to_time_t(point);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

std::string now_rfc3339() { return format_rfc3339(std::chrono::system_clock::now()); }

std::optional<TimePoint> parse_rfc3339(const std::string &text) {
  const std::string value = trim(text);
  if (value.size() < 10) {
    return std::nullopt;
  }

  std::tm tm{};
  long offset = 0;
  if (value.size() == 10) {
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%d");
    if (in.fail()) {
      return std::nullopt;
    }
  } else {
    std::istringstream in(value.substr(0, 19));
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail() || value.size() < 19) {
      return std::nullopt;
    }
    const auto zone = parse_zone_suffix(value.substr(19));
    if (!zone.has_value()) {
      return std::nullopt;
    }
    offset = *zone;
  }

  const std::time_t utc = to_utc_time(tm);
  if (utc == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  return std::chrono::system_clock::from_time_t(utc - offset);
}

double age_in_days(const TimePoint then, const TimePoint now) {
  const auto age = std::chrono::duration_cast<std::chrono::duration<double>>(now - then);
  return age.count() / 86400.0;
}

} // namespace distill::common
