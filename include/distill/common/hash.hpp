#pragma once

#include <string>

namespace distill::common {

/// Lower-case hex SHA-256 digest of `text`.
[[nodiscard]] std::string sha256_hex(const std::string &text);

} // namespace distill::common
