#pragma once

#include <string>
#include <string_view>

namespace domshield::common {

/// Lowercase hex SHA-256 of `data`. Returns an empty string if the digest fails.
[[nodiscard]] std::string sha256_hex(std::string_view data);

} // namespace domshield::common
