#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace ragsync::common {

/// Lowercase hex SHA-256 of `data`.
[[nodiscard]] std::string sha256_hex(std::string_view data);
[[nodiscard]] std::string sha256_hex(const void *data, std::size_t size);

} // namespace ragsync::common
