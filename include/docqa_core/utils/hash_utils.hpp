#pragma once

#include <string>
#include <string_view>

namespace docqa_core::hash_utils {

// Lower-case hex SHA-256 digest. Throws std::runtime_error if OpenSSL fails.
std::string sha256_hex(std::string_view content);

}  // namespace docqa_core::hash_utils
