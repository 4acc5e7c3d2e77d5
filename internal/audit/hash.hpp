#pragma once

#include <string>
#include <string_view>

namespace siros::audit {

// Lowercase hex SHA-256 (64 chars). Throws std::runtime_error if OpenSSL fails.
std::string Sha256Hex(std::string_view data);

} // namespace siros::audit
