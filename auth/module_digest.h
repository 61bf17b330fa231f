#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace Nepse::Auth {

// Lowercase hex SHA-256 of `data`
[[nodiscard]] bool sha256Hex(const uint8_t* data, std::size_t len, std::string& out) noexcept;

// Case-insensitive comparison of two hex digests
[[nodiscard]] bool digestEquals(const std::string& actual, const char* expected) noexcept;

} // namespace Nepse::Auth
