#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

#include "auth/token_types.h"

namespace Nepse::Auth {

// Removes the bytes of `raw` at the given positions. Positions are sorted
// first; negative or past-the-end positions are skipped and a repeated
// position removes its byte once.
[[nodiscard]] auto reconstruct(std::string_view raw, const int32_t* indices, std::size_t count) -> std::string;

[[nodiscard]] inline auto reconstruct(std::string_view raw, const IndexSet& indices) -> std::string {
    return reconstruct(raw, indices.data(), indices.size());
}

[[nodiscard]] inline auto reconstruct(std::string_view raw, std::initializer_list<int32_t> indices) -> std::string {
    return reconstruct(raw, indices.begin(), indices.size());
}

} // namespace Nepse::Auth
