#include "auth/token_reconstruct.h"

#include <algorithm>
#include <vector>

namespace Nepse::Auth {

auto reconstruct(std::string_view raw, const int32_t* indices, std::size_t count) -> std::string {
    std::vector<int32_t> sorted(indices, indices + count);
    std::sort(sorted.begin(), sorted.end());

    std::string out;
    out.reserve(raw.size());

    std::size_t prev = 0;
    for (const int32_t idx : sorted) {
        if (idx < 0 || static_cast<std::size_t>(idx) >= raw.size()) {
            continue;
        }
        const auto pos = static_cast<std::size_t>(idx);
        if (pos < prev) {
            continue;  // duplicate of a position already removed
        }
        out.append(raw.data() + prev, pos - prev);
        prev = pos + 1;
    }
    out.append(raw.data() + prev, raw.size() - prev);
    return out;
}

} // namespace Nepse::Auth
