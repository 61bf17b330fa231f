#pragma once

#include <cstddef>

namespace Nepse::Auth {

// data/css.wasm, converted into a translation unit at build time.
// Size is zero when the build had no module file.
extern const unsigned char CSS_WASM_DATA[];
extern const std::size_t CSS_WASM_SIZE;

} // namespace Nepse::Auth
