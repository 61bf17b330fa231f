#pragma once

#include <cstring>

// Branch hints
#define LIKELY(x) __builtin_expect(!!(x), 1)
#define UNLIKELY(x) __builtin_expect(!!(x), 0)

// Cache line size for state shared between threads
#define CACHE_LINE_SIZE 64

// printf-style format checking for logging helpers
#define PRINTF_FORMAT(fmt_idx, args_idx) __attribute__((format(printf, fmt_idx, args_idx)))

// Copy helper for the fixed-size char fields used throughout config structs
#define COPY_FIXED(dst, src) do {                      \
        std::strncpy((dst), (src), sizeof(dst) - 1);   \
        (dst)[sizeof(dst) - 1] = '\0';                 \
    } while (0)
