#include "auth/module_digest.h"

#include <cstdio>
#include <cstring>
#include <strings.h>

#include <openssl/evp.h>

namespace Nepse::Auth {

bool sha256Hex(const uint8_t* data, std::size_t len, std::string& out) noexcept {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (EVP_Digest(data, len, hash, &hash_len, EVP_sha256(), nullptr) != 1) {
        return false;
    }

    char hex[EVP_MAX_MD_SIZE * 2 + 1];
    for (unsigned int i = 0; i < hash_len; ++i) {
        std::snprintf(hex + (i * 2), 3, "%02x", hash[i]);
    }
    hex[hash_len * 2] = '\0';

    out.assign(hex, hash_len * 2);
    return true;
}

bool digestEquals(const std::string& actual, const char* expected) noexcept {
    if (!expected) {
        return false;
    }
    const std::size_t len = std::strlen(expected);
    return len == actual.size() && strncasecmp(actual.c_str(), expected, len) == 0;
}

} // namespace Nepse::Auth
