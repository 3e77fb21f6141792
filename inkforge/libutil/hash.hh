#pragma once
///@file

#include <openssl/evp.h>

#include "inkforge/libutil/error.hh"
#include "inkforge/libutil/types.hh"

#include <memory>

namespace inkforge {

namespace detail {

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

}

const size_t sha256HashSize = 32;

/**
 * A SHA-256 digest. This is the only hash the builder reports: the code hash
 * of a compiled module as shown to clients.
 */
struct Hash
{
    uint8_t hash[sha256HashSize] = {};

    /**
     * Lowercase hexadecimal rendering.
     */
    std::string to_string() const;

    bool operator==(const Hash & h2) const = default;
};

/**
 * Compute the hash of the given string.
 */
Hash hashString(std::string_view s);

}
