#pragma once

#include "core/result.hpp"
#include <sodium.h>
#include <array>
#include <cstdint>
#include <string_view>

namespace quire {

constexpr size_t DIGEST_SIZE = crypto_generichash_BYTES;

using Digest = std::array<uint8_t, DIGEST_SIZE>;

/**
 * Initialize libsodium. Safe to call more than once.
 */
[[nodiscard]] Result<void, Error> init_hashing();

/**
 * Hasher - streaming BLAKE2b over a sequence of byte strings.
 *
 * The digest depends on the concatenated bytes only: update("ab") and
 * update("a"), update("b") produce the same result.
 */
class Hasher {
public:
    Hasher();

    Hasher(const Hasher&) = delete;
    Hasher& operator=(const Hasher&) = delete;

    void update(std::string_view bytes);

    /**
     * Produce the digest. The hasher must not be updated afterwards.
     */
    [[nodiscard]] Digest finalize();

private:
    crypto_generichash_state state_;
};

/**
 * One-shot digest of a single string.
 */
[[nodiscard]] Digest digest_of(std::string_view bytes);

/**
 * Lowercase hex rendering of a digest.
 */
[[nodiscard]] std::string to_hex(const Digest& digest);

} // namespace quire
