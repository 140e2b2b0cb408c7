#include "core/hashing.hpp"

#include <string>

namespace quire {

Result<void, Error> init_hashing() {
    if (sodium_init() < 0) {
        return Result<void, Error>::err(Error{"Failed to initialize libsodium"});
    }
    return Result<void, Error>::ok();
}

Hasher::Hasher() {
    crypto_generichash_init(&state_, nullptr, 0, DIGEST_SIZE);
}

void Hasher::update(std::string_view bytes) {
    crypto_generichash_update(&state_,
                              reinterpret_cast<const unsigned char*>(bytes.data()),
                              bytes.size());
}

Digest Hasher::finalize() {
    Digest out{};
    crypto_generichash_final(&state_, out.data(), out.size());
    return out;
}

Digest digest_of(std::string_view bytes) {
    Hasher hasher;
    hasher.update(bytes);
    return hasher.finalize();
}

std::string to_hex(const Digest& digest) {
    std::string out(digest.size() * 2 + 1, '\0');
    sodium_bin2hex(out.data(), out.size(), digest.data(), digest.size());
    out.pop_back();
    return out;
}

} // namespace quire
