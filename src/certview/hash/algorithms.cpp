#include "certview/hash/algorithms.hpp"

#include <sodium.h>

#include "certview/utils/sodium_utils.hpp"

namespace certview::hash {

    std::string_view algorithm_name(Algorithm algo) noexcept {
        switch (algo) {
        case Algorithm::SHA256:
            return "SHA-256";
        case Algorithm::SHA512:
            return "SHA-512";
        case Algorithm::BLAKE2b:
            return "BLAKE2b";
        }
        return "unknown";
    }

    Result digest(Algorithm algo, std::span<const uint8_t> data) {
        utils::ensure_sodium_init();

        switch (algo) {
        case Algorithm::SHA256: {
            std::vector<uint8_t> digest(crypto_hash_sha256_BYTES);
            crypto_hash_sha256(digest.data(), data.data(), data.size());
            return {true, digest, ""};
        }
        case Algorithm::SHA512: {
            std::vector<uint8_t> digest(crypto_hash_sha512_BYTES);
            crypto_hash_sha512(digest.data(), data.data(), data.size());
            return {true, digest, ""};
        }
        case Algorithm::BLAKE2b: {
            std::vector<uint8_t> digest(crypto_generichash_BYTES);
            crypto_generichash(digest.data(), digest.size(), data.data(), data.size(), nullptr, 0);
            return {true, digest, ""};
        }
        }

        return {false, {}, "Unsupported hash algorithm"};
    }

} // namespace certview::hash
