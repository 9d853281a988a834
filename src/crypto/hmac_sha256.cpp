#include "airmesh/crypto/hmac_sha256.hpp"
#include "airmesh/crypto/random.hpp"
#include <sodium.h>

namespace airmesh::crypto {

namespace {

// Writes T(1) .. T(N) into the given keys
void expand_into(const Mac& prk, std::span<const uint8_t> info, std::span<SymmetricKey> out) {
    Mac previous;
    for (size_t i = 0; i < out.size(); ++i) {
        crypto_auth_hmacsha256_state state;
        crypto_auth_hmacsha256_init(&state, prk.data(), MAC_SIZE);
        if (i > 0) {
            crypto_auth_hmacsha256_update(&state, previous.data(), MAC_SIZE);
        }
        crypto_auth_hmacsha256_update(&state, info.data(), info.size());
        const uint8_t block_index = static_cast<uint8_t>(i + 1);
        crypto_auth_hmacsha256_update(&state, &block_index, 1);
        crypto_auth_hmacsha256_final(&state, previous.data());
        sodium_memzero(&state, sizeof(state));

        out[i] = previous;
    }
}

} // anonymous namespace

Mac hmac_sha256(std::span<const uint8_t> key, std::span<const uint8_t> data) {
    ensure_sodium_initialized();

    crypto_auth_hmacsha256_state state;
    crypto_auth_hmacsha256_init(&state, key.data(), key.size());
    crypto_auth_hmacsha256_update(&state, data.data(), data.size());

    Mac result;
    crypto_auth_hmacsha256_final(&state, result.data());
    sodium_memzero(&state, sizeof(state));
    return result;
}

bool verify_hmac_sha256(
    std::span<const uint8_t> received,
    std::span<const uint8_t> key,
    std::span<const uint8_t> data
) {
    if (received.size() != MAC_SIZE) {
        return false;
    }
    Mac expected = hmac_sha256(key, data);
    return sodium_memcmp(expected.data(), received.data(), MAC_SIZE) == 0;
}

Mac hkdf_extract(std::span<const uint8_t> salt, std::span<const uint8_t> input_key_material) {
    if (salt.empty()) {
        std::array<uint8_t, MAC_SIZE> zero_salt{};
        return hmac_sha256(zero_salt, input_key_material);
    }
    return hmac_sha256(salt, input_key_material);
}

template<>
std::array<SymmetricKey, 1> hkdf_expand(const Mac& prk, std::span<const uint8_t> info) {
    ensure_sodium_initialized();
    std::array<SymmetricKey, 1> result;
    expand_into(prk, info, result);
    return result;
}

template<>
std::array<SymmetricKey, 2> hkdf_expand(const Mac& prk, std::span<const uint8_t> info) {
    ensure_sodium_initialized();
    std::array<SymmetricKey, 2> result;
    expand_into(prk, info, result);
    return result;
}

template<>
std::array<SymmetricKey, 4> hkdf_expand(const Mac& prk, std::span<const uint8_t> info) {
    ensure_sodium_initialized();
    std::array<SymmetricKey, 4> result;
    expand_into(prk, info, result);
    return result;
}

template<>
std::array<SymmetricKey, 1> hkdf(
    std::span<const uint8_t> salt,
    std::span<const uint8_t> input_key_material,
    std::span<const uint8_t> info
) {
    return hkdf_expand<1>(hkdf_extract(salt, input_key_material), info);
}

template<>
std::array<SymmetricKey, 2> hkdf(
    std::span<const uint8_t> salt,
    std::span<const uint8_t> input_key_material,
    std::span<const uint8_t> info
) {
    return hkdf_expand<2>(hkdf_extract(salt, input_key_material), info);
}

template<>
std::array<SymmetricKey, 4> hkdf(
    std::span<const uint8_t> salt,
    std::span<const uint8_t> input_key_material,
    std::span<const uint8_t> info
) {
    return hkdf_expand<4>(hkdf_extract(salt, input_key_material), info);
}

SymmetricKey ratchet_key(const SymmetricKey& key, std::string_view label, Counter counter) {
    std::vector<uint8_t> input(label.begin(), label.end());
    for (int i = 7; i >= 0; --i) {
        input.push_back(static_cast<uint8_t>((counter >> (8 * i)) & 0xFF));
    }
    return hmac_sha256(key.span(), input);
}

} // namespace airmesh::crypto
