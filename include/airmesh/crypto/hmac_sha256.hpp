#pragma once

#include "types.hpp"
#include <string_view>

namespace airmesh::crypto {

// HMAC-SHA256 (RFC 2104), HKDF (RFC 5869) and the one-way key ratchet
// built on top of them

Mac hmac_sha256(std::span<const uint8_t> key, std::span<const uint8_t> data);

// Constant-time comparison of a received MAC against HMAC(key, data)
bool verify_hmac_sha256(
    std::span<const uint8_t> received,
    std::span<const uint8_t> key,
    std::span<const uint8_t> data
);

// HKDF-Extract: PRK = HMAC(salt, IKM); an empty salt means HashLen zeros
Mac hkdf_extract(
    std::span<const uint8_t> salt,
    std::span<const uint8_t> input_key_material
);

// HKDF-Expand into N keys of KEY_SIZE bytes each (T(1) .. T(N))
template<size_t N>
std::array<SymmetricKey, N> hkdf_expand(
    const Mac& prk,
    std::span<const uint8_t> info = {}
);

// Combined HKDF (extract + expand)
template<size_t N>
std::array<SymmetricKey, N> hkdf(
    std::span<const uint8_t> salt,
    std::span<const uint8_t> input_key_material,
    std::span<const uint8_t> info = {}
);

// Defined for N = 1, 2 and 4
template<> std::array<SymmetricKey, 1> hkdf_expand<1>(const Mac&, std::span<const uint8_t>);
template<> std::array<SymmetricKey, 2> hkdf_expand<2>(const Mac&, std::span<const uint8_t>);
template<> std::array<SymmetricKey, 4> hkdf_expand<4>(const Mac&, std::span<const uint8_t>);
template<> std::array<SymmetricKey, 1> hkdf<1>(std::span<const uint8_t>, std::span<const uint8_t>, std::span<const uint8_t>);
template<> std::array<SymmetricKey, 2> hkdf<2>(std::span<const uint8_t>, std::span<const uint8_t>, std::span<const uint8_t>);
template<> std::array<SymmetricKey, 4> hkdf<4>(std::span<const uint8_t>, std::span<const uint8_t>, std::span<const uint8_t>);

// next = HMAC(key, label || counter as 8 big-endian bytes)
// Keyed by the previous key, so earlier keys cannot be recovered
SymmetricKey ratchet_key(const SymmetricKey& key, std::string_view label, Counter counter);

} // namespace airmesh::crypto
