#pragma once

#include "types.hpp"
#include <optional>
#include <vector>

namespace airmesh::crypto {

// ChaCha20-Poly1305 (RFC 8439, IETF nonce). Every ratchet step yields a new
// key, so the message counter only has to be unique per key
class ChaCha20Poly1305 {
public:
    explicit ChaCha20Poly1305(const SymmetricKey& key);

    // Returns ciphertext with the Poly1305 tag appended
    std::vector<uint8_t> seal(
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> additional_data,
        Counter counter
    ) const;

    // Returns nullopt if the tag does not verify
    std::optional<std::vector<uint8_t>> open(
        std::span<const uint8_t> ciphertext,
        std::span<const uint8_t> additional_data,
        Counter counter
    ) const;

    static constexpr size_t overhead() { return TAG_SIZE; }

    // 4 zero bytes followed by the 8-byte little-endian counter
    static Nonce make_nonce(Counter counter);

private:
    SymmetricKey key_;
};

} // namespace airmesh::crypto
