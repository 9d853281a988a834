#include "airmesh/crypto/chacha20poly1305.hpp"
#include "airmesh/crypto/random.hpp"
#include <sodium.h>

namespace airmesh::crypto {

ChaCha20Poly1305::ChaCha20Poly1305(const SymmetricKey& key) : key_(key) {
    ensure_sodium_initialized();
}

Nonce ChaCha20Poly1305::make_nonce(Counter counter) {
    Nonce nonce{};
    for (int i = 0; i < 8; ++i) {
        nonce[4 + i] = static_cast<uint8_t>((counter >> (8 * i)) & 0xFF);
    }
    return nonce;
}

std::vector<uint8_t> ChaCha20Poly1305::seal(
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> additional_data,
    Counter counter
) const {
    std::vector<uint8_t> ciphertext(plaintext.size() + TAG_SIZE);
    unsigned long long ciphertext_len = 0;

    Nonce nonce = make_nonce(counter);

    crypto_aead_chacha20poly1305_ietf_encrypt(
        ciphertext.data(), &ciphertext_len,
        plaintext.data(), plaintext.size(),
        additional_data.data(), additional_data.size(),
        nullptr,
        nonce.data(),
        key_.data()
    );

    ciphertext.resize(static_cast<size_t>(ciphertext_len));
    return ciphertext;
}

std::optional<std::vector<uint8_t>> ChaCha20Poly1305::open(
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> additional_data,
    Counter counter
) const {
    if (ciphertext.size() < TAG_SIZE) {
        return std::nullopt;
    }

    std::vector<uint8_t> plaintext(ciphertext.size() - TAG_SIZE);
    unsigned long long plaintext_len = 0;

    Nonce nonce = make_nonce(counter);

    if (crypto_aead_chacha20poly1305_ietf_decrypt(
            plaintext.data(), &plaintext_len,
            nullptr,
            ciphertext.data(), ciphertext.size(),
            additional_data.data(), additional_data.size(),
            nonce.data(),
            key_.data()
        ) != 0) {
        return std::nullopt;
    }

    plaintext.resize(static_cast<size_t>(plaintext_len));
    return plaintext;
}

} // namespace airmesh::crypto
