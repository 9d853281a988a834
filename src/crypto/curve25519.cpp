#include "airmesh/crypto/curve25519.hpp"
#include "airmesh/crypto/random.hpp"
#include "airmesh/util/encoding.hpp"
#include <sodium.h>

namespace airmesh::crypto {

X25519KeyPair X25519KeyPair::generate() {
    ensure_sodium_initialized();

    X25519KeyPair kp;
    crypto_box_keypair(kp.public_key_.data(), kp.private_key_.data());
    return kp;
}

X25519KeyPair X25519KeyPair::from_private_key(const PrivateKey& private_key) {
    ensure_sodium_initialized();

    X25519KeyPair kp;
    kp.private_key_ = private_key;
    crypto_scalarmult_base(kp.public_key_.data(), kp.private_key_.data());
    return kp;
}

std::optional<X25519KeyPair> X25519KeyPair::from_base64(std::string_view base64_private) {
    auto decoded = util::base64_decode(base64_private);
    if (!decoded) {
        return std::nullopt;
    }

    PrivateKey pk;
    bool sized = PrivateKey::from_bytes(*decoded, pk);
    sodium_memzero(decoded->data(), decoded->size());
    if (!sized) {
        return std::nullopt;
    }
    return from_private_key(pk);
}

std::string X25519KeyPair::private_key_base64() const {
    return util::base64_encode(private_key_.span());
}

std::string X25519KeyPair::public_key_base64() const {
    return util::base64_encode(public_key_.span());
}

std::optional<SharedSecret> x25519(const PrivateKey& private_key, const PublicKey& public_key) {
    ensure_sodium_initialized();

    SharedSecret secret;
    if (crypto_scalarmult(secret.data(), private_key.data(), public_key.data()) != 0) {
        return std::nullopt;
    }
    return secret;
}

} // namespace airmesh::crypto
