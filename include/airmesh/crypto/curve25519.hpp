#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace airmesh::crypto {

// X25519 key pair; used both for the long-lived device identity and for
// the per-handshake ephemeral keys
class X25519KeyPair {
public:
    static X25519KeyPair generate();

    // Derives the public key from an existing private key
    static X25519KeyPair from_private_key(const PrivateKey& private_key);

    // Loads a base64-encoded 32-byte private key
    static std::optional<X25519KeyPair> from_base64(std::string_view base64_private);

    const PrivateKey& private_key() const { return private_key_; }
    const PublicKey& public_key() const { return public_key_; }

    std::string private_key_base64() const;
    std::string public_key_base64() const;

    X25519KeyPair() = default;

private:
    PrivateKey private_key_;
    PublicKey public_key_;
};

// X25519 Diffie-Hellman. Returns nullopt when the peer key is a low-order
// point, which would otherwise yield an all-zero shared secret
std::optional<SharedSecret> x25519(const PrivateKey& private_key, const PublicKey& public_key);

} // namespace airmesh::crypto
