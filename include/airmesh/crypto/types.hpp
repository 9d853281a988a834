#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <vector>
#include <cstring>

namespace airmesh::crypto {

inline constexpr size_t KEY_SIZE = 32;    // X25519 and ChaCha20 keys
inline constexpr size_t NONCE_SIZE = 12;  // ChaCha20-Poly1305 IETF nonce
inline constexpr size_t TAG_SIZE = 16;    // Poly1305 tag
inline constexpr size_t MAC_SIZE = 32;    // HMAC-SHA256 output

// Fixed-size key material that is wiped on destruction and when moved from
template<size_t N>
class SecureArray {
public:
    SecureArray() { std::memset(data_.data(), 0, N); }

    ~SecureArray() { clear(); }

    SecureArray(const SecureArray& other) {
        std::memcpy(data_.data(), other.data_.data(), N);
    }

    SecureArray& operator=(const SecureArray& other) {
        if (this != &other) {
            std::memcpy(data_.data(), other.data_.data(), N);
        }
        return *this;
    }

    SecureArray(SecureArray&& other) noexcept {
        std::memcpy(data_.data(), other.data_.data(), N);
        other.clear();
    }

    SecureArray& operator=(SecureArray&& other) noexcept {
        if (this != &other) {
            std::memcpy(data_.data(), other.data_.data(), N);
            other.clear();
        }
        return *this;
    }

    // Copies exactly N bytes; returns false when the input has another length
    static bool from_bytes(std::span<const uint8_t> bytes, SecureArray& out) {
        if (bytes.size() != N) return false;
        std::memcpy(out.data_.data(), bytes.data(), N);
        return true;
    }

    void clear() {
        volatile uint8_t* p = data_.data();
        for (size_t i = 0; i < N; ++i) {
            p[i] = 0;
        }
    }

    bool is_zero() const {
        uint8_t acc = 0;
        for (size_t i = 0; i < N; ++i) {
            acc |= data_[i];
        }
        return acc == 0;
    }

    uint8_t* data() { return data_.data(); }
    const uint8_t* data() const { return data_.data(); }

    static constexpr size_t size() { return N; }

    uint8_t& operator[](size_t i) { return data_[i]; }
    const uint8_t& operator[](size_t i) const { return data_[i]; }

    std::span<uint8_t> span() { return {data_.data(), N}; }
    std::span<const uint8_t> span() const { return {data_.data(), N}; }

    std::vector<uint8_t> to_vector() const { return {data_.begin(), data_.end()}; }

    bool operator==(const SecureArray& other) const {
        return std::memcmp(data_.data(), other.data_.data(), N) == 0;
    }

    bool operator!=(const SecureArray& other) const {
        return !(*this == other);
    }

    // Lexicographic order, used to agree on roles between two public keys
    bool operator<(const SecureArray& other) const {
        return std::memcmp(data_.data(), other.data_.data(), N) < 0;
    }

private:
    std::array<uint8_t, N> data_;
};

using PrivateKey = SecureArray<KEY_SIZE>;
using PublicKey = SecureArray<KEY_SIZE>;
using SharedSecret = SecureArray<KEY_SIZE>;
using SymmetricKey = SecureArray<KEY_SIZE>;
using Mac = SecureArray<MAC_SIZE>;
using Nonce = std::array<uint8_t, NONCE_SIZE>;

// Message counter used to build AEAD nonces
using Counter = uint64_t;

} // namespace airmesh::crypto
