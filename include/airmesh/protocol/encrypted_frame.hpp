#pragma once

#include "airmesh/protocol/wire.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace airmesh::protocol {

inline constexpr uint8_t ENCRYPTED_FRAME_VERSION = 1;

// version(1) + message number(8) + timestamp(8)
inline constexpr size_t ENCRYPTED_FRAME_AUTH_HEADER_SIZE = 17;

// Authenticated header plus the 2-byte HMAC length
inline constexpr size_t ENCRYPTED_FRAME_MIN_SIZE = 19;

// Envelope produced by the session cipher. Integers are big-endian:
//   version:u8, message_number:u64, timestamp:u64, hmac_len:u16, hmac, ciphertext
struct EncryptedFrame {
    uint64_t message_number = 0;
    uint64_t timestamp = 0;  // seconds since the Unix epoch
    std::vector<uint8_t> hmac;
    std::vector<uint8_t> ciphertext;

    static util::Result<EncryptedFrame, DecodeError> parse(std::span<const uint8_t> data);
    std::vector<uint8_t> serialize() const;

    // Bytes bound into both the AEAD and the HMAC
    std::array<uint8_t, ENCRYPTED_FRAME_AUTH_HEADER_SIZE> auth_header() const;

    bool operator==(const EncryptedFrame&) const = default;
};

} // namespace airmesh::protocol
