#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <span>
#include <cstdint>

namespace airmesh::util {

// Encode binary data to standard (padded) base64
std::string base64_encode(std::span<const uint8_t> data);

// Decode base64 string to binary data
// Returns nullopt if the input is not valid base64
std::optional<std::vector<uint8_t>> base64_decode(std::string_view encoded);

// Lowercase hex of the first max_bytes bytes (all bytes when max_bytes is 0)
std::string to_hex(std::span<const uint8_t> data, size_t max_bytes = 0);

// Short printable fingerprint for public keys in log lines
inline std::string fingerprint(std::span<const uint8_t> key) {
    return to_hex(key, 4);
}

} // namespace airmesh::util
