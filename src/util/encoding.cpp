#include "airmesh/util/encoding.hpp"
#include <sodium.h>

namespace airmesh::util {

std::string base64_encode(std::span<const uint8_t> data) {
    size_t encoded_len = sodium_base64_encoded_len(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string result(encoded_len, '\0');

    sodium_bin2base64(
        result.data(), encoded_len,
        data.data(), data.size(),
        sodium_base64_VARIANT_ORIGINAL
    );

    // Drop the terminator libsodium writes
    while (!result.empty() && result.back() == '\0') {
        result.pop_back();
    }

    return result;
}

std::optional<std::vector<uint8_t>> base64_decode(std::string_view encoded) {
    if (encoded.empty()) {
        return std::vector<uint8_t>{};
    }

    size_t max_decoded_len = encoded.size() * 3 / 4 + 1;
    std::vector<uint8_t> result(max_decoded_len);
    size_t actual_len = 0;

    if (sodium_base642bin(
            result.data(), max_decoded_len,
            encoded.data(), encoded.size(),
            " \t\r\n",  // tolerate whitespace from pasted keys
            &actual_len,
            nullptr,
            sodium_base64_VARIANT_ORIGINAL
        ) != 0) {
        return std::nullopt;
    }

    result.resize(actual_len);
    return result;
}

std::string to_hex(std::span<const uint8_t> data, size_t max_bytes) {
    if (max_bytes != 0 && data.size() > max_bytes) {
        data = data.first(max_bytes);
    }

    std::string hex(data.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), data.data(), data.size());
    hex.pop_back();
    return hex;
}

} // namespace airmesh::util
