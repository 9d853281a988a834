#include "airmesh/protocol/encrypted_frame.hpp"
#include <algorithm>
#include <stdexcept>

namespace airmesh::protocol {

namespace {

template<typename T>
T read_be(const uint8_t* data) {
    T result = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        result = static_cast<T>((result << 8) | data[i]);
    }
    return result;
}

template<typename T>
void write_be(uint8_t* data, T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
        data[sizeof(T) - 1 - i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
    }
}

} // anonymous namespace

util::Result<EncryptedFrame, DecodeError> EncryptedFrame::parse(std::span<const uint8_t> data) {
    using R = util::Result<EncryptedFrame, DecodeError>;

    if (data.size() < ENCRYPTED_FRAME_MIN_SIZE) {
        return R::err(DecodeError::Truncated);
    }
    if (data[0] != ENCRYPTED_FRAME_VERSION) {
        return R::err(DecodeError::UnsupportedVersion);
    }

    EncryptedFrame frame;
    frame.message_number = read_be<uint64_t>(&data[1]);
    frame.timestamp = read_be<uint64_t>(&data[9]);
    const uint16_t hmac_len = read_be<uint16_t>(&data[17]);

    if (data.size() - ENCRYPTED_FRAME_MIN_SIZE < hmac_len) {
        return R::err(DecodeError::Truncated);
    }

    auto hmac_begin = data.begin() + ENCRYPTED_FRAME_MIN_SIZE;
    frame.hmac.assign(hmac_begin, hmac_begin + hmac_len);
    frame.ciphertext.assign(hmac_begin + hmac_len, data.end());
    return R::ok(std::move(frame));
}

std::vector<uint8_t> EncryptedFrame::serialize() const {
    if (hmac.size() > 0xFFFF) {
        throw std::length_error("HMAC does not fit a 16-bit length prefix");
    }

    std::vector<uint8_t> out(ENCRYPTED_FRAME_MIN_SIZE);
    auto header = auth_header();
    std::copy(header.begin(), header.end(), out.begin());
    write_be(&out[17], static_cast<uint16_t>(hmac.size()));

    out.insert(out.end(), hmac.begin(), hmac.end());
    out.insert(out.end(), ciphertext.begin(), ciphertext.end());
    return out;
}

std::array<uint8_t, ENCRYPTED_FRAME_AUTH_HEADER_SIZE> EncryptedFrame::auth_header() const {
    std::array<uint8_t, ENCRYPTED_FRAME_AUTH_HEADER_SIZE> header{};
    header[0] = ENCRYPTED_FRAME_VERSION;
    write_be(&header[1], message_number);
    write_be(&header[9], timestamp);
    return header;
}

} // namespace airmesh::protocol
