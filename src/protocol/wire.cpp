#include "airmesh/protocol/wire.hpp"
#include <stdexcept>
#include <type_traits>

namespace airmesh::protocol {

namespace {

template<typename T>
void write_le(std::vector<uint8_t>& out, T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
        out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

void write_short_string(std::vector<uint8_t>& out, std::string_view value) {
    if (value.size() > MAX_SHORT_FIELD) {
        // Back off to a UTF-8 lead byte so no character is split
        size_t cut = MAX_SHORT_FIELD;
        while (cut > 0 && (static_cast<uint8_t>(value[cut]) & 0xC0) == 0x80) {
            --cut;
        }
        value = value.substr(0, cut);
    }
    out.push_back(static_cast<uint8_t>(value.size()));
    out.insert(out.end(), value.begin(), value.end());
}

void write_key(std::vector<uint8_t>& out, const std::vector<uint8_t>& key) {
    if (key.size() > MAX_KEY_FIELD) {
        throw std::length_error("public key does not fit a 16-bit length prefix");
    }
    write_le(out, static_cast<uint16_t>(key.size()));
    out.insert(out.end(), key.begin(), key.end());
}

// Bounds-checked cursor over a payload
class Reader {
public:
    explicit Reader(std::span<const uint8_t> data) : data_(data) {}

    bool at_end() const { return offset_ == data_.size(); }

    template<typename T>
    bool read_le(T& value) {
        if (data_.size() - offset_ < sizeof(T)) return false;
        value = 0;
        for (size_t i = 0; i < sizeof(T); ++i) {
            value |= static_cast<T>(data_[offset_ + i]) << (8 * i);
        }
        offset_ += sizeof(T);
        return true;
    }

    bool read_bytes(size_t count, std::vector<uint8_t>& out) {
        if (data_.size() - offset_ < count) return false;
        out.assign(data_.begin() + offset_, data_.begin() + offset_ + count);
        offset_ += count;
        return true;
    }

    bool read_short_string(std::string& out) {
        uint8_t len = 0;
        std::vector<uint8_t> bytes;
        if (!read_le(len) || !read_bytes(len, bytes)) return false;
        out.assign(bytes.begin(), bytes.end());
        return true;
    }

    bool read_key(std::vector<uint8_t>& out) {
        uint16_t len = 0;
        return read_le(len) && read_bytes(len, out);
    }

private:
    std::span<const uint8_t> data_;
    size_t offset_ = 0;
};

} // anonymous namespace

std::optional<MessageType> message_type_from_byte(uint8_t value) {
    if (value >= static_cast<uint8_t>(MessageType::Signal) &&
        value <= static_cast<uint8_t>(MessageType::KeyExchangeResponse)) {
        return static_cast<MessageType>(value);
    }
    return std::nullopt;
}

std::string_view to_string(MessageType type) {
    switch (type) {
        case MessageType::Signal: return "signal";
        case MessageType::Emergency: return "emergency";
        case MessageType::Chat: return "chat";
        case MessageType::System: return "system";
        case MessageType::KeyExchange: return "keyExchange";
        case MessageType::Game: return "game";
        case MessageType::Topology: return "topology";
        case MessageType::KeyExchangeResponse: return "keyExchangeResponse";
    }
    return "unknown";
}

std::string_view to_string(DecodeError error) {
    switch (error) {
        case DecodeError::Truncated: return "truncated";
        case DecodeError::UnsupportedVersion: return "unsupported version";
        case DecodeError::InvalidField: return "invalid field";
    }
    return "unknown";
}

std::string_view to_string(KeyExchangeStatus status) {
    switch (status) {
        case KeyExchangeStatus::Success: return "success";
        case KeyExchangeStatus::AlreadyEstablished: return "alreadyEstablished";
        case KeyExchangeStatus::Error: return "error";
    }
    return "unknown";
}

// KeyExchangeRequest

util::Result<KeyExchangeRequest, DecodeError> KeyExchangeRequest::parse(std::span<const uint8_t> payload) {
    using R = util::Result<KeyExchangeRequest, DecodeError>;

    Reader reader(payload);
    KeyExchangeRequest msg;
    if (!reader.read_le(msg.retry_count) ||
        !reader.read_le(msg.timestamp) ||
        !reader.read_short_string(msg.sender_id) ||
        !reader.read_key(msg.public_key)) {
        return R::err(DecodeError::Truncated);
    }
    return R::ok(std::move(msg));
}

std::vector<uint8_t> KeyExchangeRequest::serialize() const {
    std::vector<uint8_t> out;
    out.reserve(8 + sender_id.size() + public_key.size());
    out.push_back(retry_count);
    write_le(out, timestamp);
    write_short_string(out, sender_id);
    write_key(out, public_key);
    return out;
}

// KeyExchangeResponse

util::Result<KeyExchangeResponse, DecodeError> KeyExchangeResponse::parse(std::span<const uint8_t> payload) {
    using R = util::Result<KeyExchangeResponse, DecodeError>;

    Reader reader(payload);
    KeyExchangeResponse msg;

    uint8_t status = 0;
    if (!reader.read_le(status) ||
        !reader.read_le(msg.timestamp) ||
        !reader.read_short_string(msg.sender_id) ||
        !reader.read_key(msg.public_key)) {
        return R::err(DecodeError::Truncated);
    }

    if (status > static_cast<uint8_t>(KeyExchangeStatus::Error)) {
        return R::err(DecodeError::InvalidField);
    }
    msg.status = static_cast<KeyExchangeStatus>(status);

    // Older senders omit the error field entirely
    if (!reader.at_end()) {
        std::string error;
        if (!reader.read_short_string(error)) {
            return R::err(DecodeError::Truncated);
        }
        if (!error.empty()) {
            msg.error_message = std::move(error);
        }
    }

    return R::ok(std::move(msg));
}

std::vector<uint8_t> KeyExchangeResponse::serialize() const {
    std::vector<uint8_t> out;
    out.reserve(10 + sender_id.size() + public_key.size());
    out.push_back(static_cast<uint8_t>(status));
    write_le(out, timestamp);
    write_short_string(out, sender_id);
    write_key(out, public_key);
    write_short_string(out, error_message.value_or(std::string{}));
    return out;
}

// WireMessage

uint8_t WireMessage::type_byte() const {
    return std::visit([](const auto& p) -> uint8_t {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, KeyExchangeRequest>) {
            return static_cast<uint8_t>(MessageType::KeyExchange);
        } else if constexpr (std::is_same_v<T, KeyExchangeResponse>) {
            return static_cast<uint8_t>(MessageType::KeyExchangeResponse);
        } else if constexpr (std::is_same_v<T, FeaturePayload>) {
            return static_cast<uint8_t>(p.type);
        } else {
            return p.raw_type;
        }
    }, payload);
}

std::optional<MessageType> WireMessage::type() const {
    if (std::holds_alternative<UnrecognizedPayload>(payload)) {
        return std::nullopt;
    }
    return static_cast<MessageType>(type_byte());
}

WireMessage make_feature_message(MessageType type, std::span<const uint8_t> data) {
    return WireMessage{PROTOCOL_VERSION, FeaturePayload{type, {data.begin(), data.end()}}};
}

std::vector<uint8_t> encode(const WireMessage& message) {
    std::vector<uint8_t> out{message.version, message.type_byte()};

    std::visit([&out](const auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, KeyExchangeRequest> ||
                      std::is_same_v<T, KeyExchangeResponse>) {
            auto body = p.serialize();
            out.insert(out.end(), body.begin(), body.end());
        } else {
            out.insert(out.end(), p.data.begin(), p.data.end());
        }
    }, message.payload);

    return out;
}

util::Result<WireMessage, DecodeError> decode(std::span<const uint8_t> bytes) {
    using R = util::Result<WireMessage, DecodeError>;

    if (bytes.size() < FRAME_HEADER_SIZE) {
        return R::err(DecodeError::Truncated);
    }
    if (bytes[0] != PROTOCOL_VERSION) {
        return R::err(DecodeError::UnsupportedVersion);
    }

    const uint8_t raw_type = bytes[1];
    auto body = bytes.subspan(FRAME_HEADER_SIZE);

    auto type = message_type_from_byte(raw_type);
    if (!type) {
        return R::ok(WireMessage{bytes[0], UnrecognizedPayload{raw_type, {body.begin(), body.end()}}});
    }

    switch (*type) {
        case MessageType::KeyExchange: {
            auto request = KeyExchangeRequest::parse(body);
            if (!request) return R::err(request.error());
            return R::ok(WireMessage{bytes[0], std::move(request).value()});
        }
        case MessageType::KeyExchangeResponse: {
            auto response = KeyExchangeResponse::parse(body);
            if (!response) return R::err(response.error());
            return R::ok(WireMessage{bytes[0], std::move(response).value()});
        }
        default:
            return R::ok(WireMessage{bytes[0], FeaturePayload{*type, {body.begin(), body.end()}}});
    }
}

} // namespace airmesh::protocol
