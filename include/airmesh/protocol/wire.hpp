#pragma once

#include "airmesh/util/result.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace airmesh::protocol {

inline constexpr uint8_t PROTOCOL_VERSION = 1;

// version + type
inline constexpr size_t FRAME_HEADER_SIZE = 2;

// Length-prefixed strings carry at most 255 bytes; longer ones are truncated
// on encode at the last whole UTF-8 character
inline constexpr size_t MAX_SHORT_FIELD = 255;

// Public keys use a 2-byte length prefix
inline constexpr size_t MAX_KEY_FIELD = 65535;

enum class MessageType : uint8_t {
    Signal = 1,
    Emergency = 2,
    Chat = 3,
    System = 4,
    KeyExchange = 5,
    Game = 6,
    Topology = 7,
    KeyExchangeResponse = 8
};

std::optional<MessageType> message_type_from_byte(uint8_t value);
std::string_view to_string(MessageType type);

enum class DecodeError {
    Truncated,
    UnsupportedVersion,
    InvalidField
};

std::string_view to_string(DecodeError error);

enum class KeyExchangeStatus : uint8_t {
    Success = 0,
    AlreadyEstablished = 1,
    Error = 2
};

std::string_view to_string(KeyExchangeStatus status);

// Key exchange request (type 5)
struct KeyExchangeRequest {
    uint8_t retry_count = 0;
    uint32_t timestamp = 0;
    std::string sender_id;
    std::vector<uint8_t> public_key;

    static util::Result<KeyExchangeRequest, DecodeError> parse(std::span<const uint8_t> payload);
    std::vector<uint8_t> serialize() const;

    bool operator==(const KeyExchangeRequest&) const = default;
};

// Key exchange response (type 8)
struct KeyExchangeResponse {
    KeyExchangeStatus status = KeyExchangeStatus::Success;
    uint32_t timestamp = 0;
    std::string sender_id;
    std::vector<uint8_t> public_key;
    std::optional<std::string> error_message;

    static util::Result<KeyExchangeResponse, DecodeError> parse(std::span<const uint8_t> payload);
    std::vector<uint8_t> serialize() const;

    bool operator==(const KeyExchangeResponse&) const = default;
};

// Signal, emergency, chat, system, game and topology payloads are opaque
// here; their consumers decode them
struct FeaturePayload {
    MessageType type = MessageType::Chat;
    std::vector<uint8_t> data;

    bool operator==(const FeaturePayload&) const = default;
};

// A type tag this build does not know; kept so it can be logged
struct UnrecognizedPayload {
    uint8_t raw_type = 0;
    std::vector<uint8_t> data;

    bool operator==(const UnrecognizedPayload&) const = default;
};

using WirePayload = std::variant<
    KeyExchangeRequest,
    KeyExchangeResponse,
    FeaturePayload,
    UnrecognizedPayload
>;

struct WireMessage {
    uint8_t version = PROTOCOL_VERSION;
    WirePayload payload;

    // Raw tag byte written at offset 1
    uint8_t type_byte() const;

    // nullopt for unrecognized tags
    std::optional<MessageType> type() const;

    bool operator==(const WireMessage&) const = default;
};

WireMessage make_feature_message(MessageType type, std::span<const uint8_t> data);

// Throws std::length_error if a public key exceeds MAX_KEY_FIELD bytes
std::vector<uint8_t> encode(const WireMessage& message);

// Never throws on malformed input
util::Result<WireMessage, DecodeError> decode(std::span<const uint8_t> bytes);

} // namespace airmesh::protocol
