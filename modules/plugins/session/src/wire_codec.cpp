#include "wire_codec.h"

#include <nlohmann/json.hpp>
#include <sodium.h>

using json = nlohmann::json;

namespace {
    struct TagEntry {
        MessageType type;
        const char* tag;
    };

    constexpr TagEntry kTags[] = {
        {MessageType::HANDSHAKE, "handshake"},
        {MessageType::HEARTBEAT, "heartbeat"},
        {MessageType::VOLUME_SYNC, "volumeSync"},
        {MessageType::DISCONNECT, "disconnect"},
        {MessageType::DISCOVERY_TOKEN, "discoveryToken"},
        {MessageType::TOKEN_ACK, "tokenAck"},
        {MessageType::AUDIO_STREAM, "audioStream"},
        {MessageType::PAIRING_REQUEST, "pairingRequest"},
        {MessageType::PAIRING_ACCEPT, "pairingAccept"},
        {MessageType::PAIRING_REJECT, "pairingReject"},
        {MessageType::DEVICE_INFO, "deviceInfo"},
    };

    bool fail(std::string* error, const std::string& msg) {
        if (error) *error = msg;
        return false;
    }
}

const char* message_type_to_string(MessageType type) {
    for (const auto& entry : kTags) {
        if (entry.type == type) return entry.tag;
    }
    return "unknown";
}

MessageType message_type_from_string(const std::string& tag) {
    for (const auto& entry : kTags) {
        if (tag == entry.tag) return entry.type;
    }
    return MessageType::UNKNOWN;
}

namespace wire {

std::string ProtocolMessage::field(const std::string& key) const {
    auto it = payload.find(key);
    return it == payload.end() ? std::string() : it->second;
}

ProtocolMessage make_message(MessageType type, double timestamp, std::map<std::string, std::string> payload) {
    ProtocolMessage msg;
    msg.type = type;
    msg.type_tag = message_type_to_string(type);
    msg.timestamp = timestamp;
    msg.payload = std::move(payload);
    return msg;
}

std::string encode_message(const ProtocolMessage& message) {
    json j;
    j["type"] = message.type == MessageType::UNKNOWN && !message.type_tag.empty()
                    ? message.type_tag
                    : std::string(message_type_to_string(message.type));
    j["timestamp"] = message.timestamp;
    j["payload"] = json::object();
    for (const auto& kv : message.payload) {
        j["payload"][kv.first] = kv.second;
    }
    return j.dump();
}

bool decode_message(const std::string& data, ProtocolMessage& out, std::string* error) {
    if (data.empty()) {
        return fail(error, "empty frame");
    }
    if (data.size() > kMaxMessageSize) {
        return fail(error, "frame too large: " + std::to_string(data.size()));
    }

    json j = json::parse(data, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return fail(error, "frame is not a JSON object");
    }

    auto type_it = j.find("type");
    if (type_it == j.end() || !type_it->is_string()) {
        return fail(error, "missing type");
    }

    ProtocolMessage msg;
    msg.type_tag = type_it->get<std::string>();
    msg.type = message_type_from_string(msg.type_tag);

    auto ts_it = j.find("timestamp");
    if (ts_it != j.end()) {
        if (!ts_it->is_number()) {
            return fail(error, "timestamp is not a number");
        }
        msg.timestamp = ts_it->get<double>();
    }

    auto payload_it = j.find("payload");
    if (payload_it != j.end() && !payload_it->is_null()) {
        if (!payload_it->is_object()) {
            return fail(error, "payload is not an object");
        }
        for (auto it = payload_it->begin(); it != payload_it->end(); ++it) {
            if (!it.value().is_string()) {
                return fail(error, "payload value for '" + it.key() + "' is not a string");
            }
            msg.payload[it.key()] = it.value().get<std::string>();
        }
    }

    out = std::move(msg);
    return true;
}

std::string encode_base64(const std::string& bytes) {
    const size_t encoded_len = sodium_base64_ENCODED_LEN(bytes.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string out(encoded_len, '\0');
    sodium_bin2base64(&out[0], out.size(),
                      reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size(),
                      sodium_base64_VARIANT_ORIGINAL);
    // encoded_len counts the terminating NUL
    out.resize(encoded_len - 1);
    return out;
}

bool decode_base64(const std::string& text, std::string& bytes) {
    if (text.empty()) {
        return false;
    }
    std::string out(text.size() / 4 * 3 + 3, '\0');
    size_t bin_len = 0;
    if (sodium_base642bin(reinterpret_cast<unsigned char*>(&out[0]), out.size(),
                          text.data(), text.size(),
                          nullptr, &bin_len, nullptr,
                          sodium_base64_VARIANT_ORIGINAL) != 0) {
        return false;
    }
    out.resize(bin_len);
    bytes = std::move(out);
    return true;
}

} // namespace wire
