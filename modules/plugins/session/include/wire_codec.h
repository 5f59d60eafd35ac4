#pragma once

#include "message_types.h"

#include <cstddef>
#include <map>
#include <string>

namespace wire {

// Upper bound on an inbound frame; larger frames are dropped before parsing.
inline constexpr size_t kMaxMessageSize = 64u * 1024u;

struct ProtocolMessage {
    MessageType type = MessageType::UNKNOWN;
    std::string type_tag;                       // tag as seen on the wire
    double timestamp = 0.0;                     // seconds since epoch
    std::map<std::string, std::string> payload;

    // Empty string when the key is absent.
    std::string field(const std::string& key) const;
};

// JSON object: {"type": "...", "timestamp": <seconds>, "payload": {string: string}}
std::string encode_message(const ProtocolMessage& message);

// Returns false for malformed or oversized input. Unknown type tags decode
// successfully with type == MessageType::UNKNOWN.
bool decode_message(const std::string& data, ProtocolMessage& out, std::string* error = nullptr);

ProtocolMessage make_message(MessageType type, double timestamp,
                             std::map<std::string, std::string> payload = {});

// Binary tokens travel as standard base64.
std::string encode_base64(const std::string& bytes);
bool decode_base64(const std::string& text, std::string& bytes);

} // namespace wire
