#pragma once

#include <string>

enum class MessageType {
    HANDSHAKE,
    HEARTBEAT,
    VOLUME_SYNC,
    DISCONNECT,
    DISCOVERY_TOKEN,
    TOKEN_ACK,
    AUDIO_STREAM,       // Recognised on the wire, carried by the audio layer
    PAIRING_REQUEST,
    PAIRING_ACCEPT,
    PAIRING_REJECT,
    DEVICE_INFO,
    UNKNOWN             // Any tag this build does not know
};

const char* message_type_to_string(MessageType type);
MessageType message_type_from_string(const std::string& tag);
