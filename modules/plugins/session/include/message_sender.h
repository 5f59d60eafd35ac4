#ifndef MESSAGE_SENDER_H
#define MESSAGE_SENDER_H

#include "wire_codec.h"

#include <string>

// Outbound path used by the protocol handlers; the engine encodes and hands
// the frame to the transport.
class IMessageSender {
public:
    virtual ~IMessageSender() = default;

    virtual bool sendMessage(const std::string& peer_id, MessageType type,
                             std::map<std::string, std::string> payload,
                             std::string* error = nullptr) = 0;
};

#endif // MESSAGE_SENDER_H
