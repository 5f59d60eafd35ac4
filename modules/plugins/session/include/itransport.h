#ifndef ITRANSPORT_H
#define ITRANSPORT_H

#include "peer.h"

#include <functional>
#include <optional>
#include <string>

struct TransportCallbacks {
    std::function<void(const std::string& peer_id, const std::string& display_name,
                       std::optional<int> rssi, bool compatible)> on_peer_found;
    std::function<void(const std::string& peer_id)> on_peer_lost;
    std::function<void(const std::string& peer_id, ConnectionState state,
                       const std::string& display_name)> on_connection_state;
    std::function<void(const std::string& peer_id, const std::string& data)> on_data;
};

// Mesh transport boundary: discovery, connection events and opaque bytes.
// Callbacks may fire on any thread.
class ITransport {
public:
    virtual ~ITransport() = default;

    virtual bool startDiscovery(TransportCallbacks callbacks, std::string* error) = 0;
    virtual void stopDiscovery() = 0;
    virtual bool send(const std::string& peer_id, const std::string& data, std::string* error) = 0;
    virtual bool broadcast(const std::string& data, std::string* error) = 0;
};

#endif // ITRANSPORT_H
