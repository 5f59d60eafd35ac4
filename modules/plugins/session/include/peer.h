#ifndef PEER_H
#define PEER_H

#include "distance_estimator.h"
#include "ranging_source.h"

#include <chrono>
#include <optional>
#include <string>

enum class ConnectionState {
    DISCONNECTED,
    CONNECTING,
    CONNECTED
};

enum class PairingState {
    NONE,
    PENDING,
    PAIRED
};

struct Peer {
    std::string id;
    std::string display_name;
    ConnectionState connection_state = ConnectionState::DISCONNECTED;
    PairingState pairing_state = PairingState::NONE;
    RangingSourceType provider_type = RangingSourceType::SIGNAL_STRENGTH;
    double distance = 0.0;
    DistanceLevel distance_level = DistanceLevel::UNKNOWN;
    double volume = 1.0;
    int raw_signal_strength = 0;            // dBm, meaningful for SIGNAL_STRENGTH
    std::chrono::steady_clock::time_point last_seen;
    bool compatible = false;                // advertises as a compatible app instance
    bool in_pairing_mode = false;           // from the peer's last deviceInfo
    bool selected = false;

    bool isConnected() const { return connection_state == ConnectionState::CONNECTED; }
    bool isPaired() const { return pairing_state == PairingState::PAIRED; }
    // Connected or paired peers are "active", everything else is merely discoverable.
    bool isActive() const { return isConnected() || isPaired(); }
};

// Persisted record of a completed pairing.
struct PairedDevice {
    std::string id;
    std::string name;
    double paired_at = 0.0;                 // seconds since epoch
    std::optional<double> last_connected;
};

const char* connection_state_to_string(ConnectionState state);
const char* pairing_state_to_string(PairingState state);

#endif // PEER_H
