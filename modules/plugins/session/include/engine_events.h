#ifndef ENGINE_EVENTS_H
#define ENGINE_EVENTS_H

#include "ranging_source.h"

#include <chrono>
#include <optional>
#include <string>
#include <variant>

// --- Event for when discovery sees a peer (or sees it again) ---
struct PeerFoundEvent {
    std::string peer_id;
    std::string display_name;
    std::optional<int> rssi;
    bool compatible = false;
};

// --- Event for when discovery stops seeing a peer ---
struct PeerLostEvent {
    std::string peer_id;
};

// --- Event for a transport connection attempt in progress ---
struct PeerConnectingEvent {
    std::string peer_id;
};

// --- Event for an established transport connection ---
struct PeerConnectedEvent {
    std::string peer_id;
    std::string display_name;
};

// --- Event for when a peer's connection is lost ---
struct PeerDisconnectedEvent {
    std::string peer_id;
};

// --- Event for when data is received from a peer ---
struct DataReceivedEvent {
    std::string peer_id;
    std::string data;
};

// --- Event for a distance reading from a ranging source ---
struct RangingSampleEvent {
    RangingSourceType source = RangingSourceType::SIGNAL_STRENGTH;
    std::string peer_id;        // empty: attribute to the primary peer
    double value = 0.0;
};

// --- Event for a ranging source that stopped working ---
struct RangingInvalidatedEvent {
    RangingSourceType source = RangingSourceType::PRECISE;
    std::string reason;
};

// --- Event for the local precise-ranging token becoming available ---
struct LocalTokenReadyEvent {
    std::string token;
};

// --- Timer events ---
struct PairingTimeoutEvent {
    std::string peer_id;
};

struct TokenExchangeTimeoutEvent {
    std::string peer_id;
};

struct StalePurgeEvent {};

struct HeartbeatEvent {};

using EngineEvent = std::variant<
    PeerFoundEvent,
    PeerLostEvent,
    PeerConnectingEvent,
    PeerConnectedEvent,
    PeerDisconnectedEvent,
    DataReceivedEvent,
    RangingSampleEvent,
    RangingInvalidatedEvent,
    LocalTokenReadyEvent,
    PairingTimeoutEvent,
    TokenExchangeTimeoutEvent,
    StalePurgeEvent,
    HeartbeatEvent
>;

#endif // ENGINE_EVENTS_H
