#ifndef PAIRING_PROTOCOL_H
#define PAIRING_PROTOCOL_H

#include "peer.h"
#include "peer_registry.h"
#include "paired_device_store.h"
#include "event_loop.h"
#include "message_sender.h"
#include "engine_notification.h"
#include "wire_codec.h"

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

// =======================================================
// Pairing FSM input events
// =======================================================
enum class PairingEvent {
    REQUEST_SENT,
    REQUEST_RECEIVED,
    ACCEPTED,
    REJECTED,
    TIMEOUT,
    PEER_DISCONNECTED,
    UNPAIR
};

// =======================================================
// Pairing State Machine (PURE LOGIC ONLY)
// =======================================================
class PairingStateMachine {
public:
    // Returns the next state, or nullopt when the transition is illegal.
    static std::optional<PairingState> compute_transition(PairingState current, PairingEvent event);

    // Logs the step; illegal transitions are logged and leave the state unchanged.
    PairingState handle_event(const std::string& peer_id, PairingState current, PairingEvent event) const;

    static const char* event_to_string(PairingEvent event);
};

struct PairingOptions {
    std::string local_id;
    std::string local_name;
    std::chrono::milliseconds request_timeout{30000};
};

/**
 * @brief Per-peer pairing handshake: request, accept/reject, timeout, unpair.
 *
 * At most one inbound request is surfaced at a time; later ones are dropped
 * until it resolves. Completed pairings are persisted through the store.
 */
class PairingProtocol {
public:
    PairingProtocol(PeerRegistry& registry,
                    IPairedDeviceStore& store,
                    EventLoop& loop,
                    IMessageSender& sender,
                    NotificationQueue& notifications,
                    const Clock& clock,
                    PairingOptions options);

    // Reads the persisted list and rehydrates the registry.
    void loadPersisted();

    bool requestPairing(const std::string& peer_id, std::string* error = nullptr);
    bool acceptPairing(const std::string& peer_id, std::string* error = nullptr);
    bool rejectPairing(const std::string& peer_id, std::string* error = nullptr);
    bool unpair(const std::string& peer_id, std::string* error = nullptr);

    // Inbound pairingRequest / pairingAccept / pairingReject / disconnect
    void handleMessage(const std::string& from, const wire::ProtocolMessage& message);
    void handleTimeout(const std::string& peer_id);
    void handlePeerConnected(const std::string& peer_id);
    // Must run before the registry drops the peer.
    void handlePeerDisconnected(const std::string& peer_id);

    // Leaving pairing mode declines the surfaced inbound request.
    void setPairingMode(bool enabled);
    bool isInPairingMode() const { return m_pairing_mode; }

    std::optional<std::string> pendingInboundRequest() const { return m_inbound; }
    bool isOutgoingPending(const std::string& peer_id) const { return m_outgoing.count(peer_id) > 0; }
    std::vector<PairedDevice> pairedDevices() const;
    std::optional<PairedDevice> pairedDevice(const std::string& peer_id) const;

    static std::string timerId(const std::string& peer_id) { return "pairing-timeout:" + peer_id; }

private:
    PairingState stateOf(const std::string& peer_id) const;
    bool apply(const std::string& peer_id, PairingEvent event);
    void completePairing(const std::string& peer_id);
    void dropPairing(const std::string& peer_id);
    void resolvePending(const std::string& peer_id);
    bool persist(std::string* error = nullptr);

    void onRequest(const std::string& from, const wire::ProtocolMessage& message);
    void onAccept(const std::string& from, const wire::ProtocolMessage& message);
    void onReject(const std::string& from);
    void onDisconnectNotice(const std::string& from);

    PeerRegistry& m_registry;
    IPairedDeviceStore& m_store;
    EventLoop& m_loop;
    IMessageSender& m_sender;
    NotificationQueue& m_notifications;
    const Clock& m_clock;
    PairingOptions m_options;
    PairingStateMachine m_fsm;

    std::map<std::string, PairedDevice> m_paired;
    std::optional<std::string> m_inbound;       // surfaced inbound request
    std::set<std::string> m_outgoing;           // peers we asked
    bool m_pairing_mode = false;
};

#endif // PAIRING_PROTOCOL_H
