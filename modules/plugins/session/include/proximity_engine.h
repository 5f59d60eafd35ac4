#ifndef PROXIMITY_ENGINE_H
#define PROXIMITY_ENGINE_H

#include "app_state_machine.h"
#include "clock.h"
#include "engine_config.h"
#include "engine_events.h"
#include "engine_notification.h"
#include "event_loop.h"
#include "itransport.h"
#include "message_sender.h"
#include "paired_device_store.h"
#include "pairing_protocol.h"
#include "peer_registry.h"
#include "ranging_provider.h"
#include "token_exchange.h"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Composition root of the proximity and pairing engine.
 *
 * Owns the event loop, registry, ranging provider and protocol state
 * machines. Collaborators are injected and must outlive the engine.
 *
 * Threading: transport and ranging callbacks only enqueue events. Event
 * handling and public commands are serialized by one state mutex, and
 * notifications go to the sink after that mutex is released.
 */
class ProximityEngine : private IMessageSender {
public:
    // Throws std::invalid_argument when config does not validate.
    ProximityEngine(EngineConfig config,
                    const Clock& clock,
                    ITransport& transport,
                    IRangingSource* precise_source,
                    IRangingSource* fallback_source,
                    IPairedDeviceStore& store);
    ~ProximityEngine() override;

    ProximityEngine(const ProximityEngine&) = delete;
    ProximityEngine& operator=(const ProximityEngine&) = delete;

    void setNotificationSink(NotificationSink sink);

    // Event loop driving: background thread, or manual pumping.
    void startEventLoop();
    void stopEventLoop();
    size_t processPending();

    // Session lifecycle (idle/error -> discovering, anything -> idle)
    bool start(std::string* error = nullptr);
    void stop();

    // Pairing
    bool requestPairing(const std::string& peer_id, std::string* error = nullptr);
    bool acceptPairing(const std::string& peer_id, std::string* error = nullptr);
    bool rejectPairing(const std::string& peer_id, std::string* error = nullptr);
    bool unpair(const std::string& peer_id, std::string* error = nullptr);

    // Pairing mode: entering starts discovery when idle; leaving declines the
    // surfaced request and drops discovered peers that are neither paired nor connected.
    bool startPairingMode(std::string* error = nullptr);
    void stopPairingMode();
    bool isInPairingMode() const;

    bool selectPeer(const std::string& peer_id);
    size_t purgeStaleNow();
    bool setVolumeBounds(double min_volume, double max_volume, std::string* error = nullptr);
    bool setVolumeDistances(double min_distance, double max_distance, std::string* error = nullptr);

    // Read accessors (copies)
    AppState appState() const;
    std::optional<std::string> errorMessage() const;
    std::vector<Peer> peers() const;
    std::vector<Peer> activePeers() const;
    std::vector<Peer> discoverablePeers() const;
    std::optional<Peer> peer(const std::string& peer_id) const;
    std::optional<std::string> pendingPairingRequest() const;
    TokenExchangeState tokenExchangeState(const std::string& peer_id) const;
    std::vector<PairedDevice> pairedDevices() const;
    std::optional<RangingSourceType> activeRangingSource() const;
    const EngineConfig& config() const { return m_config; }

    static constexpr const char* kPurgeTimerId = "stale-purge";
    static constexpr const char* kHeartbeatTimerId = "heartbeat";

private:
    // IMessageSender
    bool sendMessage(const std::string& peer_id, MessageType type,
                     std::map<std::string, std::string> payload,
                     std::string* error) override;

    void handleEvent(const EngineEvent& event);
    void deliver(std::vector<EngineNotification> notifications);

    void sendDeviceInfo(const std::string& peer_id);
    bool applyEstimatorOptions(const DistanceEstimatorOptions& options, std::string* error);

    void onPeerFound(const PeerFoundEvent& e);
    void onPeerLost(const PeerLostEvent& e);
    void onPeerConnecting(const PeerConnectingEvent& e);
    void onPeerConnected(const PeerConnectedEvent& e);
    void onPeerDisconnected(const PeerDisconnectedEvent& e);
    void onDataReceived(const DataReceivedEvent& e);
    void onRangingSample(const RangingSampleEvent& e);
    void onRangingInvalidated(const RangingInvalidatedEvent& e);
    void onLocalTokenReady();
    void onStalePurge();
    void onHeartbeat();

    TransportCallbacks makeTransportCallbacks();
    RangingEvents makeRangingEvents();

    void stopLocked();
    void teardownSession();
    void raiseError(const std::string& message);
    void moveApp(AppState to);
    // Restarts ranging once no connected paired peer keeps the session alive.
    void ensureRanging();
    void reconcileAppState();
    bool ignoresSignalStrength(const std::string& peer_id) const;

    EngineConfig m_config;
    const Clock& m_clock;
    ITransport& m_transport;
    IPairedDeviceStore& m_store;

    mutable std::mutex m_state_mutex;
    std::mutex m_sink_mutex;
    NotificationSink m_sink;

    EventLoop m_loop;
    PeerRegistry m_registry;
    RangingProvider m_ranging;
    NotificationQueue m_notifications;
    AppStateMachine m_app;
    PairingProtocol m_pairing;
    TokenExchange m_token_exchange;

    bool m_discovery_running = false;
};

#endif // PROXIMITY_ENGINE_H
