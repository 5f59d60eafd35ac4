#include "proximity_engine.h"
#include "logger.h"

#include <stdexcept>
#include <type_traits>
#include <variant>

namespace {
    EngineConfig validated(EngineConfig config) {
        std::string error;
        if (!config.validate(&error)) {
            throw std::invalid_argument("ProximityEngine: " + error);
        }
        return config;
    }

    bool fail(std::string* error, const std::string& msg) {
        if (error) *error = msg;
        return false;
    }
}

ProximityEngine::ProximityEngine(EngineConfig config,
                                 const Clock& clock,
                                 ITransport& transport,
                                 IRangingSource* precise_source,
                                 IRangingSource* fallback_source,
                                 IPairedDeviceStore& store)
    : m_config(validated(std::move(config))),
      m_clock(clock),
      m_transport(transport),
      m_store(store),
      m_loop(clock),
      m_registry(clock, m_config.estimator),
      m_ranging(precise_source, fallback_source, m_config.prefer_precise),
      m_pairing(m_registry, store, m_loop, *this, m_notifications, clock,
                PairingOptions{m_config.device_id, m_config.display_name, m_config.pairing_timeout}),
      m_token_exchange(m_registry, m_ranging, m_loop, *this, m_notifications,
                       TokenExchangeOptions{m_config.display_name, m_config.token_exchange_timeout}) {
    m_pairing.loadPersisted();
    m_loop.setHandler([this](const EngineEvent& event) { handleEvent(event); });
    LOG_INFO("[Engine] Created for device " + m_config.device_id);
}

ProximityEngine::~ProximityEngine() {
    m_loop.stop();
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        stopLocked();
        (void)m_notifications.take();
    }
    m_loop.setHandler(nullptr);
}

void ProximityEngine::setNotificationSink(NotificationSink sink) {
    std::lock_guard<std::mutex> lock(m_sink_mutex);
    m_sink = std::move(sink);
}

void ProximityEngine::deliver(std::vector<EngineNotification> notifications) {
    if (notifications.empty()) {
        return;
    }
    NotificationSink sink;
    {
        std::lock_guard<std::mutex> lock(m_sink_mutex);
        sink = m_sink;
    }
    if (!sink) {
        return;
    }
    for (const auto& n : notifications) {
        sink(n);
    }
}

void ProximityEngine::startEventLoop() {
    m_loop.start();
}

void ProximityEngine::stopEventLoop() {
    m_loop.stop();
}

size_t ProximityEngine::processPending() {
    return m_loop.processPending();
}

// ============================================================================
// Callbacks from collaborators: enqueue only
// ============================================================================

TransportCallbacks ProximityEngine::makeTransportCallbacks() {
    TransportCallbacks cb;
    cb.on_peer_found = [this](const std::string& peer_id, const std::string& name,
                              std::optional<int> rssi, bool compatible) {
        m_loop.pushEvent(PeerFoundEvent{peer_id, name, rssi, compatible});
    };
    cb.on_peer_lost = [this](const std::string& peer_id) {
        m_loop.pushEvent(PeerLostEvent{peer_id});
    };
    cb.on_connection_state = [this](const std::string& peer_id, ConnectionState state, const std::string& name) {
        switch (state) {
            case ConnectionState::CONNECTING:
                m_loop.pushEvent(PeerConnectingEvent{peer_id});
                break;
            case ConnectionState::CONNECTED:
                m_loop.pushEvent(PeerConnectedEvent{peer_id, name});
                break;
            case ConnectionState::DISCONNECTED:
                m_loop.pushEvent(PeerDisconnectedEvent{peer_id});
                break;
        }
    };
    cb.on_data = [this](const std::string& peer_id, const std::string& data) {
        m_loop.pushEvent(DataReceivedEvent{peer_id, data});
    };
    return cb;
}

RangingEvents ProximityEngine::makeRangingEvents() {
    RangingEvents events;
    events.on_sample = [this](RangingSourceType type, const std::string& peer_id, double value) {
        m_loop.pushEvent(RangingSampleEvent{type, peer_id, value});
    };
    events.on_local_token = [this](const std::string& token) {
        m_loop.pushEvent(LocalTokenReadyEvent{token});
    };
    events.on_invalidated = [this](RangingSourceType type, const std::string& reason) {
        m_loop.pushEvent(RangingInvalidatedEvent{type, reason});
    };
    return events;
}

// ============================================================================
// Commands
// ============================================================================

bool ProximityEngine::start(std::string* error) {
    bool ok = false;
    std::vector<EngineNotification> pending;
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        const AppState state = m_app.state();
        if (state != AppState::IDLE && state != AppState::ERROR) {
            return fail(error, std::string("Cannot start while ") + app_state_to_string(state));
        }

        if (state == AppState::ERROR) {
            teardownSession();
            moveApp(AppState::IDLE);
        }
        m_app.clearError();
        moveApp(AppState::DISCOVERING);

        std::string transport_error;
        std::string ranging_error;
        std::string notice;
        if (!m_transport.startDiscovery(makeTransportCallbacks(), &transport_error)) {
            raiseError("Cannot start transport: " + transport_error);
            fail(error, "Cannot start transport: " + transport_error);
        } else if (!m_ranging.start(makeRangingEvents(), &notice, &ranging_error)) {
            m_transport.stopDiscovery();
            raiseError(ranging_error);
            fail(error, ranging_error);
        } else {
            if (!notice.empty()) {
                m_notifications.push(NotificationKind::RANGING_NOTICE, "", notice);
            }
            m_discovery_running = true;
            m_loop.scheduleAfter(kPurgeTimerId, StalePurgeEvent{}, m_config.purge_interval);
            if (m_config.heartbeat_interval.count() > 0) {
                m_loop.scheduleAfter(kHeartbeatTimerId, HeartbeatEvent{}, m_config.heartbeat_interval);
            }
            LOG_INFO("[Engine] Discovery started");
            ok = true;
        }
        pending = m_notifications.take();
    }
    deliver(std::move(pending));
    return ok;
}

void ProximityEngine::stop() {
    std::vector<EngineNotification> pending;
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        stopLocked();
        pending = m_notifications.take();
    }
    deliver(std::move(pending));
}

void ProximityEngine::stopLocked() {
    const AppState state = m_app.state();
    if (!m_discovery_running && state == AppState::IDLE) {
        return;
    }

    teardownSession();

    if (state == AppState::TRANSMITTING) {
        moveApp(AppState::CONNECTED);
    }
    if (m_app.state() != AppState::IDLE) {
        moveApp(AppState::IDLE);
    }
    m_notifications.push(NotificationKind::PEERS_CHANGED);
    LOG_INFO("[Engine] Stopped");
}

void ProximityEngine::teardownSession() {
    m_discovery_running = false;
    m_transport.stopDiscovery();
    m_ranging.stop();
    m_loop.removeScheduledEvent(kPurgeTimerId);
    m_loop.removeScheduledEvent(kHeartbeatTimerId);

    for (const auto& p : m_registry.peers()) {
        m_pairing.handlePeerDisconnected(p.id);
    }
    m_token_exchange.resetAll();
    // Paired devices stay, their runtime fields reset
    m_registry.resetSession();
}

bool ProximityEngine::requestPairing(const std::string& peer_id, std::string* error) {
    bool ok;
    std::vector<EngineNotification> pending;
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        ok = m_pairing.requestPairing(peer_id, error);
        pending = m_notifications.take();
    }
    deliver(std::move(pending));
    return ok;
}

bool ProximityEngine::acceptPairing(const std::string& peer_id, std::string* error) {
    bool ok;
    std::vector<EngineNotification> pending;
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        ok = m_pairing.acceptPairing(peer_id, error);
        pending = m_notifications.take();
    }
    deliver(std::move(pending));
    return ok;
}

bool ProximityEngine::rejectPairing(const std::string& peer_id, std::string* error) {
    bool ok;
    std::vector<EngineNotification> pending;
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        ok = m_pairing.rejectPairing(peer_id, error);
        pending = m_notifications.take();
    }
    deliver(std::move(pending));
    return ok;
}

bool ProximityEngine::unpair(const std::string& peer_id, std::string* error) {
    bool ok;
    std::vector<EngineNotification> pending;
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        ok = m_pairing.unpair(peer_id, error);
        pending = m_notifications.take();
    }
    deliver(std::move(pending));
    return ok;
}

bool ProximityEngine::startPairingMode(std::string* error) {
    const AppState state = appState();
    if ((state == AppState::IDLE || state == AppState::ERROR) && !start(error)) {
        return false;
    }

    std::vector<EngineNotification> pending;
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        if (!m_pairing.isInPairingMode()) {
            m_pairing.setPairingMode(true);
            for (const auto& peer_id : m_registry.connectedPeerIds()) {
                sendDeviceInfo(peer_id);
            }
        }
        pending = m_notifications.take();
    }
    deliver(std::move(pending));
    return true;
}

void ProximityEngine::stopPairingMode() {
    std::vector<EngineNotification> pending;
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        if (m_pairing.isInPairingMode()) {
            m_pairing.setPairingMode(false);
            if (!m_registry.removeUnpairedIdle().empty()) {
                m_notifications.push(NotificationKind::PEERS_CHANGED);
            }
            for (const auto& peer_id : m_registry.connectedPeerIds()) {
                sendDeviceInfo(peer_id);
            }
        }
        pending = m_notifications.take();
    }
    deliver(std::move(pending));
}

bool ProximityEngine::isInPairingMode() const {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    return m_pairing.isInPairingMode();
}

bool ProximityEngine::selectPeer(const std::string& peer_id) {
    bool selected;
    std::vector<EngineNotification> pending;
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        selected = m_registry.select(peer_id);
        m_notifications.push(NotificationKind::PEERS_CHANGED);
        pending = m_notifications.take();
    }
    deliver(std::move(pending));
    return selected;
}

size_t ProximityEngine::purgeStaleNow() {
    size_t removed;
    std::vector<EngineNotification> pending;
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        removed = m_registry.purgeStale(m_config.stale_timeout).size();
        if (removed > 0) {
            m_notifications.push(NotificationKind::PEERS_CHANGED);
        }
        pending = m_notifications.take();
    }
    deliver(std::move(pending));
    return removed;
}

bool ProximityEngine::applyEstimatorOptions(const DistanceEstimatorOptions& options, std::string* error) {
    if (!m_registry.estimator().configure(options, error)) {
        return false;
    }
    m_config.estimator = m_registry.estimator().options();
    m_registry.refreshDerived();
    m_notifications.push(NotificationKind::PEERS_CHANGED);
    return true;
}

bool ProximityEngine::setVolumeBounds(double min_volume, double max_volume, std::string* error) {
    bool ok;
    std::vector<EngineNotification> pending;
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        DistanceEstimatorOptions options = m_registry.estimator().options();
        options.min_volume = min_volume;
        options.max_volume = max_volume;
        ok = applyEstimatorOptions(options, error);
        pending = m_notifications.take();
    }
    deliver(std::move(pending));
    return ok;
}

bool ProximityEngine::setVolumeDistances(double min_distance, double max_distance, std::string* error) {
    bool ok;
    std::vector<EngineNotification> pending;
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        DistanceEstimatorOptions options = m_registry.estimator().options();
        options.min_distance = min_distance;
        options.max_distance = max_distance;
        ok = applyEstimatorOptions(options, error);
        pending = m_notifications.take();
    }
    deliver(std::move(pending));
    return ok;
}

// ============================================================================
// Accessors
// ============================================================================

AppState ProximityEngine::appState() const {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    return m_app.state();
}

std::optional<std::string> ProximityEngine::errorMessage() const {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    return m_app.errorMessage();
}

std::vector<Peer> ProximityEngine::peers() const {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    return m_registry.peers();
}

std::vector<Peer> ProximityEngine::activePeers() const {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    return m_registry.activePeers();
}

std::vector<Peer> ProximityEngine::discoverablePeers() const {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    return m_registry.discoverablePeers();
}

std::optional<Peer> ProximityEngine::peer(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    return m_registry.find(peer_id);
}

std::optional<std::string> ProximityEngine::pendingPairingRequest() const {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    return m_pairing.pendingInboundRequest();
}

TokenExchangeState ProximityEngine::tokenExchangeState(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    return m_token_exchange.stateOf(peer_id);
}

std::vector<PairedDevice> ProximityEngine::pairedDevices() const {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    return m_pairing.pairedDevices();
}

std::optional<RangingSourceType> ProximityEngine::activeRangingSource() const {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    return m_ranging.activeType();
}

// ============================================================================
// Outbound messages
// ============================================================================

bool ProximityEngine::sendMessage(const std::string& peer_id, MessageType type,
                                  std::map<std::string, std::string> payload,
                                  std::string* error) {
    const auto message = wire::make_message(type, m_clock.wallSeconds(), std::move(payload));
    std::string send_error;
    if (!m_transport.send(peer_id, wire::encode_message(message), &send_error)) {
        LOG_WARN(std::string("[Engine] Send ") + message_type_to_string(type) + " to " + peer_id +
                 " failed: " + send_error);
        if (error) *error = send_error;
        return false;
    }
    return true;
}

// ============================================================================
// Event handling (runs on the event loop)
// ============================================================================

void ProximityEngine::handleEvent(const EngineEvent& event) {
    std::vector<EngineNotification> pending;
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);

        std::visit([this](auto&& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, PeerFoundEvent>) onPeerFound(e);
            else if constexpr (std::is_same_v<T, PeerLostEvent>) onPeerLost(e);
            else if constexpr (std::is_same_v<T, PeerConnectingEvent>) onPeerConnecting(e);
            else if constexpr (std::is_same_v<T, PeerConnectedEvent>) onPeerConnected(e);
            else if constexpr (std::is_same_v<T, PeerDisconnectedEvent>) onPeerDisconnected(e);
            else if constexpr (std::is_same_v<T, DataReceivedEvent>) onDataReceived(e);
            else if constexpr (std::is_same_v<T, RangingSampleEvent>) onRangingSample(e);
            else if constexpr (std::is_same_v<T, RangingInvalidatedEvent>) onRangingInvalidated(e);
            else if constexpr (std::is_same_v<T, LocalTokenReadyEvent>) onLocalTokenReady();
            else if constexpr (std::is_same_v<T, PairingTimeoutEvent>) m_pairing.handleTimeout(e.peer_id);
            else if constexpr (std::is_same_v<T, TokenExchangeTimeoutEvent>) m_token_exchange.handleTimeout(e.peer_id);
            else if constexpr (std::is_same_v<T, StalePurgeEvent>) onStalePurge();
            else if constexpr (std::is_same_v<T, HeartbeatEvent>) onHeartbeat();
        }, event);

        reconcileAppState();
        pending = m_notifications.take();
    }
    deliver(std::move(pending));
}

void ProximityEngine::onPeerFound(const PeerFoundEvent& e) {
    if (!m_discovery_running) return;

    std::optional<int> rssi = e.rssi;
    if (rssi && ignoresSignalStrength(e.peer_id)) {
        rssi.reset();
    }
    m_registry.upsertDiscovered(e.peer_id, e.display_name, rssi, e.compatible);
    m_notifications.push(NotificationKind::PEERS_CHANGED);
}

void ProximityEngine::onPeerLost(const PeerLostEvent& e) {
    if (!m_discovery_running) return;

    if (m_registry.removeLost(e.peer_id)) {
        m_notifications.push(NotificationKind::PEERS_CHANGED);
    }
}

void ProximityEngine::onPeerConnecting(const PeerConnectingEvent& e) {
    if (!m_discovery_running) return;

    m_registry.markConnecting(e.peer_id);
    m_notifications.push(NotificationKind::PEERS_CHANGED);
}

void ProximityEngine::onPeerConnected(const PeerConnectedEvent& e) {
    if (!m_discovery_running) return;

    m_registry.markConnected(e.peer_id, e.display_name);
    m_pairing.handlePeerConnected(e.peer_id);

    sendDeviceInfo(e.peer_id);

    // Runs for every connection, paired or not
    m_token_exchange.handlePeerConnected(e.peer_id);
    m_notifications.push(NotificationKind::PEERS_CHANGED);
}

void ProximityEngine::sendDeviceInfo(const std::string& peer_id) {
    std::string error;
    if (!sendMessage(peer_id, MessageType::DEVICE_INFO,
                     {{"displayName", m_config.display_name},
                      {"isCompatible", "true"},
                      {"isInPairingMode", m_pairing.isInPairingMode() ? "true" : "false"}},
                     &error)) {
        LOG_WARN("[Engine] Device info to " + peer_id + " not sent: " + error);
    }
}

void ProximityEngine::onPeerDisconnected(const PeerDisconnectedEvent& e) {
    if (!m_registry.contains(e.peer_id)) return;

    m_pairing.handlePeerDisconnected(e.peer_id);
    m_token_exchange.handlePeerDisconnected(e.peer_id);
    m_registry.markDisconnected(e.peer_id);
    m_notifications.push(NotificationKind::PEERS_CHANGED);
}

void ProximityEngine::onDataReceived(const DataReceivedEvent& e) {
    if (!m_discovery_running) return;

    wire::ProtocolMessage message;
    std::string error;
    if (!wire::decode_message(e.data, message, &error)) {
        LOG_WARN("[Engine] Dropped undecodable frame from " + e.peer_id + ": " + error);
        return;
    }
    if (!m_registry.touch(e.peer_id)) {
        LOG_WARN("[Engine] Dropped frame from unknown peer " + e.peer_id);
        return;
    }

    switch (message.type) {
        case MessageType::HANDSHAKE:
        case MessageType::HEARTBEAT:
        case MessageType::VOLUME_SYNC:
        case MessageType::AUDIO_STREAM:
            break;

        case MessageType::DEVICE_INFO: {
            auto flag = [&message](const char* key) -> std::optional<bool> {
                const std::string value = message.field(key);
                if (value.empty()) return std::nullopt;
                return value == "true";
            };
            m_registry.updateDeviceInfo(e.peer_id, message.field("displayName"),
                                        flag("isCompatible"), flag("isInPairingMode"));
            m_notifications.push(NotificationKind::PEERS_CHANGED);
            break;
        }

        case MessageType::PAIRING_REQUEST:
        case MessageType::PAIRING_ACCEPT:
        case MessageType::PAIRING_REJECT:
        case MessageType::DISCONNECT:
            m_pairing.handleMessage(e.peer_id, message);
            break;

        case MessageType::DISCOVERY_TOKEN:
        case MessageType::TOKEN_ACK:
            m_token_exchange.handleMessage(e.peer_id, message);
            break;

        case MessageType::UNKNOWN:
            LOG_DEBUG("[Engine] Ignoring message type '" + message.type_tag + "' from " + e.peer_id);
            break;
    }
}

void ProximityEngine::onRangingSample(const RangingSampleEvent& e) {
    if (!m_discovery_running) return;

    if (e.source == RangingSourceType::PRECISE && !m_ranging.isPreciseActive()) {
        return;
    }

    std::string peer_id = e.peer_id;
    if (peer_id.empty()) {
        auto primary = m_registry.primaryPeerId();
        if (!primary) return;
        peer_id = *primary;
    }

    if (e.source == RangingSourceType::SIGNAL_STRENGTH && ignoresSignalStrength(peer_id)) {
        return;
    }

    if (m_registry.applyDistanceUpdate(peer_id, e.value, e.source)) {
        m_notifications.push(NotificationKind::PEERS_CHANGED);
    }
}

void ProximityEngine::onRangingInvalidated(const RangingInvalidatedEvent& e) {
    if (!m_discovery_running) return;

    auto active = m_ranging.activeType();
    if (!active || *active != e.source) {
        return;
    }
    LOG_WARN(std::string("[Engine] ") + ranging_source_type_to_string(e.source) +
             " ranging invalidated: " + e.reason);

    if (e.source == RangingSourceType::PRECISE) {
        m_token_exchange.resetAll();
        std::string error;
        if (m_ranging.fallBackToSignalStrength(&error)) {
            m_notifications.push(NotificationKind::RANGING_NOTICE, "",
                                 "Precise ranging lost, using signal strength (lower accuracy)");
            return;
        }
        raiseError("Cannot start any proximity provider");
        return;
    }

    m_ranging.stop();
    raiseError("No ranging source available");
}

void ProximityEngine::onLocalTokenReady() {
    if (!m_discovery_running) return;
    m_token_exchange.handleLocalTokenReady();
}

void ProximityEngine::onStalePurge() {
    if (!m_discovery_running) return;

    if (!m_registry.purgeStale(m_config.stale_timeout).empty()) {
        m_notifications.push(NotificationKind::PEERS_CHANGED);
    }
    m_loop.scheduleAfter(kPurgeTimerId, StalePurgeEvent{}, m_config.purge_interval);
}

void ProximityEngine::onHeartbeat() {
    if (!m_discovery_running) return;

    for (const auto& peer_id : m_registry.connectedPeerIds()) {
        std::string error;
        if (!sendMessage(peer_id, MessageType::HEARTBEAT, {}, &error)) {
            LOG_DEBUG("[Engine] Heartbeat to " + peer_id + " not sent");
        }
    }
    m_loop.scheduleAfter(kHeartbeatTimerId, HeartbeatEvent{}, m_config.heartbeat_interval);
}

// ============================================================================
// Application state
// ============================================================================

bool ProximityEngine::ignoresSignalStrength(const std::string& peer_id) const {
    auto peer = m_registry.find(peer_id);
    return peer && peer->provider_type == RangingSourceType::PRECISE &&
           m_token_exchange.stateOf(peer_id) == TokenExchangeState::COMPLETED;
}

void ProximityEngine::moveApp(AppState to) {
    if (m_app.transition(to)) {
        m_notifications.pushAppState(to);
    }
}

void ProximityEngine::raiseError(const std::string& message) {
    if (m_registry.hasConnectedPairedPeer()) {
        // Keep talking to the paired device; only surface the problem
        LOG_WARN("[Engine] " + message + " (paired peer connected, staying in " +
                 app_state_to_string(m_app.state()) + ")");
        m_notifications.push(NotificationKind::ERROR_BANNER, "", message);
        return;
    }
    if (m_app.fail(message)) {
        m_notifications.pushAppState(AppState::ERROR, message);
    }
}

void ProximityEngine::ensureRanging() {
    if (m_ranging.isRunning() || m_app.state() == AppState::ERROR) {
        return;
    }
    // The banner was shown when ranging stopped; the paired link carries on
    if (m_registry.hasConnectedPairedPeer()) {
        return;
    }

    std::string notice;
    std::string error;
    if (m_ranging.start(makeRangingEvents(), &notice, &error)) {
        LOG_INFO("[Engine] Ranging restarted");
        if (!notice.empty()) {
            m_notifications.push(NotificationKind::RANGING_NOTICE, "", notice);
        }
        return;
    }
    raiseError(error.empty() ? "No ranging source available" : error);
}

void ProximityEngine::reconcileAppState() {
    if (!m_discovery_running) {
        return;
    }

    ensureRanging();
    if (m_app.state() == AppState::ERROR) {
        return;
    }

    const size_t connected = m_registry.connectedCount();
    const size_t completed = m_token_exchange.completedConnectedCount();

    if (m_app.state() == AppState::TRANSMITTING && completed == 0) {
        moveApp(AppState::CONNECTED);
    }
    if (m_app.state() == AppState::CONNECTED && connected == 0) {
        // Last peer gone while discovery keeps running
        moveApp(AppState::IDLE);
        moveApp(AppState::DISCOVERING);
    }
    if (m_app.state() == AppState::DISCOVERING && connected > 0) {
        moveApp(AppState::CONNECTED);
    }
    if (m_app.state() == AppState::CONNECTED && completed > 0) {
        moveApp(AppState::TRANSMITTING);
    }
}
