#include "pairing_protocol.h"
#include "logger.h"

namespace {
    bool fail(std::string* error, const std::string& msg) {
        if (error) *error = msg;
        LOG_WARN("[Pairing] " + msg);
        return false;
    }
}

// ==========================================================
// PURE FSM TRANSITION TABLE (AUTHORITATIVE)
// ==========================================================
std::optional<PairingState> PairingStateMachine::compute_transition(PairingState current, PairingEvent event) {
    switch (current) {

    // ------------------------------------------------------
    case PairingState::NONE:
        if (event == PairingEvent::REQUEST_SENT || event == PairingEvent::REQUEST_RECEIVED)
            return PairingState::PENDING;
        break;

    // ------------------------------------------------------
    case PairingState::PENDING:
        if (event == PairingEvent::ACCEPTED)
            return PairingState::PAIRED;

        if (event == PairingEvent::REJECTED ||
            event == PairingEvent::TIMEOUT ||
            event == PairingEvent::PEER_DISCONNECTED)
            return PairingState::NONE;
        break;

    // ------------------------------------------------------
    case PairingState::PAIRED:
        // A repeated accept after a lost reply is a no-op
        if (event == PairingEvent::ACCEPTED)
            return PairingState::PAIRED;

        if (event == PairingEvent::UNPAIR)
            return PairingState::NONE;
        break;
    }

    return std::nullopt;
}

PairingState PairingStateMachine::handle_event(const std::string& peer_id, PairingState current, PairingEvent event) const {
    auto next = compute_transition(current, event);
    if (!next) {
        LOG_WARN(
            std::string("[PairingFSM] Ignored transition ") +
            pairing_state_to_string(current) +
            " + " + event_to_string(event) +
            " peer=" + peer_id
        );
        return current;
    }

    if (*next != current) {
        LOG_INFO(
            std::string("[PairingFSM] ") +
            pairing_state_to_string(current) +
            " --(" + event_to_string(event) + ")--> " +
            pairing_state_to_string(*next) +
            " peer=" + peer_id
        );
    }
    return *next;
}

const char* PairingStateMachine::event_to_string(PairingEvent event) {
    switch (event) {
        case PairingEvent::REQUEST_SENT: return "REQUEST_SENT";
        case PairingEvent::REQUEST_RECEIVED: return "REQUEST_RECEIVED";
        case PairingEvent::ACCEPTED: return "ACCEPTED";
        case PairingEvent::REJECTED: return "REJECTED";
        case PairingEvent::TIMEOUT: return "TIMEOUT";
        case PairingEvent::PEER_DISCONNECTED: return "PEER_DISCONNECTED";
        case PairingEvent::UNPAIR: return "UNPAIR";
        default: return "UNKNOWN";
    }
}

// ==========================================================
// PairingProtocol
// ==========================================================
PairingProtocol::PairingProtocol(PeerRegistry& registry,
                                 IPairedDeviceStore& store,
                                 EventLoop& loop,
                                 IMessageSender& sender,
                                 NotificationQueue& notifications,
                                 const Clock& clock,
                                 PairingOptions options)
    : m_registry(registry),
      m_store(store),
      m_loop(loop),
      m_sender(sender),
      m_notifications(notifications),
      m_clock(clock),
      m_options(std::move(options)) {}

void PairingProtocol::loadPersisted() {
    m_paired.clear();
    for (auto& device : m_store.loadPairedDevices()) {
        m_paired[device.id] = device;
    }
    m_registry.rehydratePaired(pairedDevices());
}

std::vector<PairedDevice> PairingProtocol::pairedDevices() const {
    std::vector<PairedDevice> out;
    out.reserve(m_paired.size());
    for (const auto& kv : m_paired) {
        out.push_back(kv.second);
    }
    return out;
}

std::optional<PairedDevice> PairingProtocol::pairedDevice(const std::string& peer_id) const {
    auto it = m_paired.find(peer_id);
    if (it == m_paired.end()) {
        return std::nullopt;
    }
    return it->second;
}

PairingState PairingProtocol::stateOf(const std::string& peer_id) const {
    auto peer = m_registry.find(peer_id);
    return peer ? peer->pairing_state : PairingState::NONE;
}

bool PairingProtocol::apply(const std::string& peer_id, PairingEvent event) {
    const PairingState current = stateOf(peer_id);
    if (!PairingStateMachine::compute_transition(current, event)) {
        m_fsm.handle_event(peer_id, current, event);
        return false;
    }
    m_registry.setPairingState(peer_id, m_fsm.handle_event(peer_id, current, event));
    return true;
}

bool PairingProtocol::persist(std::string* error) {
    std::string save_error;
    if (!m_store.savePairedDevices(pairedDevices(), &save_error)) {
        LOG_ERROR("[Pairing] Failed to persist paired devices: " + save_error);
        if (error) *error = save_error;
        return false;
    }
    return true;
}

void PairingProtocol::resolvePending(const std::string& peer_id) {
    m_loop.removeScheduledEvent(timerId(peer_id));
    m_outgoing.erase(peer_id);
    if (m_inbound && *m_inbound == peer_id) {
        m_inbound.reset();
    }
}

void PairingProtocol::completePairing(const std::string& peer_id) {
    if (!apply(peer_id, PairingEvent::ACCEPTED)) {
        return;
    }
    resolvePending(peer_id);

    auto peer = m_registry.find(peer_id);
    PairedDevice device;
    device.id = peer_id;
    device.name = peer ? peer->display_name : peer_id;
    device.paired_at = m_clock.wallSeconds();
    if (peer && peer->isConnected()) {
        device.last_connected = device.paired_at;
    }
    m_paired[peer_id] = device;

    if (!persist()) {
        m_notifications.push(NotificationKind::ERROR_BANNER, peer_id, "Could not save paired device");
    }
    m_notifications.push(NotificationKind::PAIRING_COMPLETED, peer_id);
    m_notifications.push(NotificationKind::PEERS_CHANGED);
}

void PairingProtocol::dropPairing(const std::string& peer_id) {
    if (!apply(peer_id, PairingEvent::UNPAIR)) {
        return;
    }
    m_paired.erase(peer_id);
    if (!persist()) {
        m_notifications.push(NotificationKind::ERROR_BANNER, peer_id, "Could not save paired devices");
    }
    m_notifications.push(NotificationKind::UNPAIRED, peer_id);
    m_notifications.push(NotificationKind::PEERS_CHANGED);
}

bool PairingProtocol::requestPairing(const std::string& peer_id, std::string* error) {
    auto peer = m_registry.find(peer_id);
    if (!peer || !peer->isConnected()) {
        return fail(error, "Peer not connected: " + peer_id);
    }
    if (peer->pairing_state == PairingState::PAIRED) {
        return fail(error, "Already paired with " + peer_id);
    }
    if (peer->pairing_state == PairingState::PENDING) {
        return fail(error, "Pairing already pending with " + peer_id);
    }

    apply(peer_id, PairingEvent::REQUEST_SENT);
    m_outgoing.insert(peer_id);

    std::string send_error;
    if (!m_sender.sendMessage(peer_id, MessageType::PAIRING_REQUEST,
                              {{"deviceId", m_options.local_id}, {"deviceName", m_options.local_name}},
                              &send_error)) {
        // Nothing went out, so the request never existed
        m_outgoing.erase(peer_id);
        m_registry.setPairingState(peer_id, PairingState::NONE);
        return fail(error, "Failed to send pairing request: " + send_error);
    }

    m_loop.scheduleAfter(timerId(peer_id), PairingTimeoutEvent{peer_id}, m_options.request_timeout);
    m_notifications.push(NotificationKind::PEERS_CHANGED);
    LOG_INFO("[Pairing] Requested pairing with " + peer_id);
    return true;
}

bool PairingProtocol::acceptPairing(const std::string& peer_id, std::string* error) {
    const PairingState state = stateOf(peer_id);
    if (state == PairingState::PAIRED) {
        return true;
    }
    if (state != PairingState::PENDING || !m_inbound || *m_inbound != peer_id) {
        return fail(error, "No pending pairing request from " + peer_id);
    }

    std::string send_error;
    if (!m_sender.sendMessage(peer_id, MessageType::PAIRING_ACCEPT,
                              {{"deviceName", m_options.local_name}}, &send_error)) {
        return fail(error, "Failed to send pairing accept: " + send_error);
    }

    completePairing(peer_id);
    return true;
}

bool PairingProtocol::rejectPairing(const std::string& peer_id, std::string* error) {
    if (stateOf(peer_id) != PairingState::PENDING || !m_inbound || *m_inbound != peer_id) {
        return fail(error, "No pending pairing request from " + peer_id);
    }

    std::string send_error;
    if (!m_sender.sendMessage(peer_id, MessageType::PAIRING_REJECT, {}, &send_error)) {
        LOG_WARN("[Pairing] Reject notice to " + peer_id + " not sent: " + send_error);
    }

    apply(peer_id, PairingEvent::REJECTED);
    resolvePending(peer_id);
    m_notifications.push(NotificationKind::PAIRING_REJECTED, peer_id);
    m_notifications.push(NotificationKind::PEERS_CHANGED);
    return true;
}

bool PairingProtocol::unpair(const std::string& peer_id, std::string* error) {
    const PairingState state = stateOf(peer_id);
    if (state == PairingState::NONE) {
        return true;
    }
    if (state != PairingState::PAIRED) {
        return fail(error, "Cannot unpair " + peer_id + " while pairing is pending");
    }

    auto peer = m_registry.find(peer_id);
    if (peer && peer->isConnected()) {
        std::string send_error;
        if (!m_sender.sendMessage(peer_id, MessageType::DISCONNECT, {}, &send_error)) {
            LOG_WARN("[Pairing] Disconnect notice to " + peer_id + " not sent: " + send_error);
        }
    }

    dropPairing(peer_id);
    return true;
}

void PairingProtocol::setPairingMode(bool enabled) {
    if (m_pairing_mode == enabled) {
        return;
    }
    m_pairing_mode = enabled;
    LOG_INFO(std::string("[Pairing] Pairing mode ") + (enabled ? "ON" : "OFF"));

    if (!enabled && m_inbound) {
        const std::string peer_id = *m_inbound;
        std::string send_error;
        if (!m_sender.sendMessage(peer_id, MessageType::PAIRING_REJECT, {}, &send_error)) {
            LOG_WARN("[Pairing] Reject notice to " + peer_id + " not sent: " + send_error);
        }
        apply(peer_id, PairingEvent::REJECTED);
        resolvePending(peer_id);
        m_notifications.push(NotificationKind::PEERS_CHANGED);
    }
    m_notifications.push(NotificationKind::PAIRING_MODE_CHANGED, "", enabled ? "on" : "off");
}

void PairingProtocol::handleMessage(const std::string& from, const wire::ProtocolMessage& message) {
    switch (message.type) {
        case MessageType::PAIRING_REQUEST:
            onRequest(from, message);
            break;
        case MessageType::PAIRING_ACCEPT:
            onAccept(from, message);
            break;
        case MessageType::PAIRING_REJECT:
            onReject(from);
            break;
        case MessageType::DISCONNECT:
            onDisconnectNotice(from);
            break;
        default:
            break;
    }
}

void PairingProtocol::onRequest(const std::string& from, const wire::ProtocolMessage& message) {
    if (!m_registry.contains(from)) {
        LOG_WARN("[Pairing] Request from unknown peer " + from + " dropped");
        return;
    }
    const std::string name = message.field("deviceName");
    if (!name.empty()) {
        m_registry.updateDeviceInfo(from, name, std::nullopt);
    }

    const PairingState state = stateOf(from);
    if (state == PairingState::PAIRED) {
        // Our earlier accept was lost; say it again
        std::string send_error;
        if (!m_sender.sendMessage(from, MessageType::PAIRING_ACCEPT,
                                  {{"deviceName", m_options.local_name}}, &send_error)) {
            LOG_WARN("[Pairing] Re-accept to " + from + " not sent: " + send_error);
        }
        return;
    }

    if (state == PairingState::PENDING && m_outgoing.count(from)) {
        // Both sides asked at once; treat each request as the other's answer.
        std::string send_error;
        if (!m_sender.sendMessage(from, MessageType::PAIRING_ACCEPT,
                                  {{"deviceName", m_options.local_name}}, &send_error)) {
            LOG_WARN("[Pairing] Accept to " + from + " not sent: " + send_error);
            return;
        }
        completePairing(from);
        return;
    }

    if (m_inbound) {
        LOG_INFO("[Pairing] Request from " + from + " dropped, request from " + *m_inbound + " outstanding");
        return;
    }

    if (!apply(from, PairingEvent::REQUEST_RECEIVED)) {
        return;
    }
    m_inbound = from;
    m_loop.scheduleAfter(timerId(from), PairingTimeoutEvent{from}, m_options.request_timeout);
    m_notifications.push(NotificationKind::PAIRING_REQUEST_RECEIVED, from);
    m_notifications.push(NotificationKind::PEERS_CHANGED);
}

void PairingProtocol::onAccept(const std::string& from, const wire::ProtocolMessage& message) {
    const std::string name = message.field("deviceName");
    if (!name.empty()) {
        m_registry.updateDeviceInfo(from, name, std::nullopt);
    }

    const PairingState state = stateOf(from);
    if (state == PairingState::PAIRED) {
        return;
    }
    if (state != PairingState::PENDING || !m_outgoing.count(from)) {
        LOG_WARN("[Pairing] Unsolicited accept from " + from + " ignored");
        return;
    }
    completePairing(from);
}

void PairingProtocol::onReject(const std::string& from) {
    if (stateOf(from) != PairingState::PENDING || !m_outgoing.count(from)) {
        LOG_WARN("[Pairing] Unsolicited reject from " + from + " ignored");
        return;
    }
    apply(from, PairingEvent::REJECTED);
    resolvePending(from);
    m_notifications.push(NotificationKind::PAIRING_REJECTED, from);
    m_notifications.push(NotificationKind::PEERS_CHANGED);
}

void PairingProtocol::onDisconnectNotice(const std::string& from) {
    const PairingState state = stateOf(from);
    if (state == PairingState::PAIRED) {
        LOG_INFO("[Pairing] " + from + " unpaired remotely");
        dropPairing(from);
    } else if (state == PairingState::PENDING) {
        apply(from, PairingEvent::REJECTED);
        resolvePending(from);
        m_notifications.push(NotificationKind::PAIRING_REJECTED, from);
        m_notifications.push(NotificationKind::PEERS_CHANGED);
    }
}

void PairingProtocol::handleTimeout(const std::string& peer_id) {
    if (stateOf(peer_id) != PairingState::PENDING) {
        return;
    }
    apply(peer_id, PairingEvent::TIMEOUT);
    resolvePending(peer_id);
    LOG_INFO("[Pairing] Request with " + peer_id + " timed out");
    m_notifications.push(NotificationKind::PAIRING_TIMED_OUT, peer_id);
    m_notifications.push(NotificationKind::PEERS_CHANGED);
}

void PairingProtocol::handlePeerConnected(const std::string& peer_id) {
    auto it = m_paired.find(peer_id);
    if (it == m_paired.end()) {
        return;
    }
    it->second.last_connected = m_clock.wallSeconds();
    if (!persist()) {
        LOG_WARN("[Pairing] Last-connected time for " + peer_id + " kept in memory only");
    }
}

void PairingProtocol::handlePeerDisconnected(const std::string& peer_id) {
    if (stateOf(peer_id) == PairingState::PENDING) {
        apply(peer_id, PairingEvent::PEER_DISCONNECTED);
        m_notifications.push(NotificationKind::PAIRING_TIMED_OUT, peer_id, "Peer disconnected");
    }
    resolvePending(peer_id);
}
