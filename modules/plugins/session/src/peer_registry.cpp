#include "peer_registry.h"
#include "logger.h"

#include <algorithm>
#include <cmath>

const char* connection_state_to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "DISCONNECTED";
        case ConnectionState::CONNECTING: return "CONNECTING";
        case ConnectionState::CONNECTED: return "CONNECTED";
        default: return "UNKNOWN";
    }
}

const char* pairing_state_to_string(PairingState state) {
    switch (state) {
        case PairingState::NONE: return "NONE";
        case PairingState::PENDING: return "PENDING";
        case PairingState::PAIRED: return "PAIRED";
        default: return "UNKNOWN";
    }
}

PeerRegistry::PeerRegistry(const Clock& clock, const DistanceEstimatorOptions& options)
    : m_clock(clock), m_estimator(options) {}

Peer& PeerRegistry::getOrCreate(const std::string& id, const std::string& display_name) {
    auto it = m_peers.find(id);
    if (it != m_peers.end()) {
        return it->second;
    }

    Peer peer;
    peer.id = id;
    peer.display_name = display_name.empty() ? id : display_name;
    peer.volume = m_estimator.options().max_volume;
    peer.last_seen = m_clock.now();
    LOG_DEBUG("[Registry] New peer " + id);
    return m_peers.emplace(id, std::move(peer)).first->second;
}

void PeerRegistry::resetRuntimeFields(Peer& peer) {
    peer.connection_state = ConnectionState::DISCONNECTED;
    peer.distance = 0.0;
    peer.distance_level = DistanceLevel::UNKNOWN;
    peer.volume = m_estimator.options().max_volume;
    peer.provider_type = RangingSourceType::SIGNAL_STRENGTH;
    peer.raw_signal_strength = 0;
    m_estimator.resetPeer(peer.id);
}

Peer PeerRegistry::upsertDiscovered(const std::string& id, const std::string& display_name,
                                    std::optional<int> rssi, bool compatible) {
    Peer& peer = getOrCreate(id, display_name);
    peer.last_seen = m_clock.now();

    // A connected record supersedes discovery: only liveness and signal are refreshed.
    if (!peer.isConnected()) {
        if (!display_name.empty()) {
            peer.display_name = display_name;
        }
        peer.compatible = peer.compatible || compatible;
    }

    if (rssi) {
        applyDistanceUpdate(id, static_cast<double>(*rssi), RangingSourceType::SIGNAL_STRENGTH);
    }
    return m_peers.at(id);
}

bool PeerRegistry::removeLost(const std::string& id) {
    auto it = m_peers.find(id);
    if (it == m_peers.end() || it->second.isActive()) {
        return false;
    }
    m_estimator.resetPeer(id);
    m_peers.erase(it);
    LOG_DEBUG("[Registry] Lost peer " + id);
    return true;
}

Peer PeerRegistry::markConnecting(const std::string& id, const std::string& display_name) {
    Peer& peer = getOrCreate(id, display_name);
    peer.last_seen = m_clock.now();
    if (!peer.isConnected()) {
        peer.connection_state = ConnectionState::CONNECTING;
    }
    return peer;
}

Peer PeerRegistry::markConnected(const std::string& id, const std::string& display_name) {
    Peer& peer = getOrCreate(id, display_name);
    if (!display_name.empty()) {
        peer.display_name = display_name;
    }
    peer.last_seen = m_clock.now();
    if (!peer.isConnected()) {
        peer.connection_state = ConnectionState::CONNECTED;
        LOG_INFO("[Registry] " + id + " connected (" + pairing_state_to_string(peer.pairing_state) + ")");
    }
    return peer;
}

DisconnectOutcome PeerRegistry::markDisconnected(const std::string& id) {
    auto it = m_peers.find(id);
    if (it == m_peers.end()) {
        return DisconnectOutcome::UNKNOWN_PEER;
    }

    Peer& peer = it->second;
    if (peer.isPaired()) {
        resetRuntimeFields(peer);
        peer.last_seen = m_clock.now();
        LOG_INFO("[Registry] Paired peer " + id + " disconnected, record kept");
        return DisconnectOutcome::RETAINED;
    }

    m_estimator.resetPeer(id);
    m_peers.erase(it);
    LOG_INFO("[Registry] Peer " + id + " disconnected, removed");
    return DisconnectOutcome::REMOVED;
}

std::optional<Peer> PeerRegistry::applyDistanceUpdate(const std::string& id, double raw, RangingSourceType source) {
    auto it = m_peers.find(id);
    if (it == m_peers.end()) {
        return std::nullopt;
    }

    Peer& peer = it->second;
    peer.last_seen = m_clock.now();

    double distance = 0.0;
    if (source == RangingSourceType::SIGNAL_STRENGTH) {
        if (std::isnan(raw) || raw >= 0.0) {
            // Not a usable reading, but the peer is evidently alive.
            return peer;
        }
        const int rssi = static_cast<int>(std::lround(raw));
        peer.raw_signal_strength = rssi;
        distance = m_estimator.rssiToDistance(rssi);
    } else {
        if (std::isnan(raw) || raw < 0.0) {
            return peer;
        }
        distance = raw;
    }

    if (peer.provider_type != source) {
        // Windows never mix metres from two different technologies.
        m_estimator.resetPeer(id);
        peer.provider_type = source;
    }

    const double smoothed = m_estimator.addSample(id, distance);
    peer.distance = smoothed;
    peer.distance_level = m_estimator.distanceLevel(smoothed);
    peer.volume = m_estimator.volumeForDistance(smoothed);
    return peer;
}

std::vector<std::string> PeerRegistry::purgeStale(std::chrono::milliseconds timeout) {
    const auto now = m_clock.now();
    std::vector<std::string> removed;

    for (auto it = m_peers.begin(); it != m_peers.end();) {
        const Peer& peer = it->second;
        // An attempt still CONNECTING after the timeout is treated as abandoned
        if (!peer.isActive() && now - peer.last_seen > timeout) {
            removed.push_back(it->first);
            m_estimator.resetPeer(it->first);
            it = m_peers.erase(it);
        } else {
            ++it;
        }
    }

    if (!removed.empty()) {
        LOG_DEBUG("[Registry] Purged " + std::to_string(removed.size()) + " stale peers");
    }
    return removed;
}

std::vector<std::string> PeerRegistry::removeUnpairedIdle() {
    std::vector<std::string> removed;
    for (auto it = m_peers.begin(); it != m_peers.end();) {
        if (it->second.isActive()) {
            ++it;
            continue;
        }
        removed.push_back(it->first);
        m_estimator.resetPeer(it->first);
        it = m_peers.erase(it);
    }
    if (!removed.empty()) {
        LOG_DEBUG("[Registry] Dropped " + std::to_string(removed.size()) + " unpaired peers");
    }
    return removed;
}

bool PeerRegistry::select(const std::string& id) {
    auto it = m_peers.find(id);
    if (it == m_peers.end()) {
        return false;
    }
    const bool now_selected = !it->second.selected;
    for (auto& kv : m_peers) {
        kv.second.selected = false;
    }
    it->second.selected = now_selected;
    return now_selected;
}

bool PeerRegistry::setPairingState(const std::string& id, PairingState state) {
    auto it = m_peers.find(id);
    if (it == m_peers.end()) {
        return false;
    }
    it->second.pairing_state = state;
    return true;
}

bool PeerRegistry::updateDeviceInfo(const std::string& id, const std::string& display_name,
                                    std::optional<bool> compatible, std::optional<bool> pairing_mode) {
    auto it = m_peers.find(id);
    if (it == m_peers.end()) {
        return false;
    }
    if (!display_name.empty()) {
        it->second.display_name = display_name;
    }
    if (compatible) {
        it->second.compatible = *compatible;
    }
    if (pairing_mode) {
        it->second.in_pairing_mode = *pairing_mode;
    }
    it->second.last_seen = m_clock.now();
    return true;
}

bool PeerRegistry::touch(const std::string& id) {
    auto it = m_peers.find(id);
    if (it == m_peers.end()) {
        return false;
    }
    it->second.last_seen = m_clock.now();
    return true;
}

void PeerRegistry::rehydratePaired(const std::vector<PairedDevice>& devices) {
    for (const auto& device : devices) {
        Peer& peer = getOrCreate(device.id, device.name);
        if (!device.name.empty() && !peer.isConnected()) {
            peer.display_name = device.name;
        }
        peer.pairing_state = PairingState::PAIRED;
        peer.compatible = true;
    }
    LOG_INFO("[Registry] Rehydrated " + std::to_string(devices.size()) + " paired devices");
}

void PeerRegistry::refreshDerived() {
    for (auto& kv : m_peers) {
        Peer& peer = kv.second;
        if (peer.distance_level == DistanceLevel::UNKNOWN) {
            peer.volume = m_estimator.options().max_volume;
            continue;
        }
        peer.distance_level = m_estimator.distanceLevel(peer.distance);
        peer.volume = m_estimator.volumeForDistance(peer.distance);
    }
}

void PeerRegistry::resetSession() {
    for (auto it = m_peers.begin(); it != m_peers.end();) {
        if (it->second.isPaired()) {
            resetRuntimeFields(it->second);
            it->second.selected = false;
            ++it;
        } else {
            it = m_peers.erase(it);
        }
    }
    m_estimator.resetAll();
}

std::optional<Peer> PeerRegistry::find(const std::string& id) const {
    auto it = m_peers.find(id);
    if (it == m_peers.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Peer> PeerRegistry::peers() const {
    std::vector<Peer> out;
    out.reserve(m_peers.size());
    for (const auto& kv : m_peers) {
        out.push_back(kv.second);
    }
    return out;
}

std::vector<Peer> PeerRegistry::activePeers() const {
    std::vector<Peer> out;
    for (const auto& kv : m_peers) {
        if (kv.second.isActive()) {
            out.push_back(kv.second);
        }
    }
    return out;
}

std::vector<Peer> PeerRegistry::discoverablePeers() const {
    std::vector<Peer> out;
    for (const auto& kv : m_peers) {
        if (!kv.second.isActive()) {
            out.push_back(kv.second);
        }
    }

    std::stable_sort(out.begin(), out.end(), [](const Peer& a, const Peer& b) {
        if (a.compatible != b.compatible) {
            return a.compatible;
        }
        const bool a_known = a.distance_level != DistanceLevel::UNKNOWN;
        const bool b_known = b.distance_level != DistanceLevel::UNKNOWN;
        if (a_known != b_known) {
            return a_known;
        }
        return a.distance < b.distance;
    });
    return out;
}

std::vector<std::string> PeerRegistry::connectedPeerIds() const {
    std::vector<std::string> out;
    for (const auto& kv : m_peers) {
        if (kv.second.isConnected()) {
            out.push_back(kv.first);
        }
    }
    return out;
}

size_t PeerRegistry::connectedCount() const {
    return static_cast<size_t>(std::count_if(m_peers.begin(), m_peers.end(),
        [](const std::pair<const std::string, Peer>& kv) { return kv.second.isConnected(); }));
}

bool PeerRegistry::hasConnectedPairedPeer() const {
    return std::any_of(m_peers.begin(), m_peers.end(),
        [](const std::pair<const std::string, Peer>& kv) {
            return kv.second.isConnected() && kv.second.isPaired();
        });
}

std::optional<Peer> PeerRegistry::selectedPeer() const {
    for (const auto& kv : m_peers) {
        if (kv.second.selected) {
            return kv.second;
        }
    }
    return std::nullopt;
}

std::optional<std::string> PeerRegistry::primaryPeerId() const {
    for (const auto& kv : m_peers) {
        if (kv.second.selected && kv.second.isConnected()) {
            return kv.first;
        }
    }
    for (const auto& kv : m_peers) {
        if (kv.second.isConnected()) {
            return kv.first;
        }
    }
    return std::nullopt;
}
