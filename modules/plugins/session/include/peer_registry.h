#ifndef PEER_REGISTRY_H
#define PEER_REGISTRY_H

#include "peer.h"
#include "clock.h"
#include "distance_estimator.h"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

enum class DisconnectOutcome {
    UNKNOWN_PEER,
    REMOVED,        // non-paired peer dropped together with its smoothing state
    RETAINED        // paired peer kept with runtime fields reset
};

/**
 * @brief Single owner of every Peer record, keyed by id.
 *
 * All mutation goes through here. Lookups return copies so callers never
 * hold references into the map. Not thread-safe; the engine serializes access.
 */
class PeerRegistry {
public:
    explicit PeerRegistry(const Clock& clock, const DistanceEstimatorOptions& options = DistanceEstimatorOptions());

    DistanceEstimator& estimator() { return m_estimator; }
    const DistanceEstimator& estimator() const { return m_estimator; }

    // Discovery
    Peer upsertDiscovered(const std::string& id, const std::string& display_name,
                          std::optional<int> rssi = std::nullopt, bool compatible = false);
    bool removeLost(const std::string& id);

    // Connection lifecycle
    Peer markConnecting(const std::string& id, const std::string& display_name = "");
    Peer markConnected(const std::string& id, const std::string& display_name = "");
    DisconnectOutcome markDisconnected(const std::string& id);

    // Ranging
    std::optional<Peer> applyDistanceUpdate(const std::string& id, double raw, RangingSourceType source);

    // Removes non-paired, non-connected peers not seen within timeout. Returns removed ids.
    std::vector<std::string> purgeStale(std::chrono::milliseconds timeout);
    // Same filter without the age check (leaving pairing mode).
    std::vector<std::string> removeUnpairedIdle();

    // Toggles selection of id and clears every other peer. Returns the new selection state of id.
    bool select(const std::string& id);

    bool setPairingState(const std::string& id, PairingState state);
    bool updateDeviceInfo(const std::string& id, const std::string& display_name,
                          std::optional<bool> compatible, std::optional<bool> pairing_mode = std::nullopt);
    bool touch(const std::string& id);
    void rehydratePaired(const std::vector<PairedDevice>& devices);

    // Recomputes tier and volume from the stored distance after an estimator change.
    void refreshDerived();

    // Drops every non-paired peer and resets paired ones to disconnected.
    void resetSession();

    // Queries
    std::optional<Peer> find(const std::string& id) const;
    bool contains(const std::string& id) const { return m_peers.count(id) > 0; }
    std::vector<Peer> peers() const;
    std::vector<Peer> activePeers() const;
    // Compatible peers first, then nearest first.
    std::vector<Peer> discoverablePeers() const;
    std::vector<std::string> connectedPeerIds() const;
    size_t connectedCount() const;
    bool hasConnectedPairedPeer() const;
    std::optional<Peer> selectedPeer() const;
    // Selected connected peer, else the first connected peer.
    std::optional<std::string> primaryPeerId() const;

private:
    Peer& getOrCreate(const std::string& id, const std::string& display_name);
    void resetRuntimeFields(Peer& peer);

    const Clock& m_clock;
    DistanceEstimator m_estimator;
    std::map<std::string, Peer> m_peers;
};

#endif // PEER_REGISTRY_H
