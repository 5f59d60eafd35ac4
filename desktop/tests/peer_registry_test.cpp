#include "peer_registry.h"
#include "clock.h"
#include "logger.h"
#include <iostream>
#include <algorithm>
#include <cmath>
#include <limits>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

bool test_discovery_upsert() {
    std::cout << "Testing discovery upsert..." << std::endl;
    ManualClock clock;
    PeerRegistry registry(clock);

    Peer p = registry.upsertDiscovered("a", "", std::nullopt, false);
    TEST_ASSERT(p.display_name == "a", "Missing name defaults to the id");
    TEST_ASSERT(p.connection_state == ConnectionState::DISCONNECTED, "Discovered peers start disconnected");
    TEST_ASSERT(p.distance_level == DistanceLevel::UNKNOWN, "No reading yet");

    p = registry.upsertDiscovered("a", "Alpha", -70, true);
    TEST_ASSERT(p.display_name == "Alpha", "Name should be updated");
    TEST_ASSERT(p.compatible, "Compatibility should be recorded");
    TEST_ASSERT(p.raw_signal_strength == -70, "RSSI should be stored");
    TEST_ASSERT(std::fabs(p.distance - 10.0) < 1e-6, "RSSI should be converted to distance");
    TEST_ASSERT(p.distance_level == DistanceLevel::VERY_FAR, "10 m is very far");

    p = registry.upsertDiscovered("a", "", std::nullopt, false);
    TEST_ASSERT(p.compatible, "A later advert without the flag does not clear compatibility");
    TEST_ASSERT(registry.peers().size() == 1, "Upserts should not duplicate peers");

    std::cout << "Discovery upsert Passed!" << std::endl;
    return true;
}

bool test_connected_peer_keeps_state_on_rediscovery() {
    std::cout << "Testing rediscovery of a connected peer..." << std::endl;
    ManualClock clock;
    PeerRegistry registry(clock);

    registry.markConnected("a", "Alpha");
    registry.setPairingState("a", PairingState::PAIRED);
    registry.upsertDiscovered("a", "Renamed", -60, false);

    auto p = registry.find("a");
    TEST_ASSERT(p.has_value(), "Peer should exist");
    TEST_ASSERT(p->isConnected(), "Connection state kept");
    TEST_ASSERT(p->isPaired(), "Pairing state kept");
    TEST_ASSERT(p->display_name == "Alpha", "Name from the connection kept");
    TEST_ASSERT(p->raw_signal_strength == -60, "Signal strength still refreshed");

    std::cout << "Rediscovery of a connected peer Passed!" << std::endl;
    return true;
}

bool test_disconnect_outcomes() {
    std::cout << "Testing disconnect outcomes..." << std::endl;
    ManualClock clock;
    PeerRegistry registry(clock);

    registry.markConnected("plain", "Plain");
    registry.markConnected("paired", "Paired");
    registry.setPairingState("paired", PairingState::PAIRED);
    registry.applyDistanceUpdate("paired", 2.0, RangingSourceType::PRECISE);

    TEST_ASSERT(registry.markDisconnected("plain") == DisconnectOutcome::REMOVED, "Unpaired peer removed");
    TEST_ASSERT(!registry.contains("plain"), "Unpaired peer gone");

    TEST_ASSERT(registry.markDisconnected("paired") == DisconnectOutcome::RETAINED, "Paired peer retained");
    auto p = registry.find("paired");
    TEST_ASSERT(p && p->connection_state == ConnectionState::DISCONNECTED, "Paired peer disconnected");
    TEST_ASSERT(p->isPaired(), "Pairing survives the disconnect");
    TEST_ASSERT(p->distance_level == DistanceLevel::UNKNOWN, "Distance reset");
    TEST_ASSERT(p->provider_type == RangingSourceType::SIGNAL_STRENGTH, "Provider reset");
    TEST_ASSERT(registry.estimator().sampleCount("paired") == 0, "Smoothing window reset");

    TEST_ASSERT(registry.markDisconnected("ghost") == DisconnectOutcome::UNKNOWN_PEER, "Unknown peer");

    std::cout << "Disconnect outcomes Passed!" << std::endl;
    return true;
}

bool test_lost_peers() {
    std::cout << "Testing lost peers..." << std::endl;
    ManualClock clock;
    PeerRegistry registry(clock);

    registry.upsertDiscovered("seen", "Seen");
    registry.markConnecting("dialing", "Dialing");
    registry.markConnected("linked", "Linked");

    TEST_ASSERT(registry.removeLost("seen"), "Discovered-only peer removed");
    TEST_ASSERT(registry.removeLost("dialing"), "Unresolved connection attempt removed");
    TEST_ASSERT(!registry.removeLost("linked"), "Connected peer kept");
    TEST_ASSERT(!registry.removeLost("ghost"), "Unknown peer ignored");

    std::cout << "Lost peers Passed!" << std::endl;
    return true;
}

bool test_distance_updates() {
    std::cout << "Testing distance updates..." << std::endl;
    ManualClock clock;
    PeerRegistry registry(clock);

    TEST_ASSERT(!registry.applyDistanceUpdate("ghost", 1.0, RangingSourceType::PRECISE).has_value(),
                "Unknown peer ignored");

    registry.markConnected("a", "Alpha");
    auto p = registry.applyDistanceUpdate("a", 0.5, RangingSourceType::PRECISE);
    TEST_ASSERT(p && p->provider_type == RangingSourceType::PRECISE, "Provider follows the sample");
    TEST_ASSERT(p->distance_level == DistanceLevel::IMMEDIATE, "0.5 m is immediate");
    TEST_ASSERT(std::fabs(p->volume - 1.0) < 1e-9, "Close peer at full volume");

    registry.applyDistanceUpdate("a", 0.6, RangingSourceType::PRECISE);
    TEST_ASSERT(registry.estimator().sampleCount("a") == 2, "Two precise samples in the window");

    p = registry.applyDistanceUpdate("a", -60, RangingSourceType::SIGNAL_STRENGTH);
    TEST_ASSERT(p->provider_type == RangingSourceType::SIGNAL_STRENGTH, "Provider switched");
    TEST_ASSERT(registry.estimator().sampleCount("a") == 1, "Switching provider resets the window");
    TEST_ASSERT(p->raw_signal_strength == -60, "RSSI recorded");

    const double before = p->distance;
    clock.advance(std::chrono::seconds(5));
    p = registry.applyDistanceUpdate("a", 0.0, RangingSourceType::SIGNAL_STRENGTH);
    TEST_ASSERT(p->distance == before, "rssi 0 leaves distance untouched");
    TEST_ASSERT(p->last_seen == clock.now(), "rssi 0 still counts as liveness");

    p = registry.applyDistanceUpdate("a", std::numeric_limits<double>::quiet_NaN(), RangingSourceType::PRECISE);
    TEST_ASSERT(p->provider_type == RangingSourceType::SIGNAL_STRENGTH, "NaN precise sample ignored");

    std::cout << "Distance updates Passed!" << std::endl;
    return true;
}

bool test_stale_purge() {
    std::cout << "Testing stale purge..." << std::endl;
    ManualClock clock;
    PeerRegistry registry(clock);

    registry.upsertDiscovered("old", "Old");
    registry.upsertDiscovered("paired", "Paired");
    registry.setPairingState("paired", PairingState::PAIRED);
    registry.markConnected("linked", "Linked");
    registry.markConnecting("dialing", "Dialing");

    clock.advance(std::chrono::seconds(20));
    registry.upsertDiscovered("fresh", "Fresh");
    clock.advance(std::chrono::seconds(15));

    auto removed = registry.purgeStale(std::chrono::seconds(30));
    TEST_ASSERT(removed.size() == 2, "Stale discovered peer and abandoned attempt purged, got " << removed.size());
    TEST_ASSERT(!registry.contains("old"), "Stale discovered peer purged");
    TEST_ASSERT(!registry.contains("dialing"), "Connection attempt never resolved is purged");
    TEST_ASSERT(registry.contains("fresh"), "Recently seen peer kept");
    TEST_ASSERT(registry.contains("paired"), "Paired peer exempt");
    TEST_ASSERT(registry.contains("linked"), "Connected peer exempt");

    // A fresh attempt is still within the timeout
    registry.markConnecting("retry", "Retry");
    clock.advance(std::chrono::seconds(10));
    TEST_ASSERT(registry.purgeStale(std::chrono::seconds(30)).empty(), "Recent connection attempt kept");
    TEST_ASSERT(registry.contains("retry"), "Connecting peer still present");

    // Leaving pairing mode drops every idle unpaired record regardless of age
    removed = registry.removeUnpairedIdle();
    TEST_ASSERT(removed.size() == 2, "fresh and retry dropped, got " << removed.size());
    TEST_ASSERT(registry.contains("paired") && registry.contains("linked"), "Paired and connected kept");

    std::cout << "Stale purge Passed!" << std::endl;
    return true;
}

bool test_discoverable_ordering() {
    std::cout << "Testing discoverable ordering..." << std::endl;
    ManualClock clock;
    PeerRegistry registry(clock);

    registry.upsertDiscovered("far", "Far", -70, true);
    registry.upsertDiscovered("near", "Near", -52, true);
    registry.upsertDiscovered("silent", "Silent", std::nullopt, true);
    registry.upsertDiscovered("other", "Other", -45, false);
    registry.markConnected("linked", "Linked");

    auto list = registry.discoverablePeers();
    TEST_ASSERT(list.size() == 4, "Connected peers are not discoverable");
    TEST_ASSERT(list[0].id == "near", "Nearest compatible first, got " << list[0].id);
    TEST_ASSERT(list[1].id == "far", "Then the farther compatible peer");
    TEST_ASSERT(list[2].id == "silent", "Compatible peer without a reading after ranged ones");
    TEST_ASSERT(list[3].id == "other", "Incompatible peers last");

    auto active = registry.activePeers();
    TEST_ASSERT(active.size() == 1 && active[0].id == "linked", "Active list holds the connected peer");

    std::cout << "Discoverable ordering Passed!" << std::endl;
    return true;
}

bool test_selection_and_primary() {
    std::cout << "Testing selection..." << std::endl;
    ManualClock clock;
    PeerRegistry registry(clock);

    registry.markConnected("a", "A");
    registry.markConnected("b", "B");
    TEST_ASSERT(registry.primaryPeerId() == std::optional<std::string>("a"), "First connected peer is primary");

    TEST_ASSERT(registry.select("b"), "Selecting b");
    TEST_ASSERT(registry.primaryPeerId() == std::optional<std::string>("b"), "Selected peer is primary");
    TEST_ASSERT(registry.select("a"), "Selecting a");
    TEST_ASSERT(!registry.find("b")->selected, "Selection is exclusive");
    TEST_ASSERT(!registry.select("a"), "Selecting again toggles off");
    TEST_ASSERT(!registry.selectedPeer().has_value(), "Nothing selected");
    TEST_ASSERT(!registry.select("ghost"), "Unknown peer cannot be selected");

    std::cout << "Selection Passed!" << std::endl;
    return true;
}

bool test_rehydrate_and_reset() {
    std::cout << "Testing rehydrate and session reset..." << std::endl;
    ManualClock clock;
    PeerRegistry registry(clock);

    PairedDevice dev;
    dev.id = "buddy";
    dev.name = "Buddy";
    dev.paired_at = 1700000000.0;
    registry.rehydratePaired({dev});

    auto p = registry.find("buddy");
    TEST_ASSERT(p && p->isPaired() && p->compatible, "Rehydrated peer is paired and compatible");
    TEST_ASSERT(p->display_name == "Buddy", "Name from the record");
    TEST_ASSERT(p->connection_state == ConnectionState::DISCONNECTED, "Rehydrated peer not connected");
    TEST_ASSERT(p->isActive(), "Paired peers count as active");

    registry.markConnected("buddy", "Buddy");
    registry.upsertDiscovered("stranger", "Stranger", -60);
    registry.resetSession();

    TEST_ASSERT(!registry.contains("stranger"), "Non-paired peers dropped on reset");
    p = registry.find("buddy");
    TEST_ASSERT(p && !p->isConnected() && p->isPaired(), "Paired peer kept, disconnected");
    TEST_ASSERT(registry.connectedCount() == 0, "Nothing connected after reset");

    std::cout << "Rehydrate and session reset Passed!" << std::endl;
    return true;
}

bool test_refresh_derived() {
    std::cout << "Testing derived value refresh..." << std::endl;
    ManualClock clock;
    PeerRegistry registry(clock);

    registry.markConnected("a", "A");
    registry.applyDistanceUpdate("a", 7.0, RangingSourceType::PRECISE);
    TEST_ASSERT(registry.find("a")->distance_level == DistanceLevel::FAR, "7 m is far in standard tiers");

    DistanceEstimatorOptions opts = registry.estimator().options();
    opts.tier_profile = TierProfile::EXTENDED;
    opts.max_volume = 0.5;
    TEST_ASSERT(registry.estimator().configure(opts), "Reconfigure");
    registry.refreshDerived();

    auto p = registry.find("a");
    TEST_ASSERT(p->distance_level == DistanceLevel::MEDIUM, "7 m is medium in extended tiers");
    TEST_ASSERT(p->volume <= 0.5, "Volume respects the new bound");

    std::cout << "Derived value refresh Passed!" << std::endl;
    return true;
}

int main() {
    set_log_level(LogLevel::ERROR);
    std::cout << "Running Peer Registry Tests..." << std::endl;

    test_discovery_upsert();
    test_connected_peer_keeps_state_on_rediscovery();
    test_disconnect_outcomes();
    test_lost_peers();
    test_distance_updates();
    test_stale_purge();
    test_discoverable_ordering();
    test_selection_and_primary();
    test_rehydrate_and_reset();
    test_refresh_derived();

    if (tests_failed == 0) {
        std::cout << "ALL PEER REGISTRY TESTS PASSED" << std::endl;
        return 0;
    } else {
        std::cout << tests_failed << " TESTS FAILED" << std::endl;
        return 1;
    }
}
