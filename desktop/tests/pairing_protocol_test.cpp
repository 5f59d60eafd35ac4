#include "pairing_protocol.h"
#include "paired_device_store.h"
#include "event_loop.h"
#include "clock.h"
#include "logger.h"
#include <iostream>
#include <algorithm>
#include <map>
#include <string>
#include <vector>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

// Records outbound messages instead of putting them on a transport
class RecordingSender : public IMessageSender {
public:
    struct Sent {
        std::string peer_id;
        MessageType type;
        std::map<std::string, std::string> payload;
    };

    bool sendMessage(const std::string& peer_id, MessageType type,
                     std::map<std::string, std::string> payload,
                     std::string* error) override {
        if (fail_sends) {
            if (error) *error = "link down";
            return false;
        }
        sent.push_back({peer_id, type, std::move(payload)});
        return true;
    }

    size_t count(MessageType type) const {
        return static_cast<size_t>(std::count_if(sent.begin(), sent.end(),
            [type](const Sent& s) { return s.type == type; }));
    }

    std::vector<Sent> sent;
    bool fail_sends = false;
};

struct Fixture {
    ManualClock clock;
    PeerRegistry registry{clock};
    MemoryPairedDeviceStore store;
    EventLoop loop{clock};
    RecordingSender sender;
    NotificationQueue notifications;
    PairingProtocol pairing;

    Fixture()
        : pairing(registry, store, loop, sender, notifications, clock,
                  PairingOptions{"local", "Local Device", std::chrono::seconds(30)}) {
        loop.setHandler([this](const EngineEvent& ev) {
            if (auto* t = std::get_if<PairingTimeoutEvent>(&ev)) {
                pairing.handleTimeout(t->peer_id);
            }
        });
    }

    bool hasNotification(NotificationKind kind, const std::string& peer_id = "") {
        for (const auto& n : notifications.take()) {
            if (n.kind == kind && (peer_id.empty() || n.peer_id == peer_id)) return true;
        }
        return false;
    }
};

static wire::ProtocolMessage msg(MessageType type, std::map<std::string, std::string> payload = {}) {
    return wire::make_message(type, 1700000000.0, std::move(payload));
}

bool test_pairing_fsm_table() {
    std::cout << "Testing pairing FSM table..." << std::endl;
    using SM = PairingStateMachine;

    TEST_ASSERT(SM::compute_transition(PairingState::NONE, PairingEvent::REQUEST_SENT) == PairingState::PENDING, "none + sent");
    TEST_ASSERT(SM::compute_transition(PairingState::NONE, PairingEvent::REQUEST_RECEIVED) == PairingState::PENDING, "none + received");
    TEST_ASSERT(SM::compute_transition(PairingState::PENDING, PairingEvent::ACCEPTED) == PairingState::PAIRED, "pending + accepted");
    TEST_ASSERT(SM::compute_transition(PairingState::PENDING, PairingEvent::REJECTED) == PairingState::NONE, "pending + rejected");
    TEST_ASSERT(SM::compute_transition(PairingState::PENDING, PairingEvent::TIMEOUT) == PairingState::NONE, "pending + timeout");
    TEST_ASSERT(SM::compute_transition(PairingState::PENDING, PairingEvent::PEER_DISCONNECTED) == PairingState::NONE, "pending + disconnect");
    TEST_ASSERT(SM::compute_transition(PairingState::PAIRED, PairingEvent::UNPAIR) == PairingState::NONE, "paired + unpair");
    TEST_ASSERT(SM::compute_transition(PairingState::PAIRED, PairingEvent::ACCEPTED) == PairingState::PAIRED, "paired + accepted");

    TEST_ASSERT(!SM::compute_transition(PairingState::NONE, PairingEvent::ACCEPTED), "none + accepted is illegal");
    TEST_ASSERT(!SM::compute_transition(PairingState::PAIRED, PairingEvent::REQUEST_RECEIVED), "paired + request is illegal");
    TEST_ASSERT(!SM::compute_transition(PairingState::NONE, PairingEvent::UNPAIR), "none + unpair is illegal");

    PairingStateMachine fsm;
    TEST_ASSERT(fsm.handle_event("p", PairingState::NONE, PairingEvent::TIMEOUT) == PairingState::NONE,
                "Illegal events leave the state alone");

    std::cout << "Pairing FSM table Passed!" << std::endl;
    return true;
}

bool test_outgoing_request_accepted() {
    std::cout << "Testing outgoing request accepted..." << std::endl;
    Fixture f;
    f.registry.markConnected("peer", "Peer");

    std::string error;
    TEST_ASSERT(f.pairing.requestPairing("peer", &error), "Request should go out: " << error);
    TEST_ASSERT(f.registry.find("peer")->pairing_state == PairingState::PENDING, "Pending after request");
    TEST_ASSERT(f.sender.count(MessageType::PAIRING_REQUEST) == 1, "pairingRequest sent");
    TEST_ASSERT(f.sender.sent[0].payload["deviceId"] == "local", "Request carries our id");
    TEST_ASSERT(f.sender.sent[0].payload["deviceName"] == "Local Device", "Request carries our name");
    TEST_ASSERT(f.loop.hasScheduledEvent(PairingProtocol::timerId("peer")), "Timeout armed");
    TEST_ASSERT(f.pairing.isOutgoingPending("peer"), "Outgoing request tracked");

    TEST_ASSERT(!f.pairing.requestPairing("peer", &error), "Second request refused while pending");

    f.pairing.handleMessage("peer", msg(MessageType::PAIRING_ACCEPT, {{"deviceName", "Peer Phone"}}));
    auto p = f.registry.find("peer");
    TEST_ASSERT(p->pairing_state == PairingState::PAIRED, "Paired after accept");
    TEST_ASSERT(p->display_name == "Peer Phone", "Name from accept applied");
    TEST_ASSERT(!f.loop.hasScheduledEvent(PairingProtocol::timerId("peer")), "Timeout cancelled");
    TEST_ASSERT(f.store.saveCount() == 1, "Pairing persisted once");

    auto saved = f.store.loadPairedDevices();
    TEST_ASSERT(saved.size() == 1 && saved[0].id == "peer", "Store holds the pairing");
    TEST_ASSERT(saved[0].paired_at == f.clock.wallSeconds(), "paired_at stamped from the clock");
    TEST_ASSERT(saved[0].last_connected.has_value(), "Connected at pairing time");
    TEST_ASSERT(f.hasNotification(NotificationKind::PAIRING_COMPLETED, "peer"), "Completion notified");

    std::cout << "Outgoing request accepted Passed!" << std::endl;
    return true;
}

bool test_request_requires_connection() {
    std::cout << "Testing request requires a connection..." << std::endl;
    Fixture f;
    f.registry.upsertDiscovered("peer", "Peer");

    std::string error;
    TEST_ASSERT(!f.pairing.requestPairing("peer", &error), "Discovered-only peer cannot be asked");
    TEST_ASSERT(!error.empty(), "Error describes the refusal");
    TEST_ASSERT(!f.pairing.requestPairing("ghost", &error), "Unknown peer cannot be asked");
    TEST_ASSERT(f.sender.sent.empty(), "Nothing sent");

    f.registry.markConnected("peer", "Peer");
    f.sender.fail_sends = true;
    TEST_ASSERT(!f.pairing.requestPairing("peer", &error), "Send failure surfaces");
    TEST_ASSERT(f.registry.find("peer")->pairing_state == PairingState::NONE, "State reverted on send failure");
    TEST_ASSERT(!f.loop.hasScheduledEvent(PairingProtocol::timerId("peer")), "No timer on send failure");

    std::cout << "Request requires a connection Passed!" << std::endl;
    return true;
}

bool test_inbound_request_and_accept() {
    std::cout << "Testing inbound request..." << std::endl;
    Fixture f;
    f.registry.markConnected("peer", "Peer");

    f.pairing.handleMessage("peer", msg(MessageType::PAIRING_REQUEST, {{"deviceId", "peer"}, {"deviceName", "Peer Phone"}}));
    TEST_ASSERT(f.registry.find("peer")->pairing_state == PairingState::PENDING, "Pending after inbound request");
    TEST_ASSERT(f.pairing.pendingInboundRequest() == std::optional<std::string>("peer"), "Request surfaced");
    TEST_ASSERT(f.hasNotification(NotificationKind::PAIRING_REQUEST_RECEIVED, "peer"), "Request notified");

    std::string error;
    f.sender.fail_sends = true;
    TEST_ASSERT(!f.pairing.acceptPairing("peer", &error), "Accept fails when the reply cannot be sent");
    TEST_ASSERT(f.registry.find("peer")->pairing_state == PairingState::PENDING, "Still pending");

    f.sender.fail_sends = false;
    TEST_ASSERT(f.pairing.acceptPairing("peer", &error), "Accept succeeds: " << error);
    TEST_ASSERT(f.sender.count(MessageType::PAIRING_ACCEPT) == 1, "pairingAccept sent");
    TEST_ASSERT(f.registry.find("peer")->isPaired(), "Paired");
    TEST_ASSERT(!f.pairing.pendingInboundRequest().has_value(), "Inbound slot cleared");
    TEST_ASSERT(f.pairing.pairedDevice("peer").has_value(), "Paired device recorded");

    TEST_ASSERT(f.pairing.acceptPairing("peer", &error), "Accepting an existing pairing is a no-op");
    TEST_ASSERT(f.sender.count(MessageType::PAIRING_ACCEPT) == 1, "No extra accept sent");

    // The peer missed our accept and asks again
    f.pairing.handleMessage("peer", msg(MessageType::PAIRING_REQUEST, {{"deviceId", "peer"}}));
    TEST_ASSERT(f.sender.count(MessageType::PAIRING_ACCEPT) == 2, "Accept repeated for a paired peer");
    TEST_ASSERT(f.registry.find("peer")->isPaired(), "Still paired");

    std::cout << "Inbound request Passed!" << std::endl;
    return true;
}

bool test_second_inbound_request_dropped() {
    std::cout << "Testing second inbound request..." << std::endl;
    Fixture f;
    f.registry.markConnected("first", "First");
    f.registry.markConnected("second", "Second");

    f.pairing.handleMessage("first", msg(MessageType::PAIRING_REQUEST));
    f.pairing.handleMessage("second", msg(MessageType::PAIRING_REQUEST));

    TEST_ASSERT(f.pairing.pendingInboundRequest() == std::optional<std::string>("first"), "First request keeps the slot");
    TEST_ASSERT(f.registry.find("second")->pairing_state == PairingState::NONE, "Second request dropped");

    std::string error;
    TEST_ASSERT(!f.pairing.acceptPairing("second", &error), "Cannot accept a dropped request");
    TEST_ASSERT(f.pairing.rejectPairing("first", &error), "Reject the first");
    TEST_ASSERT(f.sender.count(MessageType::PAIRING_REJECT) == 1, "pairingReject sent");
    TEST_ASSERT(f.registry.find("first")->pairing_state == PairingState::NONE, "First back to none");
    TEST_ASSERT(!f.pairing.pendingInboundRequest().has_value(), "Slot free again");

    f.pairing.handleMessage("second", msg(MessageType::PAIRING_REQUEST));
    TEST_ASSERT(f.pairing.pendingInboundRequest() == std::optional<std::string>("second"), "Slot reusable");

    std::cout << "Second inbound request Passed!" << std::endl;
    return true;
}

bool test_crossing_requests() {
    std::cout << "Testing crossing requests..." << std::endl;
    Fixture f;
    f.registry.markConnected("peer", "Peer");

    TEST_ASSERT(f.pairing.requestPairing("peer"), "Our request");
    f.pairing.handleMessage("peer", msg(MessageType::PAIRING_REQUEST, {{"deviceId", "peer"}}));

    TEST_ASSERT(f.registry.find("peer")->isPaired(), "Crossing requests pair both sides");
    TEST_ASSERT(f.sender.count(MessageType::PAIRING_ACCEPT) == 1, "Their request answered with an accept");
    TEST_ASSERT(!f.pairing.isOutgoingPending("peer"), "Outgoing request resolved");

    std::cout << "Crossing requests Passed!" << std::endl;
    return true;
}

bool test_timeout_via_event_loop() {
    std::cout << "Testing pairing timeout..." << std::endl;
    Fixture f;
    f.registry.markConnected("peer", "Peer");
    TEST_ASSERT(f.pairing.requestPairing("peer"), "Request");
    (void)f.notifications.take();

    f.clock.advance(std::chrono::seconds(29));
    f.loop.processPending();
    TEST_ASSERT(f.registry.find("peer")->pairing_state == PairingState::PENDING, "Still pending before the deadline");

    f.clock.advance(std::chrono::seconds(2));
    f.loop.processPending();
    TEST_ASSERT(f.registry.find("peer")->pairing_state == PairingState::NONE, "Back to none after timeout");
    TEST_ASSERT(f.hasNotification(NotificationKind::PAIRING_TIMED_OUT, "peer"), "Timeout notified");

    // A late accept after the timeout does not pair
    f.pairing.handleMessage("peer", msg(MessageType::PAIRING_ACCEPT));
    TEST_ASSERT(f.registry.find("peer")->pairing_state == PairingState::NONE, "Late accept ignored");

    std::cout << "Pairing timeout Passed!" << std::endl;
    return true;
}

bool test_remote_reject_and_disconnect() {
    std::cout << "Testing remote reject and disconnect..." << std::endl;
    Fixture f;
    f.registry.markConnected("peer", "Peer");

    TEST_ASSERT(f.pairing.requestPairing("peer"), "Request");
    f.pairing.handleMessage("peer", msg(MessageType::PAIRING_REJECT));
    TEST_ASSERT(f.registry.find("peer")->pairing_state == PairingState::NONE, "Rejected");
    TEST_ASSERT(f.hasNotification(NotificationKind::PAIRING_REJECTED, "peer"), "Reject notified");

    TEST_ASSERT(f.pairing.requestPairing("peer"), "Request again");
    f.pairing.handlePeerDisconnected("peer");
    TEST_ASSERT(f.registry.find("peer")->pairing_state == PairingState::NONE, "Disconnect cancels pending pairing");
    TEST_ASSERT(!f.loop.hasScheduledEvent(PairingProtocol::timerId("peer")), "Timer cancelled");

    std::cout << "Remote reject and disconnect Passed!" << std::endl;
    return true;
}

bool test_unpair() {
    std::cout << "Testing unpair..." << std::endl;
    Fixture f;
    f.registry.markConnected("peer", "Peer");

    std::string error;
    TEST_ASSERT(f.pairing.unpair("peer", &error), "Unpairing an unpaired peer is a no-op");
    TEST_ASSERT(f.sender.sent.empty(), "Nothing sent for a no-op unpair");

    TEST_ASSERT(f.pairing.requestPairing("peer"), "Request");
    TEST_ASSERT(!f.pairing.unpair("peer", &error), "Cannot unpair while pending");

    f.pairing.handleMessage("peer", msg(MessageType::PAIRING_ACCEPT));
    TEST_ASSERT(f.registry.find("peer")->isPaired(), "Paired");
    (void)f.notifications.take();

    TEST_ASSERT(f.pairing.unpair("peer", &error), "Unpair: " << error);
    TEST_ASSERT(f.sender.count(MessageType::DISCONNECT) == 1, "Peer told about the unpair");
    TEST_ASSERT(f.registry.find("peer")->pairing_state == PairingState::NONE, "Unpaired");
    TEST_ASSERT(f.store.loadPairedDevices().empty(), "Store emptied");
    TEST_ASSERT(f.hasNotification(NotificationKind::UNPAIRED, "peer"), "Unpair notified");

    std::cout << "Unpair Passed!" << std::endl;
    return true;
}

bool test_remote_unpair() {
    std::cout << "Testing remote unpair..." << std::endl;
    Fixture f;
    f.registry.markConnected("peer", "Peer");
    f.pairing.handleMessage("peer", msg(MessageType::PAIRING_REQUEST));
    TEST_ASSERT(f.pairing.acceptPairing("peer"), "Accept");

    f.pairing.handleMessage("peer", msg(MessageType::DISCONNECT));
    TEST_ASSERT(f.registry.find("peer")->pairing_state == PairingState::NONE, "Remote unpair applied");
    TEST_ASSERT(!f.pairing.pairedDevice("peer").has_value(), "Record dropped");

    std::cout << "Remote unpair Passed!" << std::endl;
    return true;
}

bool test_persist_failure_banner() {
    std::cout << "Testing persistence failure..." << std::endl;
    Fixture f;
    f.registry.markConnected("peer", "Peer");
    f.store.setSaveFails(true);

    TEST_ASSERT(f.pairing.requestPairing("peer"), "Request");
    f.pairing.handleMessage("peer", msg(MessageType::PAIRING_ACCEPT));
    TEST_ASSERT(f.registry.find("peer")->isPaired(), "Paired in memory");

    bool banner = false;
    bool completed = false;
    for (const auto& n : f.notifications.take()) {
        if (n.kind == NotificationKind::ERROR_BANNER) banner = true;
        if (n.kind == NotificationKind::PAIRING_COMPLETED) completed = true;
    }
    TEST_ASSERT(banner, "Save failure raises a banner");
    TEST_ASSERT(completed, "Pairing still completes");

    std::cout << "Persistence failure Passed!" << std::endl;
    return true;
}

bool test_load_persisted() {
    std::cout << "Testing persisted pairings..." << std::endl;
    Fixture f;
    PairedDevice dev;
    dev.id = "old-friend";
    dev.name = "Old Friend";
    dev.paired_at = 1600000000.0;
    TEST_ASSERT(f.store.savePairedDevices({dev}), "Seed store");

    f.pairing.loadPersisted();
    auto p = f.registry.find("old-friend");
    TEST_ASSERT(p && p->isPaired(), "Rehydrated as paired");
    TEST_ASSERT(!p->isConnected(), "Not connected yet");

    f.registry.markConnected("old-friend", "Old Friend");
    f.pairing.handlePeerConnected("old-friend");
    auto record = f.pairing.pairedDevice("old-friend");
    TEST_ASSERT(record && record->last_connected == f.clock.wallSeconds(), "last_connected updated");
    TEST_ASSERT(f.store.loadPairedDevices()[0].last_connected.has_value(), "last_connected persisted");

    std::cout << "Persisted pairings Passed!" << std::endl;
    return true;
}

int main() {
    set_log_level(LogLevel::ERROR);
    std::cout << "Running Pairing Protocol Tests..." << std::endl;

    test_pairing_fsm_table();
    test_outgoing_request_accepted();
    test_request_requires_connection();
    test_inbound_request_and_accept();
    test_second_inbound_request_dropped();
    test_crossing_requests();
    test_timeout_via_event_loop();
    test_remote_reject_and_disconnect();
    test_unpair();
    test_remote_unpair();
    test_persist_failure_banner();
    test_load_persisted();

    if (tests_failed == 0) {
        std::cout << "ALL PAIRING PROTOCOL TESTS PASSED" << std::endl;
        return 0;
    } else {
        std::cout << tests_failed << " TESTS FAILED" << std::endl;
        return 1;
    }
}
