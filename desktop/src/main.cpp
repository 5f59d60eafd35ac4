#include "proximity_engine.h"
#include "loopback_transport.h"
#include "simulated_ranging_source.h"
#include "paired_device_store.h"
#include "config_manager.h"
#include "engine_config.h"
#include "clock.h"
#include "logger.h"
#include <iostream>
#include <iomanip>
#include <memory>
#include <string>
#include <vector>
#include <filesystem>

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Runs two proximity engines against each other over an in-process transport.\n\n"
              << "Options:\n"
              << "  --config FILE    Path to configuration file (default: config.json)\n"
              << "  --log-level LVL  Log level: debug|info|warning|error|none (default: from config)\n"
              << "  --scenario NAME  precise|fallback|pairing (default: precise)\n"
              << "  --persist DIR    Keep paired devices in DIR instead of memory\n"
              << "  --help           Show this help message\n"
              << std::endl;
}

namespace {

struct SimDevice {
    std::string id;
    std::unique_ptr<LoopbackTransport> transport;
    std::unique_ptr<SimulatedRangingSource> precise;
    std::unique_ptr<SimulatedRangingSource> fallback;
    std::unique_ptr<IPairedDeviceStore> store;
    std::unique_ptr<ProximityEngine> engine;
};

std::unique_ptr<SimDevice> make_device(LoopbackHub& hub, const Clock& clock, EngineConfig config,
                                       const std::string& id, const std::string& name,
                                       bool precise_available, const std::string& persist_dir) {
    auto device = std::make_unique<SimDevice>();
    device->id = id;
    config.device_id = id;
    config.display_name = name;

    device->transport = std::make_unique<LoopbackTransport>(hub, id, name, true);
    device->precise = std::make_unique<SimulatedRangingSource>(RangingSourceType::PRECISE, precise_available);
    device->fallback = std::make_unique<SimulatedRangingSource>(RangingSourceType::SIGNAL_STRENGTH);
    if (persist_dir.empty()) {
        device->store = std::make_unique<MemoryPairedDeviceStore>();
    } else {
        std::filesystem::path path = std::filesystem::path(persist_dir) / (id + "_paired_devices.json");
        device->store = std::make_unique<JsonPairedDeviceStore>(path.string());
    }

    device->engine = std::make_unique<ProximityEngine>(config, clock, *device->transport,
                                                       device->precise.get(), device->fallback.get(),
                                                       *device->store);
    const std::string tag = id;
    device->engine->setNotificationSink([tag](const EngineNotification& n) {
        if (n.kind == NotificationKind::PEERS_CHANGED) {
            return;
        }
        std::string line = "[" + tag + "] " + notification_kind_to_string(n.kind);
        if (n.kind == NotificationKind::APP_STATE_CHANGED) {
            line += std::string(" -> ") + app_state_to_string(n.app_state);
        }
        if (!n.peer_id.empty()) line += " peer=" + n.peer_id;
        if (!n.message.empty()) line += " (" + n.message + ")";
        std::cout << line << std::endl;
    });
    return device;
}

void pump(ManualClock& clock, std::vector<SimDevice*> devices, std::chrono::milliseconds step = std::chrono::milliseconds(0)) {
    if (step.count() > 0) {
        clock.advance(step);
    }
    // Frames delivered by one engine land in another's queue; pump until quiet.
    for (int round = 0; round < 16; ++round) {
        size_t handled = 0;
        for (auto* d : devices) {
            handled += d->engine->processPending();
        }
        if (handled == 0) break;
    }
}

void print_peers(const SimDevice& device) {
    std::cout << "  " << device.id << " sees:" << std::endl;
    for (const auto& p : device.engine->peers()) {
        std::cout << "    " << std::left << std::setw(8) << p.id
                  << " conn=" << std::setw(12) << connection_state_to_string(p.connection_state)
                  << " pair=" << std::setw(7) << pairing_state_to_string(p.pairing_state)
                  << " src=" << std::setw(15) << ranging_source_type_to_string(p.provider_type)
                  << std::fixed << std::setprecision(2)
                  << " d=" << std::setw(6) << p.distance << "m"
                  << " tier=" << std::setw(9) << distance_level_to_string(p.distance_level)
                  << " vol=" << p.volume << std::endl;
    }
}

int run_precise(LoopbackHub& hub, ManualClock& clock, SimDevice& a, SimDevice& b) {
    std::vector<SimDevice*> all{&a, &b};

    hub.announce(a.id, b.id, -60);
    hub.announce(b.id, a.id, -60);
    hub.connect(a.id, b.id);
    pump(clock, all);

    std::cout << "After connect: " << a.id << "=" << app_state_to_string(a.engine->appState())
              << " " << b.id << "=" << app_state_to_string(b.engine->appState()) << std::endl;

    const double walk[] = {0.5, 1.5, 2.5, 4.0, 5.0, 7.0, 9.0, 12.0, 60.0, 12.5};
    for (double metres : walk) {
        a.precise->emitSample(b.id, metres);
        b.precise->emitSample(a.id, metres);
        pump(clock, all, std::chrono::milliseconds(500));
    }
    print_peers(a);
    print_peers(b);

    std::cout << "Precise ranging on " << a.id << " drops out" << std::endl;
    a.precise->invalidate("hardware session ended");
    pump(clock, all);
    a.fallback->emitSample(b.id, -58);
    pump(clock, all);
    print_peers(a);
    std::cout << a.id << " ranging source: "
              << ranging_source_type_to_string(a.engine->activeRangingSource().value_or(RangingSourceType::SIGNAL_STRENGTH))
              << ", state " << app_state_to_string(a.engine->appState()) << std::endl;
    return 0;
}

int run_fallback(LoopbackHub& hub, ManualClock& clock, SimDevice& a, SimDevice& b) {
    std::vector<SimDevice*> all{&a, &b};

    hub.connect(a.id, b.id);
    pump(clock, all);

    const int readings[] = {-50, -56, -62, -68, -70, -20, -71, -74};
    for (int rssi : readings) {
        a.fallback->emitSample(b.id, rssi);
        pump(clock, all, std::chrono::milliseconds(500));
    }
    print_peers(a);
    std::cout << a.id << " state " << app_state_to_string(a.engine->appState()) << std::endl;
    return 0;
}

int run_pairing(LoopbackHub& hub, ManualClock& clock, SimDevice& a, SimDevice& b) {
    std::vector<SimDevice*> all{&a, &b};
    std::string error;

    if (!b.engine->startPairingMode(&error)) {
        std::cerr << "Pairing mode failed: " << error << std::endl;
        return 1;
    }
    hub.connect(a.id, b.id);
    pump(clock, all);

    if (!a.engine->requestPairing(b.id, &error)) {
        std::cerr << "Pairing request failed: " << error << std::endl;
        return 1;
    }
    pump(clock, all);

    auto pending = b.engine->pendingPairingRequest();
    if (!pending) {
        std::cerr << "Pairing request never surfaced on " << b.id << std::endl;
        return 1;
    }
    if (!b.engine->acceptPairing(*pending, &error)) {
        std::cerr << "Accept failed: " << error << std::endl;
        return 1;
    }
    pump(clock, all);
    b.engine->stopPairingMode();
    pump(clock, all);
    print_peers(a);
    print_peers(b);

    std::cout << "Link drops and comes back" << std::endl;
    hub.disconnect(a.id, b.id);
    pump(clock, all, std::chrono::seconds(10));
    print_peers(a);
    hub.connect(a.id, b.id);
    pump(clock, all, std::chrono::seconds(10));
    print_peers(a);

    std::cout << b.id << " unpairs" << std::endl;
    if (!b.engine->unpair(a.id, &error)) {
        std::cerr << "Unpair failed: " << error << std::endl;
        return 1;
    }
    pump(clock, all);
    print_peers(a);
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = "config.json";
    std::string scenario = "precise";
    std::string persist_dir;
    std::string log_level_arg;

    // Parse arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            if (i + 1 < argc) {
                config_path = argv[++i];
            } else {
                std::cerr << "Error: --config requires an argument" << std::endl;
                return 1;
            }
        } else if (arg == "--log-level") {
            if (i + 1 < argc) {
                log_level_arg = argv[++i];
            } else {
                std::cerr << "Error: --log-level requires an argument" << std::endl;
                return 1;
            }
        } else if (arg == "--scenario") {
            if (i + 1 < argc) {
                scenario = argv[++i];
            } else {
                std::cerr << "Error: --scenario requires an argument" << std::endl;
                return 1;
            }
        } else if (arg == "--persist") {
            if (i + 1 < argc) {
                persist_dir = argv[++i];
            } else {
                std::cerr << "Error: --persist requires an argument" << std::endl;
                return 1;
            }
        } else {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    ConfigManager config;
    if (!config.loadConfig(config_path)) {
        std::cerr << "Warning: using built-in defaults" << std::endl;
    }
    // The simulator names its own devices
    (void)config.setValueAtPath({"device", "id"}, "sim");

    std::string error;
    auto engine_config = EngineConfig::fromConfig(config, &error);
    if (!engine_config) {
        std::cerr << "Error: invalid configuration: " << error << std::endl;
        return 1;
    }
    set_log_level(log_level_arg.empty() ? engine_config->log_level : parse_log_level(log_level_arg));
    setNodeTag("sim");

    ManualClock clock;
    LoopbackHub hub;
    const bool precise = scenario != "fallback";
    auto alpha = make_device(hub, clock, *engine_config, "alpha", "Alpha Walkie", precise, persist_dir);
    auto bravo = make_device(hub, clock, *engine_config, "bravo", "Bravo Walkie", precise, persist_dir);

    for (auto* d : {alpha.get(), bravo.get()}) {
        if (!d->engine->start(&error)) {
            std::cerr << "Error: " << d->id << " failed to start: " << error << std::endl;
            return 1;
        }
    }

    int rc = 0;
    if (scenario == "precise") {
        rc = run_precise(hub, clock, *alpha, *bravo);
    } else if (scenario == "fallback") {
        rc = run_fallback(hub, clock, *alpha, *bravo);
    } else if (scenario == "pairing") {
        rc = run_pairing(hub, clock, *alpha, *bravo);
    } else {
        std::cerr << "Error: Unknown scenario: " << scenario << std::endl;
        rc = 1;
    }

    alpha->engine->stop();
    bravo->engine->stop();
    return rc;
}
