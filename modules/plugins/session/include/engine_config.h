#ifndef ENGINE_CONFIG_H
#define ENGINE_CONFIG_H

#include "config_manager.h"
#include "distance_estimator.h"
#include "logger.h"

#include <chrono>
#include <optional>
#include <string>

struct EngineConfig {
    // Device
    std::string device_id;
    std::string display_name = "ProxLink Device";
    std::string service_type = "walkie-talkie";

    DistanceEstimatorOptions estimator;
    bool prefer_precise = true;

    // Timers
    std::chrono::milliseconds stale_timeout{30000};
    std::chrono::milliseconds purge_interval{5000};
    std::chrono::milliseconds heartbeat_interval{5000};    // 0 disables heartbeats
    std::chrono::milliseconds pairing_timeout{30000};
    std::chrono::milliseconds token_exchange_timeout{10000};

    std::string paired_devices_path = "paired_devices.json";
    LogLevel log_level = LogLevel::INFO;

    bool validate(std::string* error = nullptr) const;

    // Snapshot of the config document; nullopt with error on any invalid value.
    static std::optional<EngineConfig> fromConfig(const ConfigManager& config, std::string* error = nullptr);
};

#endif // ENGINE_CONFIG_H
