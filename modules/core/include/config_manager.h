#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;

// Owns the parsed config.json document. Getters fall back to the built-in
// defaults when a key is missing or has the wrong type, so a partial file is
// always usable. Range validation happens in EngineConfig::fromConfig.
class ConfigManager {
public:
    ConfigManager() = default;

    bool loadConfig(const std::string& config_path);
    bool loadFromString(const std::string& text, std::string* error = nullptr);

    // Writes value at a nested object path, creating intermediate objects.
    // Fails if an intermediate node exists and is not an object.
    bool setValueAtPath(const std::vector<std::string>& path, const json& value);

    const json& raw() const { return m_config; }

    // Device
    std::string getDeviceId() const;
    std::string getDisplayName() const;
    std::string getServiceType() const;

    // Ranging
    double getMeasuredPower() const;
    double getPathLossExponent() const;
    double getMinRangeMeters() const;
    double getMaxRangeMeters() const;
    bool isPreciseRangingPreferred() const;

    // Smoothing
    bool isSmoothingEnabled() const;
    int getSmoothingWindow() const;
    std::string getSmoothingPolicy() const;

    // Distance tiers
    std::string getDistanceTierProfile() const;

    // Volume
    double getVolumeMinDistance() const;
    double getVolumeMaxDistance() const;
    double getMinVolume() const;
    double getMaxVolume() const;

    // Peer management
    int getStaleTimeoutMs() const;
    int getPurgeIntervalMs() const;
    int getHeartbeatIntervalMs() const;

    // Protocols
    int getPairingTimeoutMs() const;
    int getTokenExchangeTimeoutMs() const;

    // Storage
    std::string getPairedDevicesPath() const;

    // Logging
    std::string getLogLevel() const;

private:
    template <typename T>
    T valueAt(const char* section, const char* key, const T& fallback) const;

    json m_config = json::object();
};
