#include "config_manager.h"
#include "logger.h"
#include <fstream>

bool ConfigManager::loadConfig(const std::string& config_path) {
    try {
        std::ifstream config_file(config_path);
        if (!config_file.is_open()) {
            LOG_ERROR("ConfigManager: Failed to open config file: " + config_path);
            return false;
        }
        json parsed;
        config_file >> parsed;
        if (!parsed.is_object()) {
            LOG_ERROR("ConfigManager: Top-level value is not an object: " + config_path);
            return false;
        }
        m_config = std::move(parsed);
        LOG_INFO("ConfigManager: Configuration loaded from " + config_path);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("ConfigManager: Config loading failed: " + std::string(e.what()));
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& text, std::string* error) {
    try {
        json parsed = json::parse(text);
        if (!parsed.is_object()) {
            if (error) *error = "top-level value is not an object";
            return false;
        }
        m_config = std::move(parsed);
        return true;
    } catch (const json::exception& e) {
        if (error) *error = e.what();
        return false;
    }
}

bool ConfigManager::setValueAtPath(const std::vector<std::string>& path, const json& value) {
    if (path.empty()) {
        return false;
    }

    json* node = &m_config;
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        json& child = (*node)[path[i]];
        if (child.is_null()) {
            child = json::object();
        } else if (!child.is_object()) {
            LOG_WARN("ConfigManager: Cannot descend into non-object key " + path[i]);
            return false;
        }
        node = &child;
    }
    (*node)[path.back()] = value;
    return true;
}

template <typename T>
T ConfigManager::valueAt(const char* section, const char* key, const T& fallback) const {
    auto sit = m_config.find(section);
    if (sit == m_config.end() || !sit->is_object()) {
        return fallback;
    }
    auto kit = sit->find(key);
    if (kit == sit->end() || kit->is_null()) {
        return fallback;
    }
    try {
        return kit->template get<T>();
    } catch (const json::exception&) {
        LOG_WARN(std::string("ConfigManager: Wrong type for ") + section + "." + key + ", using default");
        return fallback;
    }
}

std::string ConfigManager::getDeviceId() const {
    return valueAt<std::string>("device", "id", "");
}

std::string ConfigManager::getDisplayName() const {
    return valueAt<std::string>("device", "display_name", "ProxLink Device");
}

std::string ConfigManager::getServiceType() const {
    return valueAt<std::string>("device", "service_type", "walkie-talkie");
}

double ConfigManager::getMeasuredPower() const {
    return valueAt<double>("ranging", "measured_power", -50.0);
}

double ConfigManager::getPathLossExponent() const {
    return valueAt<double>("ranging", "path_loss_exponent", 2.0);
}

double ConfigManager::getMinRangeMeters() const {
    return valueAt<double>("ranging", "min_range_m", 0.0);
}

double ConfigManager::getMaxRangeMeters() const {
    return valueAt<double>("ranging", "max_range_m", 50.0);
}

bool ConfigManager::isPreciseRangingPreferred() const {
    return valueAt<bool>("ranging", "prefer_precise", true);
}

bool ConfigManager::isSmoothingEnabled() const {
    return valueAt<bool>("smoothing", "enabled", true);
}

int ConfigManager::getSmoothingWindow() const {
    return valueAt<int>("smoothing", "window_size", 5);
}

std::string ConfigManager::getSmoothingPolicy() const {
    return valueAt<std::string>("smoothing", "policy", "sigma");
}

std::string ConfigManager::getDistanceTierProfile() const {
    return valueAt<std::string>("distance_tiers", "profile", "standard");
}

double ConfigManager::getVolumeMinDistance() const {
    return valueAt<double>("volume", "min_distance", 1.0);
}

double ConfigManager::getVolumeMaxDistance() const {
    return valueAt<double>("volume", "max_distance", 10.0);
}

double ConfigManager::getMinVolume() const {
    return valueAt<double>("volume", "min_volume", 0.1);
}

double ConfigManager::getMaxVolume() const {
    return valueAt<double>("volume", "max_volume", 1.0);
}

int ConfigManager::getStaleTimeoutMs() const {
    return valueAt<int>("peers", "stale_timeout_ms", 30000);
}

int ConfigManager::getPurgeIntervalMs() const {
    return valueAt<int>("peers", "purge_interval_ms", 5000);
}

int ConfigManager::getHeartbeatIntervalMs() const {
    return valueAt<int>("peers", "heartbeat_interval_ms", 5000);
}

int ConfigManager::getPairingTimeoutMs() const {
    return valueAt<int>("pairing", "request_timeout_ms", 30000);
}

int ConfigManager::getTokenExchangeTimeoutMs() const {
    return valueAt<int>("token_exchange", "timeout_ms", 10000);
}

std::string ConfigManager::getPairedDevicesPath() const {
    return valueAt<std::string>("storage", "paired_devices_path", "paired_devices.json");
}

std::string ConfigManager::getLogLevel() const {
    return valueAt<std::string>("logging", "level", "info");
}
