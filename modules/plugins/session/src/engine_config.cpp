#include "engine_config.h"

namespace {
    bool fail(std::string* error, const std::string& msg) {
        if (error) *error = msg;
        return false;
    }
}

bool EngineConfig::validate(std::string* error) const {
    if (device_id.empty()) {
        return fail(error, "device.id must not be empty");
    }
    if (stale_timeout.count() <= 0) {
        return fail(error, "peers.stale_timeout_ms must be > 0");
    }
    if (purge_interval.count() <= 0) {
        return fail(error, "peers.purge_interval_ms must be > 0");
    }
    if (heartbeat_interval.count() < 0) {
        return fail(error, "peers.heartbeat_interval_ms must be >= 0");
    }
    if (pairing_timeout.count() <= 0) {
        return fail(error, "pairing.request_timeout_ms must be > 0");
    }
    if (token_exchange_timeout.count() <= 0) {
        return fail(error, "token_exchange.timeout_ms must be > 0");
    }
    return DistanceEstimator::validate(estimator, error);
}

std::optional<EngineConfig> EngineConfig::fromConfig(const ConfigManager& config, std::string* error) {
    EngineConfig c;
    c.device_id = config.getDeviceId();
    c.display_name = config.getDisplayName();
    c.service_type = config.getServiceType();

    c.estimator.measured_power = config.getMeasuredPower();
    c.estimator.path_loss_exponent = config.getPathLossExponent();
    c.estimator.min_range_m = config.getMinRangeMeters();
    c.estimator.max_range_m = config.getMaxRangeMeters();
    c.estimator.smoothing_enabled = config.isSmoothingEnabled();
    c.estimator.window_size = config.getSmoothingWindow();
    if (!parse_smoothing_policy(config.getSmoothingPolicy(), c.estimator.smoothing_policy)) {
        fail(error, "smoothing.policy must be \"sigma\" or \"trim\"");
        return std::nullopt;
    }
    if (!parse_tier_profile(config.getDistanceTierProfile(), c.estimator.tier_profile)) {
        fail(error, "distance_tiers.profile must be \"standard\" or \"extended\"");
        return std::nullopt;
    }
    c.estimator.min_distance = config.getVolumeMinDistance();
    c.estimator.max_distance = config.getVolumeMaxDistance();
    c.estimator.min_volume = config.getMinVolume();
    c.estimator.max_volume = config.getMaxVolume();
    c.prefer_precise = config.isPreciseRangingPreferred();

    c.stale_timeout = std::chrono::milliseconds(config.getStaleTimeoutMs());
    c.purge_interval = std::chrono::milliseconds(config.getPurgeIntervalMs());
    c.heartbeat_interval = std::chrono::milliseconds(config.getHeartbeatIntervalMs());
    c.pairing_timeout = std::chrono::milliseconds(config.getPairingTimeoutMs());
    c.token_exchange_timeout = std::chrono::milliseconds(config.getTokenExchangeTimeoutMs());

    c.paired_devices_path = config.getPairedDevicesPath();
    c.log_level = parse_log_level(config.getLogLevel());

    if (!c.validate(error)) {
        return std::nullopt;
    }
    return c;
}
