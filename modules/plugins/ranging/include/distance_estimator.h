#ifndef DISTANCE_ESTIMATOR_H
#define DISTANCE_ESTIMATOR_H

#include <deque>
#include <map>
#include <string>

enum class DistanceLevel {
    UNKNOWN,
    IMMEDIATE,
    NEAR,
    MEDIUM,
    FAR,
    VERY_FAR
};

enum class SmoothingPolicy {
    SIGMA,          // Leave-one-out 2-sigma rejection, then mean
    TRIM_MIN_MAX    // Drop one min and one max, then mean
};

enum class TierProfile {
    STANDARD,       // 1 / 3 / 6 / 10 m
    EXTENDED        // 1 / 3 / 10 / 20 m
};

struct DistanceEstimatorOptions {
    // Signal-strength model
    double measured_power = -50.0;      // dBm at 1 m
    double path_loss_exponent = 2.0;
    double min_range_m = 0.0;
    double max_range_m = 50.0;

    // Smoothing
    bool smoothing_enabled = true;
    int window_size = 5;
    SmoothingPolicy smoothing_policy = SmoothingPolicy::SIGMA;

    TierProfile tier_profile = TierProfile::STANDARD;

    // Volume curve
    double min_distance = 1.0;
    double max_distance = 10.0;
    double min_volume = 0.1;
    double max_volume = 1.0;
};

/**
 * @brief Turns raw ranging readings into a stable per-peer distance, a tier and a volume.
 *
 * Not thread-safe; the owner (PeerRegistry) serializes access.
 */
class DistanceEstimator {
public:
    DistanceEstimator() = default;
    // Throws std::invalid_argument when the options do not validate.
    explicit DistanceEstimator(const DistanceEstimatorOptions& options);

    static bool validate(const DistanceEstimatorOptions& options, std::string* error = nullptr);

    // Applies options after validation. On failure the previous options stay active.
    bool configure(const DistanceEstimatorOptions& options, std::string* error = nullptr);
    bool setVolumeBounds(double min_volume, double max_volume, std::string* error = nullptr);
    const DistanceEstimatorOptions& options() const { return m_options; }

    // Log-distance path loss. rssi >= 0 is not a valid reading and yields 0.0.
    double rssiToDistance(int rssi) const;

    // Appends to the peer's window and returns the smoothed value.
    double addSample(const std::string& peer_id, double value);
    void resetPeer(const std::string& peer_id);
    void resetAll();
    size_t sampleCount(const std::string& peer_id) const;

    DistanceLevel distanceLevel(double distance) const;
    double volumeForDistance(double distance) const;

private:
    double smooth(const std::deque<double>& samples) const;

    DistanceEstimatorOptions m_options;
    std::map<std::string, std::deque<double>> m_samples;
};

const char* distance_level_to_string(DistanceLevel level);
bool parse_smoothing_policy(const std::string& text, SmoothingPolicy& out);
bool parse_tier_profile(const std::string& text, TierProfile& out);

#endif // DISTANCE_ESTIMATOR_H
