#include "distance_estimator.h"
#include "logger.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <vector>

namespace {
    // Below this many samples the latest reading is returned as-is.
    constexpr size_t kMinSamplesForFiltering = 3;
    constexpr double kSigmaThreshold = 2.0;

    double mean_of(const std::vector<double>& values) {
        if (values.empty()) return 0.0;
        return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
    }

    double stddev_of(const std::vector<double>& values, double mean) {
        if (values.empty()) return 0.0;
        double acc = 0.0;
        for (double v : values) {
            acc += (v - mean) * (v - mean);
        }
        return std::sqrt(acc / static_cast<double>(values.size()));
    }

    bool fail(std::string* error, const std::string& msg) {
        if (error) *error = msg;
        return false;
    }
}

DistanceEstimator::DistanceEstimator(const DistanceEstimatorOptions& options) {
    std::string error;
    if (!validate(options, &error)) {
        throw std::invalid_argument("DistanceEstimator: " + error);
    }
    m_options = options;
}

bool DistanceEstimator::validate(const DistanceEstimatorOptions& o, std::string* error) {
    if (!std::isfinite(o.measured_power)) {
        return fail(error, "measured_power must be finite");
    }
    if (!(o.path_loss_exponent > 0.0)) {
        return fail(error, "path_loss_exponent must be > 0");
    }
    if (!(o.min_range_m >= 0.0) || !(o.max_range_m > o.min_range_m)) {
        return fail(error, "range clamp must satisfy 0 <= min_range_m < max_range_m");
    }
    if (o.window_size < 1) {
        return fail(error, "smoothing window_size must be >= 1");
    }
    if (!(o.min_distance >= 0.0) || !(o.max_distance > o.min_distance)) {
        return fail(error, "volume distances must satisfy 0 <= min_distance < max_distance");
    }
    if (!(o.min_volume > 0.0)) {
        return fail(error, "min_volume must be > 0");
    }
    if (!(o.max_volume <= 1.0) || !(o.min_volume <= o.max_volume)) {
        return fail(error, "volume bounds must satisfy min_volume <= max_volume <= 1");
    }
    return true;
}

bool DistanceEstimator::configure(const DistanceEstimatorOptions& options, std::string* error) {
    if (!validate(options, error)) {
        return false;
    }
    const bool window_shrunk = options.window_size < m_options.window_size;
    m_options = options;
    if (window_shrunk) {
        for (auto& kv : m_samples) {
            while (kv.second.size() > static_cast<size_t>(m_options.window_size)) {
                kv.second.pop_front();
            }
        }
    }
    return true;
}

bool DistanceEstimator::setVolumeBounds(double min_volume, double max_volume, std::string* error) {
    DistanceEstimatorOptions next = m_options;
    next.min_volume = min_volume;
    next.max_volume = max_volume;
    return configure(next, error);
}

double DistanceEstimator::rssiToDistance(int rssi) const {
    if (rssi >= 0) {
        return 0.0;
    }
    const double exponent = (m_options.measured_power - static_cast<double>(rssi)) /
                            (10.0 * m_options.path_loss_exponent);
    const double distance = std::pow(10.0, exponent);
    return std::clamp(distance, m_options.min_range_m, m_options.max_range_m);
}

double DistanceEstimator::addSample(const std::string& peer_id, double value) {
    if (!m_options.smoothing_enabled) {
        return value;
    }

    auto& window = m_samples[peer_id];
    window.push_back(value);
    while (window.size() > static_cast<size_t>(m_options.window_size)) {
        window.pop_front();
    }
    return smooth(window);
}

void DistanceEstimator::resetPeer(const std::string& peer_id) {
    m_samples.erase(peer_id);
}

void DistanceEstimator::resetAll() {
    m_samples.clear();
}

size_t DistanceEstimator::sampleCount(const std::string& peer_id) const {
    auto it = m_samples.find(peer_id);
    return it == m_samples.end() ? 0 : it->second.size();
}

double DistanceEstimator::smooth(const std::deque<double>& samples) const {
    if (samples.size() < kMinSamplesForFiltering) {
        return samples.back();
    }

    std::vector<double> values(samples.begin(), samples.end());

    if (m_options.smoothing_policy == SmoothingPolicy::TRIM_MIN_MAX) {
        std::sort(values.begin(), values.end());
        std::vector<double> inner(values.begin() + 1, values.end() - 1);
        return mean_of(inner);
    }

    // Each sample is judged against the statistics of the others, otherwise a
    // single outlier in a short window widens sigma enough to survive.
    std::vector<double> kept;
    kept.reserve(values.size());
    std::vector<double> others;
    others.reserve(values.size() - 1);
    for (size_t i = 0; i < values.size(); ++i) {
        others.clear();
        for (size_t j = 0; j < values.size(); ++j) {
            if (j != i) others.push_back(values[j]);
        }
        const double m = mean_of(others);
        const double sd = stddev_of(others, m);
        if (std::fabs(values[i] - m) <= kSigmaThreshold * sd) {
            kept.push_back(values[i]);
        }
    }

    if (kept.empty()) {
        return mean_of(values);
    }
    return mean_of(kept);
}

DistanceLevel DistanceEstimator::distanceLevel(double distance) const {
    if (std::isnan(distance) || distance < 0.0) {
        return DistanceLevel::UNKNOWN;
    }

    const bool extended = m_options.tier_profile == TierProfile::EXTENDED;
    const double medium_limit = extended ? 10.0 : 6.0;
    const double far_limit = extended ? 20.0 : 10.0;

    if (distance < 1.0) return DistanceLevel::IMMEDIATE;
    if (distance < 3.0) return DistanceLevel::NEAR;
    if (distance < medium_limit) return DistanceLevel::MEDIUM;
    if (distance < far_limit) return DistanceLevel::FAR;
    return DistanceLevel::VERY_FAR;
}

double DistanceEstimator::volumeForDistance(double distance) const {
    const auto& o = m_options;
    // Also catches NaN
    if (!(distance > o.min_distance)) {
        return o.max_volume;
    }
    if (distance >= o.max_distance) {
        return o.min_volume;
    }

    const double k = std::log(o.max_volume / o.min_volume) / (o.max_distance - o.min_distance);
    const double volume = o.max_volume * std::exp(-k * (distance - o.min_distance));
    return std::clamp(volume, o.min_volume, o.max_volume);
}

const char* distance_level_to_string(DistanceLevel level) {
    switch (level) {
        case DistanceLevel::UNKNOWN: return "unknown";
        case DistanceLevel::IMMEDIATE: return "immediate";
        case DistanceLevel::NEAR: return "near";
        case DistanceLevel::MEDIUM: return "medium";
        case DistanceLevel::FAR: return "far";
        case DistanceLevel::VERY_FAR: return "veryFar";
        default: return "unknown";
    }
}

bool parse_smoothing_policy(const std::string& text, SmoothingPolicy& out) {
    if (text == "sigma") {
        out = SmoothingPolicy::SIGMA;
        return true;
    }
    if (text == "trim") {
        out = SmoothingPolicy::TRIM_MIN_MAX;
        return true;
    }
    LOG_WARN("DistanceEstimator: Unknown smoothing policy '" + text + "'");
    return false;
}

bool parse_tier_profile(const std::string& text, TierProfile& out) {
    if (text == "standard") {
        out = TierProfile::STANDARD;
        return true;
    }
    if (text == "extended") {
        out = TierProfile::EXTENDED;
        return true;
    }
    LOG_WARN("DistanceEstimator: Unknown distance tier profile '" + text + "'");
    return false;
}
