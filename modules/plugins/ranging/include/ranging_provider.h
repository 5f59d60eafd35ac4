#ifndef RANGING_PROVIDER_H
#define RANGING_PROVIDER_H

#include "ranging_source.h"

#include <functional>
#include <optional>
#include <string>

struct RangingEvents {
    std::function<void(RangingSourceType type, const std::string& peer_id, double value)> on_sample;
    std::function<void(const std::string& token)> on_local_token;
    std::function<void(RangingSourceType type, const std::string& reason)> on_invalidated;
};

/**
 * @brief Picks and runs one ranging source, preferring precise hardware.
 *
 * Falls back to signal-strength ranging when precise ranging is missing, fails
 * to start, or is invalidated at run time. Either source may be null.
 */
class RangingProvider {
public:
    RangingProvider(IRangingSource* precise, IRangingSource* fallback, bool prefer_precise = true);
    ~RangingProvider();

    RangingProvider(const RangingProvider&) = delete;
    RangingProvider& operator=(const RangingProvider&) = delete;

    // notice is set when running in degraded (signal-strength) mode.
    bool start(RangingEvents events, std::string* notice = nullptr, std::string* error = nullptr);
    void stop();

    // Stops the precise source and starts the fallback in its place.
    bool fallBackToSignalStrength(std::string* error = nullptr);

    bool isRunning() const { return m_active != nullptr; }
    std::optional<RangingSourceType> activeType() const;
    bool isPreciseActive() const;

    std::optional<std::string> localToken() const;
    bool configurePeerSession(const std::string& peer_id, const std::string& token, std::string* error = nullptr);

private:
    bool startSource(IRangingSource* source, std::string* error);

    IRangingSource* m_precise;
    IRangingSource* m_fallback;
    bool m_prefer_precise;
    IRangingSource* m_active = nullptr;
    RangingEvents m_events;
};

#endif // RANGING_PROVIDER_H
