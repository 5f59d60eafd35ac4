#ifndef SIMULATED_RANGING_SOURCE_H
#define SIMULATED_RANGING_SOURCE_H

#include "ranging_source.h"

#include <mutex>
#include <map>
#include <string>

/**
 * @brief Scriptable ranging source for the desktop simulator and tests.
 *
 * A PRECISE instance generates a random local token on start (unless
 * publication is deferred) and records which peers were configured with a
 * token. Samples and invalidation are injected by the caller.
 */
class SimulatedRangingSource : public IRangingSource {
public:
    explicit SimulatedRangingSource(RangingSourceType type, bool available = true);

    RangingSourceType type() const override { return m_type; }
    bool isAvailable() const override;
    bool start(RangingCallbacks callbacks, std::string* error) override;
    void stop() override;
    std::optional<std::string> localToken() const override;
    bool runWithPeerToken(const std::string& peer_id, const std::string& token, std::string* error) override;

    // Scripting
    void setAvailable(bool available);
    void setStartFails(bool fails);
    void setSessionConfigFails(bool fails);
    void setDeferLocalToken(bool defer);
    void publishLocalToken();
    void emitSample(const std::string& peer_id, double value);
    void invalidate(const std::string& reason);

    // Inspection
    bool isStarted() const;
    bool hasSessionFor(const std::string& peer_id) const;
    std::string sessionTokenFor(const std::string& peer_id) const;

    static constexpr size_t kTokenBytes = 32;

private:
    RangingSourceType m_type;
    mutable std::mutex m_mutex;
    bool m_available;
    bool m_start_fails = false;
    bool m_session_fails = false;
    bool m_defer_token = false;
    bool m_started = false;
    std::string m_local_token;
    RangingCallbacks m_callbacks;
    std::map<std::string, std::string> m_sessions;  // peer id -> token
};

#endif // SIMULATED_RANGING_SOURCE_H
