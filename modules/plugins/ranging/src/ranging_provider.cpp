#include "ranging_provider.h"
#include "logger.h"

const char* ranging_source_type_to_string(RangingSourceType type) {
    switch (type) {
        case RangingSourceType::PRECISE: return "precise";
        case RangingSourceType::SIGNAL_STRENGTH: return "signal-strength";
        default: return "unknown";
    }
}

RangingProvider::RangingProvider(IRangingSource* precise, IRangingSource* fallback, bool prefer_precise)
    : m_precise(precise), m_fallback(fallback), m_prefer_precise(prefer_precise) {}

RangingProvider::~RangingProvider() {
    stop();
}

bool RangingProvider::startSource(IRangingSource* source, std::string* error) {
    RangingCallbacks callbacks;
    const RangingSourceType type = source->type();
    // Copies: the provider may be restarted while a source thread still holds these.
    auto events = m_events;
    callbacks.on_sample = [events, type](const std::string& peer_id, double value) {
        if (events.on_sample) events.on_sample(type, peer_id, value);
    };
    callbacks.on_local_token = [events](const std::string& token) {
        if (events.on_local_token) events.on_local_token(token);
    };
    callbacks.on_invalidated = [events, type](const std::string& reason) {
        if (events.on_invalidated) events.on_invalidated(type, reason);
    };

    if (!source->start(std::move(callbacks), error)) {
        return false;
    }
    m_active = source;
    LOG_INFO(std::string("[Ranging] Started ") + ranging_source_type_to_string(type) + " ranging");
    return true;
}

bool RangingProvider::start(RangingEvents events, std::string* notice, std::string* error) {
    if (m_active) {
        return true;
    }
    m_events = std::move(events);

    std::string precise_error;
    if (m_prefer_precise && m_precise) {
        if (m_precise->isAvailable()) {
            if (startSource(m_precise, &precise_error)) {
                return true;
            }
            LOG_WARN("[Ranging] Precise ranging failed to start: " + precise_error);
        } else {
            precise_error = "precise ranging unsupported";
        }
    }

    std::string fallback_error = "no signal-strength source";
    if (m_fallback && m_fallback->isAvailable() && startSource(m_fallback, &fallback_error)) {
        if (notice && m_prefer_precise) {
            *notice = "Precise ranging unavailable, using signal strength (lower accuracy)";
        }
        return true;
    }

    LOG_ERROR("[Ranging] Cannot start any ranging source: " + fallback_error);
    if (error) {
        *error = "No ranging source available";
    }
    return false;
}

void RangingProvider::stop() {
    if (!m_active) {
        return;
    }
    m_active->stop();
    LOG_INFO(std::string("[Ranging] Stopped ") + ranging_source_type_to_string(m_active->type()) + " ranging");
    m_active = nullptr;
}

bool RangingProvider::fallBackToSignalStrength(std::string* error) {
    if (m_active && m_active == m_fallback) {
        return true;
    }
    if (m_active) {
        m_active->stop();
        m_active = nullptr;
    }
    if (!m_fallback || !m_fallback->isAvailable()) {
        if (error) *error = "No ranging source available";
        return false;
    }
    return startSource(m_fallback, error);
}

std::optional<RangingSourceType> RangingProvider::activeType() const {
    if (!m_active) {
        return std::nullopt;
    }
    return m_active->type();
}

bool RangingProvider::isPreciseActive() const {
    return m_active && m_active->type() == RangingSourceType::PRECISE;
}

std::optional<std::string> RangingProvider::localToken() const {
    if (!isPreciseActive()) {
        return std::nullopt;
    }
    return m_active->localToken();
}

bool RangingProvider::configurePeerSession(const std::string& peer_id, const std::string& token, std::string* error) {
    if (!isPreciseActive()) {
        if (error) *error = "precise ranging not active";
        return false;
    }
    return m_active->runWithPeerToken(peer_id, token, error);
}
