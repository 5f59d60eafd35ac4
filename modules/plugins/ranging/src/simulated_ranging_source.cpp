#include "simulated_ranging_source.h"
#include "logger.h"

#include <sodium.h>
#include <stdexcept>

SimulatedRangingSource::SimulatedRangingSource(RangingSourceType type, bool available)
    : m_type(type), m_available(available) {
    if (sodium_init() < 0) {
        LOG_ERROR("[Ranging] libsodium initialization failed");
        throw std::runtime_error("Libsodium init failed");
    }
}

bool SimulatedRangingSource::isAvailable() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_available;
}

bool SimulatedRangingSource::start(RangingCallbacks callbacks, std::string* error) {
    std::function<void(const std::string&)> token_cb;
    std::string token;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_available || m_start_fails) {
            if (error) *error = std::string(ranging_source_type_to_string(m_type)) + " source failed to start";
            return false;
        }
        m_callbacks = std::move(callbacks);
        m_started = true;

        if (m_type == RangingSourceType::PRECISE) {
            std::string bytes(kTokenBytes, '\0');
            randombytes_buf(&bytes[0], bytes.size());
            m_local_token = bytes;
            if (!m_defer_token) {
                token_cb = m_callbacks.on_local_token;
                token = m_local_token;
            }
        }
    }

    if (token_cb && !token.empty()) {
        token_cb(token);
    }
    return true;
}

void SimulatedRangingSource::stop() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_started = false;
    m_callbacks = RangingCallbacks{};
    m_sessions.clear();
}

std::optional<std::string> SimulatedRangingSource::localToken() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_type != RangingSourceType::PRECISE || !m_started || m_defer_token || m_local_token.empty()) {
        return std::nullopt;
    }
    return m_local_token;
}

bool SimulatedRangingSource::runWithPeerToken(const std::string& peer_id, const std::string& token, std::string* error) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_type != RangingSourceType::PRECISE) {
        if (error) *error = "signal-strength ranging has no peer sessions";
        return false;
    }
    if (!m_started) {
        if (error) *error = "ranging source not started";
        return false;
    }
    if (m_session_fails || token.empty()) {
        if (error) *error = "precise session rejected token";
        return false;
    }
    m_sessions[peer_id] = token;
    LOG_DEBUG("[Ranging] Precise session configured for " + peer_id);
    return true;
}

void SimulatedRangingSource::setAvailable(bool available) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_available = available;
}

void SimulatedRangingSource::setStartFails(bool fails) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_start_fails = fails;
}

void SimulatedRangingSource::setSessionConfigFails(bool fails) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_session_fails = fails;
}

void SimulatedRangingSource::setDeferLocalToken(bool defer) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_defer_token = defer;
}

void SimulatedRangingSource::publishLocalToken() {
    std::function<void(const std::string&)> token_cb;
    std::string token;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_defer_token = false;
        if (!m_started || m_local_token.empty()) {
            return;
        }
        token_cb = m_callbacks.on_local_token;
        token = m_local_token;
    }
    if (token_cb) {
        token_cb(token);
    }
}

void SimulatedRangingSource::emitSample(const std::string& peer_id, double value) {
    std::function<void(const std::string&, double)> sample_cb;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_started) return;
        sample_cb = m_callbacks.on_sample;
    }
    if (sample_cb) {
        sample_cb(peer_id, value);
    }
}

void SimulatedRangingSource::invalidate(const std::string& reason) {
    std::function<void(const std::string&)> invalidated_cb;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_started) return;
        invalidated_cb = m_callbacks.on_invalidated;
    }
    if (invalidated_cb) {
        invalidated_cb(reason);
    }
}

bool SimulatedRangingSource::isStarted() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_started;
}

bool SimulatedRangingSource::hasSessionFor(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sessions.count(peer_id) > 0;
}

std::string SimulatedRangingSource::sessionTokenFor(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_sessions.find(peer_id);
    return it == m_sessions.end() ? std::string() : it->second;
}
