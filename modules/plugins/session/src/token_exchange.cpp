#include "token_exchange.h"
#include "logger.h"

const char* token_exchange_state_to_string(TokenExchangeState state) {
    switch (state) {
        case TokenExchangeState::IDLE: return "IDLE";
        case TokenExchangeState::WAITING: return "WAITING";
        case TokenExchangeState::RECEIVED: return "RECEIVED";
        case TokenExchangeState::COMPLETED: return "COMPLETED";
        default: return "UNKNOWN";
    }
}

TokenExchange::TokenExchange(PeerRegistry& registry,
                             RangingProvider& ranging,
                             EventLoop& loop,
                             IMessageSender& sender,
                             NotificationQueue& notifications,
                             TokenExchangeOptions options)
    : m_registry(registry),
      m_ranging(ranging),
      m_loop(loop),
      m_sender(sender),
      m_notifications(notifications),
      m_options(std::move(options)) {}

void TokenExchange::setState(const std::string& peer_id, PeerExchange& exchange, TokenExchangeState next) {
    if (exchange.state == next) {
        return;
    }
    LOG_INFO(
        std::string("[TokenX] ") +
        token_exchange_state_to_string(exchange.state) + " --> " +
        token_exchange_state_to_string(next) +
        " peer=" + peer_id
    );
    exchange.state = next;
    if (next == TokenExchangeState::COMPLETED) {
        m_loop.removeScheduledEvent(timerId(peer_id));
        m_notifications.push(NotificationKind::TOKEN_EXCHANGE_COMPLETED, peer_id);
    }
}

bool TokenExchange::sendLocalToken(const std::string& peer_id, std::string* error) {
    auto token = m_ranging.localToken();
    if (!token || token->empty()) {
        if (error) *error = "no local token";
        return false;
    }
    return m_sender.sendMessage(peer_id, MessageType::DISCOVERY_TOKEN,
                                {{"token", wire::encode_base64(*token)}, {"sender", m_options.local_name}},
                                error);
}

bool TokenExchange::beginExchange(const std::string& peer_id) {
    auto peer = m_registry.find(peer_id);
    if (!peer || !peer->isConnected() || !m_ranging.isPreciseActive()) {
        return false;
    }

    auto& exchange = m_exchanges[peer_id];
    if (exchange.state != TokenExchangeState::IDLE) {
        return false;
    }

    std::string error;
    if (!sendLocalToken(peer_id, &error)) {
        LOG_DEBUG("[TokenX] Exchange with " + peer_id + " not started: " + error);
        return false;
    }

    setState(peer_id, exchange, TokenExchangeState::WAITING);
    m_loop.scheduleAfter(timerId(peer_id), TokenExchangeTimeoutEvent{peer_id}, m_options.timeout);
    return true;
}

void TokenExchange::handlePeerConnected(const std::string& peer_id) {
    beginExchange(peer_id);
}

void TokenExchange::handleLocalTokenReady() {
    for (const auto& peer_id : m_registry.connectedPeerIds()) {
        auto it = m_exchanges.find(peer_id);
        if (it == m_exchanges.end() || it->second.state == TokenExchangeState::IDLE) {
            beginExchange(peer_id);
            continue;
        }

        if (it->second.state == TokenExchangeState::RECEIVED) {
            // Their token arrived before ours existed: answer now and retry the session.
            std::string error;
            if (!sendLocalToken(peer_id, &error)) {
                LOG_WARN("[TokenX] Token to " + peer_id + " not sent: " + error);
            }
            tryConfigure(peer_id, it->second);
        }
    }
}

void TokenExchange::tryConfigure(const std::string& peer_id, PeerExchange& exchange) {
    std::string error;
    if (!m_ranging.configurePeerSession(peer_id, exchange.peer_token, &error)) {
        LOG_WARN("[TokenX] Precise session for " + peer_id + " not configured: " + error);
        return;
    }

    if (!m_sender.sendMessage(peer_id, MessageType::TOKEN_ACK, {{"ack", "true"}}, &error)) {
        LOG_WARN("[TokenX] Ack to " + peer_id + " not sent: " + error);
    }
    setState(peer_id, exchange, TokenExchangeState::COMPLETED);
}

void TokenExchange::handleMessage(const std::string& from, const wire::ProtocolMessage& message) {
    if (message.type == MessageType::DISCOVERY_TOKEN) {
        onToken(from, message);
    } else if (message.type == MessageType::TOKEN_ACK) {
        onAck(from);
    }
}

void TokenExchange::onToken(const std::string& from, const wire::ProtocolMessage& message) {
    std::string token;
    if (!wire::decode_base64(message.field("token"), token) || token.empty()) {
        LOG_WARN("[TokenX] Undecodable token from " + from + " dropped");
        return;
    }
    auto peer = m_registry.find(from);
    if (!peer || !peer->isConnected()) {
        LOG_WARN("[TokenX] Token from unconnected peer " + from + " dropped");
        return;
    }

    auto& exchange = m_exchanges[from];
    if (exchange.state == TokenExchangeState::COMPLETED && exchange.peer_token == token) {
        return;
    }
    exchange.peer_token = token;
    setState(from, exchange, TokenExchangeState::RECEIVED);
    // Without our own pending send nothing else bounds RECEIVED
    if (!m_loop.hasScheduledEvent(timerId(from))) {
        m_loop.scheduleAfter(timerId(from), TokenExchangeTimeoutEvent{from}, m_options.timeout);
    }
    tryConfigure(from, exchange);
}

void TokenExchange::onAck(const std::string& from) {
    auto it = m_exchanges.find(from);
    if (it == m_exchanges.end() || it->second.state != TokenExchangeState::WAITING) {
        return;
    }
    setState(from, it->second, TokenExchangeState::COMPLETED);
}

void TokenExchange::handleTimeout(const std::string& peer_id) {
    auto it = m_exchanges.find(peer_id);
    if (it == m_exchanges.end()) {
        return;
    }
    auto& exchange = it->second;
    if (exchange.state != TokenExchangeState::WAITING && exchange.state != TokenExchangeState::RECEIVED) {
        return;
    }
    LOG_INFO("[TokenX] Exchange with " + peer_id + " timed out");
    exchange.peer_token.clear();
    setState(peer_id, exchange, TokenExchangeState::IDLE);
}

void TokenExchange::handlePeerDisconnected(const std::string& peer_id) {
    m_loop.removeScheduledEvent(timerId(peer_id));
    m_exchanges.erase(peer_id);
}

void TokenExchange::resetAll() {
    for (const auto& kv : m_exchanges) {
        m_loop.removeScheduledEvent(timerId(kv.first));
    }
    m_exchanges.clear();
}

TokenExchangeState TokenExchange::stateOf(const std::string& peer_id) const {
    auto it = m_exchanges.find(peer_id);
    return it == m_exchanges.end() ? TokenExchangeState::IDLE : it->second.state;
}

std::optional<std::string> TokenExchange::peerToken(const std::string& peer_id) const {
    auto it = m_exchanges.find(peer_id);
    if (it == m_exchanges.end() || it->second.peer_token.empty()) {
        return std::nullopt;
    }
    return it->second.peer_token;
}

size_t TokenExchange::completedConnectedCount() const {
    size_t count = 0;
    for (const auto& kv : m_exchanges) {
        if (kv.second.state != TokenExchangeState::COMPLETED) continue;
        auto peer = m_registry.find(kv.first);
        if (peer && peer->isConnected()) ++count;
    }
    return count;
}
