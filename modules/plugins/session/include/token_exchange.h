#ifndef TOKEN_EXCHANGE_H
#define TOKEN_EXCHANGE_H

#include "peer_registry.h"
#include "ranging_provider.h"
#include "event_loop.h"
#include "message_sender.h"
#include "engine_notification.h"
#include "wire_codec.h"

#include <chrono>
#include <map>
#include <optional>
#include <string>

enum class TokenExchangeState {
    IDLE,
    WAITING,        // our token sent, nothing back yet
    RECEIVED,       // peer token stored, precise session not configured
    COMPLETED
};

struct TokenExchangeOptions {
    std::string local_name;
    std::chrono::milliseconds timeout{10000};
};

/**
 * @brief Swaps precise-ranging tokens with each connected peer.
 *
 * Completion is reached either by configuring a precise session from the
 * peer's token (then acking it) or by receiving the peer's ack of ours.
 */
class TokenExchange {
public:
    TokenExchange(PeerRegistry& registry,
                  RangingProvider& ranging,
                  EventLoop& loop,
                  IMessageSender& sender,
                  NotificationQueue& notifications,
                  TokenExchangeOptions options);

    // Sends the local token if precise ranging has one. Returns true when the exchange started.
    bool beginExchange(const std::string& peer_id);

    void handlePeerConnected(const std::string& peer_id);
    void handleLocalTokenReady();
    // Inbound discoveryToken / tokenAck
    void handleMessage(const std::string& from, const wire::ProtocolMessage& message);
    void handleTimeout(const std::string& peer_id);
    void handlePeerDisconnected(const std::string& peer_id);

    // Forget every exchange (precise ranging lost or session stopped).
    void resetAll();

    TokenExchangeState stateOf(const std::string& peer_id) const;
    std::optional<std::string> peerToken(const std::string& peer_id) const;
    size_t completedConnectedCount() const;

    static std::string timerId(const std::string& peer_id) { return "token-exchange:" + peer_id; }

private:
    struct PeerExchange {
        TokenExchangeState state = TokenExchangeState::IDLE;
        std::string peer_token;     // raw bytes
    };

    void setState(const std::string& peer_id, PeerExchange& exchange, TokenExchangeState next);
    bool sendLocalToken(const std::string& peer_id, std::string* error);
    void tryConfigure(const std::string& peer_id, PeerExchange& exchange);
    void onToken(const std::string& from, const wire::ProtocolMessage& message);
    void onAck(const std::string& from);

    PeerRegistry& m_registry;
    RangingProvider& m_ranging;
    EventLoop& m_loop;
    IMessageSender& m_sender;
    NotificationQueue& m_notifications;
    TokenExchangeOptions m_options;

    std::map<std::string, PeerExchange> m_exchanges;
};

const char* token_exchange_state_to_string(TokenExchangeState state);

#endif // TOKEN_EXCHANGE_H
