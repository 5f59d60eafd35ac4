#include "engine_notification.h"

void NotificationQueue::push(NotificationKind kind, const std::string& peer_id, const std::string& message) {
    EngineNotification n;
    n.kind = kind;
    n.peer_id = peer_id;
    n.message = message;
    m_pending.push_back(std::move(n));
}

void NotificationQueue::pushAppState(AppState state, const std::string& message) {
    EngineNotification n;
    n.kind = NotificationKind::APP_STATE_CHANGED;
    n.app_state = state;
    n.message = message;
    m_pending.push_back(std::move(n));
}

std::vector<EngineNotification> NotificationQueue::take() {
    std::vector<EngineNotification> out;
    out.swap(m_pending);
    return out;
}

const char* notification_kind_to_string(NotificationKind kind) {
    switch (kind) {
        case NotificationKind::PEERS_CHANGED: return "peers-changed";
        case NotificationKind::APP_STATE_CHANGED: return "app-state-changed";
        case NotificationKind::PAIRING_REQUEST_RECEIVED: return "pairing-request";
        case NotificationKind::PAIRING_COMPLETED: return "pairing-completed";
        case NotificationKind::PAIRING_REJECTED: return "pairing-rejected";
        case NotificationKind::PAIRING_TIMED_OUT: return "pairing-timed-out";
        case NotificationKind::UNPAIRED: return "unpaired";
        case NotificationKind::PAIRING_MODE_CHANGED: return "pairing-mode-changed";
        case NotificationKind::TOKEN_EXCHANGE_COMPLETED: return "token-exchange-completed";
        case NotificationKind::RANGING_NOTICE: return "ranging-notice";
        case NotificationKind::ERROR_BANNER: return "error-banner";
        default: return "unknown";
    }
}
