#ifndef ENGINE_NOTIFICATION_H
#define ENGINE_NOTIFICATION_H

#include "app_state_machine.h"

#include <functional>
#include <string>
#include <vector>

enum class NotificationKind {
    PEERS_CHANGED,
    APP_STATE_CHANGED,
    PAIRING_REQUEST_RECEIVED,
    PAIRING_COMPLETED,
    PAIRING_REJECTED,
    PAIRING_TIMED_OUT,
    UNPAIRED,
    PAIRING_MODE_CHANGED,   // message is "on" or "off"
    TOKEN_EXCHANGE_COMPLETED,
    RANGING_NOTICE,         // non-fatal, e.g. degraded accuracy
    ERROR_BANNER            // error shown without leaving the current state
};

struct EngineNotification {
    NotificationKind kind = NotificationKind::PEERS_CHANGED;
    std::string peer_id;
    std::string message;
    AppState app_state = AppState::IDLE;
};

using NotificationSink = std::function<void(const EngineNotification&)>;

// Collects notifications raised while engine state is locked; the engine
// delivers them once the lock is released.
class NotificationQueue {
public:
    void push(NotificationKind kind, const std::string& peer_id = "", const std::string& message = "");
    void pushAppState(AppState state, const std::string& message = "");

    std::vector<EngineNotification> take();
    bool empty() const { return m_pending.empty(); }

private:
    std::vector<EngineNotification> m_pending;
};

const char* notification_kind_to_string(NotificationKind kind);

#endif // ENGINE_NOTIFICATION_H
