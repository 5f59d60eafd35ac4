#include "app_state_machine.h"
#include "logger.h"

const char* app_state_to_string(AppState state) {
    switch (state) {
        case AppState::IDLE: return "idle";
        case AppState::DISCOVERING: return "discovering";
        case AppState::CONNECTED: return "connected";
        case AppState::TRANSMITTING: return "transmitting";
        case AppState::ERROR: return "error";
        default: return "unknown";
    }
}

// ==========================================================
// PURE TRANSITION TABLE (AUTHORITATIVE)
// ==========================================================
bool AppStateMachine::isLegal(AppState from, AppState to) {
    switch (from) {
    case AppState::IDLE:
        return to == AppState::DISCOVERING;

    case AppState::DISCOVERING:
        return to == AppState::CONNECTED || to == AppState::IDLE;

    case AppState::CONNECTED:
        return to == AppState::TRANSMITTING || to == AppState::IDLE;

    case AppState::TRANSMITTING:
        return to == AppState::CONNECTED;

    case AppState::ERROR:
        return to == AppState::IDLE;
    }
    return false;
}

bool AppStateMachine::transition(AppState to) {
    if (!isLegal(m_state, to)) {
        LOG_WARN(
            std::string("[AppFSM] Ignored transition ") +
            app_state_to_string(m_state) + " -> " + app_state_to_string(to)
        );
        return false;
    }

    LOG_INFO(
        std::string("[AppFSM] ") +
        app_state_to_string(m_state) + " --> " + app_state_to_string(to)
    );
    m_state = to;
    if (to == AppState::IDLE) {
        m_error_message.reset();
    }
    return true;
}

bool AppStateMachine::fail(const std::string& message) {
    if (message.empty()) {
        LOG_WARN("[AppFSM] Refusing to enter error without a message");
        return false;
    }
    if (m_state == AppState::ERROR) {
        m_error_message = message;
        return false;
    }

    LOG_ERROR(
        std::string("[AppFSM] ") +
        app_state_to_string(m_state) + " --> error: " + message
    );
    m_state = AppState::ERROR;
    m_error_message = message;
    return true;
}
