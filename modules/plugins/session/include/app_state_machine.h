#ifndef APP_STATE_MACHINE_H
#define APP_STATE_MACHINE_H

#include <optional>
#include <string>

enum class AppState {
    IDLE,
    DISCOVERING,
    CONNECTED,
    TRANSMITTING,
    ERROR
};

/**
 * @brief Process-wide application state with a fixed legal transition table.
 *
 * ERROR is reachable only through fail(); transition(ERROR) is always rejected.
 */
class AppStateMachine {
public:
    AppState state() const { return m_state; }
    const std::optional<std::string>& errorMessage() const { return m_error_message; }

    static bool isLegal(AppState from, AppState to);

    // Applies a legal transition. Illegal requests are logged and ignored.
    bool transition(AppState to);

    // Enters ERROR from any non-error state. Requires a non-empty message.
    bool fail(const std::string& message);

    void clearError() { m_error_message.reset(); }

private:
    AppState m_state = AppState::IDLE;
    std::optional<std::string> m_error_message;
};

const char* app_state_to_string(AppState state);

#endif // APP_STATE_MACHINE_H
