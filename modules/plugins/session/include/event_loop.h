#ifndef EVENT_LOOP_H
#define EVENT_LOOP_H

#include "engine_events.h"
#include "clock.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief EventLoop - the engine's single serialized execution context
 *
 * Transport and ranging callbacks only push events here; every state change
 * happens inside the handler. Timers are scheduled events keyed by id:
 * scheduling an existing id replaces it, removing an unknown id is a no-op.
 *
 * Two driving modes:
 * - start()/stop(): a background thread drains the queue and fires timers
 * - processPending(): the caller drains synchronously (tests with ManualClock)
 *
 * The handler is never invoked with an internal lock held, so it may push
 * or schedule further events.
 */
class EventLoop {
public:
    using EventHandler = std::function<void(const EngineEvent&)>;

    explicit EventLoop(const Clock& clock);
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void setHandler(EventHandler handler);

    // Lifecycle (threaded mode)
    void start();
    void stop();
    bool isRunning() const { return m_running.load(std::memory_order_acquire); }

    // Event queue
    void pushEvent(EngineEvent event);

    // Timer management
    void addScheduledEvent(const std::string& id, EngineEvent event, Clock::TimePoint due_time);
    void scheduleAfter(const std::string& id, EngineEvent event, std::chrono::milliseconds delay);
    void removeScheduledEvent(const std::string& id);
    bool hasScheduledEvent(const std::string& id) const;
    void clearScheduledEvents();

    // Drains queued events and fires every timer due at clock.now().
    // Returns the number of events handled.
    size_t processPending();

private:
    struct ScheduledEvent {
        std::string id;
        EngineEvent event;
        Clock::TimePoint due_time;
    };

    void runLoop();
    bool popDueEvent(EngineEvent& out);
    void dispatch(const EngineEvent& event);

    const Clock& m_clock;

    std::atomic<bool> m_running{false};
    std::unique_ptr<std::thread> m_thread;

    // Event queue
    std::queue<EngineEvent> m_event_queue;
    std::mutex m_event_mutex;
    std::condition_variable m_event_cv;

    // Scheduled events (sorted by due time)
    std::vector<ScheduledEvent> m_scheduled_events;
    mutable std::mutex m_scheduled_mutex;

    // Serializes handler invocations across driving threads
    std::mutex m_dispatch_mutex;
    EventHandler m_event_handler;
};

#endif // EVENT_LOOP_H
