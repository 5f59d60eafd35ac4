#include "event_loop.h"
#include "logger.h"

#include <algorithm>

namespace {
    // Upper bound on one wait so a ManualClock or a missed notify never stalls the loop.
    constexpr std::chrono::milliseconds kMaxWait{100};
}

EventLoop::EventLoop(const Clock& clock)
    : m_clock(clock) {
    LOG_DEBUG("EventLoop: Initialized");
}

EventLoop::~EventLoop() {
    stop();
    LOG_DEBUG("EventLoop: Destroyed");
}

void EventLoop::setHandler(EventHandler handler) {
    std::lock_guard<std::mutex> lock(m_dispatch_mutex);
    m_event_handler = std::move(handler);
}

/**
 * @brief Runs the loop on a background thread until stop().
 *
 * Tests leave the loop stopped and drive it with processPending().
 */
void EventLoop::start() {
    if (m_running.load(std::memory_order_acquire)) {
        LOG_WARN("EventLoop: Already running");
        return;
    }

    m_running.store(true, std::memory_order_release);
    m_thread = std::make_unique<std::thread>(&EventLoop::runLoop, this);
    LOG_INFO("EventLoop: Started background thread");
}

/**
 * @brief Stops and joins the background thread. Safe to call from the handler.
 */
void EventLoop::stop() {
    if (!m_running.exchange(false, std::memory_order_acq_rel)) {
        return;
    }

    LOG_INFO("EventLoop: Stopping");
    {
        std::lock_guard<std::mutex> lock(m_event_mutex);
    }
    m_event_cv.notify_all();

    if (m_thread && m_thread->joinable()) {
        if (m_thread->get_id() == std::this_thread::get_id()) {
            // stop() from inside the handler: let the thread unwind on its own
            m_thread->detach();
        } else {
            m_thread->join();
        }
    }
    m_thread.reset();
}

/**
 * @brief Queues an event for the next processPending() pass.
 */
void EventLoop::pushEvent(EngineEvent event) {
    {
        std::lock_guard<std::mutex> lock(m_event_mutex);
        m_event_queue.push(std::move(event));
    }
    m_event_cv.notify_one();
}

/**
 * @brief Schedules an event at an absolute time.
 * @param id Timer key; an existing timer with the same key is replaced.
 * @param event Event dispatched once the clock reaches due_time.
 * @param due_time Deadline on the loop's clock.
 */
void EventLoop::addScheduledEvent(const std::string& id, EngineEvent event, Clock::TimePoint due_time) {
    {
        std::lock_guard<std::mutex> lock(m_scheduled_mutex);

        // Remove existing event with same ID
        m_scheduled_events.erase(
            std::remove_if(m_scheduled_events.begin(), m_scheduled_events.end(),
                           [&id](const ScheduledEvent& e) { return e.id == id; }),
            m_scheduled_events.end()
        );

        m_scheduled_events.push_back({id, std::move(event), due_time});

        // Sort by due time; stable so equal deadlines fire in scheduling order
        std::stable_sort(m_scheduled_events.begin(), m_scheduled_events.end(),
                         [](const ScheduledEvent& a, const ScheduledEvent& b) {
                             return a.due_time < b.due_time;
                         });
    }
    m_event_cv.notify_one();

    LOG_DEBUG("EventLoop: Scheduled event added, id=" + id);
}

void EventLoop::scheduleAfter(const std::string& id, EngineEvent event, std::chrono::milliseconds delay) {
    addScheduledEvent(id, std::move(event), m_clock.now() + delay);
}

/**
 * @brief Cancels the timer with this key, if any.
 */
void EventLoop::removeScheduledEvent(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_scheduled_mutex);
    m_scheduled_events.erase(
        std::remove_if(m_scheduled_events.begin(), m_scheduled_events.end(),
                       [&id](const ScheduledEvent& e) { return e.id == id; }),
        m_scheduled_events.end()
    );
}

bool EventLoop::hasScheduledEvent(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_scheduled_mutex);
    return std::any_of(m_scheduled_events.begin(), m_scheduled_events.end(),
                       [&id](const ScheduledEvent& e) { return e.id == id; });
}

void EventLoop::clearScheduledEvents() {
    std::lock_guard<std::mutex> lock(m_scheduled_mutex);
    m_scheduled_events.clear();
}

bool EventLoop::popDueEvent(EngineEvent& out) {
    std::lock_guard<std::mutex> lock(m_scheduled_mutex);
    if (m_scheduled_events.empty() || m_scheduled_events.front().due_time > m_clock.now()) {
        return false;
    }
    out = std::move(m_scheduled_events.front().event);
    m_scheduled_events.erase(m_scheduled_events.begin());
    return true;
}

void EventLoop::dispatch(const EngineEvent& event) {
    if (m_event_handler) {
        m_event_handler(event);
    }
}

/**
 * @brief Dispatches queued events and due timers until neither is left.
 * @return Number of events handed to the handler.
 */
size_t EventLoop::processPending() {
    std::lock_guard<std::mutex> dispatch_lock(m_dispatch_mutex);
    size_t handled = 0;

    bool progressed = true;
    while (progressed) {
        progressed = false;

        std::queue<EngineEvent> events_to_process;
        {
            std::lock_guard<std::mutex> lock(m_event_mutex);
            std::swap(events_to_process, m_event_queue);
        }
        while (!events_to_process.empty()) {
            dispatch(events_to_process.front());
            events_to_process.pop();
            ++handled;
            progressed = true;
        }

        // Timers one at a time: a handler may cancel a later one
        EngineEvent due;
        while (popDueEvent(due)) {
            dispatch(due);
            ++handled;
            progressed = true;
        }
    }

    return handled;
}

void EventLoop::runLoop() {
    LOG_DEBUG("EventLoop: Entering main loop");

    while (m_running.load(std::memory_order_acquire)) {
        processPending();

        std::chrono::milliseconds wait = kMaxWait;
        {
            std::lock_guard<std::mutex> lock(m_scheduled_mutex);
            if (!m_scheduled_events.empty()) {
                auto until = std::chrono::duration_cast<std::chrono::milliseconds>(
                    m_scheduled_events.front().due_time - m_clock.now());
                if (until < wait) {
                    wait = until.count() > 0 ? until : std::chrono::milliseconds(0);
                }
            }
        }

        std::unique_lock<std::mutex> lock(m_event_mutex);
        m_event_cv.wait_for(lock, wait, [this] {
            return !m_event_queue.empty() || !m_running.load(std::memory_order_acquire);
        });
    }

    LOG_DEBUG("EventLoop: Exited main loop");
}
