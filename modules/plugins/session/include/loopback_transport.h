#ifndef LOOPBACK_TRANSPORT_H
#define LOOPBACK_TRANSPORT_H

#include "itransport.h"

#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>

class LoopbackTransport;

/**
 * @brief In-process medium connecting LoopbackTransport endpoints.
 *
 * Discovery and connections are scripted by the owner (simulator or test).
 * Frames are delivered synchronously to the receiver's data callback.
 */
class LoopbackHub {
public:
    // Return true to drop a frame in transit. The sender still sees success.
    using DropFilter = std::function<bool(const std::string& from, const std::string& to, const std::string& data)>;

    bool announce(const std::string& from, const std::string& to, std::optional<int> rssi = std::nullopt);
    bool lose(const std::string& from, const std::string& to);
    bool connect(const std::string& a, const std::string& b);
    bool disconnect(const std::string& a, const std::string& b);
    bool isLinked(const std::string& a, const std::string& b) const;

    void setDropFilter(DropFilter filter);
    size_t deliveredCount() const;

private:
    friend class LoopbackTransport;

    void attach(LoopbackTransport* endpoint);
    void detach(LoopbackTransport* endpoint);
    bool deliver(const std::string& from, const std::string& to, const std::string& data, std::string* error);
    std::set<std::string> linksOf(const std::string& id) const;

    static std::pair<std::string, std::string> linkKey(const std::string& a, const std::string& b);

    mutable std::mutex m_mutex;
    std::map<std::string, LoopbackTransport*> m_endpoints;
    std::set<std::pair<std::string, std::string>> m_links;
    DropFilter m_drop_filter;
    size_t m_delivered = 0;
};

class LoopbackTransport : public ITransport {
public:
    LoopbackTransport(LoopbackHub& hub, std::string local_id, std::string display_name, bool compatible = true);
    ~LoopbackTransport() override;

    LoopbackTransport(const LoopbackTransport&) = delete;
    LoopbackTransport& operator=(const LoopbackTransport&) = delete;

    bool startDiscovery(TransportCallbacks callbacks, std::string* error) override;
    void stopDiscovery() override;
    bool send(const std::string& peer_id, const std::string& data, std::string* error) override;
    bool broadcast(const std::string& data, std::string* error) override;

    void setStartFails(bool fails);
    bool isDiscovering() const;
    const std::string& localId() const { return m_local_id; }
    const std::string& displayName() const { return m_display_name; }
    bool isCompatible() const { return m_compatible; }

private:
    friend class LoopbackHub;

    TransportCallbacks callbacks() const;

    LoopbackHub& m_hub;
    std::string m_local_id;
    std::string m_display_name;
    bool m_compatible;

    mutable std::mutex m_mutex;
    bool m_discovering = false;
    bool m_start_fails = false;
    TransportCallbacks m_callbacks;
};

#endif // LOOPBACK_TRANSPORT_H
