#include "loopback_transport.h"
#include "logger.h"

#include <vector>

// ============================================================================
// LoopbackHub
// ============================================================================

std::pair<std::string, std::string> LoopbackHub::linkKey(const std::string& a, const std::string& b) {
    return a < b ? std::make_pair(a, b) : std::make_pair(b, a);
}

void LoopbackHub::attach(LoopbackTransport* endpoint) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_endpoints[endpoint->localId()] = endpoint;
}

void LoopbackHub::detach(LoopbackTransport* endpoint) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_endpoints.find(endpoint->localId());
    if (it != m_endpoints.end() && it->second == endpoint) {
        m_endpoints.erase(it);
    }
    for (auto link = m_links.begin(); link != m_links.end();) {
        if (link->first == endpoint->localId() || link->second == endpoint->localId()) {
            link = m_links.erase(link);
        } else {
            ++link;
        }
    }
}

bool LoopbackHub::announce(const std::string& from, const std::string& to, std::optional<int> rssi) {
    TransportCallbacks cb;
    std::string name;
    bool compatible = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto src = m_endpoints.find(from);
        auto dst = m_endpoints.find(to);
        if (src == m_endpoints.end() || dst == m_endpoints.end()) {
            return false;
        }
        if (!src->second->isDiscovering() || !dst->second->isDiscovering()) {
            return false;
        }
        name = src->second->displayName();
        compatible = src->second->isCompatible();
        cb = dst->second->callbacks();
    }
    if (cb.on_peer_found) {
        cb.on_peer_found(from, name, rssi, compatible);
    }
    return true;
}

bool LoopbackHub::lose(const std::string& from, const std::string& to) {
    TransportCallbacks cb;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto dst = m_endpoints.find(to);
        if (dst == m_endpoints.end()) {
            return false;
        }
        cb = dst->second->callbacks();
    }
    if (cb.on_peer_lost) {
        cb.on_peer_lost(from);
    }
    return true;
}

bool LoopbackHub::connect(const std::string& a, const std::string& b) {
    TransportCallbacks cb_a;
    TransportCallbacks cb_b;
    std::string name_a;
    std::string name_b;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto ea = m_endpoints.find(a);
        auto eb = m_endpoints.find(b);
        if (a == b || ea == m_endpoints.end() || eb == m_endpoints.end()) {
            return false;
        }
        if (!ea->second->isDiscovering() || !eb->second->isDiscovering()) {
            return false;
        }
        if (!m_links.insert(linkKey(a, b)).second) {
            return true;  // already linked
        }
        name_a = ea->second->displayName();
        name_b = eb->second->displayName();
        cb_a = ea->second->callbacks();
        cb_b = eb->second->callbacks();
    }

    if (cb_a.on_connection_state) cb_a.on_connection_state(b, ConnectionState::CONNECTING, name_b);
    if (cb_b.on_connection_state) cb_b.on_connection_state(a, ConnectionState::CONNECTING, name_a);
    if (cb_a.on_connection_state) cb_a.on_connection_state(b, ConnectionState::CONNECTED, name_b);
    if (cb_b.on_connection_state) cb_b.on_connection_state(a, ConnectionState::CONNECTED, name_a);
    LOG_DEBUG("LoopbackHub: Linked " + a + " <-> " + b);
    return true;
}

bool LoopbackHub::disconnect(const std::string& a, const std::string& b) {
    TransportCallbacks cb_a;
    TransportCallbacks cb_b;
    std::string name_a;
    std::string name_b;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_links.erase(linkKey(a, b)) == 0) {
            return false;
        }
        auto ea = m_endpoints.find(a);
        auto eb = m_endpoints.find(b);
        if (ea != m_endpoints.end()) {
            cb_a = ea->second->callbacks();
            name_a = ea->second->displayName();
        }
        if (eb != m_endpoints.end()) {
            cb_b = eb->second->callbacks();
            name_b = eb->second->displayName();
        }
    }

    if (cb_a.on_connection_state) cb_a.on_connection_state(b, ConnectionState::DISCONNECTED, name_b);
    if (cb_b.on_connection_state) cb_b.on_connection_state(a, ConnectionState::DISCONNECTED, name_a);
    LOG_DEBUG("LoopbackHub: Unlinked " + a + " <-> " + b);
    return true;
}

bool LoopbackHub::isLinked(const std::string& a, const std::string& b) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_links.count(linkKey(a, b)) > 0;
}

void LoopbackHub::setDropFilter(DropFilter filter) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_drop_filter = std::move(filter);
}

size_t LoopbackHub::deliveredCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_delivered;
}

std::set<std::string> LoopbackHub::linksOf(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::set<std::string> out;
    for (const auto& link : m_links) {
        if (link.first == id) out.insert(link.second);
        if (link.second == id) out.insert(link.first);
    }
    return out;
}

bool LoopbackHub::deliver(const std::string& from, const std::string& to, const std::string& data, std::string* error) {
    TransportCallbacks cb;
    DropFilter filter;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_links.count(linkKey(from, to)) == 0) {
            if (error) *error = "peer not connected: " + to;
            return false;
        }
        auto dst = m_endpoints.find(to);
        if (dst == m_endpoints.end()) {
            if (error) *error = "peer not connected: " + to;
            return false;
        }
        cb = dst->second->callbacks();
        filter = m_drop_filter;
    }

    if (filter && filter(from, to, data)) {
        LOG_DEBUG("LoopbackHub: Dropped frame " + from + " -> " + to);
        return true;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_delivered;
    }
    if (cb.on_data) {
        cb.on_data(from, data);
    }
    return true;
}

// ============================================================================
// LoopbackTransport
// ============================================================================

LoopbackTransport::LoopbackTransport(LoopbackHub& hub, std::string local_id, std::string display_name, bool compatible)
    : m_hub(hub),
      m_local_id(std::move(local_id)),
      m_display_name(std::move(display_name)),
      m_compatible(compatible) {
    m_hub.attach(this);
}

LoopbackTransport::~LoopbackTransport() {
    stopDiscovery();
    m_hub.detach(this);
}

bool LoopbackTransport::startDiscovery(TransportCallbacks callbacks, std::string* error) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_start_fails) {
        if (error) *error = "transport unavailable";
        return false;
    }
    m_callbacks = std::move(callbacks);
    m_discovering = true;
    return true;
}

void LoopbackTransport::stopDiscovery() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_discovering) {
            return;
        }
        m_discovering = false;
        m_callbacks = TransportCallbacks{};
    }

    // Leaving the session drops every link; remote sides see a disconnect.
    for (const auto& peer : m_hub.linksOf(m_local_id)) {
        m_hub.disconnect(m_local_id, peer);
    }
}

bool LoopbackTransport::send(const std::string& peer_id, const std::string& data, std::string* error) {
    if (!isDiscovering()) {
        if (error) *error = "transport not started";
        return false;
    }
    return m_hub.deliver(m_local_id, peer_id, data, error);
}

bool LoopbackTransport::broadcast(const std::string& data, std::string* error) {
    bool ok = true;
    for (const auto& peer : m_hub.linksOf(m_local_id)) {
        std::string send_error;
        if (!send(peer, data, &send_error)) {
            ok = false;
            if (error) *error = send_error;
        }
    }
    return ok;
}

void LoopbackTransport::setStartFails(bool fails) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_start_fails = fails;
}

bool LoopbackTransport::isDiscovering() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_discovering;
}

TransportCallbacks LoopbackTransport::callbacks() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_callbacks;
}
