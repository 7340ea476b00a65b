#include "FakeTransport.hpp"

std::vector<FakeNetwork::ConnectRecord> FakeNetwork::connects() const {
    std::lock_guard<std::mutex> lk(m_mtx);
    return m_connects;
}

void FakeNetwork::releaseConnects() {
    std::vector<std::pair<FakeTransport*, uint16_t>> pending;
    {
        std::lock_guard<std::mutex> lk(m_mtx);
        pending.swap(m_pending);
    }
    for (auto& [client, port] : pending) establish(client, port);
}

void FakeNetwork::establish(FakeTransport* client, uint16_t port) {
    std::lock_guard<std::mutex> lk(m_mtx);

    auto it = m_hosts.find(port);
    if (it == m_hosts.end()) {
        client->m_events.post(SessionEvent::localConnectFailed("no host on port " + std::to_string(port)));
        return;
    }

    FakeTransport* host = it->second;
    const ClientId id = host->m_nextId++;
    host->m_peers[id] = client;
    client->m_host = host;
    client->m_id = id;

    // same order as the real transport: the welcome precedes anything the host sends later
    host->m_events.post(SessionEvent::peerConnected(id));
    client->m_events.post(SessionEvent::localConnected(id));
}

bool FakeTransport::listen(uint16_t port) {
    std::lock_guard<std::mutex> lk(m_net.m_mtx);
    if (m_net.failListen || m_hosting || m_host) return false;
    if (m_net.m_hosts.count(port)) return false;

    m_net.m_hosts[port] = this;
    m_hosting = true;
    m_port = port;
    return true;
}

bool FakeTransport::connect(const std::string& address, uint16_t port) {
    {
        std::lock_guard<std::mutex> lk(m_net.m_mtx);
        m_net.m_connects.push_back({ address, port });
        if (m_net.rejectConnect || m_hosting || m_host) return false;
        if (m_net.holdConnects) {
            m_net.m_pending.emplace_back(this, port);
            return true;
        }
    }
    m_net.establish(this, port);
    return true;
}

bool FakeTransport::send(ClientId to, const void* data, uint32_t size) {
    std::lock_guard<std::mutex> lk(m_net.m_mtx);

    if (m_hosting) {
        auto it = m_peers.find(to);
        if (it == m_peers.end()) return false;
        it->second->m_events.post(SessionEvent::message(kHostClientId, data, size));
        ++m_sent;
        return true;
    }
    if (m_host && to == kHostClientId) {
        m_host->m_events.post(SessionEvent::message(m_id, data, size));
        ++m_sent;
        return true;
    }
    return false;
}

void FakeTransport::close(const char* reason) {
    std::lock_guard<std::mutex> lk(m_net.m_mtx);

    if (m_hosting) {
        for (auto& [id, peer] : m_peers) {
            peer->m_host = nullptr;
            peer->m_events.post(SessionEvent::localDropped(reason));
        }
        m_peers.clear();
        m_net.m_hosts.erase(m_port);
        m_hosting = false;
    }
    if (m_host) {
        m_host->m_peers.erase(m_id);
        m_host->m_events.post(SessionEvent::peerDisconnected(m_id));
        m_host = nullptr;
    }
    for (auto it = m_net.m_pending.begin(); it != m_net.m_pending.end();) {
        if (it->first == this) it = m_net.m_pending.erase(it);
        else ++it;
    }
    m_id = kInvalidClientId;
}

void FakeTransport::breakLink() {
    std::lock_guard<std::mutex> lk(m_net.m_mtx);
    if (!m_host) return;
    m_host->m_peers.erase(m_id);
    m_host->m_events.post(SessionEvent::peerDisconnected(m_id));
    m_host = nullptr;
    m_events.post(SessionEvent::localDropped("link broken"));
}

void FakeTransport::failHost() {
    std::lock_guard<std::mutex> lk(m_net.m_mtx);
    if (!m_hosting) return;
    m_events.post(SessionEvent::localDropped("listen socket failed"));
}
