#include "HostAuthority.hpp"
#include "net/Transport.hpp"

PeerIdentity HostAuthority::admit(ClientId id) {
    if (const PeerIdentity* existing = m_roster.find(id)) return *existing;

    m_roster.upsert(id, Roster::defaultName(id));
    return *m_roster.find(id);
}

bool HostAuthority::expel(ClientId id) {
    if (id == kHostClientId) return false;  // the host leaves by ending the session
    return m_roster.remove(id);
}

size_t HostAuthority::fanOut(const void* data, uint32_t size) {
    size_t sent = 0;
    for (const auto& [id, peer] : m_roster) {
        if (id == kHostClientId) continue;
        if (m_transport.send(id, data, size)) ++sent;
    }
    return sent;
}

bool HostAuthority::sendTo(ClientId id, const void* data, uint32_t size) {
    if (id == kHostClientId) return false;
    return m_transport.send(id, data, size);
}
