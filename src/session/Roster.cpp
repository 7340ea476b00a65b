#include "Roster.hpp"

bool Roster::upsert(ClientId id, const std::string& name) {
    auto it = m_entries.find(id);
    if (it != m_entries.end()) {
        if (it->second.displayName == name) return false;
        it->second.displayName = name;
        return true;
    }
    m_entries.emplace(id, PeerIdentity{ id, name });
    return true;
}

bool Roster::remove(ClientId id) {
    return m_entries.erase(id) != 0;
}

const PeerIdentity* Roster::find(ClientId id) const {
    auto it = m_entries.find(id);
    return it == m_entries.end() ? nullptr : &it->second;
}

std::string Roster::nameOf(ClientId id) const {
    if (const PeerIdentity* p = find(id)) return p->displayName;
    return "Unknown Player (" + std::to_string(id) + ")";
}

bool Roster::operator==(const Roster& o) const {
    if (m_entries.size() != o.m_entries.size()) return false;
    for (const auto& [id, peer] : m_entries) {
        const PeerIdentity* other = o.find(id);
        if (!other || other->displayName != peer.displayName) return false;
    }
    return true;
}

std::string Roster::defaultName(ClientId id) {
    return "Player " + std::to_string(id);
}
