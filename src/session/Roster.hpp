#pragma once
#include <map>
#include <string>

#include "net/Transport.hpp"

struct PeerIdentity {
    ClientId    clientId{ kInvalidClientId };
    std::string displayName;
};

// clientId -> identity. On the host this is the authoritative list; on a joining peer it is
// a mirror that only changes when the host says so. Both update paths are idempotent.
class Roster {
public:
    using Map = std::map<ClientId, PeerIdentity>;

    // Insert or rename. Returns true if anything changed.
    bool upsert(ClientId id, const std::string& name);
    // Returns true if the entry existed.
    bool remove(ClientId id);

    const PeerIdentity* find(ClientId id) const;
    bool contains(ClientId id) const { return m_entries.count(id) != 0; }

    // Display name, or "Unknown Player (id)" for ids we have never heard of.
    std::string nameOf(ClientId id) const;

    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }
    void clear() { m_entries.clear(); }

    Map::const_iterator begin() const { return m_entries.begin(); }
    Map::const_iterator end() const { return m_entries.end(); }

    bool operator==(const Roster& o) const;
    bool operator!=(const Roster& o) const { return !(*this == o); }

    static std::string defaultName(ClientId id);

private:
    Map m_entries;
};
