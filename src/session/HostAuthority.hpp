#pragma once
#include <cstdint>
#include <string>

#include "Roster.hpp"

class Transport;

// Proof that this process is the host. Only ChatSession can create one, and only while it is
// Hosting; every host-only relay operation takes it as a parameter. A joining peer never
// holds one, so it has no way to invent roster entries or broadcasts.
class HostAuthority {
public:
    HostAuthority(const HostAuthority&) = delete;
    HostAuthority& operator=(const HostAuthority&) = delete;

    // Adds `id` as "Player {id}" (or keeps the existing entry) and returns the identity.
    PeerIdentity admit(ClientId id);
    bool expel(ClientId id);

    // Sender names always come from here, never from the frame a peer sent.
    std::string resolveName(ClientId id) const { return m_roster.nameOf(id); }
    bool isMember(ClientId id) const { return m_roster.contains(id); }

    const Roster& roster() const { return m_roster; }
    ClientId selfId() const { return kHostClientId; }

    // Reliable send to every remote roster member, in roster order. Returns how many sends succeeded.
    size_t fanOut(const void* data, uint32_t size);
    bool sendTo(ClientId id, const void* data, uint32_t size);

private:
    friend class ChatSession;
    HostAuthority(Roster& roster, Transport& transport) : m_roster(roster), m_transport(transport) {}

private:
    Roster& m_roster;
    Transport& m_transport;
};
