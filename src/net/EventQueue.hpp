#pragma once
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "DiscoveryProtocol.hpp"
#include "Transport.hpp"

// Everything that crosses from a background context (discovery threads, transport pump)
// into the context that owns the session.
struct SessionEvent {
    enum class Kind : uint8_t {
        ServerFound,         // requester: first valid announcement
        PeerConnected,       // host: remote peer accepted and assigned `peer`
        PeerDisconnected,    // host: remote peer `peer` gone
        LocalConnected,      // joining peer: host welcomed us as `peer`
        LocalConnectFailed,  // joining peer: connection died before the welcome
        LocalDropped,        // joining peer or host: established session lost
        Message,             // frame `payload` received from `peer`
    };

    Kind kind{ Kind::Message };
    ClientId peer{ kInvalidClientId };
    discovery::ServerAnnouncement server{};
    std::vector<uint8_t> payload;
    std::string reason;

    static SessionEvent serverFound(discovery::ServerAnnouncement a);
    static SessionEvent peerConnected(ClientId id);
    static SessionEvent peerDisconnected(ClientId id);
    static SessionEvent localConnected(ClientId yourId);
    static SessionEvent localConnectFailed(std::string why);
    static SessionEvent localDropped(std::string why);
    static SessionEvent message(ClientId from, const void* data, uint32_t size);
};

// Serializes events from any thread into the owning context. post() may be called
// concurrently; drain() is only called by the owner and never blocks on new input.
class EventQueue {
public:
    EventQueue() = default;
    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    void post(SessionEvent ev);

    // Moves out everything queued right now, oldest first. Returns how many were appended.
    size_t drain(std::vector<SessionEvent>& out);

    size_t pending() const;
    void clear();

private:
    mutable std::mutex m_mtx;
    std::deque<SessionEvent> m_events;
};
