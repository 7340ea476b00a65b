#pragma once
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <vector>

#include "net/DiscoveryRequester.hpp"
#include "net/DiscoveryResponder.hpp"
#include "net/EventQueue.hpp"
#include "net/Transport.hpp"
#include "ChatLog.hpp"
#include "ChatRelay.hpp"
#include "HostAuthority.hpp"
#include "Roster.hpp"
#include "SessionConfig.hpp"

enum class SessionRole : uint8_t {
    Idle,
    Hosting,
    Connecting,
    Connected,
    Disconnected,  // last attempt ended; ready for a new one exactly like Idle
};

const char* toString(SessionRole role);

struct SessionNotice {
    enum class Kind : uint8_t {
        HostStarted,
        HostStartFailed,
        DiscoveryStarted,
        DiscoveryStartFailed,
        ServerFound,
        Connected,
        ConnectFailed,
        Disconnected,
        PeerJoined,
        PeerLeft,
    };

    Kind kind{ Kind::Disconnected };
    std::string text;
};

// Owns the role, the roster and the chat log of this process, and is their only writer.
// Background activity (discovery threads, the transport) reaches it exclusively through
// the EventQueue, which pump() drains on the owning thread. All accessors are for that
// same thread.
class ChatSession {
public:
    ChatSession(Transport& transport, EventQueue& events, SessionConfig cfg = {});
    ~ChatSession();

    ChatSession(const ChatSession&) = delete;
    ChatSession& operator=(const ChatSession&) = delete;

    // Idle -> Hosting. True if hosting after the call. A no-op returning false while
    // Connecting or Connected.
    bool startHosting();

    // Starts looking for a host. The resulting ServerFound moves Idle -> Connecting.
    bool startDiscovery();
    void stopDiscovery();

    // Leave the current session (or cancel discovery). Always ends in a state where a
    // new attempt is allowed.
    void stop(const char* reason = "leaving");

    // Chat input. Only while Hosting or Connected; blank text is rejected.
    bool sendMessage(const std::string& text);

    // Transport pump, then every queued event in arrival order. Never blocks.
    void pump();

    SessionRole role() const { return m_role; }
    bool isHost() const { return m_role == SessionRole::Hosting; }
    bool canChat() const { return m_role == SessionRole::Hosting || m_role == SessionRole::Connected; }
    bool isReady() const { return m_role == SessionRole::Idle || m_role == SessionRole::Disconnected; }

    ClientId localId() const { return m_localId; }
    const Roster& roster() const { return m_roster; }
    const ChatLog& messages() const { return m_log; }
    const discovery::ServerAnnouncement& target() const { return m_target; }
    const SessionConfig& config() const { return m_cfg; }

    bool isSearching() const { return m_requester.isRunning(); }
    bool isDiscoverable() const { return m_responder.isRunning(); }
    uint16_t discoveryPortInUse() const { return m_responder.boundPort(); }

    const std::string& statusText() const { return m_status; }
    bool popNotice(SessionNotice& out);

    uint32_t relayDropped() const { return m_relay.framesDropped(); }

private:
    void apply(SessionEvent& ev);

    void onServerFound(const discovery::ServerAnnouncement& server);
    void onLocalConnected(ClientId yourId);
    void onPeerConnected(ClientId id);
    void onPeerDisconnected(ClientId id);

    void enterDisconnected(SessionNotice::Kind kind, const std::string& why);
    void updateDiscoverability();

    void notify(SessionNotice::Kind kind, std::string text);

private:
    Transport& m_transport;
    EventQueue& m_events;
    SessionConfig m_cfg;

    SessionRole m_role{ SessionRole::Idle };
    ClientId m_localId{ kInvalidClientId };
    discovery::ServerAnnouncement m_target{};

    Roster m_roster;
    ChatLog m_log;
    ChatRelay m_relay;
    std::unique_ptr<HostAuthority> m_authority;  // present exactly while Hosting

    DiscoveryResponder m_responder;
    bool m_announceable{ false };  // the announcement fits in a datagram
    DiscoveryRequester m_requester;

    std::string m_status{ "Idle" };
    std::deque<SessionNotice> m_notices;
    std::vector<SessionEvent> m_batch;
    uint64_t m_epoch{ 0 };  // bumped whenever a session ends; stale events are not applied
};
