#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "net/RelayProtocol.hpp"
#include "net/Transport.hpp"
#include "ChatLog.hpp"
#include "Roster.hpp"

class HostAuthority;

// Host-mediated chat and roster sync. Peers only ever talk to the host; the host stamps
// the sender name and fans every accepted message out to all peers, itself included,
// before it looks at the next request. That single ordering point is what gives every
// peer the same message order.
class ChatRelay {
public:
    ChatRelay(Transport& transport, Roster& roster, ChatLog& log);

    // Peer -> host, fire-and-forget.
    bool submitMessage(ClientId self, const std::string& text);
    bool requestRoster(ClientId self);

    // Host only.
    void broadcastMessage(HostAuthority& host, ClientId senderId, const std::string& senderName, const std::string& text);
    void rosterUpdate(HostAuthority& host, ClientId id, const std::string& name);
    void rosterRemove(HostAuthority& host, ClientId id);
    void replayRoster(HostAuthority& host, ClientId to);

    // The host's own chat input: same path as a remote submit, without the wire.
    bool acceptLocal(HostAuthority& host, const std::string& text);

    // A frame from `from`. `host` is non-null only while hosting. Malformed frames and
    // frames the receiving side is not supposed to get are dropped and logged.
    void handleFrame(HostAuthority* host, ClientId from, const std::vector<uint8_t>& frame);

    uint32_t framesDropped() const { return m_dropped; }

    static bool isBlank(const std::string& text);

private:
    void acceptSubmit(HostAuthority& host, ClientId from, const relay::SubmitMessage& m);

    void handleAsHost(HostAuthority& host, ClientId from, const uint8_t* data, size_t size);
    void handleAsPeer(ClientId from, const uint8_t* data, size_t size);

    void applyBroadcast(ClientId senderId, const std::string& senderName, const std::string& text);
    void drop(ClientId from, const char* why);

private:
    Transport& m_transport;
    Roster& m_roster;
    ChatLog& m_log;
    uint32_t m_dropped{ 0 };
};
