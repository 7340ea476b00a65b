#include "ChatRelay.hpp"
#include "HostAuthority.hpp"

#include <cctype>
#include <iostream>

ChatRelay::ChatRelay(Transport& transport, Roster& roster, ChatLog& log)
    : m_transport(transport), m_roster(roster), m_log(log) {
}

bool ChatRelay::isBlank(const std::string& text) {
    for (unsigned char c : text) {
        if (!std::isspace(c)) return false;
    }
    return true;
}

bool ChatRelay::submitMessage(ClientId self, const std::string& text) {
    if (isBlank(text)) return false;

    relay::SubmitMessage m{};
    m.type = relay::Type::SubmitMessage;
    m.senderId = self;
    relay::writeString(m.text, text);
    return m_transport.send(kHostClientId, &m, sizeof(m));
}

bool ChatRelay::requestRoster(ClientId self) {
    relay::RequestRoster r{};
    r.type = relay::Type::RequestRoster;
    r.requestingId = self;
    return m_transport.send(kHostClientId, &r, sizeof(r));
}

void ChatRelay::broadcastMessage(HostAuthority& host, ClientId senderId, const std::string& senderName, const std::string& text) {
    relay::BroadcastMessage b{};
    b.type = relay::Type::BroadcastMessage;
    b.senderId = senderId;
    relay::writeString(b.senderName, senderName);
    relay::writeString(b.text, text);

    host.fanOut(&b, sizeof(b));

    // the host is a peer of its own session; it sees exactly what went on the wire
    std::string name, body;
    relay::readString(b.senderName, name);
    relay::readString(b.text, body);
    applyBroadcast(senderId, name, body);
}

void ChatRelay::rosterUpdate(HostAuthority& host, ClientId id, const std::string& name) {
    relay::RosterUpdate u{};
    u.type = relay::Type::RosterUpdate;
    u.clientId = id;
    relay::writeString(u.name, name);

    host.fanOut(&u, sizeof(u));
    m_roster.upsert(id, name);
}

void ChatRelay::rosterRemove(HostAuthority& host, ClientId id) {
    relay::RosterRemove r{};
    r.type = relay::Type::RosterRemove;
    r.clientId = id;

    host.fanOut(&r, sizeof(r));
    m_roster.remove(id);
}

void ChatRelay::replayRoster(HostAuthority& host, ClientId to) {
    for (const auto& [id, peer] : host.roster()) {
        relay::RosterUpdate u{};
        u.type = relay::Type::RosterUpdate;
        u.clientId = id;
        relay::writeString(u.name, peer.displayName);
        host.sendTo(to, &u, sizeof(u));
    }
    std::cout << "[Relay] sent roster (" << host.roster().size() << " entries) to " << to << "\n";
}

bool ChatRelay::acceptLocal(HostAuthority& host, const std::string& text) {
    if (isBlank(text)) return false;

    relay::SubmitMessage m{};
    m.type = relay::Type::SubmitMessage;
    m.senderId = host.selfId();
    relay::writeString(m.text, text);
    acceptSubmit(host, host.selfId(), m);
    return true;
}

void ChatRelay::acceptSubmit(HostAuthority& host, ClientId from, const relay::SubmitMessage& m) {
    std::string text;
    if (!relay::readString(m.text, text)) return drop(from, "unterminated text");
    if (isBlank(text)) return drop(from, "empty message");

    // trust the connection's id, not the one the peer wrote into the frame
    if (m.senderId != from) {
        std::cerr << "[Relay] peer " << from << " claimed to be " << m.senderId << "; using " << from << "\n";
    }

    broadcastMessage(host, from, host.resolveName(from), text);
}

void ChatRelay::handleFrame(HostAuthority* host, ClientId from, const std::vector<uint8_t>& frame) {
    if (frame.empty()) return drop(from, "empty frame");

    if (host) handleAsHost(*host, from, frame.data(), frame.size());
    else handleAsPeer(from, frame.data(), frame.size());
}

void ChatRelay::handleAsHost(HostAuthority& host, ClientId from, const uint8_t* data, size_t size) {
    const auto type = (relay::Type)data[0];

    if (type == relay::Type::SubmitMessage) {
        relay::SubmitMessage m{};
        if (!relay::readFrame(data, size, m)) return drop(from, "short SubmitMessage");
        acceptSubmit(host, from, m);
        return;
    }

    if (type == relay::Type::RequestRoster) {
        relay::RequestRoster r{};
        if (!relay::readFrame(data, size, r)) return drop(from, "short RequestRoster");
        if (r.requestingId != from) {
            std::cerr << "[Relay] roster request from " << from << " named " << r.requestingId << "\n";
        }
        replayRoster(host, from);
        return;
    }

    drop(from, "frame type not accepted by host");
}

void ChatRelay::handleAsPeer(ClientId from, const uint8_t* data, size_t size) {
    if (from != kHostClientId) return drop(from, "not from host");

    const auto type = (relay::Type)data[0];

    if (type == relay::Type::BroadcastMessage) {
        relay::BroadcastMessage b{};
        if (!relay::readFrame(data, size, b)) return drop(from, "short BroadcastMessage");
        std::string name, text;
        if (!relay::readString(b.senderName, name) || !relay::readString(b.text, text))
            return drop(from, "unterminated BroadcastMessage");
        applyBroadcast(b.senderId, name, text);
        return;
    }

    if (type == relay::Type::RosterUpdate) {
        relay::RosterUpdate u{};
        if (!relay::readFrame(data, size, u)) return drop(from, "short RosterUpdate");
        std::string name;
        if (!relay::readString(u.name, name)) return drop(from, "unterminated RosterUpdate");
        m_roster.upsert(u.clientId, name);
        return;
    }

    if (type == relay::Type::RosterRemove) {
        relay::RosterRemove r{};
        if (!relay::readFrame(data, size, r)) return drop(from, "short RosterRemove");
        m_roster.remove(r.clientId);
        return;
    }

    drop(from, "frame type not accepted by peer");
}

void ChatRelay::applyBroadcast(ClientId senderId, const std::string& senderName, const std::string& text) {
    ChatMessage msg{ senderId, senderName, text };
    std::cout << "[Relay] " << ChatLog::formatLine(msg) << "\n";
    m_log.push(std::move(msg));
}

void ChatRelay::drop(ClientId from, const char* why) {
    ++m_dropped;
    std::cerr << "[Relay] dropped frame from " << from << ": " << why << "\n";
}
