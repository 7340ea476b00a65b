#include "ChatSession.hpp"
#include "net/BroadcastChannel.hpp"

#include <iostream>

const char* toString(SessionRole role) {
    switch (role) {
    case SessionRole::Idle:         return "Idle";
    case SessionRole::Hosting:      return "Hosting";
    case SessionRole::Connecting:   return "Connecting";
    case SessionRole::Connected:    return "Connected";
    case SessionRole::Disconnected: return "Disconnected";
    }
    return "?";
}

ChatSession::ChatSession(Transport& transport, EventQueue& events, SessionConfig cfg)
    : m_transport(transport)
    , m_events(events)
    , m_cfg(std::move(cfg))
    , m_log(m_cfg.maxMessages)
    , m_relay(m_transport, m_roster, m_log)
    , m_requester(events) {
}

ChatSession::~ChatSession() {
    m_requester.stop();
    m_responder.stop();
    if (!isReady()) m_transport.close("shutdown");
}

bool ChatSession::startHosting() {
    if (m_role == SessionRole::Hosting) return true;
    if (!isReady()) {
        std::cout << "[Session] already " << toString(m_role) << "; not hosting\n";
        return false;
    }

    // a peer that was searching may decide to host instead
    stopDiscovery();

    std::cout << "[Session] Host starting with port: " << m_cfg.listenPort << "\n";
    if (!m_transport.listen(m_cfg.listenPort)) {
        m_status = "Failed to start host";
        notify(SessionNotice::Kind::HostStartFailed, m_status);
        return false;
    }

    m_roster.clear();
    m_log.clear();
    m_authority.reset(new HostAuthority(m_roster, m_transport));
    m_localId = kHostClientId;
    m_role = SessionRole::Hosting;

    const PeerIdentity self = m_authority->admit(kHostClientId);
    m_relay.rosterUpdate(*m_authority, self.clientId, self.displayName);

    discovery::ServerAnnouncement a;
    a.address = m_cfg.advertisedAddress.empty() ? BroadcastChannel::localIPv4() : m_cfg.advertisedAddress;
    a.port = m_cfg.listenPort;
    a.serverName = m_cfg.serverName;
    m_announceable = m_responder.setAnnouncement(a);

    m_status = "Hosting...";
    notify(SessionNotice::Kind::HostStarted, m_status);

    if (!m_announceable || !m_responder.start(m_cfg.discoveryPort)) {
        // peers can still join by address; only LAN discovery is missing
        std::cerr << "[Session] hosting without discovery\n";
        notify(SessionNotice::Kind::DiscoveryStartFailed, "Not discoverable on the LAN");
    }
    else {
        std::cout << "[Session] advertising " << a.address << ":" << a.port << " as \"" << a.serverName << "\"\n";
    }
    return true;
}

bool ChatSession::startDiscovery() {
    if (!isReady()) return false;
    if (m_requester.isRunning()) return true;

    DiscoveryOptions opts;
    opts.discoveryPort = m_cfg.discoveryPort;
    opts.attempts = m_cfg.discoveryAttempts;
    opts.interval = m_cfg.discoveryInterval;
    opts.broadcastAddress = m_cfg.broadcastAddress;

    if (!m_requester.start(opts)) {
        m_status = "Discovery failed to start";
        notify(SessionNotice::Kind::DiscoveryStartFailed, m_status);
        return false;
    }

    m_role = SessionRole::Idle;
    m_status = "Searching for games...";
    notify(SessionNotice::Kind::DiscoveryStarted, m_status);
    return true;
}

void ChatSession::stopDiscovery() {
    m_requester.stop();
}

void ChatSession::stop(const char* reason) {
    std::cout << "[Session] stop: " << reason << "\n";

    if (isReady()) {
        stopDiscovery();
        m_events.clear();
        return;
    }
    enterDisconnected(SessionNotice::Kind::Disconnected, "Disconnected");
}

bool ChatSession::sendMessage(const std::string& text) {
    if (!canChat()) return false;
    if (ChatRelay::isBlank(text)) return false;

    if (m_authority) return m_relay.acceptLocal(*m_authority, text);
    return m_relay.submitMessage(m_localId, text);
}

void ChatSession::pump() {
    m_transport.pump();

    m_batch.clear();
    m_events.drain(m_batch);

    const uint64_t epoch = m_epoch;
    for (auto& ev : m_batch) {
        apply(ev);
        if (m_epoch != epoch) break;  // the session ended; the rest belongs to it
    }
    m_batch.clear();
}

void ChatSession::apply(SessionEvent& ev) {
    switch (ev.kind) {
    case SessionEvent::Kind::ServerFound:
        onServerFound(ev.server);
        return;

    case SessionEvent::Kind::LocalConnected:
        onLocalConnected(ev.peer);
        return;

    case SessionEvent::Kind::LocalConnectFailed:
        if (m_role != SessionRole::Connecting) return;
        enterDisconnected(SessionNotice::Kind::ConnectFailed, "Connection failed: " + ev.reason);
        return;

    case SessionEvent::Kind::LocalDropped:
        if (m_role == SessionRole::Connecting)
            enterDisconnected(SessionNotice::Kind::ConnectFailed, "Connection failed: " + ev.reason);
        else if (m_role == SessionRole::Connected || m_role == SessionRole::Hosting)
            enterDisconnected(SessionNotice::Kind::Disconnected, "Connection failed: Transport error");
        return;

    case SessionEvent::Kind::PeerConnected:
        onPeerConnected(ev.peer);
        return;

    case SessionEvent::Kind::PeerDisconnected:
        onPeerDisconnected(ev.peer);
        return;

    case SessionEvent::Kind::Message:
        if (!canChat()) return;
        m_relay.handleFrame(m_authority.get(), ev.peer, ev.payload);
        return;
    }
}

void ChatSession::onServerFound(const discovery::ServerAnnouncement& server) {
    // overlapping answers (several hosts, retried requests) must not start a second attempt
    if (!isReady()) {
        std::cout << "[Session] ignoring " << server.address << ":" << server.port
                  << " while " << toString(m_role) << "\n";
        return;
    }

    stopDiscovery();

    m_target = server;
    m_roster.clear();
    m_log.clear();
    m_role = SessionRole::Connecting;
    notify(SessionNotice::Kind::ServerFound, "Server found: " + server.serverName);

    std::cout << "[Session] Attempting to connect to " << server.address << ":" << server.port << "\n";
    if (!m_transport.connect(server.address, server.port)) {
        enterDisconnected(SessionNotice::Kind::ConnectFailed, "Connection failed");
        return;
    }
    m_status = "Connecting...";
}

void ChatSession::onLocalConnected(ClientId yourId) {
    if (m_role != SessionRole::Connecting) return;

    m_localId = yourId;
    m_role = SessionRole::Connected;
    m_status = "Connected!";
    notify(SessionNotice::Kind::Connected, m_status);

    // our own entry arrives with the host's roster, not from us
    if (!m_relay.requestRoster(m_localId)) {
        std::cerr << "[Session] could not request roster\n";
    }
}

void ChatSession::onPeerConnected(ClientId id) {
    if (!m_authority) return;

    const PeerIdentity peer = m_authority->admit(id);
    m_relay.rosterUpdate(*m_authority, peer.clientId, peer.displayName);
    notify(SessionNotice::Kind::PeerJoined, peer.displayName + " joined");
    updateDiscoverability();
}

void ChatSession::onPeerDisconnected(ClientId id) {
    if (!m_authority || !m_authority->isMember(id)) return;

    const std::string name = m_roster.nameOf(id);
    m_authority->expel(id);
    m_relay.rosterRemove(*m_authority, id);
    notify(SessionNotice::Kind::PeerLeft, name + " left");
    updateDiscoverability();
}

void ChatSession::updateDiscoverability() {
    if (!m_authority || m_cfg.maxPeers == 0) return;

    const size_t remote = m_roster.size() - (m_roster.contains(kHostClientId) ? 1 : 0);
    if (remote >= m_cfg.maxPeers && m_responder.isRunning()) {
        std::cout << "[Session] session full, no longer discoverable\n";
        m_responder.stop();
    }
    else if (remote < m_cfg.maxPeers && !m_responder.isRunning() && m_announceable) {
        if (!m_responder.start(m_cfg.discoveryPort))
            std::cerr << "[Session] could not become discoverable again\n";
    }
}

void ChatSession::enterDisconnected(SessionNotice::Kind kind, const std::string& why) {
    const bool wasHost = (m_role == SessionRole::Hosting);

    m_responder.stop();
    m_requester.stop();
    m_transport.close("session ended");
    m_events.clear();
    ++m_epoch;

    // with exactly one host, the host leaving ends the session for every peer
    if (wasHost) std::cout << "[Session] host session over (" << m_roster.size() << " in roster)\n";

    m_authority.reset();
    m_roster.clear();
    m_localId = kInvalidClientId;
    m_role = SessionRole::Disconnected;

    m_status = why;
    notify(kind, why);
}

void ChatSession::notify(SessionNotice::Kind kind, std::string text) {
    std::cout << "[Session] Status: " << text << "\n";
    m_notices.push_back(SessionNotice{ kind, std::move(text) });
}

bool ChatSession::popNotice(SessionNotice& out) {
    if (m_notices.empty()) return false;
    out = std::move(m_notices.front());
    m_notices.pop_front();
    return true;
}
