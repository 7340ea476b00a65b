#include "EventQueue.hpp"
#include <iterator>

SessionEvent SessionEvent::serverFound(discovery::ServerAnnouncement a) {
    SessionEvent e;
    e.kind = Kind::ServerFound;
    e.server = std::move(a);
    return e;
}

SessionEvent SessionEvent::peerConnected(ClientId id) {
    SessionEvent e;
    e.kind = Kind::PeerConnected;
    e.peer = id;
    return e;
}

SessionEvent SessionEvent::peerDisconnected(ClientId id) {
    SessionEvent e;
    e.kind = Kind::PeerDisconnected;
    e.peer = id;
    return e;
}

SessionEvent SessionEvent::localConnected(ClientId yourId) {
    SessionEvent e;
    e.kind = Kind::LocalConnected;
    e.peer = yourId;
    return e;
}

SessionEvent SessionEvent::localConnectFailed(std::string why) {
    SessionEvent e;
    e.kind = Kind::LocalConnectFailed;
    e.reason = std::move(why);
    return e;
}

SessionEvent SessionEvent::localDropped(std::string why) {
    SessionEvent e;
    e.kind = Kind::LocalDropped;
    e.reason = std::move(why);
    return e;
}

SessionEvent SessionEvent::message(ClientId from, const void* data, uint32_t size) {
    SessionEvent e;
    e.kind = Kind::Message;
    e.peer = from;
    const auto* p = static_cast<const uint8_t*>(data);
    e.payload.assign(p, p + size);
    return e;
}

void EventQueue::post(SessionEvent ev) {
    std::lock_guard<std::mutex> lk(m_mtx);
    m_events.push_back(std::move(ev));
}

size_t EventQueue::drain(std::vector<SessionEvent>& out) {
    std::deque<SessionEvent> taken;
    {
        std::lock_guard<std::mutex> lk(m_mtx);
        taken.swap(m_events);
    }
    const size_t n = taken.size();
    out.insert(out.end(), std::make_move_iterator(taken.begin()), std::make_move_iterator(taken.end()));
    return n;
}

size_t EventQueue::pending() const {
    std::lock_guard<std::mutex> lk(m_mtx);
    return m_events.size();
}

void EventQueue::clear() {
    std::lock_guard<std::mutex> lk(m_mtx);
    m_events.clear();
}
