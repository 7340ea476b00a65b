#include "DiscoveryResponder.hpp"
#include <iostream>

DiscoveryResponder::~DiscoveryResponder() {
    stop();
}

bool DiscoveryResponder::setAnnouncement(const discovery::ServerAnnouncement& a) {
    std::string encoded = discovery::encodeAnnouncement(a);
    if (encoded.size() > discovery::kMaxDatagram) {
        std::cerr << "[Responder] announcement is " << encoded.size() << " bytes, limit is "
                  << discovery::kMaxDatagram << "; server name too long\n";
        return false;
    }

    std::lock_guard<std::mutex> lk(m_annMtx);
    m_encoded = std::move(encoded);
    return true;
}

bool DiscoveryResponder::start(uint16_t discoveryPort) {
    if (m_running.load()) return true;
    stop();  // a loop that ended on its own still has a thread to join

    auto channel = std::make_unique<BroadcastChannel>();
    if (!channel->open(discoveryPort)) {
        std::cerr << "[Responder] cannot listen on UDP " << discoveryPort << "\n";
        return false;
    }

    m_channel = std::move(channel);
    m_answered.store(0);
    m_ignored.store(0);
    m_running.store(true);
    m_thr = std::thread(&DiscoveryResponder::listenLoop, this);

    std::cout << "[Responder] discoverable on UDP " << m_channel->localPort() << "\n";
    return true;
}

void DiscoveryResponder::stop() {
    if (!m_channel) return;

    m_running.store(false);
    m_channel->close();
    if (m_thr.joinable()) m_thr.join();
    m_channel.reset();

    std::cout << "[Responder] stopped (" << m_answered.load() << " requests answered)\n";
}

uint16_t DiscoveryResponder::boundPort() const {
    return m_channel ? m_channel->localPort() : 0;
}

void DiscoveryResponder::listenLoop() {
    Datagram dg;
    while (m_channel->receive(dg)) {
        if (!discovery::isRequest(dg.payload)) {
            m_ignored.fetch_add(1);
            continue;
        }

        std::string reply;
        {
            std::lock_guard<std::mutex> lk(m_annMtx);
            reply = m_encoded;
        }
        if (reply.empty()) continue;  // nothing to advertise yet

        if (m_channel->sendTo(reply, dg.from)) {
            m_answered.fetch_add(1);
            std::cout << "[Responder] answered " << dg.from.address << ":" << dg.from.port << "\n";
        }
    }
    // receive() returning false means stop() closed the channel, or the socket failed
    if (m_running.exchange(false))
        std::cerr << "[Responder] receive failed; no longer discoverable\n";
}
