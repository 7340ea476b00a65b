#include "DiscoveryRequester.hpp"
#include "EventQueue.hpp"

#include <iostream>

DiscoveryRequester::~DiscoveryRequester() {
    stop();
}

bool DiscoveryRequester::start(const DiscoveryOptions& opts) {
    if (m_channel) return true;

    auto channel = std::make_unique<BroadcastChannel>();
    if (!opts.broadcastAddress.empty()) channel->setBroadcastAddress(opts.broadcastAddress);
    if (!channel->open(0)) {
        std::cerr << "[Requester] cannot open discovery socket\n";
        return false;
    }

    m_opts = opts;
    m_channel = std::move(channel);
    m_found.store(false);
    m_sent.store(0);
    m_dropped.store(0);
    {
        std::lock_guard<std::mutex> lk(m_stopMtx);
        m_stopRequested = false;
    }

    m_listenThr = std::thread(&DiscoveryRequester::listenLoop, this);
    m_sendThr = std::thread(&DiscoveryRequester::sendLoop, this);

    std::cout << "[Requester] searching via " << m_channel->broadcastAddress()
              << ":" << m_opts.discoveryPort << "\n";
    return true;
}

void DiscoveryRequester::stop() {
    if (!m_channel) return;

    {
        std::lock_guard<std::mutex> lk(m_stopMtx);
        m_stopRequested = true;
    }
    m_stopCv.notify_all();
    m_channel->close();

    if (m_sendThr.joinable()) m_sendThr.join();
    if (m_listenThr.joinable()) m_listenThr.join();
    m_channel.reset();

    std::cout << "[Requester] stopped\n";
}

void DiscoveryRequester::sendLoop() {
    for (int i = 0; i < m_opts.attempts; ++i) {
        if (m_found.load()) break;

        if (m_channel->sendBroadcast(discovery::kRequestToken, m_opts.discoveryPort))
            m_sent.fetch_add(1);

        std::unique_lock<std::mutex> lk(m_stopMtx);
        m_stopCv.wait_for(lk, m_opts.interval, [this] { return m_stopRequested || m_found.load(); });
        if (m_stopRequested) break;
    }
}

void DiscoveryRequester::listenLoop() {
    Datagram dg;
    while (m_channel->receive(dg)) {
        discovery::ServerAnnouncement ann;
        if (!discovery::decodeAnnouncement(dg.payload, ann)) {
            m_dropped.fetch_add(1);
            std::cerr << "[Requester] dropped malformed reply from " << dg.from.address << "\n";
            continue;
        }

        // late or duplicate answers (retries, several hosts) are expected; report only the first
        {
            std::lock_guard<std::mutex> lk(m_stopMtx);
            if (m_found.exchange(true)) continue;
        }

        std::cout << "[Requester] server \"" << ann.serverName << "\" at "
                  << ann.address << ":" << ann.port << "\n";
        m_events.post(SessionEvent::serverFound(std::move(ann)));
        m_stopCv.notify_all();
    }
}
