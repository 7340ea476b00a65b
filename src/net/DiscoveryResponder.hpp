#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "BroadcastChannel.hpp"
#include "DiscoveryProtocol.hpp"

// Host side of LAN discovery. Answers every exact discovery request on the well-known
// port with a unicast ServerAnnouncement until stop() is called. Does not know how many
// peers the host has; the owner decides when the host should stop being discoverable.
class DiscoveryResponder {
public:
    DiscoveryResponder() = default;
    ~DiscoveryResponder();

    DiscoveryResponder(const DiscoveryResponder&) = delete;
    DiscoveryResponder& operator=(const DiscoveryResponder&) = delete;

    // May be called while running; the next reply uses the new data. False (previous
    // announcement kept) if the encoded reply would not fit in one datagram.
    bool setAnnouncement(const discovery::ServerAnnouncement& a);

    bool start(uint16_t discoveryPort = discovery::kDefaultPort);
    void stop();

    bool isRunning() const { return m_running.load(); }
    uint16_t boundPort() const;

    uint32_t requestsAnswered() const { return m_answered.load(); }
    uint32_t datagramsIgnored() const { return m_ignored.load(); }

private:
    void listenLoop();

private:
    std::mutex m_annMtx;
    std::string m_encoded;  // announcement, pre-encoded

    std::unique_ptr<BroadcastChannel> m_channel;
    std::thread m_thr;
    std::atomic<bool> m_running{ false };

    std::atomic<uint32_t> m_answered{ 0 };
    std::atomic<uint32_t> m_ignored{ 0 };
};
