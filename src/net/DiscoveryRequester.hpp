#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "BroadcastChannel.hpp"
#include "DiscoveryProtocol.hpp"

class EventQueue;

struct DiscoveryOptions {
    uint16_t discoveryPort = discovery::kDefaultPort;
    int attempts = 3;
    std::chrono::milliseconds interval{ 1000 };
    std::string broadcastAddress;  // empty: subnet broadcast of the first LAN interface
};

// Joining side of LAN discovery. Broadcasts the request a fixed number of times and posts
// exactly one ServerFound event for the first valid reply. The listen side keeps running
// (and ignoring replies) until the owner calls stop().
class DiscoveryRequester {
public:
    explicit DiscoveryRequester(EventQueue& events) : m_events(events) {}
    ~DiscoveryRequester();

    DiscoveryRequester(const DiscoveryRequester&) = delete;
    DiscoveryRequester& operator=(const DiscoveryRequester&) = delete;

    bool start(const DiscoveryOptions& opts = {});
    void stop();

    bool isRunning() const { return m_channel != nullptr; }
    bool found() const { return m_found.load(); }
    int requestsSent() const { return m_sent.load(); }
    uint32_t responsesDropped() const { return m_dropped.load(); }

private:
    void sendLoop();
    void listenLoop();

private:
    EventQueue& m_events;
    DiscoveryOptions m_opts;

    std::unique_ptr<BroadcastChannel> m_channel;
    std::thread m_sendThr;
    std::thread m_listenThr;

    std::mutex m_stopMtx;
    std::condition_variable m_stopCv;
    bool m_stopRequested{ false };

    std::atomic<bool> m_found{ false };
    std::atomic<int> m_sent{ 0 };
    std::atomic<uint32_t> m_dropped{ 0 };
};
