#pragma once
#include <atomic>
#include <cstdint>
#include <string>

struct Endpoint {
    std::string address;  // dotted-quad
    uint16_t    port{ 0 };
};

struct Datagram {
    std::string payload;
    Endpoint    from;
};

// Broadcast-capable UDP socket. No delivery, ordering or duplicate guarantees.
//
// receive() blocks the calling thread; close() may be called from any other thread
// and makes a pending or future receive() return false. Descriptors are released
// when the channel is destroyed, so the receiving thread must be joined first.
class BroadcastChannel {
public:
    BroadcastChannel() = default;
    ~BroadcastChannel();

    BroadcastChannel(const BroadcastChannel&) = delete;
    BroadcastChannel& operator=(const BroadcastChannel&) = delete;

    // Binds 0.0.0.0:bindPort (0 = ephemeral). False on socket/bind error, channel stays closed.
    bool open(uint16_t bindPort);

    // Target for sendBroadcast(). Defaults to subnetBroadcastIPv4().
    void setBroadcastAddress(const std::string& address) { m_broadcastAddr = address; }
    const std::string& broadcastAddress() const { return m_broadcastAddr; }

    bool sendBroadcast(const std::string& payload, uint16_t port);
    bool sendTo(const std::string& payload, const Endpoint& to);

    // False once the channel is closed (the "closed" signal); true with a datagram otherwise.
    bool receive(Datagram& out);

    void close();

    bool isOpen() const { return m_sock >= 0 && !m_closed.load(); }
    uint16_t localPort() const { return m_localPort; }

    // First up, non-loopback IPv4 address of this machine, or "127.0.0.1".
    static std::string localIPv4();
    // Broadcast address of that interface's subnet, or "255.255.255.255".
    static std::string subnetBroadcastIPv4();

private:
    void releaseFds();

private:
    int m_sock{ -1 };
    int m_wake[2]{ -1, -1 };  // self-pipe: written by close() to wake receive()
    uint16_t m_localPort{ 0 };
    std::string m_broadcastAddr;
    std::atomic<bool> m_closed{ true };
};
