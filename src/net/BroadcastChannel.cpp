#include "BroadcastChannel.hpp"
#include "DiscoveryProtocol.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>

#include <arpa/inet.h>
#include <fcntl.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

BroadcastChannel::~BroadcastChannel() {
    close();
    releaseFds();
}

void BroadcastChannel::releaseFds() {
    if (m_sock >= 0) { ::close(m_sock); m_sock = -1; }
    for (int& fd : m_wake) {
        if (fd >= 0) { ::close(fd); fd = -1; }
    }
    m_localPort = 0;
}

bool BroadcastChannel::open(uint16_t bindPort) {
    releaseFds();

    m_sock = socket(AF_INET, SOCK_DGRAM, 0);
    if (m_sock < 0) {
        std::cerr << "[Discovery] socket: " << std::strerror(errno) << "\n";
        return false;
    }

    int on = 1;
    setsockopt(m_sock, SOL_SOCKET, SO_BROADCAST, &on, sizeof(on));
    setsockopt(m_sock, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(bindPort);
    addr.sin_addr.s_addr = INADDR_ANY;
    if (bind(m_sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::cerr << "[Discovery] bind to UDP " << bindPort << " failed: " << std::strerror(errno) << "\n";
        releaseFds();
        return false;
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (getsockname(m_sock, reinterpret_cast<sockaddr*>(&bound), &len) == 0)
        m_localPort = ntohs(bound.sin_port);

    if (pipe(m_wake) != 0) {
        std::cerr << "[Discovery] pipe: " << std::strerror(errno) << "\n";
        releaseFds();
        return false;
    }
    fcntl(m_wake[1], F_SETFL, O_NONBLOCK);

    if (m_broadcastAddr.empty()) m_broadcastAddr = subnetBroadcastIPv4();

    m_closed.store(false);
    return true;
}

bool BroadcastChannel::sendTo(const std::string& payload, const Endpoint& to) {
    if (!isOpen()) return false;

    sockaddr_in dest{};
    dest.sin_family = AF_INET;
    dest.sin_port = htons(to.port);
    if (inet_pton(AF_INET, to.address.c_str(), &dest.sin_addr) != 1) {
        std::cerr << "[Discovery] bad destination address: " << to.address << "\n";
        return false;
    }

    const ssize_t n = sendto(m_sock, payload.data(), payload.size(), 0,
                             reinterpret_cast<sockaddr*>(&dest), sizeof(dest));
    if (n != static_cast<ssize_t>(payload.size())) {
        std::cerr << "[Discovery] sendto " << to.address << ":" << to.port
                  << " failed: " << std::strerror(errno) << "\n";
        return false;
    }
    return true;
}

bool BroadcastChannel::sendBroadcast(const std::string& payload, uint16_t port) {
    return sendTo(payload, Endpoint{ m_broadcastAddr, port });
}

bool BroadcastChannel::receive(Datagram& out) {
    char buf[discovery::kMaxDatagram];

    while (!m_closed.load()) {
        pollfd fds[2]{};
        fds[0].fd = m_sock;
        fds[0].events = POLLIN;
        fds[1].fd = m_wake[0];
        fds[1].events = POLLIN;

        const int r = poll(fds, 2, -1);
        if (r < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (m_closed.load() || (fds[1].revents & POLLIN)) return false;
        if (!(fds[0].revents & POLLIN)) continue;

        sockaddr_in src{};
        socklen_t srclen = sizeof(src);
        const ssize_t n = recvfrom(m_sock, buf, sizeof(buf), 0,
                                   reinterpret_cast<sockaddr*>(&src), &srclen);
        // EINTR, or an ICMP error queued by an earlier send; neither ends the channel
        if (n < 0) continue;

        char ip[INET_ADDRSTRLEN]{};
        inet_ntop(AF_INET, &src.sin_addr, ip, sizeof(ip));

        out.payload.assign(buf, (size_t)n);
        out.from.address = ip;
        out.from.port = ntohs(src.sin_port);
        return true;
    }
    return false;
}

void BroadcastChannel::close() {
    if (m_closed.exchange(true)) return;
    if (m_wake[1] >= 0) {
        const char b = 1;
        (void)!write(m_wake[1], &b, 1);
    }
}

static const ifaddrs* firstLanInterface(const ifaddrs* list) {
    for (const ifaddrs* it = list; it; it = it->ifa_next) {
        if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) continue;
        if (!(it->ifa_flags & IFF_UP) || (it->ifa_flags & IFF_LOOPBACK)) continue;
        return it;
    }
    return nullptr;
}

std::string BroadcastChannel::localIPv4() {
    ifaddrs* list = nullptr;
    if (getifaddrs(&list) != 0) return "127.0.0.1";

    std::string result = "127.0.0.1";
    if (const ifaddrs* it = firstLanInterface(list)) {
        char ip[INET_ADDRSTRLEN]{};
        inet_ntop(AF_INET, &reinterpret_cast<const sockaddr_in*>(it->ifa_addr)->sin_addr, ip, sizeof(ip));
        result = ip;
    }
    freeifaddrs(list);
    return result;
}

std::string BroadcastChannel::subnetBroadcastIPv4() {
    ifaddrs* list = nullptr;
    if (getifaddrs(&list) != 0) return "255.255.255.255";

    std::string result = "255.255.255.255";
    const ifaddrs* it = firstLanInterface(list);
    if (it && (it->ifa_flags & IFF_BROADCAST) && it->ifa_broadaddr) {
        char ip[INET_ADDRSTRLEN]{};
        inet_ntop(AF_INET, &reinterpret_cast<const sockaddr_in*>(it->ifa_broadaddr)->sin_addr, ip, sizeof(ip));
        result = ip;
    }
    else if (it && it->ifa_netmask) {
        // no broadcast flag reported: derive it from address | ~netmask
        const uint32_t a = reinterpret_cast<const sockaddr_in*>(it->ifa_addr)->sin_addr.s_addr;
        const uint32_t m = reinterpret_cast<const sockaddr_in*>(it->ifa_netmask)->sin_addr.s_addr;
        in_addr b{};
        b.s_addr = a | ~m;
        char ip[INET_ADDRSTRLEN]{};
        inet_ntop(AF_INET, &b, ip, sizeof(ip));
        result = ip;
    }
    freeifaddrs(list);
    return result;
}
