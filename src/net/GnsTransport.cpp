#include "GnsTransport.hpp"
#include "EventQueue.hpp"
#include "RelayProtocol.hpp"

#include <iostream>

GnsTransport::GnsTransport(ISteamNetworkingSockets* iface, EventQueue& events)
    : m_iface(iface), m_events(events) {
}

GnsTransport::~GnsTransport() {
    close("shutdown");
}

bool GnsTransport::listen(uint16_t port) {
    if (!m_iface || m_mode != Mode::None) return false;

    SteamNetworkingIPAddr addr;
    addr.Clear();  // all interfaces
    addr.m_port = port;

    m_listen = m_iface->CreateListenSocketIP(addr, 0, nullptr);
    if (m_listen == k_HSteamListenSocket_Invalid) {
        std::cerr << "[Transport] CreateListenSocketIP failed on port " << port << "\n";
        return false;
    }

    m_poll = m_iface->CreatePollGroup();
    if (m_poll == k_HSteamNetPollGroup_Invalid) {
        std::cerr << "[Transport] CreatePollGroup failed\n";
        m_iface->CloseListenSocket(m_listen);
        m_listen = k_HSteamListenSocket_Invalid;
        return false;
    }

    m_mode = Mode::Host;
    m_nextId = kHostClientId + 1;
    std::cout << "[Transport] Listening on port " << port << "\n";
    return true;
}

bool GnsTransport::connect(const std::string& address, uint16_t port) {
    if (!m_iface || m_mode != Mode::None) return false;

    SteamNetworkingIPAddr addr;
    addr.Clear();
    if (!addr.ParseString(address.c_str())) {
        std::cerr << "[Transport] Bad host address: " << address << "\n";
        return false;
    }
    addr.m_port = port;

    m_conn = m_iface->ConnectByIPAddress(addr, 0, nullptr);
    if (m_conn == k_HSteamNetConnection_Invalid) {
        std::cerr << "[Transport] ConnectByIPAddress failed\n";
        return false;
    }

    m_mode = Mode::Client;
    m_welcomed = false;
    std::cout << "[Transport] Connecting to " << address << ":" << port << "\n";
    return true;
}

bool GnsTransport::send(ClientId to, const void* data, uint32_t size) {
    HSteamNetConnection conn = k_HSteamNetConnection_Invalid;

    if (m_mode == Mode::Host) {
        auto it = m_idToConn.find(to);
        if (it == m_idToConn.end()) return false;
        conn = it->second;
    }
    else if (m_mode == Mode::Client) {
        if (to != kHostClientId || !m_welcomed) return false;
        conn = m_conn;
    }
    else {
        return false;
    }

    const EResult r = m_iface->SendMessageToConnection(conn, data, size, k_nSteamNetworkingSend_Reliable, nullptr);
    if (r != k_EResultOK) {
        std::cerr << "[Transport] send to " << to << " failed (" << (int)r << ")\n";
        return false;
    }
    return true;
}

void GnsTransport::close(const char* reason) {
    if (!m_iface) return;

    for (auto& kv : m_connToId) {
        m_iface->CloseConnection(kv.first, 0, reason, false);
    }
    m_connToId.clear();
    m_idToConn.clear();

    if (m_poll != k_HSteamNetPollGroup_Invalid) {
        m_iface->DestroyPollGroup(m_poll);
        m_poll = k_HSteamNetPollGroup_Invalid;
    }
    if (m_listen != k_HSteamListenSocket_Invalid) {
        m_iface->CloseListenSocket(m_listen);
        m_listen = k_HSteamListenSocket_Invalid;
    }
    if (m_conn != k_HSteamNetConnection_Invalid) {
        // linger so queued reliable frames still reach the host
        m_iface->CloseConnection(m_conn, 0, reason, true);
        m_conn = k_HSteamNetConnection_Invalid;
    }

    m_welcomed = false;
    m_mode = Mode::None;
}

bool GnsTransport::owns(const SteamNetConnectionStatusChangedCallback_t* info) const {
    if (m_mode == Mode::Host) return info->m_info.m_hListenSocket == m_listen;
    if (m_mode == Mode::Client) return info->m_hConn == m_conn;
    return false;
}

void GnsTransport::onConnStatusChanged(SteamNetConnectionStatusChangedCallback_t* info) {
    if (!owns(info)) return;

    if (m_mode == Mode::Host) onHostConnStatus(info);
    else onClientConnStatus(info);
}

void GnsTransport::onHostConnStatus(SteamNetConnectionStatusChangedCallback_t* info) {
    const auto st = info->m_info.m_eState;
    const auto conn = info->m_hConn;

    if (st == k_ESteamNetworkingConnectionState_Connecting) {
        if (m_iface->AcceptConnection(conn) != k_EResultOK) {
            m_iface->CloseConnection(conn, 0, "AcceptConnection failed", false);
            return;
        }
        m_iface->SetConnectionPollGroup(conn, m_poll);
        return;
    }

    if (st == k_ESteamNetworkingConnectionState_Connected) {
        const ClientId id = m_nextId++;
        m_connToId[conn] = id;
        m_idToConn[id] = conn;

        relay::Welcome w{};
        w.type = relay::Type::Welcome;
        w.protocol = relay::kProtocol;
        w.yourId = id;
        m_iface->SendMessageToConnection(conn, &w, sizeof(w), k_nSteamNetworkingSend_Reliable, nullptr);

        std::cout << "[Transport] Peer connected -> id=" << id << "\n";
        m_events.post(SessionEvent::peerConnected(id));
        return;
    }

    if (st == k_ESteamNetworkingConnectionState_ClosedByPeer ||
        st == k_ESteamNetworkingConnectionState_ProblemDetectedLocally) {
        auto it = m_connToId.find(conn);
        if (it != m_connToId.end()) {
            const ClientId id = it->second;
            m_idToConn.erase(id);
            m_connToId.erase(it);
            std::cout << "[Transport] Peer disconnected id=" << id << " (" << info->m_info.m_szEndDebug << ")\n";
            m_events.post(SessionEvent::peerDisconnected(id));
        }
        m_iface->CloseConnection(conn, 0, "cleanup", false);
        return;
    }
}

void GnsTransport::onClientConnStatus(SteamNetConnectionStatusChangedCallback_t* info) {
    const auto st = info->m_info.m_eState;

    if (st == k_ESteamNetworkingConnectionState_Connected) {
        // the session only counts as connected once the host's Welcome tells us our id
        std::cout << "[Transport] Connection established, waiting for welcome\n";
        return;
    }

    if (st == k_ESteamNetworkingConnectionState_ClosedByPeer ||
        st == k_ESteamNetworkingConnectionState_ProblemDetectedLocally) {
        const std::string why = info->m_info.m_szEndDebug;
        const bool wasWelcomed = m_welcomed;

        m_iface->CloseConnection(m_conn, 0, "cleanup", false);
        m_conn = k_HSteamNetConnection_Invalid;
        m_welcomed = false;
        m_mode = Mode::None;

        std::cout << "[Transport] Disconnected: " << why << "\n";
        m_events.post(wasWelcomed ? SessionEvent::localDropped(why) : SessionEvent::localConnectFailed(why));
        return;
    }
}

void GnsTransport::handleClientFrame(const void* data, uint32_t size) {
    if (size < 1) return;

    const auto type = *(const relay::Type*)data;
    if (type == relay::Type::Welcome) {
        relay::Welcome w{};
        if (!relay::readFrame(data, size, w)) return;
        if (w.protocol != relay::kProtocol) {
            std::cerr << "[Transport] Host speaks protocol " << w.protocol << ", expected " << relay::kProtocol << "\n";
            close("protocol mismatch");
            m_events.post(SessionEvent::localConnectFailed("protocol mismatch"));
            return;
        }
        if (m_welcomed) return;
        m_welcomed = true;
        std::cout << "[Transport] Welcome: myId=" << w.yourId << "\n";
        m_events.post(SessionEvent::localConnected(w.yourId));
        return;
    }

    if (!m_welcomed) return;
    m_events.post(SessionEvent::message(kHostClientId, data, size));
}

void GnsTransport::pump() {
    if (!m_iface) return;

    SteamNetworkingMessage_t* msgs[64];

    if (m_mode == Mode::Host && m_poll != k_HSteamNetPollGroup_Invalid) {
        for (;;) {
            const int n = m_iface->ReceiveMessagesOnPollGroup(m_poll, msgs, 64);
            if (n <= 0) break;

            for (int i = 0; i < n; ++i) {
                auto it = m_connToId.find(msgs[i]->m_conn);
                if (it != m_connToId.end()) {
                    m_events.post(SessionEvent::message(it->second, msgs[i]->m_pData, (uint32_t)msgs[i]->m_cbSize));
                }
                msgs[i]->Release();
            }
        }
        return;
    }

    if (m_mode == Mode::Client && m_conn != k_HSteamNetConnection_Invalid) {
        for (;;) {
            const int n = m_iface->ReceiveMessagesOnConnection(m_conn, msgs, 64);
            if (n <= 0) break;

            for (int i = 0; i < n; ++i) {
                handleClientFrame(msgs[i]->m_pData, (uint32_t)msgs[i]->m_cbSize);
                msgs[i]->Release();
            }
            // handleClientFrame may have closed us
            if (m_mode != Mode::Client) break;
        }
    }
}
